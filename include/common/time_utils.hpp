/**
 * @file time_utils.hpp
 * @brief Date and timestamp helpers (YYYY-MM-DD dates, ISO-8601 UTC timestamps)
 */

#pragma once

#include <chrono>
#include <string>

namespace fxhedge
{
    namespace common
    {

        /**
         * @brief Format a time point as an ISO-8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ)
         */
        std::string format_timestamp(std::chrono::system_clock::time_point tp);

        /**
         * @brief Current time as an ISO-8601 UTC timestamp
         */
        std::string current_timestamp();

        /**
         * @brief Current UTC date as YYYY-MM-DD
         */
        std::string today();

        /**
         * @brief Add a number of calendar days to a YYYY-MM-DD date
         * @throws std::invalid_argument if the date cannot be parsed
         */
        std::string add_days(const std::string &date, int days);

        /**
         * @brief Check for a well-formed YYYY-MM-DD string
         */
        bool is_valid_date_format(const std::string &date);

        /**
         * @brief Build a unique-enough identifier from a prefix and the current clock
         *
         * Identifiers combine a millisecond timestamp with a process-wide counter.
         */
        std::string make_identifier(const std::string &prefix);

    } // namespace common
} // namespace fxhedge
