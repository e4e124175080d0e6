#include "common/time_utils.hpp"

#include <atomic>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace fxhedge
{
    namespace common
    {

        std::string format_timestamp(std::chrono::system_clock::time_point tp)
        {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm = {};
            gmtime_r(&t, &tm);

            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
            return std::string(buffer);
        }

        std::string current_timestamp()
        {
            return format_timestamp(std::chrono::system_clock::now());
        }

        std::string today()
        {
            return current_timestamp().substr(0, 10);
        }

        bool is_valid_date_format(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }
            return true;
        }

        std::string add_days(const std::string &date, int days)
        {
            if (!is_valid_date_format(date))
            {
                throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: " + date);
            }

            // Noon avoids day slips across daylight-saving transitions
            std::tm tm = {};
            tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
            tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
            tm.tm_mday = std::stoi(date.substr(8, 2)) + days;
            tm.tm_hour = 12;
            tm.tm_isdst = -1;

            if (std::mktime(&tm) == static_cast<std::time_t>(-1))
            {
                throw std::invalid_argument("Date out of range: " + date);
            }

            char buffer[11];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
            return std::string(buffer);
        }

        std::string make_identifier(const std::string &prefix)
        {
            static std::atomic<unsigned long long> counter{0};
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
            return prefix + "_" + std::to_string(ms) + "_" + std::to_string(++counter);
        }

    } // namespace common
} // namespace fxhedge
