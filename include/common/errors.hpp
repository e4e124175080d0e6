/**
 * @file errors.hpp
 * @brief Exception types raised by the risk and hedging pipeline
 *
 * Input validation failures use std::invalid_argument directly. The types
 * below cover the cases a caller is expected to distinguish:
 * - DataUnavailableError: a market-data lookup failed for a currency
 * - CalculationError: an unexpected numeric failure inside a calculation
 * - OperationCancelled: a long-running job observed its cancellation token
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace fxhedge
{
    namespace common
    {

        /**
         * @class DataUnavailableError
         * @brief Raised when an exchange rate or price history cannot be resolved
         */
        class DataUnavailableError : public std::runtime_error
        {
        public:
            DataUnavailableError(const std::string &currency, const std::string &message)
                : std::runtime_error(message), currency_(currency)
            {
            }

            /**
             * @brief Currency whose data could not be resolved
             */
            const std::string &currency() const { return currency_; }

        private:
            std::string currency_;
        };

        /**
         * @class CalculationError
         * @brief Structured error for unexpected numeric failures
         *
         * Carries the operation that failed, the user the calculation was
         * run for, and when the failure happened. The caller decides whether
         * to retry with a fresh calculation.
         */
        class CalculationError : public std::runtime_error
        {
        public:
            CalculationError(const std::string &operation,
                             const std::string &user_id,
                             const std::string &message)
                : std::runtime_error(operation + " failed for user " + user_id + ": " + message),
                  operation_(operation),
                  user_id_(user_id),
                  timestamp_(std::chrono::system_clock::now())
            {
            }

            const std::string &operation() const { return operation_; }
            const std::string &user_id() const { return user_id_; }
            std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

        private:
            std::string operation_;
            std::string user_id_;
            std::chrono::system_clock::time_point timestamp_;
        };

        /**
         * @class OperationCancelled
         * @brief Raised when a simulation or optimization observes cancellation
         */
        class OperationCancelled : public std::runtime_error
        {
        public:
            explicit OperationCancelled(const std::string &operation)
                : std::runtime_error(operation + " cancelled")
            {
            }
        };

    } // namespace common
} // namespace fxhedge
