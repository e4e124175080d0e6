/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between a caller and a job
 *
 * Monte Carlo batches and optimizer iterations poll the token between
 * units of work. Cancelling never interrupts a unit already in progress.
 */

#pragma once

#include "common/errors.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace fxhedge
{
    namespace common
    {

        class CancellationToken
        {
        public:
            CancellationToken() : cancelled_(false) {}

            void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

            bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

            /**
             * @brief Throw OperationCancelled if cancellation was requested
             * @param operation Name reported in the exception message
             */
            void throw_if_cancelled(const std::string &operation) const
            {
                if (is_cancelled())
                {
                    throw OperationCancelled(operation);
                }
            }

        private:
            std::atomic<bool> cancelled_;
        };

        using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

        /**
         * @brief Null-safe check used by components that accept an optional token
         */
        inline void check_cancelled(const CancellationToken *token, const std::string &operation)
        {
            if (token != nullptr)
            {
                token->throw_if_cancelled(operation);
            }
        }

    } // namespace common
} // namespace fxhedge
