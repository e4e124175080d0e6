/**
 * @file random_source.hpp
 * @brief Injectable, seedable random number source
 *
 * Every stochastic component (Monte Carlo VaR, synthetic history) draws from
 * a RandomSource instead of an ambient generator. Parallel batches each get
 * their own engine derived from (seed, batch index), so a seeded run gives
 * identical output regardless of how batches are scheduled.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace fxhedge
{
    namespace common
    {

        class RandomSource
        {
        public:
            /**
             * @brief Construct a source
             * @param seed Fixed seed; when empty a base seed is drawn from std::random_device
             */
            explicit RandomSource(std::optional<std::uint64_t> seed = std::nullopt);

            /**
             * @brief Engine for an independent simulation batch
             * @param batch_index Zero-based batch index
             * @return Engine seeded deterministically from the base seed and batch index
             */
            std::mt19937_64 engine_for_batch(std::uint64_t batch_index) const;

            /**
             * @brief Engine for a single sequential stream (batch 0)
             */
            std::mt19937_64 engine() const { return engine_for_batch(0); }

            bool is_seeded() const { return seeded_; }
            std::uint64_t base_seed() const { return base_seed_; }

        private:
            std::uint64_t base_seed_;
            bool seeded_;
        };

    } // namespace common
} // namespace fxhedge
