#include "common/random_source.hpp"

namespace fxhedge
{
    namespace common
    {

        RandomSource::RandomSource(std::optional<std::uint64_t> seed)
            : base_seed_(0), seeded_(seed.has_value())
        {
            if (seed)
            {
                base_seed_ = *seed;
            }
            else
            {
                std::random_device rd;
                base_seed_ = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
            }
        }

        std::mt19937_64 RandomSource::engine_for_batch(std::uint64_t batch_index) const
        {
            std::seed_seq seq{
                static_cast<std::uint32_t>(base_seed_ & 0xffffffffULL),
                static_cast<std::uint32_t>(base_seed_ >> 32),
                static_cast<std::uint32_t>(batch_index & 0xffffffffULL),
                static_cast<std::uint32_t>(batch_index >> 32)};
            return std::mt19937_64(seq);
        }

    } // namespace common
} // namespace fxhedge
