//
// Dice.cpp
//
#include "Dice.hpp"

#include "Exception.hpp"

namespace board::core
{
    Dice::Dice(std::uint32_t min, std::uint32_t max, std::uint64_t seed) :
        min_(min),
        max_(max),
        seed_(seed),
        state_(seed)
    {
        if (min_ > max_)
            BRD_THROW(error::Code::Rules, fmt::format("Dice range [{}, {}] is empty", min_, max_));
    }

    auto Dice::Restore(std::uint32_t min, std::uint32_t max,
                       std::uint64_t seed, std::uint64_t state) -> Dice
    {
        Dice d{min, max, seed};
        d.state_ = state;
        return d;
    }

    auto Dice::Next() -> std::uint64_t
    {
        // SplitMix64
        state_ += 0x9E3779B97F4A7C15ULL;
        std::uint64_t z = state_;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    auto Dice::Roll() -> std::uint32_t
    {
        std::uint64_t const span = static_cast<std::uint64_t>(max_ - min_) + 1;
        return min_ + static_cast<std::uint32_t>(Next() % span);
    }
}
