//
// Dice.hpp
//

#ifndef BOARDGAME_DICE_HPP
#define BOARDGAME_DICE_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace board::core
{
    // Reproducible dice. The whole generator is four words so it can live inside
    // the serialized GameState; a replay from a stored state rolls the same values.
    //
    // std::uniform_int_distribution is implementation defined, so the mapping from
    // the raw stream to a range is done here by hand (SplitMix64 + modulo).
    class Dice
    {
    public:
        Dice() = default;
        Dice(std::uint32_t min, std::uint32_t max, std::uint64_t seed);

        // Rebuilds a generator mid-stream (codec).
        static auto Restore(std::uint32_t min, std::uint32_t max,
                            std::uint64_t seed, std::uint64_t state) -> Dice;

        // Value in [min, max].
        auto Roll() -> std::uint32_t;

        // Fisher-Yates from the back, same stream as Roll().
        template <typename T>
        auto Shuffle(std::vector<T>& seq) -> void
        {
            if (seq.size() < 2) return;
            for (std::size_t i = seq.size() - 1; i > 0; --i)
            {
                auto const j = static_cast<std::size_t>(Next() % (static_cast<std::uint64_t>(i) + 1));
                using std::swap;
                swap(seq[i], seq[j]);
            }
        }

        [[nodiscard]] auto Min() const noexcept -> std::uint32_t { return min_; }
        [[nodiscard]] auto Max() const noexcept -> std::uint32_t { return max_; }
        [[nodiscard]] auto Seed() const noexcept -> std::uint64_t { return seed_; }
        [[nodiscard]] auto StateWord() const noexcept -> std::uint64_t { return state_; }

        auto operator==(Dice const&) const -> bool = default;

    private:
        auto Next() -> std::uint64_t;

    private:
        std::uint32_t min_{constants::DiceMin};
        std::uint32_t max_{constants::DiceMax};
        std::uint64_t seed_{};
        std::uint64_t state_{};
    };
}

#endif //BOARDGAME_DICE_HPP
