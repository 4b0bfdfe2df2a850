//
// RandomBot.hpp
//

#ifndef BOARDGAME_RANDOMBOT_HPP
#define BOARDGAME_RANDOMBOT_HPP

#include <random>

#include "Bot.hpp"

namespace board::sim
{
    class RandomBot final : public Bot
    {
    public:
        explicit RandomBot(std::uint64_t rng_seed);

        auto Deposit() -> std::uint64_t override;
        auto Bet(core::GameState const& view, core::Identity const& self)
            -> std::optional<core::PlaceBetAction> override;

    private:
        auto chance(std::uint32_t one_in) -> bool
        {
            return std::uniform_int_distribution<std::uint32_t>{1, one_in}(rng_) == 1;
        }

    private:
        std::mt19937_64 rng_;
    };
}

#endif //BOARDGAME_RANDOMBOT_HPP
