//
// RandomBot.cpp
//

#include "RandomBot.hpp"

namespace board::sim
{
    RandomBot::RandomBot(std::uint64_t rng_seed):
        rng_(rng_seed) {}

    using namespace board::core;

    auto RandomBot::Deposit() -> std::uint64_t
    {
        return std::uniform_int_distribution<std::uint64_t>{20, 500}(rng_);
    }

    auto RandomBot::Bet(GameState const& view, Identity const& self) -> std::optional<PlaceBetAction>
    {
        Player const* const me = view.FindPlayer(self);
        if (!me || me->coins <= 0 || view.bets.contains(self)) return std::nullopt;

        // sometimes sit the round out and eat the penalty
        if (chance(8)) return std::nullopt;

        auto const balance = static_cast<std::uint64_t>(me->coins);

        // and sometimes overbet, which the rules must refuse
        if (chance(20)) return PlaceBetAction{.amount = balance + 1};

        if (view.all_or_nothing) return PlaceBetAction{.amount = balance};

        return PlaceBetAction{.amount = std::uniform_int_distribution<std::uint64_t>{0, balance}(rng_)};
    }
}
