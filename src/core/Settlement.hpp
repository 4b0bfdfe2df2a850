//
// Settlement.hpp
//

#ifndef BOARDGAME_SETTLEMENT_HPP
#define BOARDGAME_SETTLEMENT_HPP

#include <vector>

#include "Events.hpp"
#include "State.hpp"

namespace board::core
{
    // Run after any coin change. One player left with coins (out of several) wins and
    // the game moves to RewardsDistribution; nobody left with coins ends it in GameOver.
    // Either way the open bets are dropped.
    // Returns true when the game ended, the caller must stop its transition there.
    auto CheckAndHandleGameOver(GameState& state, EventLog& events) -> bool;

    // First player holding the highest balance, nullptr if there are none.
    auto PickWinner(std::vector<Player> const& players) -> Player const*;

    // Applies delta clamped at zero; emits CoinsChanged with what actually moved.
    auto UpdatePlayerCoins(Player& player, std::int64_t delta, EventLog& events) -> void;
}

#endif //BOARDGAME_SETTLEMENT_HPP
