//
// Settlement.cpp
//
#include "Settlement.hpp"

#include <algorithm>
#include <ranges>

#include "Util.hpp"

namespace board::core
{
    auto CheckAndHandleGameOver(GameState& state, EventLog& events) -> bool
    {
        std::size_t const with_coins = state.ActivePlayerCount();

        if (with_coins == 1 && state.players.size() > 1)
        {
            auto const it = std::ranges::find_if(state.players, [](Player const& p) { return p.coins > 0; });
            events.emplace_back(event::GameEnded{.winner_id = it->id, .final_coins = it->coins});
            state.phase = phase::RewardsDistribution{};
            state.bets.clear();
            return true;
        }
        if (with_coins == 0)
        {
            events.emplace_back(event::GameEnded{.winner_id = std::nullopt, .final_coins = 0});
            state.phase = phase::GameOver{};
            state.bets.clear();
            return true;
        }
        return false;
    }

    auto PickWinner(std::vector<Player> const& players) -> Player const*
    {
        Player const* best = nullptr;
        for (Player const& p : players)
        {
            // strict > keeps the earliest player on ties
            if (!best || p.coins > best->coins) best = &p;
        }
        return best;
    }

    auto UpdatePlayerCoins(Player& player, std::int64_t const delta, EventLog& events) -> void
    {
        std::int32_t const before = player.coins;
        player.coins = util::ClampedBalance(player.coins, delta);
        events.emplace_back(event::CoinsChanged{
            .player_id = player.id,
            .amount = player.coins - before,
            .balance = player.coins
        });
    }
}
