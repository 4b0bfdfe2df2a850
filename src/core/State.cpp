//
// State.cpp
//
#include "State.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace board::core
{
    auto Player::HasUsed(Uuid const& t) const -> bool
    {
        return std::ranges::find(used_tokens, t) != std::end(used_tokens);
    }

    auto GameState::New(Identity backend, Config const& cfg) -> GameState
    {
        GameState s{};
        s.max_players = cfg.max_players;
        s.dice = Dice{constants::DiceMin, constants::DiceMax, 0};
        s.backend_identity = std::move(backend);
        return s;
    }

    auto GameState::Reset(std::vector<ContractName> new_minigames, std::uint64_t seed, Config const& cfg) -> void
    {
        players.clear();
        max_players = cfg.max_players;
        minigames = std::move(new_minigames);
        dice = Dice{constants::DiceMin, constants::DiceMax, seed};
        phase = phase::GameOver{};
        round_started_at = 0;
        round = 0;
        bets.clear();
        all_or_nothing = false;
    }

    auto GameState::IsRegistered(Identity const& id) const -> bool
    {
        return std::ranges::any_of(players, [&id](Player const& p) { return p.id == id && p.coins > 0; });
    }

    auto GameState::FindPlayer(Identity const& id) const -> Player const*
    {
        auto const it = std::ranges::find(players, id, &Player::id);
        return it != std::cend(players) ? &*it : nullptr;
    }

    auto GameState::FindPlayer(Identity const& id) -> Player*
    {
        auto const it = std::ranges::find(players, id, &Player::id);
        return it != std::end(players) ? &*it : nullptr;
    }

    auto GameState::FindPlayerIndex(Identity const& id) const -> std::optional<std::size_t>
    {
        auto const it = std::ranges::find(players, id, &Player::id);
        if (it == std::cend(players)) return std::nullopt;
        return static_cast<std::size_t>(std::distance(std::cbegin(players), it));
    }

    auto GameState::ActivePlayerCount() const -> std::size_t
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(players, [](Player const& p) { return p.coins > 0; }));
    }

    auto GameState::GetMinigameSetup() const -> MinigameSetup
    {
        MinigameSetup setup;
        setup.reserve(bets.size());
        for (auto const& [id, amount] : bets)
        {
            auto const it = std::ranges::find_if(players,
                                                 [&id](Player const& p) { return p.id == id && p.coins > 0; });
            if (it == std::cend(players)) continue;
            setup.push_back(MinigameSetupEntry{.player_id = it->id, .name = it->name, .amount = amount});
        }
        return setup;
    }
}
