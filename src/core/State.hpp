//
// State.hpp
//

#ifndef BOARDGAME_STATE_HPP
#define BOARDGAME_STATE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Actions.hpp"
#include "Dice.hpp"
#include "Types.hpp"

namespace board::core
{
    struct Player
    {
        Identity id;
        std::string name;
        std::size_t position{};
        // clamped at zero, a player with zero coins is out of play but stays listed
        std::int32_t coins{};
        std::vector<Uuid> used_tokens;

        [[nodiscard]] auto HasUsed(Uuid const& t) const -> bool;

        auto operator==(Player const&) const -> bool = default;
    };

    // Ordered by identity; that order is the manifest order and the payout order.
    using BetLedger = std::map<Identity, std::uint64_t>;

    // The whole authoritative game. Plain data, serialized as one blob.
    struct GameState
    {
        std::vector<Player> players;          // join order
        std::uint32_t max_players{constants::MaxPlayers};
        std::vector<ContractName> minigames;  // [0] is the next one offered
        Dice dice{};
        GamePhase phase{phase::GameOver{}};
        TimestampMs round_started_at{};
        std::size_t round{};
        BetLedger bets;
        bool all_or_nothing{false};

        Identity backend_identity;
        TimestampMs last_interaction_time{};
        std::string lane_id;

        static auto New(Identity backend, Config const& cfg = {}) -> GameState;

        // Clears the game, keeps backend_identity, last_interaction_time and lane_id.
        auto Reset(std::vector<ContractName> new_minigames, std::uint64_t seed, Config const& cfg) -> void;

        [[nodiscard]] auto IsRegistered(Identity const& id) const -> bool;
        [[nodiscard]] auto FindPlayer(Identity const& id) const -> Player const*;
        [[nodiscard]] auto FindPlayer(Identity const& id) -> Player*;
        [[nodiscard]] auto FindPlayerIndex(Identity const& id) const -> std::optional<std::size_t>;
        [[nodiscard]] auto ActivePlayerCount() const -> std::size_t;
        [[nodiscard]] auto GetMinigameSetup() const -> MinigameSetup;

        auto operator==(GameState const&) const -> bool = default;
    };
}

#endif //BOARDGAME_STATE_HPP
