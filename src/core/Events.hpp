//
// Events.hpp
//

#ifndef BOARDGAME_EVENTS_HPP
#define BOARDGAME_EVENTS_HPP

#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"

namespace board::core
{
    // Observational only, nothing reads these back into the state.
    namespace event
    {
        struct GameInitialized      { std::uint64_t random_seed{}; auto operator==(GameInitialized const&) const -> bool = default; };
        struct PlayerRegistered     { std::string name; Identity player_id; auto operator==(PlayerRegistered const&) const -> bool = default; };
        struct GameStarted          { std::size_t player_count{}; auto operator==(GameStarted const&) const -> bool = default; };
        struct BetPlaced            { Identity player_id; std::uint64_t amount{}; auto operator==(BetPlaced const&) const -> bool = default; };
        struct WheelSpun            { std::size_t round{}; std::uint32_t outcome{}; auto operator==(WheelSpun const&) const -> bool = default; };
        // amount is the applied (post-clamp) change
        struct CoinsChanged         { Identity player_id; std::int32_t amount{}; std::int32_t balance{}; auto operator==(CoinsChanged const&) const -> bool = default; };
        // (bettor, recipient) per redistributed bet
        struct PlayersSwappedCoins  { std::vector<std::pair<Identity, Identity>> swaps; auto operator==(PlayersSwappedCoins const&) const -> bool = default; };
        struct AllOrNothingActivated{ auto operator==(AllOrNothingActivated const&) const -> bool = default; };
        struct MinigameReady        { ContractName minigame; auto operator==(MinigameReady const&) const -> bool = default; };
        struct MinigameStarted      { ContractName minigame; auto operator==(MinigameStarted const&) const -> bool = default; };
        struct MinigameEnded        { MinigameResult result; auto operator==(MinigameEnded const&) const -> bool = default; };
        struct GameEnded            { std::optional<Identity> winner_id; std::int32_t final_coins{}; auto operator==(GameEnded const&) const -> bool = default; };
    }

    using GameEvent = std::variant<
        event::GameInitialized, event::PlayerRegistered, event::GameStarted, event::BetPlaced,
        event::WheelSpun, event::CoinsChanged, event::PlayersSwappedCoins, event::AllOrNothingActivated,
        event::MinigameReady, event::MinigameStarted, event::MinigameEnded, event::GameEnded>;

    using EventLog = std::vector<GameEvent>;

    inline auto EventName(GameEvent const& e) -> std::string_view
    {
        constexpr std::string_view names[] = {
            "GameInitialized", "PlayerRegistered", "GameStarted", "BetPlaced",
            "WheelSpun", "CoinsChanged", "PlayersSwappedCoins", "AllOrNothingActivated",
            "MinigameReady", "MinigameStarted", "MinigameEnded", "GameEnded"
        };
        return names[e.index()];
    }
}

#endif //BOARDGAME_EVENTS_HPP
