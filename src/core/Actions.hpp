//
// Actions.hpp
//

#ifndef BOARDGAME_ACTIONS_HPP
#define BOARDGAME_ACTIONS_HPP

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace board::core
{
    // What a minigame contract is handed at StartMinigame.
    struct MinigameSetupEntry
    {
        Identity player_id;
        std::string name;
        std::uint64_t amount{};

        auto operator==(MinigameSetupEntry const&) const -> bool = default;
    };
    using MinigameSetup = std::vector<MinigameSetupEntry>;

    // What it hands back at EndMinigame.
    struct PlayerMinigameResult
    {
        Identity player_id;
        std::int32_t coins_delta{};

        auto operator==(PlayerMinigameResult const&) const -> bool = default;
    };

    struct MinigameResult
    {
        ContractName contract_name;
        std::vector<PlayerMinigameResult> player_results;

        auto operator==(MinigameResult const&) const -> bool = default;
    };

    struct EndGameAction          {};
    struct InitializeAction       { std::vector<ContractName> minigames; std::uint64_t random_seed{}; };
    struct RegisterPlayerAction   { std::string name; std::uint64_t deposit{}; };
    struct StartGameAction        {};
    struct PlaceBetAction         { std::uint64_t amount{}; };
    struct SpinWheelAction        {};
    struct StartMinigameAction    { ContractName minigame; MinigameSetup players; };
    struct EndMinigameAction      { MinigameResult result; };
    // Part of the protocol, accepted by no phase.
    struct EndTurnAction          {};
    struct DistributeRewardsAction{};

    using GameAction = std::variant<
        EndGameAction, InitializeAction, RegisterPlayerAction, StartGameAction, PlaceBetAction,
        SpinWheelAction, StartMinigameAction, EndMinigameAction, EndTurnAction, DistributeRewardsAction>;

    namespace phase
    {
        struct Registration        { auto operator==(Registration const&) const -> bool = default; };
        struct Betting             { auto operator==(Betting const&) const -> bool = default; };
        struct WheelSpin           { auto operator==(WheelSpin const&) const -> bool = default; };
        struct StartMinigame       { ContractName minigame; auto operator==(StartMinigame const&) const -> bool = default; };
        struct InMinigame          { ContractName minigame; auto operator==(InMinigame const&) const -> bool = default; };
        struct FinalMinigame       { ContractName minigame; auto operator==(FinalMinigame const&) const -> bool = default; };
        struct RewardsDistribution { auto operator==(RewardsDistribution const&) const -> bool = default; };
        struct GameOver            { auto operator==(GameOver const&) const -> bool = default; };
    }

    // Index order is the wire order, do not reshuffle.
    using GamePhase = std::variant<
        phase::Registration, phase::Betting, phase::WheelSpin, phase::StartMinigame,
        phase::InMinigame, phase::FinalMinigame, phase::RewardsDistribution, phase::GameOver>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        RoundEnded,
        GameEnded
    };

    template <typename P>
    inline auto Is(GamePhase const& p) -> bool { return std::holds_alternative<P>(p); }

    inline auto PhaseName(GamePhase const& p) -> std::string_view
    {
        constexpr std::string_view names[] = {
            "Registration", "Betting", "WheelSpin", "StartMinigame",
            "InMinigame", "FinalMinigame", "RewardsDistribution", "GameOver"
        };
        return names[p.index()];
    }

    inline auto ActionName(GameAction const& a) -> std::string_view
    {
        constexpr std::string_view names[] = {
            "EndGame", "Initialize", "RegisterPlayer", "StartGame", "PlaceBet",
            "SpinWheel", "StartMinigame", "EndMinigame", "EndTurn", "DistributeRewards"
        };
        return names[a.index()];
    }

    // Minigame the phase refers to, empty for phases without one.
    inline auto PhaseMinigame(GamePhase const& p) -> std::string_view
    {
        if (auto const* s = std::get_if<phase::StartMinigame>(&p)) return s->minigame;
        if (auto const* i = std::get_if<phase::InMinigame>(&p)) return i->minigame;
        if (auto const* f = std::get_if<phase::FinalMinigame>(&p)) return f->minigame;
        return {};
    }
} // namespace board::core

#endif //BOARDGAME_ACTIONS_HPP
