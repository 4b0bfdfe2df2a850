//
// MatchDriver.hpp
//

#ifndef BOARDGAME_MATCHDRIVER_HPP
#define BOARDGAME_MATCHDRIVER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "Bot.hpp"
#include "../core/Game.hpp"
#include "../debug/AuditLogger.hpp"

namespace board::sim
{
    struct MatchOptions
    {
        std::size_t players{4};
        std::uint64_t seed{};
        // replay every action through harness::Execute and compare with direct processing
        bool through_harness{false};
        // transcript file, none when empty
        std::string audit_path;
        std::size_t max_steps{10'000};
    };

    struct MatchReport
    {
        std::optional<core::Identity> winner;
        std::int32_t winner_coins{};
        core::GamePhase final_phase{core::phase::GameOver{}};
        std::size_t rounds{};
        std::size_t actions{};
        std::size_t rejected{};
        std::size_t minigames{};
        std::vector<std::string> invariant_failures;
        std::vector<std::string> harness_mismatches;

        [[nodiscard]] auto Clean() const noexcept -> bool
        {
            return invariant_failures.empty() && harness_mismatches.empty();
        }
    };

    // Plays one complete game: the driver acts as backend and minigame contract,
    // RandomBots take the seats, a synthetic clock stands in for block time.
    class MatchDriver
    {
    public:
        explicit MatchDriver(MatchOptions opts);

        auto Run() -> MatchReport;

        static constexpr char const* Backend = "backend";
        static constexpr core::TimestampMs Epoch = 1'700'000'000'000ULL;

    private:
        auto Step(core::Identity const& caller, core::GameAction const& action) -> core::ActionResult;
        auto CrossCheck(core::GameState const& before, core::ActionContext const& ctx,
                        core::GameAction const& action, core::ActionResult const& direct) -> void;
        auto PlayBettingRound() -> void;
        auto MockMinigameResult(core::ContractName const& minigame) -> core::MinigameResult;
        auto Advance(std::chrono::milliseconds d) -> void;

    private:
        MatchOptions opts_;
        core::Config cfg_;
        core::GameImpl game_;
        std::vector<std::unique_ptr<Bot>> bots_;
        std::vector<core::Identity> seats_;
        std::mt19937_64 contract_rng_;
        std::optional<core::debug::AuditLogger> audit_;
        core::TimestampMs now_{Epoch};
        std::uint64_t next_token_{};
        MatchReport report_;
    };

    // What a step did, for transcripts.
    auto Classify(std::size_t round_before, core::GameState const& after,
                  core::ActionResult const& result) -> core::MoveOutcome;
}

#endif //BOARDGAME_MATCHDRIVER_HPP
