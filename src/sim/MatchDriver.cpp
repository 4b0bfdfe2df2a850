//
// MatchDriver.cpp
//

#include "MatchDriver.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "RandomBot.hpp"
#include "../core/ClassicRules.hpp"
#include "../debug/Invariants.hpp"
#include "../harness/Execute.hpp"
#include "../wire/codec.hpp"

namespace
{
    using namespace board::core;

    auto SimGenesis(Config const& cfg) -> GameState
    {
        GameState s = GameState::New(board::sim::MatchDriver::Backend, cfg);
        s.lane_id = "sim-lane";
        return s;
    }

    auto Minigames() -> std::vector<ContractName>
    {
        return {"dice-duel", "coin-race", "high-card"};
    }
}

namespace board::sim
{
    using namespace board::core;

    MatchDriver::MatchDriver(MatchOptions opts) :
        opts_(std::move(opts)),
        cfg_(),
        game_(SimGenesis(cfg_), std::make_unique<ClassicRules>(cfg_)),
        contract_rng_(opts_.seed ^ 0x5DEECE66DULL)
    {
    }

    auto Classify(std::size_t const round_before, GameState const& after, ActionResult const& result) -> MoveOutcome
    {
        if (!result) return MoveOutcome::Invalid;

        bool const ended = std::ranges::any_of(*result, [](GameEvent const& e)
        {
            return std::holds_alternative<event::GameEnded>(e);
        });
        if (ended) return MoveOutcome::GameEnded;

        return after.round != round_before ? MoveOutcome::RoundEnded : MoveOutcome::Applied;
    }

    auto MatchDriver::Advance(std::chrono::milliseconds const d) -> void
    {
        now_ += static_cast<TimestampMs>(d.count());
    }

    auto MatchDriver::Step(Identity const& caller, GameAction const& action) -> ActionResult
    {
        ActionContext const ctx{.caller = caller, .token = Uuid{opts_.seed, ++next_token_}, .timestamp = now_};
        GameState const before = game_.State();

        if (audit_) audit_->action(before, ctx, action);

        ActionResult result = game_.Process(ctx, action);
        ++report_.actions;

        if (!result)
        {
            ++report_.rejected;
            if (audit_) audit_->rejected(result.error());
        }
        else
        {
            if (audit_) audit_->events(*result);

            for (GameEvent const& e : *result)
            {
                if (auto const* ended = std::get_if<event::GameEnded>(&e))
                {
                    report_.winner = ended->winner_id;
                    report_.winner_coins = ended->final_coins;
                }
            }
        }

        if (audit_) audit_->outcome(Classify(before.round, game_.State(), result));

        if (opts_.through_harness) CrossCheck(before, ctx, action, result);

        if (auto const ok = debug::CheckInvariants(game_.State()); !ok)
        {
            report_.invariant_failures.push_back(
                fmt::format("step {} ({}): {}", report_.actions, ActionName(action), ok.error()));
        }
        return result;
    }

    auto MatchDriver::CrossCheck(GameState const& before, ActionContext const& ctx,
                                 GameAction const& action, ActionResult const& direct) -> void
    {
        auto const mismatch = [&](std::string what)
        {
            report_.harness_mismatches.push_back(
                fmt::format("step {} ({}): {}", report_.actions, ActionName(action), std::move(what)));
        };

        auto const input = harness::MakeExecuteInput(before, ctx, action);
        auto const output = harness::Execute(wire::AsBytes(input));
        auto const decoded = harness::DecodeExecuteOutput(wire::AsBytes(output));
        if (!decoded)
        {
            mismatch(fmt::format("unreadable harness output: {}", decoded.error().message));
            return;
        }

        if (direct)
        {
            if (decoded->violation)
                mismatch(fmt::format("harness rejected: {}", decoded->violation->message));
            else if (!decoded->state || wire::EncodeState(*decoded->state) != wire::EncodeState(game_.State()))
                mismatch("state differs");
            else if (wire::EncodeEvents(decoded->events) != wire::EncodeEvents(*direct))
                mismatch("events differ");
            return;
        }

        if (!decoded->violation)
            mismatch("harness accepted an action the engine rejected");
        else if (decoded->violation->code != static_cast<std::uint16_t>(direct.error().code))
            mismatch(fmt::format("violation code {} vs {}", decoded->violation->code,
                                 static_cast<std::uint16_t>(direct.error().code)));
        else if (!decoded->state || wire::EncodeState(*decoded->state) != wire::EncodeState(before))
            mismatch("rejected action changed the state");
    }

    auto MatchDriver::PlayBettingRound() -> void
    {
        for (std::size_t i{}; i < bots_.size(); ++i)
        {
            if (!Is<phase::Betting>(game_.PhaseNow())) return;

            Advance(std::chrono::seconds(1));
            if (auto const bet = bots_[i]->Bet(game_.State(), seats_[i]))
            {
                (void)Step(seats_[i], *bet);
            }
        }

        // someone sat out: wait the window out and force the spin
        if (Is<phase::Betting>(game_.PhaseNow()))
        {
            Advance(cfg_.betting_window);
            (void)Step(Backend, SpinWheelAction{});
        }
    }

    auto MatchDriver::MockMinigameResult(ContractName const& minigame) -> MinigameResult
    {
        MinigameSetup const setup = game_.State().GetMinigameSetup();
        MinigameResult result{.contract_name = minigame, .player_results = {}};
        if (setup.empty()) return result;

        // zero-sum: one participant takes every other stake
        std::size_t const winner = std::uniform_int_distribution<std::size_t>{0, setup.size() - 1}(contract_rng_);
        std::int64_t pot{};
        for (std::size_t i{}; i < setup.size(); ++i)
        {
            if (i == winner) continue;
            auto const stake = static_cast<std::int32_t>(std::min<std::uint64_t>(setup[i].amount, constants::MaxDeposit));
            pot += stake;
            result.player_results.push_back(PlayerMinigameResult{.player_id = setup[i].player_id, .coins_delta = -stake});
        }
        result.player_results.push_back(PlayerMinigameResult{
            .player_id = setup[winner].player_id,
            .coins_delta = static_cast<std::int32_t>(std::min<std::int64_t>(pot, std::numeric_limits<std::int32_t>::max()))
        });
        return result;
    }

    auto MatchDriver::Run() -> MatchReport
    {
        if (!opts_.audit_path.empty())
        {
            audit_.emplace(opts_.audit_path);
            audit_->start(game_, opts_.seed);
        }

        for (std::size_t i{}; i < opts_.players; ++i)
        {
            bots_.push_back(std::make_unique<RandomBot>(opts_.seed * 1'000 + i + 1));
            seats_.push_back(fmt::format("player-{}", i));
        }

        (void)Step(Backend, InitializeAction{.minigames = Minigames(), .random_seed = opts_.seed});

        for (std::size_t i{}; i < bots_.size(); ++i)
        {
            Advance(std::chrono::seconds(1));
            (void)Step(seats_[i], RegisterPlayerAction{.name = fmt::format("bot{}", i), .deposit = bots_[i]->Deposit()});
        }

        if (game_.PlayerCount() < game_.State().max_players)
            Advance(cfg_.registration_window);
        (void)Step(Backend, StartGameAction{});

        while (report_.actions < opts_.max_steps)
        {
            GamePhase const ph = game_.PhaseNow();

            if (Is<phase::Betting>(ph))
            {
                PlayBettingRound();
            }
            else if (Is<phase::WheelSpin>(ph))
            {
                Advance(std::chrono::seconds(1));
                (void)Step(Backend, SpinWheelAction{});
            }
            else if (Is<phase::StartMinigame>(ph) || Is<phase::FinalMinigame>(ph))
            {
                Advance(std::chrono::seconds(1));
                (void)Step(Backend, StartMinigameAction{
                    .minigame = ContractName{PhaseMinigame(ph)},
                    .players = game_.State().GetMinigameSetup()
                });
            }
            else if (Is<phase::InMinigame>(ph))
            {
                Advance(std::chrono::seconds(5));
                ++report_.minigames;
                (void)Step(Backend, EndMinigameAction{.result = MockMinigameResult(ContractName{PhaseMinigame(ph)})});
            }
            else if (Is<phase::RewardsDistribution>(ph))
            {
                Advance(std::chrono::seconds(1));
                (void)Step(Backend, DistributeRewardsAction{});
                break;
            }
            else
            {
                break;
            }
        }

        report_.rounds = game_.Round() + 1;
        report_.final_phase = game_.PhaseNow();
        if (audit_) audit_->end(game_, report_.winner);
        return report_;
    }
}
