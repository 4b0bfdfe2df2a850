//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include "Settlement.hpp"
#include "Util.hpp"
#include <algorithm>
#include <limits>
#include <ranges>
#include <utility>

namespace
{
    inline auto Viol(board::core::error::RuleViolationCode code) -> board::core::error::RuleViolation
    {
        return board::core::error::RuleViolation{ .code = code };
    }
}

namespace board::core
{
    ClassicRules::ClassicRules(Config cfg) :
        cfg_(std::move(cfg))
    {
        // balances are int32, a deposit must fit one
        BRD_ASSERT(cfg_.max_deposit <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()),
                   "max_deposit does not fit a balance");
    }

    auto ClassicRules::Validate(GameState const& s, ActionContext const& ctx, GameAction const& a) const -> CheckResult
    {
        using RVC = ::board::core::error::RuleViolationCode;

        TimestampMs const now = ctx.timestamp;
        auto const mismatch = [&]()
        {
            return std::unexpected(Viol(RVC::InvalidTransition)
                                   .with_phase(s.phase).with_action(a).with_actor(ctx.caller));
        };

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            // Any phase
            if constexpr (std::is_same_v<T, EndGameAction>)
            {
                bool const is_ended = Is<phase::GameOver>(s.phase);
                bool const is_backend = ctx.caller == s.backend_identity;
                std::uint64_t const idle = util::Elapsed(s.last_interaction_time, now);
                bool const backend_timed_out = idle > util::WindowMs(cfg_.backend_end_timeout);
                bool const game_timed_out = idle > util::WindowMs(cfg_.idle_end_timeout);

                if (is_ended || (is_backend && backend_timed_out) || game_timed_out)
                    return {};

                if (is_backend)
                    return std::unexpected(Viol(RVC::EndGame_TooEarly)
                                           .with_phase(s.phase).with_actor(ctx.caller)
                                           .with_elapsed(idle).with_limit(util::WindowMs(cfg_.backend_end_timeout)));

                return std::unexpected(Viol(RVC::EndGame_NotBackend)
                                       .with_phase(s.phase).with_actor(ctx.caller)
                                       .with_elapsed(idle).with_limit(util::WindowMs(cfg_.idle_end_timeout)));
            }
            else if constexpr (std::is_same_v<T, InitializeAction>)
            {
                if (!Is<phase::GameOver>(s.phase))
                    return mismatch();

                if (act.minigames.empty())
                    return std::unexpected(Viol(RVC::Initialize_NoMinigames).with_actor(ctx.caller));

                return {};
            }
            else if constexpr (std::is_same_v<T, RegisterPlayerAction>)
            {
                if (!Is<phase::Registration>(s.phase))
                    return mismatch();

                if (s.players.size() >= s.max_players)
                    return std::unexpected(Viol(RVC::Register_GameFull)
                                           .with_actor(ctx.caller).with_limit(s.max_players));

                if (s.IsRegistered(ctx.caller))
                    return std::unexpected(Viol(RVC::Register_IdentityTaken).with_actor(ctx.caller));

                if (std::ranges::any_of(s.players, [&act](Player const& p) { return p.name == act.name; }))
                    return std::unexpected(Viol(RVC::Register_NameTaken)
                                           .with_actor(ctx.caller).with_detail(act.name));

                if (act.deposit == 0)
                    return std::unexpected(Viol(RVC::Register_ZeroDeposit).with_actor(ctx.caller));

                if (act.deposit > cfg_.max_deposit)
                    return std::unexpected(Viol(RVC::Register_DepositTooLarge)
                                           .with_actor(ctx.caller)
                                           .with_amount(act.deposit).with_limit(cfg_.max_deposit));

                return {};
            }
            else if constexpr (std::is_same_v<T, StartGameAction>)
            {
                if (!Is<phase::Registration>(s.phase))
                    return mismatch();

                bool const is_full = s.players.size() == s.max_players;
                std::uint64_t const elapsed = util::Elapsed(s.round_started_at, now);
                bool const registration_done = elapsed >= util::WindowMs(cfg_.registration_window);

                if (!is_full && !registration_done)
                    return std::unexpected(Viol(RVC::Start_RegistrationOpen)
                                           .with_actor(ctx.caller)
                                           .with_elapsed(elapsed).with_limit(util::WindowMs(cfg_.registration_window)));

                return {};
            }
            else if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                if (!Is<phase::Betting>(s.phase))
                    return mismatch();

                std::uint64_t const elapsed = util::Elapsed(s.round_started_at, now);
                if (elapsed > util::WindowMs(cfg_.betting_window))
                    return std::unexpected(Viol(RVC::Bet_WindowClosed)
                                           .with_actor(ctx.caller)
                                           .with_elapsed(elapsed).with_limit(util::WindowMs(cfg_.betting_window)));

                if (s.bets.contains(ctx.caller))
                    return std::unexpected(Viol(RVC::Bet_AlreadyPlaced).with_actor(ctx.caller));

                Player const* const player = s.FindPlayer(ctx.caller);
                if (!player)
                    return std::unexpected(Viol(RVC::Bet_UnknownPlayer).with_actor(ctx.caller));

                if (player->coins <= 0)
                    return std::unexpected(Viol(RVC::Bet_PlayerEliminated).with_actor(ctx.caller));

                auto const balance = static_cast<std::uint64_t>(player->coins);
                if (s.all_or_nothing)
                {
                    if (act.amount != balance)
                        return std::unexpected(Viol(RVC::Bet_MustBetAll)
                                               .with_actor(ctx.caller)
                                               .with_amount(act.amount).with_limit(balance));
                }
                else if (act.amount > balance)
                {
                    return std::unexpected(Viol(RVC::Bet_InsufficientCoins)
                                           .with_actor(ctx.caller)
                                           .with_amount(act.amount).with_limit(balance));
                }

                return {};
            }
            else if constexpr (std::is_same_v<T, SpinWheelAction>)
            {
                if (Is<phase::Betting>(s.phase))
                {
                    std::uint64_t const elapsed = util::Elapsed(s.round_started_at, now);
                    if (elapsed < util::WindowMs(cfg_.betting_window))
                        return std::unexpected(Viol(RVC::Spin_BettingStillOpen)
                                               .with_actor(ctx.caller)
                                               .with_elapsed(elapsed).with_limit(util::WindowMs(cfg_.betting_window)));
                    return {};
                }

                if (!Is<phase::WheelSpin>(s.phase))
                    return mismatch();

                return {};
            }
            else if constexpr (std::is_same_v<T, StartMinigameAction>)
            {
                ContractName const* expected = nullptr;
                if (auto const* sm = std::get_if<phase::StartMinigame>(&s.phase))
                    expected = &sm->minigame;
                else if (auto const* fm = std::get_if<phase::FinalMinigame>(&s.phase))
                    expected = &fm->minigame;
                else
                    return mismatch();

                if (act.minigame != *expected)
                    return std::unexpected(Viol(RVC::Minigame_WrongMinigame)
                                           .with_phase(s.phase).with_actor(ctx.caller)
                                           .with_detail(act.minigame));

                if (act.players != s.GetMinigameSetup())
                    return std::unexpected(Viol(RVC::Minigame_PlayersMismatch)
                                           .with_phase(s.phase).with_actor(ctx.caller)
                                           .with_amount(act.players.size()).with_limit(s.bets.size()));

                return {};
            }
            else if constexpr (std::is_same_v<T, EndMinigameAction>)
            {
                if (!Is<phase::InMinigame>(s.phase))
                    return mismatch();

                for (PlayerMinigameResult const& r : act.result.player_results)
                {
                    if (!s.FindPlayer(r.player_id))
                        return std::unexpected(Viol(RVC::Minigame_UnknownPlayer)
                                               .with_phase(s.phase).with_actor(r.player_id));
                }

                return {};
            }
            else if constexpr (std::is_same_v<T, DistributeRewardsAction>)
            {
                // Payouts themselves are settled outside the engine.
                if (!Is<phase::RewardsDistribution>(s.phase))
                    return mismatch();

                return {};
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return mismatch();
            }

            BRD_THROW(::board::core::error::Code::Unknown, "Unreachable variant in Validate");
        }, a);
    }

    auto ClassicRules::Apply(GameState& s, ActionContext const& ctx, GameAction const& a, EventLog& events)
        -> CheckResult
    {
        TimestampMs const now = ctx.timestamp;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, EndGameAction>)
                {
                    events.emplace_back(event::GameEnded{.winner_id = std::nullopt, .final_coins = 0});
                    s.Reset(s.minigames, s.dice.Seed(), cfg_);
                    return {};
                }
                else if constexpr (std::is_same_v<T, InitializeAction>)
                {
                    s.Reset(act.minigames, act.random_seed, cfg_);
                    // registration window runs from here
                    s.round_started_at = now;
                    s.phase = phase::Registration{};
                    events.emplace_back(event::GameInitialized{.random_seed = act.random_seed});
                    return {};
                }
                else if constexpr (std::is_same_v<T, RegisterPlayerAction>)
                {
                    s.players.push_back(Player{
                        .id = ctx.caller,
                        .name = act.name,
                        .position = 0,
                        .coins = static_cast<std::int32_t>(act.deposit),
                        .used_tokens = {}
                    });
                    events.emplace_back(event::PlayerRegistered{.name = act.name, .player_id = ctx.caller});
                    return {};
                }
                else if constexpr (std::is_same_v<T, StartGameAction>)
                {
                    s.phase = phase::Betting{};
                    s.round_started_at = now;
                    s.round = 0;
                    events.emplace_back(event::GameStarted{.player_count = s.players.size()});
                    return {};
                }
                else if constexpr (std::is_same_v<T, PlaceBetAction>)
                {
                    s.bets.insert_or_assign(ctx.caller, act.amount);
                    events.emplace_back(event::BetPlaced{.player_id = ctx.caller, .amount = act.amount});

                    // only players still holding coins owe a bet
                    if (s.bets.size() != s.ActivePlayerCount())
                        return {};

                    if (s.round >= constants::Rounds - 1)
                        return EnterFinalMinigame(s, events);

                    s.phase = phase::WheelSpin{};
                    return {};
                }
                else if constexpr (std::is_same_v<T, SpinWheelAction>)
                {
                    return SpinWheel(s, now, events);
                }
                else if constexpr (std::is_same_v<T, StartMinigameAction>)
                {
                    events.emplace_back(event::MinigameStarted{.minigame = act.minigame});
                    s.phase = phase::InMinigame{act.minigame};
                    return {};
                }
                else if constexpr (std::is_same_v<T, EndMinigameAction>)
                {
                    return EndMinigame(s, now, act.result, events);
                }
                else if constexpr (std::is_same_v<T, DistributeRewardsAction>)
                {
                    s.phase = phase::GameOver{};
                    return {};
                }
                else
                {
                    return std::unexpected(Viol(error::RuleViolationCode::Internal_Unreachable)
                                           .with_phase(s.phase).with_action(a));
                }
            }, a);
    }

    auto ClassicRules::SpinWheel(GameState& s, TimestampMs const now, EventLog& events) -> CheckResult
    {
        if (Is<phase::Betting>(s.phase))
        {
            PenalizeMissedBets(s, events);
        }
        s.all_or_nothing = false;

        if (CheckAndHandleGameOver(s, events))
            return {};

        // Last round ran out of time: no spin left, straight to the final minigame.
        if (s.round >= constants::Rounds - 1)
            return EnterFinalMinigame(s, events);

        std::uint32_t const outcome = s.dice.Roll() % constants::WheelOutcomes;
        events.emplace_back(event::WheelSpun{.round = s.round, .outcome = outcome});

        switch (outcome)
        {
        case 0:
            AdvanceRound(s, now);
            return {};
        case 1:
            if (auto const r = RedistributeBets(s, events); !r.has_value())
                return r;
            AdvanceRound(s, now);
            return {};
        case 2:
            s.all_or_nothing = true;
            events.emplace_back(event::AllOrNothingActivated{});
            AdvanceRound(s, now);
            return {};
        default:
            break;
        }

        if (s.minigames.empty())
            return std::unexpected(Viol(error::RuleViolationCode::Internal_NoMinigame).with_phase(s.phase));

        events.emplace_back(event::MinigameReady{.minigame = s.minigames.front()});
        s.phase = phase::StartMinigame{s.minigames.front()};
        return {};
    }

    auto ClassicRules::EndMinigame(GameState& s, TimestampMs const now, MinigameResult const& result,
                                   EventLog& events) -> CheckResult
    {
        for (PlayerMinigameResult const& r : result.player_results)
        {
            if (r.coins_delta == 0) continue;

            Player* const player = s.FindPlayer(r.player_id);
            if (!player)
                return std::unexpected(Viol(error::RuleViolationCode::Minigame_UnknownPlayer)
                                       .with_phase(s.phase).with_actor(r.player_id));

            UpdatePlayerCoins(*player, r.coins_delta, events);
        }

        if (CheckAndHandleGameOver(s, events))
            return {};

        events.emplace_back(event::MinigameEnded{.result = result});

        if (s.round < constants::Rounds - 1)
        {
            AdvanceRound(s, now);
            return {};
        }

        Player const* const winner = PickWinner(s.players);
        if (!winner)
            return std::unexpected(Viol(error::RuleViolationCode::Internal_NoPlayers).with_phase(s.phase));

        events.emplace_back(event::GameEnded{.winner_id = winner->id, .final_coins = winner->coins});
        s.phase = phase::RewardsDistribution{};
        return {};
    }

    auto ClassicRules::PenalizeMissedBets(GameState& s, EventLog& events) const -> void
    {
        // registration order
        for (Player& p : s.players)
        {
            if (p.coins <= 0 || s.bets.contains(p.id)) continue;

            if (s.round == 0 || s.all_or_nothing)
                UpdatePlayerCoins(p, -static_cast<std::int64_t>(p.coins), events);
            else
                UpdatePlayerCoins(p, -static_cast<std::int64_t>(cfg_.missed_bet_penalty), events);
        }
    }

    auto ClassicRules::RedistributeBets(GameState& s, EventLog& events) const -> CheckResult
    {
        std::vector<std::pair<Identity, std::uint64_t>> const entries(s.bets.begin(), s.bets.end());
        s.bets.clear();

        std::vector<std::size_t> recipients;
        recipients.reserve(s.players.size());
        for (std::size_t i{}; i < s.players.size(); ++i)
        {
            if (s.players[i].coins > 0) recipients.push_back(i);
        }
        s.dice.Shuffle(recipients);

        if (recipients.empty() && !entries.empty())
            return std::unexpected(Viol(error::RuleViolationCode::Internal_NoPlayers).with_phase(s.phase));

        event::PlayersSwappedCoins swapped{};
        swapped.swaps.reserve(entries.size());

        for (std::size_t i{}; i < entries.size(); ++i)
        {
            auto const& [bettor, amount] = entries[i];

            auto const bettor_idx = s.FindPlayerIndex(bettor);
            if (!bettor_idx)
                return std::unexpected(Viol(error::RuleViolationCode::Internal_UnknownBettor)
                                       .with_phase(s.phase).with_actor(bettor));

            UpdatePlayerCoins(s.players[*bettor_idx], -static_cast<std::int64_t>(amount), events);

            std::size_t const winner_idx = recipients[i % recipients.size()];
            UpdatePlayerCoins(s.players[winner_idx], static_cast<std::int64_t>(amount), events);

            swapped.swaps.emplace_back(bettor, s.players[winner_idx].id);
        }

        events.emplace_back(std::move(swapped));
        return {};
    }

    auto ClassicRules::EnterFinalMinigame(GameState& s, EventLog& events) -> CheckResult
    {
        if (s.minigames.empty())
            return std::unexpected(Viol(error::RuleViolationCode::Internal_NoMinigame).with_phase(s.phase));

        events.emplace_back(event::MinigameReady{.minigame = s.minigames.front()});
        s.phase = phase::FinalMinigame{s.minigames.front()};
        return {};
    }

    auto ClassicRules::AdvanceRound(GameState& s, TimestampMs const now) -> void
    {
        s.round += 1;
        s.bets.clear();
        s.round_started_at = now;
        s.phase = phase::Betting{};
    }
}
