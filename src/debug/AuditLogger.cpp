#include "AuditLogger.hpp"

#include <string_view>
#include <vector>

#include <fmt/format.h>

using namespace board::core;

namespace
{

auto s_uuid(Uuid const& u) -> std::string
{
    return fmt::format("{:016x}{:016x}", u.hi, u.lo);
}

auto s_names(std::vector<ContractName> const& names) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < names.size(); ++i)
    {
        body += (i ? "," : "");
        body += names[i];
    }
    return body;
}

auto s_action(GameAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, InitializeAction>)
            {
                return fmt::format("Initialize[{}] seed={}", s_names(act.minigames), act.random_seed);
            }
            else if constexpr (std::is_same_v<T, RegisterPlayerAction>)
            {
                return fmt::format("RegisterPlayer({}, {})", act.name, act.deposit);
            }
            else if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                return fmt::format("PlaceBet({})", act.amount);
            }
            else if constexpr (std::is_same_v<T, StartMinigameAction>)
            {
                std::string body;
                for (std::size_t i{}; i < act.players.size(); ++i)
                {
                    body += (i ? "," : "");
                    body += fmt::format("{}:{}", act.players[i].player_id, act.players[i].amount);
                }
                return fmt::format("StartMinigame({})[{}]", act.minigame, body);
            }
            else if constexpr (std::is_same_v<T, EndMinigameAction>)
            {
                std::string body;
                for (std::size_t i{}; i < act.result.player_results.size(); ++i)
                {
                    auto const& r = act.result.player_results[i];
                    body += (i ? "," : "");
                    body += fmt::format("{}:{:+}", r.player_id, r.coins_delta);
                }
                return fmt::format("EndMinigame({})[{}]", act.result.contract_name, body);
            }
            else
            {
                return std::string{ActionName(a)};
            }
        },
        a
    );
}

auto s_event(GameEvent const& e) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, event::PlayerRegistered>)
            {
                return fmt::format("PlayerRegistered {} as {}", ev.player_id, ev.name);
            }
            else if constexpr (std::is_same_v<T, event::BetPlaced>)
            {
                return fmt::format("BetPlaced {} {}", ev.player_id, ev.amount);
            }
            else if constexpr (std::is_same_v<T, event::WheelSpun>)
            {
                return fmt::format("WheelSpun round={} outcome={}", ev.round, ev.outcome);
            }
            else if constexpr (std::is_same_v<T, event::CoinsChanged>)
            {
                return fmt::format("CoinsChanged {} {:+} -> {}", ev.player_id, ev.amount, ev.balance);
            }
            else if constexpr (std::is_same_v<T, event::PlayersSwappedCoins>)
            {
                std::string body;
                for (std::size_t i{}; i < ev.swaps.size(); ++i)
                {
                    body += (i ? "," : "");
                    body += fmt::format("{}>{}", ev.swaps[i].first, ev.swaps[i].second);
                }
                return fmt::format("PlayersSwappedCoins [{}]", body);
            }
            else if constexpr (std::is_same_v<T, event::GameEnded>)
            {
                return fmt::format("GameEnded winner={} coins={}", ev.winner_id.value_or("-"), ev.final_coins);
            }
            else
            {
                return std::string{EventName(e)};
            }
        },
        e
    );
}

} // anonymous namespace

namespace board::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, std::uint64_t seed) -> void
{
    GameState const& s = game.State();
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Lane={}\n", s.lane_id);
    out_ << fmt::format("Backend={}\n", s.backend_identity);
    out_ << fmt::format("Seats={}\n", s.max_players);
    out_.flush();
}

auto AuditLogger::action(GameState const& s, ActionContext const& ctx, GameAction const& a) -> void
{
    out_ << fmt::format(
        "Step t={} phase={} round={} players={} bets={} caller={} token={}\n",
        ctx.timestamp,
        PhaseName(s.phase),
        s.round,
        s.ActivePlayerCount(),
        s.bets.size(),
        ctx.caller,
        s_uuid(ctx.token)
    );

    out_ << fmt::format("Action: {}\n", s_action(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied    ? "Applied" :
        (m == MoveOutcome::RoundEnded ? "RoundEnded" :
        (m == MoveOutcome::GameEnded  ? "GameEnded" : "Invalid")));
    out_ << fmt::format("Outcome: {}\n", txt);
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << fmt::format("Rejected: {}\n", error::describe(v));
}

auto AuditLogger::events(EventLog const& log) -> void
{
    for (GameEvent const& e : log)
    {
        out_ << fmt::format("  Event: {}\n", s_event(e));
    }
}

auto AuditLogger::end(GameImpl const& game, std::optional<Identity> const& winner) -> void
{
    std::string body;
    GameState const& s = game.State();

    for (std::size_t i{}; i < s.players.size(); ++i)
    {
        body += fmt::format("{}{}:{}", (i ? "," : ""), s.players[i].id, s.players[i].coins);
    }

    out_ << fmt::format("Balances=[{}]\n", body);
    out_ << fmt::format("Winner={}\n", winner.value_or("-"));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace board::core::debug
