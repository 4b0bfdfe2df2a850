//
// Game.hpp
//

#ifndef BOARDGAME_GAME_HPP
#define BOARDGAME_GAME_HPP

#include <expected>
#include <memory>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Rules.hpp"

namespace board::core
{
    using ActionResult = std::expected<EventLog, error::RuleViolation>;

    class GameImpl
    {
    public:
        GameImpl() = delete;
        GameImpl(GameState state, std::unique_ptr<Rules> rules);

        // One state-machine step: validate/apply on a scratch copy, commit only on success.
        // On failure the stored state is left exactly as it was.
        auto Process(Identity const& caller, Uuid token, GameAction const& action,
                     TimestampMs timestamp) -> ActionResult;

        auto Process(ActionContext const& ctx, GameAction const& action) -> ActionResult;

        auto State() const noexcept -> GameState const& { return state_; }
        auto PhaseNow() const noexcept -> GamePhase const& { return state_.phase; }
        auto Round() const noexcept -> std::size_t { return state_.round; }
        auto PlayerCount() const noexcept -> size_t { return state_.players.size(); }
        auto RulesCfg() const noexcept -> Config const& { return rules_->Cfg(); }

        // Hands the state out (harness encodes it after the step).
        auto TakeState() && -> GameState { return std::move(state_); }

    private:
        auto CheckToken(ActionContext const& ctx) const -> error::ValidateResult;
        auto RecordToken(GameState& next, ActionContext const& ctx) const -> void;

    private:
        std::unique_ptr<Rules> rules_;
        GameState state_;
    };
}
#endif //BOARDGAME_GAME_HPP
