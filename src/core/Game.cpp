//
// Game.cpp
//
#include "Game.hpp"

#include <utility>

namespace board::core
{
    GameImpl::GameImpl(GameState state, std::unique_ptr<Rules> rules) :
        rules_(std::move(rules)),
        state_(std::move(state))
    {
        BRD_ASSERT(rules_ != nullptr, "Invalid rules in core");
        BRD_ASSERT(state_.players.size() <= state_.max_players, "More players than seats while initalising core");
    }

    auto GameImpl::CheckToken(ActionContext const& ctx) const -> error::ValidateResult
    {
        if (!rules_->Cfg().enforce_tokens) return {};

        Player const* const p = state_.FindPlayer(ctx.caller);
        if (p && p->HasUsed(ctx.token))
        {
            return std::unexpected(error::RuleViolation{.code = error::RuleViolationCode::ReplayedToken}
                                   .with_phase(state_.phase).with_actor(ctx.caller));
        }
        return {};
    }

    auto GameImpl::RecordToken(GameState& next, ActionContext const& ctx) const -> void
    {
        if (!rules_->Cfg().enforce_tokens) return;

        // Resets drop the player list, nothing to record then.
        if (Player* const p = next.FindPlayer(ctx.caller))
        {
            p->used_tokens.push_back(ctx.token);
        }
    }

    auto GameImpl::Process(Identity const& caller, Uuid const token, GameAction const& action,
                           TimestampMs const timestamp) -> ActionResult
    {
        return Process(ActionContext{.caller = caller, .token = token, .timestamp = timestamp}, action);
    }

    auto GameImpl::Process(ActionContext const& ctx, GameAction const& action) -> ActionResult
    {
        if (auto const ok = CheckToken(ctx); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }

        if (auto const ok = rules_->Validate(state_, ctx, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }

        GameState next{state_};
        EventLog events;
        if (auto const ok = rules_->Apply(next, ctx, action, events); !ok.has_value())
        {
            error::RuleViolation v = ok.error();
            if (!v.action) v.with_action(action);
            return std::unexpected(std::move(v));
        }

        RecordToken(next, ctx);
        next.last_interaction_time = ctx.timestamp;

        state_ = std::move(next);
        return events;
    }
}
