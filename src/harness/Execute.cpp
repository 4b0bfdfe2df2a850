//
// Execute.cpp
//
#include "Execute.hpp"

#include <memory>
#include <utility>

#include <fmt/format.h>

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"

namespace fbw = ::board::gen::wire;

namespace
{
    using namespace board::core;

    auto RejectInput(std::string const& why) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const msg = fbb.CreateString(fmt::format("[Serialization] {}", why));
        auto const viol = fbw::CreateViolation(fbb, fbw::ViolationCategory::Serialization,
                                               harness::ParseFailureCode, msg);
        auto const out = fbw::CreateExecuteOutput(fbb, /*state*/ {}, /*events*/ {}, viol);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::ExecuteOutput, out.Union());
        return wire::Finish(fbb, env);
    }

    auto Respond(GameState const& state, EventLog const& events,
                 std::optional<error::RuleViolation> const& violation) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const st = wire::WriteState(fbb, state);
        auto const ev = wire::WriteEvents(fbb, events);
        flatbuffers::Offset<fbw::Violation> viol{};
        if (violation) viol = wire::WriteViolation(fbb, *violation);

        auto const out = fbw::CreateExecuteOutput(fbb, st, ev, viol);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::ExecuteOutput, out.Union());
        return wire::Finish(fbb, env);
    }
}

namespace board::core::harness
{
    auto Execute(std::span<std::byte const> input) -> std::vector<std::uint8_t>
    {
        auto const env = wire::VerifiedEnvelope(input);
        if (!env)
            return RejectInput(env.error().message);

        if ((*env)->message_type() != fbw::Message::ExecuteInput)
            return RejectInput("not an ExecuteInput");

        auto const* in = (*env)->message_as_ExecuteInput();

        auto state = wire::ReadState(in->state());
        if (!state)
            return RejectInput(state.error().message);

        auto const decoded = wire::ReadActionMsg(in->action());
        if (!decoded)
            return RejectInput(decoded.error().message);

        if (state->players.size() > state->max_players)
        {
            return Respond(*state, {}, error::RuleViolation{.code = error::RuleViolationCode::Internal_SeatOverflow}
                                       .with_phase(state->phase)
                                       .with_amount(state->players.size()).with_limit(state->max_players));
        }

        // Everything but the seat count is fixed protocol.
        Config cfg{};
        cfg.max_players = state->max_players;

        GameState const before = *state;
        GameImpl game{std::move(*state), std::make_unique<ClassicRules>(cfg)};

        auto result = game.Process(decoded->ctx, decoded->action);
        if (!result)
            return Respond(before, {}, result.error());

        return Respond(std::move(game).TakeState(), *result, std::nullopt);
    }

    auto MakeGenesis(Identity backend, std::string lane_id, Config const& cfg) -> std::vector<std::uint8_t>
    {
        GameState s = GameState::New(std::move(backend), cfg);
        s.lane_id = std::move(lane_id);
        return wire::EncodeState(s);
    }

    auto MakeExecuteInput(GameState const& state, ActionContext const& ctx, GameAction const& action)
        -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const st = wire::WriteState(fbb, state);
        auto const msg = wire::WriteActionMsg(fbb, ctx, action);
        auto const in = fbw::CreateExecuteInput(fbb, st, msg);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::ExecuteInput, in.Union());
        return wire::Finish(fbb, env);
    }

    auto DecodeExecuteOutput(std::span<std::byte const> bytes) -> std::expected<ExecuteOutcome, wire::ParseError>
    {
        auto const env = wire::VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbw::Message::ExecuteOutput)
            return std::unexpected(wire::ParseError{"not an ExecuteOutput"});

        auto const* out = (*env)->message_as_ExecuteOutput();
        ExecuteOutcome outcome{};

        if (out->state())
        {
            auto st = wire::ReadState(out->state());
            if (!st)
                return std::unexpected(st.error());
            outcome.state = std::move(*st);
        }

        auto events = wire::ReadEvents(out->events());
        if (!events)
            return std::unexpected(events.error());
        outcome.events = std::move(*events);

        if (auto const* v = out->violation())
        {
            outcome.violation = WireViolation{
                .category = v->category(),
                .code = v->code(),
                .message = v->message() ? v->message()->str() : std::string{}
            };
        }
        return outcome;
    }
}
