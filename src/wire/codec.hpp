//
// codec.hpp
//

#ifndef BOARDGAME_CODEC_HPP
#define BOARDGAME_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/board_wire_generated.h"

namespace board::core::wire
{
    struct ParseError
    {
        std::string message;
    };

    // What an ActionMsg decodes into
    struct DecodedAction
    {
        ActionContext ctx{};
        GameAction action{};
    };

    auto ToFbPhase(GamePhase const& p) noexcept -> gen::wire::Phase;
    auto ToFbCategory(error::Category c) noexcept -> gen::wire::ViolationCategory;

    // ----- table level (used inside larger envelopes, e.g. by the harness) -----

    auto WriteState(flatbuffers::FlatBufferBuilder& fbb, GameState const& s)
        -> flatbuffers::Offset<gen::wire::GameState>;
    auto ReadState(gen::wire::GameState const* fb) -> std::expected<GameState, ParseError>;

    auto WriteActionMsg(flatbuffers::FlatBufferBuilder& fbb, ActionContext const& ctx, GameAction const& a)
        -> flatbuffers::Offset<gen::wire::ActionMsg>;
    auto ReadActionMsg(gen::wire::ActionMsg const* fb) -> std::expected<DecodedAction, ParseError>;

    auto WriteEvents(flatbuffers::FlatBufferBuilder& fbb, EventLog const& events)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<gen::wire::EventEntry>>>;
    auto ReadEvents(flatbuffers::Vector<flatbuffers::Offset<gen::wire::EventEntry>> const* fb)
        -> std::expected<EventLog, ParseError>;

    auto WriteViolation(flatbuffers::FlatBufferBuilder& fbb, error::RuleViolation const& v)
        -> flatbuffers::Offset<gen::wire::Violation>;

    // ----- whole buffers (Envelope roots) -----

    // Canonical: equal states always produce identical bytes.
    auto EncodeState(GameState const& s) -> std::vector<std::uint8_t>;
    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<GameState, ParseError>;

    auto BuildActionMsg(ActionContext const& ctx, GameAction const& a) -> std::vector<std::uint8_t>;
    auto DecodeActionMsg(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>;

    auto EncodeEvents(EventLog const& events) -> std::vector<std::uint8_t>;
    auto DecodeEvents(std::span<std::byte const> bytes) -> std::expected<EventLog, ParseError>;

    // Runs the Verifier over the whole buffer before handing out the root.
    auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<gen::wire::Envelope const*, ParseError>;

    auto AsBytes(std::vector<std::uint8_t> const& v) noexcept -> std::span<std::byte const>;
    auto Finish(flatbuffers::FlatBufferBuilder& fbb,
                flatbuffers::Offset<gen::wire::Envelope> env) -> std::vector<std::uint8_t>;
} // namespace board::core::wire

#endif //BOARDGAME_CODEC_HPP
