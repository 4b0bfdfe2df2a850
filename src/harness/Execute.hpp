//
// Execute.hpp
//

#ifndef BOARDGAME_EXECUTE_HPP
#define BOARDGAME_EXECUTE_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"
#include "../wire/codec.hpp"

namespace board::core::harness
{
    // Code used together with ViolationCategory::Serialization when the input could not be read.
    inline constexpr std::uint16_t ParseFailureCode = 0xFFFF;

    // Pure bytes-in/bytes-out step for the proving environment.
    //   in:  Envelope{ExecuteInput{state, action}}
    //   out: Envelope{ExecuteOutput{state, events, violation}}
    // A rejected action leaves the state untouched and sets violation; unreadable
    // input yields a Serialization violation and no state. Never throws for bad input.
    auto Execute(std::span<std::byte const> input) -> std::vector<std::uint8_t>;

    // StateBlob envelope of a freshly deployed game.
    auto MakeGenesis(Identity backend, std::string lane_id, Config const& cfg = {}) -> std::vector<std::uint8_t>;

    auto MakeExecuteInput(GameState const& state, ActionContext const& ctx, GameAction const& action)
        -> std::vector<std::uint8_t>;

    struct WireViolation
    {
        gen::wire::ViolationCategory category{};
        std::uint16_t code{};
        std::string message;
    };

    struct ExecuteOutcome
    {
        std::optional<GameState> state;
        EventLog events;
        std::optional<WireViolation> violation;
    };

    auto DecodeExecuteOutput(std::span<std::byte const> bytes) -> std::expected<ExecuteOutcome, wire::ParseError>;
}

#endif //BOARDGAME_EXECUTE_HPP
