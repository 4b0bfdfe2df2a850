//
// AuditLogger.hpp
//

#ifndef BOARDGAME_AUDITLOGGER_HPP
#define BOARDGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace board::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, minigames, seat count)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // Before Process: phase/round/clock, caller and proposed action
        auto action(GameState const& s, ActionContext const& ctx, GameAction const& a) -> void;

        // After Process
        auto outcome(MoveOutcome m) -> void;
        auto rejected(error::RuleViolation const& v) -> void;
        auto events(EventLog const& log) -> void;

        // Footer: balances and winner ("-" if none)
        auto end(GameImpl const& game, std::optional<Identity> const& winner) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //BOARDGAME_AUDITLOGGER_HPP
