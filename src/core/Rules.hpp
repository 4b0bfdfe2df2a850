//
// Rules.hpp
//

#ifndef BOARDGAME_RULES_HPP
#define BOARDGAME_RULES_HPP

#include "Actions.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace board::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants. Never mutates.
        virtual auto Validate(GameState const& state, ActionContext const& ctx,
                              GameAction const& a) const -> CheckResult = 0;

        // Mutate state and append events. Only called after Validate passed, on a
        // scratch copy, so a late failure here just discards the copy.
        virtual auto Apply(GameState& state, ActionContext const& ctx,
                           GameAction const& a, EventLog& events) -> CheckResult = 0;

        [[nodiscard]] virtual auto Cfg() const noexcept -> Config const& = 0;
    };
}

#endif //BOARDGAME_RULES_HPP
