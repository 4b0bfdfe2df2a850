//
// ClassicRules.hpp
//

#ifndef BOARDGAME_CLASSICRULES_HPP
#define BOARDGAME_CLASSICRULES_HPP
#include "Rules.hpp"

namespace board::core
{
    // The (phase, action) table of the board game: registration, betting rounds,
    // the wheel, minigames and settlement.
    class ClassicRules final : public Rules
    {
    public:
        explicit ClassicRules(Config cfg = {});

        auto Validate(GameState const& state, ActionContext const& ctx,
                      GameAction const& a) const -> CheckResult override;
        auto Apply(GameState& state, ActionContext const& ctx,
                   GameAction const& a, EventLog& events) -> CheckResult override;
        [[nodiscard]] auto Cfg() const noexcept -> Config const& override { return cfg_; }

    private:
        auto SpinWheel(GameState& s, TimestampMs now, EventLog& events) -> CheckResult;
        auto EndMinigame(GameState& s, TimestampMs now, MinigameResult const& result,
                         EventLog& events) -> CheckResult;
        auto PenalizeMissedBets(GameState& s, EventLog& events) const -> void;
        auto RedistributeBets(GameState& s, EventLog& events) const -> CheckResult;
        static auto EnterFinalMinigame(GameState& s, EventLog& events) -> CheckResult;
        static auto AdvanceRound(GameState& s, TimestampMs now) -> void;

    private:
        Config cfg_;
    };
}

#endif //BOARDGAME_CLASSICRULES_HPP
