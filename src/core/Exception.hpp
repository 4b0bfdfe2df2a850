//
// Exception.hpp
//

#ifndef BOARDGAME_EXCEPTION_HPP
#define BOARDGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"
#include "Actions.hpp"

namespace board::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        Io, // harness/CLI file errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IoError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::Io: throw IoError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define BRD_THROW(code_enum, msg) ::board::core::error::fail((code_enum), (msg))
#define BRD_ASSERT(cond, msg) do { if(!(cond)) ::board::core::error::fail(::board::core::error::Code::Assertion, (msg)); } while(0)

    // What kind of rejection, independent of which action caused it.
    enum class Category : std::uint8_t
    {
        PhaseMismatch,
        Authorization,
        Capacity,
        Duplicate,
        Range,
        Timing,
        Consistency,
        InvariantViolation
    };

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        InvalidTransition,
        ReplayedToken,

        // EndGame
        EndGame_NotBackend,
        EndGame_TooEarly,

        // Initialize
        Initialize_NoMinigames,

        // RegisterPlayer
        Register_GameFull,
        Register_IdentityTaken,
        Register_NameTaken,
        Register_ZeroDeposit,
        Register_DepositTooLarge,

        // StartGame
        Start_RegistrationOpen,

        // PlaceBet
        Bet_WindowClosed,
        Bet_AlreadyPlaced,
        Bet_UnknownPlayer,
        Bet_PlayerEliminated,
        Bet_MustBetAll,
        Bet_InsufficientCoins,

        // SpinWheel
        Spin_BettingStillOpen,

        // Minigames
        Minigame_WrongMinigame,
        Minigame_PlayersMismatch,
        Minigame_UnknownPlayer,

        // Safety net
        Internal_NoMinigame,
        Internal_NoPlayers,
        Internal_UnknownBettor,
        Internal_SeatOverflow,
        Internal_Unreachable
    };

    inline auto category_of(RuleViolationCode c) -> Category
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::InvalidTransition: return Category::PhaseMismatch;
        case E::ReplayedToken: return Category::Duplicate;
        case E::EndGame_NotBackend: return Category::Authorization;
        case E::EndGame_TooEarly: return Category::Timing;
        case E::Initialize_NoMinigames: return Category::Range;
        case E::Register_GameFull: return Category::Capacity;
        case E::Register_IdentityTaken: return Category::Duplicate;
        case E::Register_NameTaken: return Category::Duplicate;
        case E::Register_ZeroDeposit: return Category::Range;
        case E::Register_DepositTooLarge: return Category::Range;
        case E::Start_RegistrationOpen: return Category::Timing;
        case E::Bet_WindowClosed: return Category::Timing;
        case E::Bet_AlreadyPlaced: return Category::Duplicate;
        case E::Bet_UnknownPlayer: return Category::Authorization;
        case E::Bet_PlayerEliminated: return Category::Authorization;
        case E::Bet_MustBetAll: return Category::Range;
        case E::Bet_InsufficientCoins: return Category::Range;
        case E::Spin_BettingStillOpen: return Category::Timing;
        case E::Minigame_WrongMinigame: return Category::Consistency;
        case E::Minigame_PlayersMismatch: return Category::Consistency;
        case E::Minigame_UnknownPlayer: return Category::Consistency;
        case E::Internal_NoMinigame: return Category::InvariantViolation;
        case E::Internal_NoPlayers: return Category::InvariantViolation;
        case E::Internal_UnknownBettor: return Category::InvariantViolation;
        case E::Internal_SeatOverflow: return Category::InvariantViolation;
        case E::Internal_Unreachable: return Category::InvariantViolation;
        }
        return Category::InvariantViolation;
    }

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<std::string_view> phase{};
        std::optional<std::string_view> action{};
        std::optional<Identity> actor{};

        // Small integers useful in error messages
        std::optional<std::uint64_t> amount{};
        std::optional<std::uint64_t> limit{};
        std::optional<std::uint64_t> elapsed_ms{};

        std::optional<std::string> detail{};

        [[nodiscard]] auto category() const -> Category { return category_of(code); }

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(GamePhase const& p) -> RuleViolation&
        {
            phase = PhaseName(p);
            return *this;
        }

        auto with_action(GameAction const& a) -> RuleViolation&
        {
            action = ActionName(a);
            return *this;
        }

        auto with_actor(Identity a) -> RuleViolation&
        {
            actor = std::move(a);
            return *this;
        }

        auto with_amount(std::uint64_t v) -> RuleViolation&
        {
            amount = v;
            return *this;
        }

        auto with_limit(std::uint64_t v) -> RuleViolation&
        {
            limit = v;
            return *this;
        }

        auto with_elapsed(std::uint64_t ms) -> RuleViolation&
        {
            elapsed_ms = ms;
            return *this;
        }

        auto with_detail(std::string d) -> RuleViolation&
        {
            detail = std::move(d);
            return *this;
        }
    };

    inline auto to_string(Category c) -> std::string_view
    {
        switch (c)
        {
        case Category::PhaseMismatch: return "PhaseMismatch";
        case Category::Authorization: return "AuthorizationError";
        case Category::Capacity: return "CapacityError";
        case Category::Duplicate: return "DuplicateError";
        case Category::Range: return "RangeError";
        case Category::Timing: return "TimingError";
        case Category::Consistency: return "ConsistencyError";
        case Category::InvariantViolation: return "InvariantViolation";
        }
        return "Unknown";
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::InvalidTransition: return "Action is not valid in the current phase";
        case E::ReplayedToken: return "Idempotency token already used by this player";

        case E::EndGame_NotBackend: return "EndGame: only the backend can end the game";
        case E::EndGame_TooEarly: return "EndGame: backend must wait for the idle timeout";

        case E::Initialize_NoMinigames: return "Initialize: minigames cannot be empty";

        case E::Register_GameFull: return "Register: game is full";
        case E::Register_IdentityTaken: return "Register: identity already registered";
        case E::Register_NameTaken: return "Register: name already taken";
        case E::Register_ZeroDeposit: return "Register: deposit must be greater than zero";
        case E::Register_DepositTooLarge: return "Register: deposit exceeds maximum allowed amount";

        case E::Start_RegistrationOpen: return "StartGame: game is not full and registration period is not over";

        case E::Bet_WindowClosed: return "PlaceBet: betting time is over";
        case E::Bet_AlreadyPlaced: return "PlaceBet: player has already placed a bet";
        case E::Bet_UnknownPlayer: return "PlaceBet: caller is not a player";
        case E::Bet_PlayerEliminated: return "PlaceBet: player is out of the game (no coins)";
        case E::Bet_MustBetAll: return "PlaceBet: all or nothing round, bet must equal full balance";
        case E::Bet_InsufficientCoins: return "PlaceBet: player does not have enough coins";

        case E::Spin_BettingStillOpen: return "SpinWheel: betting window has not elapsed";

        case E::Minigame_WrongMinigame: return "Minigame: minigame mismatch";
        case E::Minigame_PlayersMismatch: return "Minigame: players mismatch";
        case E::Minigame_UnknownPlayer: return "Minigame: result references unknown player";

        case E::Internal_NoMinigame: return "Internal: no minigame available";
        case E::Internal_NoPlayers: return "Internal: no players found";
        case E::Internal_UnknownBettor: return "Internal: bettor not found";
        case E::Internal_SeatOverflow: return "Internal: more players than seats";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("[{}] {}", to_string(v.category()), to_string(v.code));
        if (v.action) s += fmt::format(" | action={}", *v.action);
        if (v.phase) s += fmt::format(" | phase={}", *v.phase);
        if (v.actor) s += fmt::format(" | actor={}", *v.actor);
        if (v.amount) s += fmt::format(" | amount={}", *v.amount);
        if (v.limit) s += fmt::format(" | limit={}", *v.limit);
        if (v.elapsed_ms) s += fmt::format(" | elapsed={}ms", *v.elapsed_ms);
        if (v.detail) s += fmt::format(" | {}", *v.detail);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //BOARDGAME_EXCEPTION_HPP
