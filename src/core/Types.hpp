//
// Types.hpp
//

#ifndef BOARDGAME_TYPES_HPP
#define BOARDGAME_TYPES_HPP

#define BRD_ENABLE_TEST_HOOKS true

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace board::core::constants
{
    inline constexpr std::size_t Rounds = 10;
    inline constexpr std::uint32_t MaxPlayers = 20;
    inline constexpr std::uint64_t MaxDeposit = 10'000'000;
    static_assert(MaxDeposit <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()),
                  "deposits are stored as int32 balances");
    inline constexpr std::int32_t MissedBetPenalty = 10;

    inline constexpr std::uint32_t DiceMin = 1;
    inline constexpr std::uint32_t DiceMax = 10;
    inline constexpr std::uint32_t WheelOutcomes = 5;
}

namespace board::core
{
    using Identity = std::string;
    using ContractName = std::string;
    // milliseconds, supplied by the ordering layer with every action
    using TimestampMs = std::uint64_t;

    struct Uuid
    {
        std::uint64_t hi{};
        std::uint64_t lo{};

        auto operator==(Uuid const&) const -> bool = default;
    };

    struct Config
    {
        std::uint32_t max_players{constants::MaxPlayers};
        std::uint64_t max_deposit{constants::MaxDeposit};
        std::int32_t  missed_bet_penalty{constants::MissedBetPenalty};
        std::chrono::milliseconds registration_window{std::chrono::seconds(55)};
        std::chrono::milliseconds betting_window{std::chrono::seconds(30)};
        // backend may force-end once idle longer than this
        std::chrono::milliseconds backend_end_timeout{std::chrono::minutes(2)};
        // anyone may force-end once idle longer than this
        std::chrono::milliseconds idle_end_timeout{std::chrono::minutes(10)};
        bool enforce_tokens{true};
    };

    // Everything about an action that is not the action itself.
    struct ActionContext
    {
        Identity caller;
        Uuid token{};
        TimestampMs timestamp{};
    };
}

#endif //BOARDGAME_TYPES_HPP
