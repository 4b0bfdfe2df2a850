//
// Util.hpp
//

#ifndef BOARDGAME_UTIL_HPP
#define BOARDGAME_UTIL_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

#include "Types.hpp"

namespace board::core::util
{
    // Timestamps come from the caller and are not guaranteed monotonic.
    inline constexpr auto Elapsed(TimestampMs const from, TimestampMs const to) noexcept -> std::uint64_t
    {
        return to > from ? to - from : 0;
    }

    inline constexpr auto WindowMs(std::chrono::milliseconds const w) noexcept -> std::uint64_t
    {
        return w.count() > 0 ? static_cast<std::uint64_t>(w.count()) : 0;
    }

    // Balance after applying delta, floored at zero and capped at int32 max.
    inline constexpr auto ClampedBalance(std::int32_t const coins, std::int64_t const delta) noexcept -> std::int32_t
    {
        std::int64_t const raw = static_cast<std::int64_t>(coins) + delta;
        return static_cast<std::int32_t>(
            std::clamp<std::int64_t>(raw, 0, std::numeric_limits<std::int32_t>::max()));
    }
}

#endif //BOARDGAME_UTIL_HPP
