//
// Bot.hpp
//

#ifndef BOARDGAME_BOT_HPP
#define BOARDGAME_BOT_HPP

#include <cstdint>
#include <optional>

#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace board::sim
{
    // A seat at the table as seen by the self-play driver.
    class Bot
    {
    public:
        virtual ~Bot() = default;

        // Coins brought to registration.
        virtual auto Deposit() -> std::uint64_t = 0;

        // Called once per betting round; nullopt sits the round out.
        virtual auto Bet(core::GameState const& view, core::Identity const& self)
            -> std::optional<core::PlaceBetAction> = 0;
    };
}
#endif //BOARDGAME_BOT_HPP
