//
// Invariants.hpp
//

#ifndef BOARDGAME_INVARIANTS_HPP
#define BOARDGAME_INVARIANTS_HPP

#include <algorithm>
#include <expected>
#include <string>
#include <unordered_set>

#include <fmt/format.h>

#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace board::core::debug
{
    // A second layer of checks over the stored state, run by the self-play drivers
    // after every step. Returns the first broken invariant.
    inline auto CheckInvariants(GameState const& s) -> std::expected<void, std::string>
    {
#if BRD_ENABLE_TEST_HOOKS == false
        (void)s;
        return {};
#else
        auto const broken = [](std::string why) { return std::unexpected(std::move(why)); };

        // 1) Seats
        if (s.players.size() > s.max_players)
            return broken(fmt::format("{} players for {} seats", s.players.size(), s.max_players));

        // 2) Unique identities and names, no negative balance
        {
            std::unordered_set<std::string> ids;
            std::unordered_set<std::string> names;
            for (Player const& p : s.players)
            {
                if (!ids.insert(p.id).second)
                    return broken(fmt::format("duplicate player id '{}'", p.id));
                if (!names.insert(p.name).second)
                    return broken(fmt::format("duplicate player name '{}'", p.name));
                if (p.coins < 0)
                    return broken(fmt::format("negative balance {} for '{}'", p.coins, p.id));
            }
        }

        // 3) Round counter
        if (s.round >= constants::Rounds)
            return broken(fmt::format("round {} out of range", s.round));

        // 4) Dice
        if (s.dice.Min() > s.dice.Max())
            return broken("empty dice range");

        // 5) Minigame phases point at a listed minigame
        if (auto const m = PhaseMinigame(s.phase); !m.empty())
        {
            if (std::ranges::none_of(s.minigames, [m](ContractName const& c) { return c == m; }))
                return broken(fmt::format("phase {} references unlisted minigame '{}'", PhaseName(s.phase), m));
        }
        else if (Is<phase::StartMinigame>(s.phase) || Is<phase::InMinigame>(s.phase)
                 || Is<phase::FinalMinigame>(s.phase))
        {
            return broken(fmt::format("phase {} without a minigame", PhaseName(s.phase)));
        }

        // 6) No bets outside a running game
        if ((Is<phase::Registration>(s.phase) || Is<phase::GameOver>(s.phase)) && !s.bets.empty())
            return broken(fmt::format("{} bet(s) in phase {}", s.bets.size(), PhaseName(s.phase)));

        // 7) While a round is live, every bet belongs to a solvent player and is covered
        if (!Is<phase::Registration>(s.phase) && !Is<phase::GameOver>(s.phase)
            && !Is<phase::RewardsDistribution>(s.phase))
        {
            for (auto const& [id, amount] : s.bets)
            {
                Player const* const p = s.FindPlayer(id);
                if (!p)
                    return broken(fmt::format("bet from unknown player '{}'", id));
                if (p->coins <= 0)
                    return broken(fmt::format("bet from eliminated player '{}'", id));
                if (amount > static_cast<std::uint64_t>(p->coins))
                    return broken(fmt::format("bet {} from '{}' exceeds balance {}", amount, id, p->coins));
            }
        }

        return {};
#endif // BRD_ENABLE_TEST_HOOKS == true
    }
}
#endif //BOARDGAME_INVARIANTS_HPP
