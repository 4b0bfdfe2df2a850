//
// main.cpp — self-play runner
//
//   board_sim [--players N] [--seed S] [--games G] [--audit DIR] [--through-harness 0|1]
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>

#include <fmt/core.h>

#include "core/Exception.hpp"
#include "sim/MatchDriver.hpp"

namespace
{
    struct SimConfig
    {
        std::uint32_t n_players{4};
        std::uint64_t seed{123456789ULL};
        std::uint64_t games{1};
        std::string audit_dir;
        bool through_harness{false};
    };

    auto ParseArgs(int argc, char** argv) -> SimConfig
    {
        SimConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = v; }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_dir = argv[++i]; }
            }
            else if (arg == "--through-harness")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.through_harness = (v != 0); }
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace board;
    using namespace board::core;

    SimConfig const sc = ParseArgs(argc, argv);

    fmt::print("[board_sim] {} game(s), {} player(s), seed {}{}\n",
               sc.games, sc.n_players, sc.seed, sc.through_harness ? ", through harness" : "");

    if (!sc.audit_dir.empty())
        std::filesystem::create_directories(sc.audit_dir);

    int failures = 0;
    try
    {
        for (std::uint64_t g = 0; g < sc.games; ++g)
        {
            std::uint64_t const seed = sc.seed + g;

            sim::MatchOptions opts{};
            opts.players = sc.n_players;
            opts.seed = seed;
            opts.through_harness = sc.through_harness;
            if (!sc.audit_dir.empty())
                opts.audit_path = (std::filesystem::path(sc.audit_dir) / fmt::format("game_{}.log", seed)).string();

            sim::MatchDriver driver{opts};
            sim::MatchReport const r = driver.Run();

            fmt::print("[board_sim] seed {}: {} after round {}, winner {} ({} coins), {} action(s), {} rejected, {} minigame(s)\n",
                       seed, PhaseName(r.final_phase), r.rounds, r.winner.value_or("-"), r.winner_coins,
                       r.actions, r.rejected, r.minigames);

            for (std::string const& f : r.invariant_failures)
                fmt::print("  invariant: {}\n", f);
            for (std::string const& m : r.harness_mismatches)
                fmt::print("  harness: {}\n", m);

            failures += r.Clean() ? 0 : 1;
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print("{}", e);
        return 1;
    }

    return failures == 0 ? 0 : 1;
}
