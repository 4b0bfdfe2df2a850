#include <gtest/gtest.h>
#include <filesystem>

#include <fmt/core.h>
#include <fmt/format.h>

#include "../sim/MatchDriver.hpp"

using namespace board;
using namespace board::core;

namespace
{
    auto PlayOne(std::uint64_t seed, std::size_t players, std::string audit = {}) -> sim::MatchReport
    {
        sim::MatchOptions opts{};
        opts.players = players;
        opts.seed = seed;
        opts.through_harness = true;
        opts.audit_path = std::move(audit);

        sim::MatchDriver driver{opts};
        return driver.Run();
    }

    auto Dump(sim::MatchReport const& r) -> std::string
    {
        std::string out;
        for (auto const& f : r.invariant_failures) out += fmt::format("invariant: {}\n", f);
        for (auto const& m : r.harness_mismatches) out += fmt::format("harness: {}\n", m);
        return out;
    }
}

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            auto const path = fs::path(fmt::format("_artifacts/game_{}.log", seed));
            sim::MatchReport const r = PlayOne(seed, 4, path.string());

            EXPECT_TRUE(r.Clean()) << Dump(r);
            EXPECT_TRUE(Is<phase::GameOver>(r.final_phase)) << PhaseName(r.final_phase);
            EXPECT_LE(r.rounds, constants::Rounds);
            EXPECT_GT(r.actions, 4u);

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        ADD_FAILURE() << fmt::format("{}", e);
    }
}

TEST(SelfPlay, SameSeedSameGame)
{
    sim::MatchReport const a = PlayOne(4242, 5);
    sim::MatchReport const b = PlayOne(4242, 5);
    EXPECT_EQ(a.winner, b.winner);
    EXPECT_EQ(a.winner_coins, b.winner_coins);
    EXPECT_EQ(a.actions, b.actions);
    EXPECT_EQ(a.rejected, b.rejected);
    EXPECT_EQ(a.rounds, b.rounds);
}

TEST(SelfPlay, FullTableManySeeds)
{
    for (std::uint64_t seed = 1; seed <= 10; ++seed)
    {
        sim::MatchReport const r = PlayOne(seed * 7919, constants::MaxPlayers);
        EXPECT_TRUE(r.Clean()) << "seed " << seed * 7919 << "\n" << Dump(r);
        EXPECT_TRUE(Is<phase::GameOver>(r.final_phase));
        if (r.winner)
            EXPECT_GT(r.winner_coins, 0);
    }
}
