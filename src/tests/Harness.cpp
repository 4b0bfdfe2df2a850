#include <gtest/gtest.h>

#include "TestTable.hpp"
#include "../harness/Execute.hpp"
#include "../wire/codec.hpp"

using namespace board::core;
using namespace board::test;

namespace fbw = ::board::gen::wire;

namespace
{
    auto Genesis() -> GameState
    {
        auto const bytes = harness::MakeGenesis(Backend, "lane-1");
        auto s = wire::DecodeState(wire::AsBytes(bytes));
        EXPECT_TRUE(s.has_value());
        return s.value_or(GameState{});
    }

    auto Run(GameState const& s, Identity caller, GameAction const& a, TimestampMs ts = T0)
        -> harness::ExecuteOutcome
    {
        ActionContext const ctx{.caller = std::move(caller), .token = Uuid{1, ts}, .timestamp = ts};
        auto const out = harness::Execute(wire::AsBytes(harness::MakeExecuteInput(s, ctx, a)));
        auto decoded = harness::DecodeExecuteOutput(wire::AsBytes(out));
        EXPECT_TRUE(decoded.has_value());
        return decoded.value_or(harness::ExecuteOutcome{});
    }
}

TEST(Harness, GenesisIsAnIdleGame)
{
    GameState const s = Genesis();
    EXPECT_TRUE(Is<phase::GameOver>(s.phase));
    EXPECT_EQ(s.backend_identity, Backend);
    EXPECT_EQ(s.lane_id, "lane-1");
    EXPECT_TRUE(s.players.empty());
    EXPECT_EQ(s.max_players, constants::MaxPlayers);
}

TEST(Harness, AppliesAnAction)
{
    auto const out = Run(Genesis(), Backend, InitializeAction{.minigames = Minigames(), .random_seed = 11});
    EXPECT_FALSE(out.violation.has_value());
    ASSERT_TRUE(out.state.has_value());
    EXPECT_TRUE(Is<phase::Registration>(out.state->phase));
    EXPECT_EQ(out.state->lane_id, "lane-1");
    EXPECT_EQ(out.state->last_interaction_time, T0);
    EXPECT_EQ(out.events, (EventLog{event::GameInitialized{.random_seed = 11}}));
}

TEST(Harness, MatchesTheEngineStepForStep)
{
    auto t = OpenTable(5, {100, 50});
    GameState const before = t->S();

    auto const out = Run(before, "p0", PlaceBetAction{.amount = 40}, t->now + 1);
    auto const direct = t->game.Process("p0", Uuid{1, t->now + 1}, PlaceBetAction{.amount = 40}, t->now + 1);
    ASSERT_TRUE(direct.has_value());
    ASSERT_TRUE(out.state.has_value());
    EXPECT_EQ(*out.state, t->S());
    EXPECT_EQ(out.events, *direct);
}

TEST(Harness, ViolationKeepsState)
{
    GameState s = Genesis();
    s.last_interaction_time = 42;

    auto const out = Run(s, "p0", PlaceBetAction{.amount = 1});
    ASSERT_TRUE(out.violation.has_value());
    EXPECT_EQ(out.violation->category, fbw::ViolationCategory::PhaseMismatch);
    EXPECT_EQ(out.violation->code, static_cast<std::uint16_t>(error::RuleViolationCode::InvalidTransition));
    EXPECT_FALSE(out.violation->message.empty());

    ASSERT_TRUE(out.state.has_value());
    EXPECT_EQ(*out.state, s);
    EXPECT_TRUE(out.events.empty());
}

TEST(Harness, TooManyPlayersForTheSeats)
{
    auto t = OpenTable(5, {100, 50, 30});
    GameState s = t->S();
    s.max_players = 2;

    auto const out = Run(s, "p0", PlaceBetAction{.amount = 1}, t->now);
    ASSERT_TRUE(out.violation.has_value());
    EXPECT_EQ(out.violation->category, fbw::ViolationCategory::InvariantViolation);
    EXPECT_EQ(out.violation->code, static_cast<std::uint16_t>(error::RuleViolationCode::Internal_SeatOverflow));
    ASSERT_TRUE(out.state.has_value());
    EXPECT_EQ(*out.state, s);
}

TEST(Harness, UnreadableInput)
{
    std::vector<std::uint8_t> const junk{1, 2, 3, 4, 5, 6, 7, 8, 9};
    auto const out = harness::DecodeExecuteOutput(wire::AsBytes(harness::Execute(wire::AsBytes(junk))));
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out->violation.has_value());
    EXPECT_EQ(out->violation->category, fbw::ViolationCategory::Serialization);
    EXPECT_EQ(out->violation->code, harness::ParseFailureCode);
    EXPECT_FALSE(out->state.has_value());

    // a well-formed buffer of the wrong kind is just as unreadable
    auto const genesis = harness::MakeGenesis(Backend, "lane-1");
    auto const wrong = harness::DecodeExecuteOutput(wire::AsBytes(harness::Execute(wire::AsBytes(genesis))));
    ASSERT_TRUE(wrong.has_value());
    ASSERT_TRUE(wrong->violation.has_value());
    EXPECT_EQ(wrong->violation->category, fbw::ViolationCategory::Serialization);
}

TEST(Harness, SeatCountAboveTheCapIsUnreadable)
{
    GameState s = Genesis();
    s.max_players = 0xFFFFFFFF;

    for (GameAction const& a : {GameAction{InitializeAction{.minigames = Minigames(), .random_seed = 4}},
                                GameAction{EndGameAction{}}})
    {
        auto const out = Run(s, Backend, a);
        ASSERT_TRUE(out.violation.has_value());
        EXPECT_EQ(out.violation->category, fbw::ViolationCategory::Serialization);
        EXPECT_EQ(out.violation->code, harness::ParseFailureCode);
        EXPECT_FALSE(out.state.has_value());
        EXPECT_TRUE(out.events.empty());
    }

    s.max_players = constants::MaxPlayers;
    EXPECT_FALSE(Run(s, Backend, InitializeAction{.minigames = Minigames(), .random_seed = 4}).violation.has_value());
}

TEST(Harness, OutputIsDeterministic)
{
    auto t = OpenTable(9, {100, 50});
    ActionContext const ctx{.caller = "p1", .token = Uuid{3, 4}, .timestamp = t->now};
    auto const input = harness::MakeExecuteInput(t->S(), ctx, PlaceBetAction{.amount = 50});

    auto const a = harness::Execute(wire::AsBytes(input));
    auto const b = harness::Execute(wire::AsBytes(input));
    EXPECT_EQ(a, b);
}
