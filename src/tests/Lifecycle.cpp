#include <gtest/gtest.h>

#include "TestTable.hpp"

using namespace board::core;
using namespace board::test;
using RVC = error::RuleViolationCode;

namespace
{
    auto CodeOf(ActionResult const& r) -> RVC
    {
        EXPECT_FALSE(r.has_value());
        return r.has_value() ? RVC::Internal_Unreachable : r.error().code;
    }

    auto Registered(Config cfg = {}) -> std::unique_ptr<Table>
    {
        auto t = std::make_unique<Table>(cfg);
        EXPECT_TRUE(t->Act(Backend, InitializeAction{.minigames = Minigames(), .random_seed = 3}).has_value());
        return t;
    }
}

// ---------- Initialize ----------

TEST(Initialize, OpensRegistration)
{
    Table t;
    auto const r = t.Act(Backend, InitializeAction{.minigames = Minigames(), .random_seed = 7});
    ASSERT_TRUE(r.has_value()) << error::describe(r.error());

    ASSERT_EQ(r->size(), 1u);
    auto const* ev = std::get_if<event::GameInitialized>(&r->front());
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->random_seed, 7u);

    EXPECT_TRUE(Is<phase::Registration>(t.S().phase));
    EXPECT_EQ(t.S().minigames, Minigames());
    EXPECT_EQ(t.S().dice.Seed(), 7u);
    EXPECT_EQ(t.S().round_started_at, T0);
    EXPECT_EQ(t.S().last_interaction_time, T0);
}

TEST(Initialize, EmptyMinigameListIsRejected)
{
    Table t;
    auto const r = t.Act(Backend, InitializeAction{.minigames = {}, .random_seed = 7});
    EXPECT_EQ(CodeOf(r), RVC::Initialize_NoMinigames);
    EXPECT_EQ(r.error().category(), error::Category::Range);
    EXPECT_TRUE(Is<phase::GameOver>(t.S().phase));
}

TEST(Initialize, OnlyFromGameOver)
{
    auto t = Registered();
    auto const r = t->Act(Backend, InitializeAction{.minigames = Minigames(), .random_seed = 8});
    EXPECT_EQ(CodeOf(r), RVC::InvalidTransition);
    EXPECT_EQ(r.error().category(), error::Category::PhaseMismatch);
    EXPECT_EQ(r.error().phase, "Registration");
    EXPECT_EQ(r.error().action, "Initialize");
}

// ---------- RegisterPlayer ----------

TEST(Register, AddsPlayerWithDeposit)
{
    auto t = Registered();
    auto const r = t->Act("p0", RegisterPlayerAction{.name = "alice", .deposit = 250});
    ASSERT_TRUE(r.has_value());

    auto const* ev = FirstEvent<event::PlayerRegistered>(*r);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->name, "alice");
    EXPECT_EQ(ev->player_id, "p0");

    ASSERT_EQ(t->S().players.size(), 1u);
    EXPECT_EQ(t->S().players[0].coins, 250);
    EXPECT_EQ(t->S().players[0].position, 0u);
    EXPECT_TRUE(t->S().IsRegistered("p0"));
}

TEST(Register, RejectsWhenFull)
{
    Config cfg{};
    cfg.max_players = 2;
    auto t = Registered(cfg);
    ASSERT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10}).has_value());
    ASSERT_TRUE(t->Act("p1", RegisterPlayerAction{.name = "b", .deposit = 10}).has_value());

    auto const r = t->Act("p2", RegisterPlayerAction{.name = "c", .deposit = 10});
    EXPECT_EQ(CodeOf(r), RVC::Register_GameFull);
    EXPECT_EQ(r.error().category(), error::Category::Capacity);
    EXPECT_EQ(r.error().limit, 2u);
}

TEST(Register, RejectsDuplicates)
{
    auto t = Registered();
    ASSERT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "alice", .deposit = 10}).has_value());

    EXPECT_EQ(CodeOf(t->Act("p0", RegisterPlayerAction{.name = "other", .deposit = 10})),
              RVC::Register_IdentityTaken);
    EXPECT_EQ(CodeOf(t->Act("p1", RegisterPlayerAction{.name = "alice", .deposit = 10})),
              RVC::Register_NameTaken);
    EXPECT_EQ(t->S().players.size(), 1u);
}

TEST(Register, DepositBounds)
{
    auto t = Registered();
    EXPECT_EQ(CodeOf(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = 0})), RVC::Register_ZeroDeposit);

    auto const big = t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = constants::MaxDeposit + 1});
    EXPECT_EQ(CodeOf(big), RVC::Register_DepositTooLarge);
    EXPECT_EQ(big.error().amount, constants::MaxDeposit + 1);
    EXPECT_EQ(big.error().limit, constants::MaxDeposit);

    EXPECT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = constants::MaxDeposit}).has_value());
}

TEST(Register, OutsideRegistrationIsPhaseMismatch)
{
    Table t;
    EXPECT_EQ(CodeOf(t.Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10})), RVC::InvalidTransition);
}

// ---------- StartGame ----------

TEST(StartGame, WaitsForRegistrationWindow)
{
    auto t = Registered();
    ASSERT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10}).has_value());
    ASSERT_TRUE(t->Act("p1", RegisterPlayerAction{.name = "b", .deposit = 10}).has_value());

    t->Later(std::chrono::milliseconds(54'999));
    auto const early = t->Act(Backend, StartGameAction{});
    EXPECT_EQ(CodeOf(early), RVC::Start_RegistrationOpen);
    EXPECT_EQ(early.error().category(), error::Category::Timing);

    t->Later(std::chrono::milliseconds(1));
    auto const r = t->Act(Backend, StartGameAction{});
    ASSERT_TRUE(r.has_value());

    auto const* ev = FirstEvent<event::GameStarted>(*r);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->player_count, 2u);
    EXPECT_TRUE(Is<phase::Betting>(t->S().phase));
    EXPECT_EQ(t->S().round, 0u);
    EXPECT_EQ(t->S().round_started_at, t->now);
}

TEST(StartGame, FullTableStartsImmediately)
{
    Config cfg{};
    cfg.max_players = 2;
    auto t = Registered(cfg);
    ASSERT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10}).has_value());
    ASSERT_TRUE(t->Act("p1", RegisterPlayerAction{.name = "b", .deposit = 10}).has_value());

    EXPECT_TRUE(t->Act(Backend, StartGameAction{}).has_value());
    EXPECT_TRUE(Is<phase::Betting>(t->S().phase));
}

// ---------- PlaceBet ----------

TEST(PlaceBet, RecordsBetAndMovesToWheelWhenAllIn)
{
    auto t = OpenTable(1, {100, 50});

    auto const r = t->Act("p0", PlaceBetAction{.amount = 10});
    ASSERT_TRUE(r.has_value());
    auto const* ev = FirstEvent<event::BetPlaced>(*r);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->player_id, "p0");
    EXPECT_EQ(ev->amount, 10u);
    EXPECT_EQ(t->S().bets.at("p0"), 10u);
    EXPECT_TRUE(Is<phase::Betting>(t->S().phase));

    ASSERT_TRUE(t->Act("p1", PlaceBetAction{.amount = 50}).has_value());
    EXPECT_TRUE(Is<phase::WheelSpin>(t->S().phase));
    // bets do not move coins by themselves
    EXPECT_EQ(t->Coins("p0"), 100);
    EXPECT_EQ(t->Coins("p1"), 50);
}

TEST(PlaceBet, Rejections)
{
    auto t = OpenTable(1, {100, 50});
    ASSERT_TRUE(t->Act("p0", PlaceBetAction{.amount = 10}).has_value());

    EXPECT_EQ(CodeOf(t->Act("p0", PlaceBetAction{.amount = 1})), RVC::Bet_AlreadyPlaced);
    EXPECT_EQ(CodeOf(t->Act("stranger", PlaceBetAction{.amount = 1})), RVC::Bet_UnknownPlayer);

    auto const over = t->Act("p1", PlaceBetAction{.amount = 51});
    EXPECT_EQ(CodeOf(over), RVC::Bet_InsufficientCoins);
    EXPECT_EQ(over.error().amount, 51u);
    EXPECT_EQ(over.error().limit, 50u);
}

TEST(PlaceBet, ZeroIsAValidBet)
{
    auto t = OpenTable(1, {100, 50});
    EXPECT_TRUE(t->Act("p0", PlaceBetAction{.amount = 0}).has_value());
    EXPECT_EQ(t->S().bets.at("p0"), 0u);
}

TEST(PlaceBet, WindowClosesAfterThirtySeconds)
{
    auto t = OpenTable(1, {100, 50});

    t->Later(std::chrono::seconds(30));
    EXPECT_TRUE(t->Act("p0", PlaceBetAction{.amount = 1}).has_value());

    t->Later(std::chrono::milliseconds(1));
    auto const late = t->Act("p1", PlaceBetAction{.amount = 1});
    EXPECT_EQ(CodeOf(late), RVC::Bet_WindowClosed);
    EXPECT_EQ(late.error().category(), error::Category::Timing);
}

// ---------- SpinWheel guards ----------

TEST(SpinWheel, BettingMustRunItsCourse)
{
    auto t = OpenTable(1, {100, 50});
    t->Later(std::chrono::milliseconds(29'999));
    EXPECT_EQ(CodeOf(t->Act(Backend, SpinWheelAction{})), RVC::Spin_BettingStillOpen);
}

TEST(SpinWheel, NotDuringRegistration)
{
    auto t = Registered();
    EXPECT_EQ(CodeOf(t->Act(Backend, SpinWheelAction{})), RVC::InvalidTransition);
}

// ---------- EndTurn / DistributeRewards ----------

TEST(EndTurn, AcceptedNowhere)
{
    Table t;
    EXPECT_EQ(CodeOf(t.Act(Backend, EndTurnAction{})), RVC::InvalidTransition);

    auto r = Registered();
    EXPECT_EQ(CodeOf(r->Act(Backend, EndTurnAction{})), RVC::InvalidTransition);

    auto b = OpenTable(1, {100, 50});
    EXPECT_EQ(CodeOf(b->Act("p0", EndTurnAction{})), RVC::InvalidTransition);
}

TEST(DistributeRewards, OnlyAfterAWinner)
{
    auto t = OpenTable(1, {100, 50});
    EXPECT_EQ(CodeOf(t->Act(Backend, DistributeRewardsAction{})), RVC::InvalidTransition);
}

// ---------- EndGame ----------

TEST(EndGame, AnyoneWhenAlreadyOver)
{
    Table t;
    auto const r = t.Act("stranger", EndGameAction{});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(Is<phase::GameOver>(t.S().phase));
}

TEST(EndGame, BackendAfterTwoMinutesOfSilence)
{
    auto t = Registered();
    ASSERT_TRUE(t->Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10}).has_value());

    t->Later(std::chrono::minutes(1));
    auto const stranger = t->Act("p0", EndGameAction{});
    EXPECT_EQ(CodeOf(stranger), RVC::EndGame_NotBackend);
    EXPECT_EQ(stranger.error().category(), error::Category::Authorization);

    t->Later(std::chrono::minutes(1));
    auto const early = t->Act(Backend, EndGameAction{});
    EXPECT_EQ(CodeOf(early), RVC::EndGame_TooEarly);
    EXPECT_EQ(early.error().elapsed_ms, 120'000u);

    t->Later(std::chrono::milliseconds(1));
    auto const r = t->Act(Backend, EndGameAction{});
    ASSERT_TRUE(r.has_value());

    auto const* ev = FirstEvent<event::GameEnded>(*r);
    ASSERT_NE(ev, nullptr);
    EXPECT_FALSE(ev->winner_id.has_value());
    EXPECT_EQ(ev->final_coins, 0);

    EXPECT_TRUE(Is<phase::GameOver>(t->S().phase));
    EXPECT_TRUE(t->S().players.empty());
    EXPECT_EQ(t->S().minigames, Minigames());
    EXPECT_EQ(t->S().backend_identity, Backend);
    EXPECT_EQ(t->S().last_interaction_time, t->now);
}

TEST(EndGame, AnyoneAfterTenMinutesOfSilence)
{
    auto t = OpenTable(1, {100, 50});
    t->Later(std::chrono::minutes(10));
    EXPECT_EQ(CodeOf(t->Act("p1", EndGameAction{})), RVC::EndGame_NotBackend);

    t->Later(std::chrono::milliseconds(1));
    EXPECT_TRUE(t->Act("p1", EndGameAction{}).has_value());
    EXPECT_TRUE(Is<phase::GameOver>(t->S().phase));
    EXPECT_TRUE(t->S().bets.empty());
}

TEST(EndGame, RejectedActionsDoNotResetTheIdleClock)
{
    auto t = OpenTable(1, {100, 50});
    TimestampMs const last = t->S().last_interaction_time;

    t->Later(std::chrono::minutes(3));
    EXPECT_FALSE(t->Act("p0", PlaceBetAction{.amount = 1}).has_value()); // window closed
    EXPECT_EQ(t->S().last_interaction_time, last);
    EXPECT_TRUE(t->Act(Backend, EndGameAction{}).has_value());
}

TEST(EndGame, ReplayAfterResetMatchesTheFirstGame)
{
    std::uint64_t const seed = SeedForOutcomes({1});
    Table t;

    auto const play = [&]() -> EventLog
    {
        EventLog log;
        auto const keep = [&](ActionResult const& r)
        {
            ASSERT_TRUE(r.has_value()) << error::describe(r.error());
            log.insert(log.end(), r->begin(), r->end());
        };

        keep(t.Act(Backend, InitializeAction{.minigames = Minigames(), .random_seed = seed}));
        std::vector<std::uint64_t> const deposits{100, 50, 30};
        for (std::size_t i{}; i < deposits.size(); ++i)
            keep(t.Act(PlayerId(i), RegisterPlayerAction{.name = "n" + std::to_string(i), .deposit = deposits[i]}));
        t.Later(t.cfg.registration_window);
        keep(t.Act(Backend, StartGameAction{}));

        std::vector<std::uint64_t> const bets{10, 20, 30};
        for (std::size_t i{}; i < bets.size(); ++i)
            keep(t.Act(PlayerId(i), PlaceBetAction{.amount = bets[i]}));
        keep(t.Act(Backend, SpinWheelAction{}));

        if (Is<phase::Betting>(t.S().phase))
        {
            for (std::size_t i{}; i < bets.size(); ++i)
            {
                if (t.Coins(PlayerId(i)) > 0)
                    keep(t.Act(PlayerId(i), PlaceBetAction{.amount = 1}));
            }
            keep(t.Act(Backend, SpinWheelAction{}));
        }
        return log;
    };

    EventLog const first = play();
    EXPECT_EQ(CountEvents<event::PlayersSwappedCoins>(first), 1u);
    EXPECT_GE(CountEvents<event::WheelSpun>(first), 1u);

    t.Later(std::chrono::minutes(2) + std::chrono::milliseconds(1));
    ASSERT_TRUE(t.Act(Backend, EndGameAction{}).has_value());
    EXPECT_TRUE(Is<phase::GameOver>(t.S().phase));
    EXPECT_TRUE(t.S().players.empty());
    EXPECT_EQ(t.S().dice.StateWord(), t.S().dice.Seed());

    EventLog const second = play();
    EXPECT_EQ(first, second);
}

TEST(EndGame, ResetCopesWithAnyConfiguredSeatCount)
{
    Config cfg;
    cfg.max_players = 0xFFFFFFFF;
    Table t{cfg};

    ASSERT_TRUE(t.Act(Backend, InitializeAction{.minigames = Minigames(), .random_seed = 9}).has_value());
    ASSERT_TRUE(t.Act("p0", RegisterPlayerAction{.name = "a", .deposit = 10}).has_value());
    t.Later(std::chrono::minutes(2) + std::chrono::milliseconds(1));

    auto const r = t.Act(Backend, EndGameAction{});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(t.S().players.empty());
    EXPECT_EQ(t.S().max_players, 0xFFFFFFFFu);
}

// ---------- configuration ----------

TEST(EngineConfig, DepositCapMustFitABalance)
{
    Config cfg;
    cfg.max_deposit = std::uint64_t{1} << 31;
    EXPECT_THROW(ClassicRules{cfg}, error::AssertionError);

    cfg.max_deposit = (std::uint64_t{1} << 31) - 1;
    EXPECT_NO_THROW(ClassicRules{cfg});
}

TEST(EngineConfig, EngineErrorsCarryTheirCode)
{
    try
    {
        BRD_THROW(error::Code::Io, "disk gone");
        FAIL() << "BRD_THROW returned";
    }
    catch (error::IoError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::Io);
    }
    EXPECT_THROW(BRD_THROW(error::Code::Rules, "bad rule"), error::RulesError);
}

// ---------- idempotency tokens ----------

TEST(Tokens, ReplayIsRejectedPerPlayer)
{
    auto t = OpenTable(1, {100, 50});
    Uuid const tok{9, 9};

    ASSERT_TRUE(t->game.Process("p0", tok, PlaceBetAction{.amount = 1}, t->now).has_value());
    GameState const after_bet = t->S();

    auto const replay = t->game.Process("p0", tok, EndGameAction{}, t->now);
    ASSERT_FALSE(replay.has_value());
    EXPECT_EQ(replay.error().code, RVC::ReplayedToken);
    EXPECT_EQ(replay.error().category(), error::Category::Duplicate);
    EXPECT_EQ(t->S(), after_bet);

    // the same value from someone else is fine
    EXPECT_TRUE(t->game.Process("p1", tok, PlaceBetAction{.amount = 1}, t->now).has_value());
}

TEST(Tokens, OnlySuccessfulActionsSpendTheToken)
{
    auto t = OpenTable(1, {100, 50});
    Uuid const tok{5, 5};

    EXPECT_FALSE(t->game.Process("p0", tok, PlaceBetAction{.amount = 101}, t->now).has_value());
    EXPECT_TRUE(t->game.Process("p0", tok, PlaceBetAction{.amount = 100}, t->now).has_value());
    EXPECT_EQ(t->S().FindPlayer("p0")->used_tokens, (std::vector<Uuid>{Uuid{0, 2}, tok}));
}

TEST(Tokens, RegistrationSpendsTheToken)
{
    auto t = Registered();
    Uuid const tok{7, 1};
    ASSERT_TRUE(t->game.Process("p0", tok, RegisterPlayerAction{.name = "a", .deposit = 10}, t->now).has_value());

    auto const again = t->game.Process("p0", tok, StartGameAction{}, t->now);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, RVC::ReplayedToken);
}

TEST(Tokens, CheckCanBeSwitchedOff)
{
    Config cfg{};
    cfg.enforce_tokens = false;
    auto t = OpenTable(1, {100, 50}, cfg);
    Uuid const tok{1, 1};

    ASSERT_TRUE(t->game.Process("p0", tok, PlaceBetAction{.amount = 1}, t->now).has_value());
    auto const r = t->game.Process("p0", tok, PlaceBetAction{.amount = 1}, t->now);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Bet_AlreadyPlaced);
    EXPECT_TRUE(t->S().FindPlayer("p0")->used_tokens.empty());
}

// ---------- atomicity ----------

TEST(Atomicity, RejectionsLeaveNoTrace)
{
    auto t = OpenTable(1, {100, 50});
    ASSERT_TRUE(t->Act("p0", PlaceBetAction{.amount = 10}).has_value());
    GameState const snapshot = t->S();

    t->Later(std::chrono::seconds(3));
    EXPECT_FALSE(t->Act("p0", PlaceBetAction{.amount = 10}).has_value());
    EXPECT_FALSE(t->Act("p1", PlaceBetAction{.amount = 500}).has_value());
    EXPECT_FALSE(t->Act(Backend, SpinWheelAction{}).has_value());
    EXPECT_FALSE(t->Act(Backend, StartMinigameAction{.minigame = "mg-1", .players = {}}).has_value());
    EXPECT_FALSE(t->Act("p1", EndGameAction{}).has_value());

    EXPECT_EQ(t->S(), snapshot);
}
