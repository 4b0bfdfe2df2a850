//
// codec.cpp
//
#include "codec.hpp"

#include <cstring>
#include <type_traits>
#include <utility>
#include <variant>

namespace fbw = ::board::gen::wire;

namespace
{
    using namespace board::core;

    // Verify enum layouts (wire order must follow the variant order)
    static_assert(std::is_same_v<std::variant_alternative_t<0, GamePhase>, phase::Registration>);
    static_assert(std::is_same_v<std::variant_alternative_t<3, GamePhase>, phase::StartMinigame>);
    static_assert(std::is_same_v<std::variant_alternative_t<7, GamePhase>, phase::GameOver>);
    static_assert(static_cast<int>(fbw::Phase::Registration) == 0);
    static_assert(static_cast<int>(fbw::Phase::GameOver) == 7);
    static_assert(static_cast<int>(error::Category::InvariantViolation)
                  == static_cast<int>(fbw::ViolationCategory::InvariantViolation));

    constexpr std::uint16_t SchemaVersion = 1;

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    inline auto Unexpected(std::string msg) -> std::unexpected<wire::ParseError>
    {
        return std::unexpected(wire::ParseError{std::move(msg)});
    }

    auto FromFbPhase(fbw::Phase p, std::string minigame) -> std::expected<GamePhase, wire::ParseError>
    {
        switch (p)
        {
        case fbw::Phase::Registration: return phase::Registration{};
        case fbw::Phase::Betting: return phase::Betting{};
        case fbw::Phase::WheelSpin: return phase::WheelSpin{};
        case fbw::Phase::StartMinigame: return phase::StartMinigame{std::move(minigame)};
        case fbw::Phase::InMinigame: return phase::InMinigame{std::move(minigame)};
        case fbw::Phase::FinalMinigame: return phase::FinalMinigame{std::move(minigame)};
        case fbw::Phase::RewardsDistribution: return phase::RewardsDistribution{};
        case fbw::Phase::GameOver: return phase::GameOver{};
        }
        return Unexpected(fmt::format("unknown phase {}", static_cast<int>(p)));
    }

    auto ToFbToken(Uuid const& t) noexcept -> fbw::Token
    {
        return fbw::Token{t.hi, t.lo};
    }

    auto WriteMinigameResult(flatbuffers::FlatBufferBuilder& fbb, MinigameResult const& r)
        -> flatbuffers::Offset<fbw::MinigameResult>
    {
        std::vector<flatbuffers::Offset<fbw::PlayerResult>> results;
        results.reserve(r.player_results.size());
        for (PlayerMinigameResult const& pr : r.player_results)
        {
            results.push_back(fbw::CreatePlayerResult(fbb, fbb.CreateString(pr.player_id), pr.coins_delta));
        }
        auto const results_vec = fbb.CreateVector(results);
        return fbw::CreateMinigameResult(fbb, fbb.CreateString(r.contract_name), results_vec);
    }

    auto ReadMinigameResult(fbw::MinigameResult const* fb) -> MinigameResult
    {
        MinigameResult r{};
        if (!fb) return r;
        r.contract_name = Str(fb->contract_name());
        if (auto const* v = fb->player_results())
        {
            r.player_results.reserve(v->size());
            for (auto const* pr : *v)
            {
                r.player_results.push_back(PlayerMinigameResult{
                    .player_id = Str(pr->player_id()),
                    .coins_delta = pr->coins_delta()
                });
            }
        }
        return r;
    }

    auto ReadStrings(flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>> const* v)
        -> std::vector<std::string>
    {
        std::vector<std::string> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* s : *v) out.push_back(Str(s));
        return out;
    }
} // anonymous

namespace board::core::wire
{
    auto ToFbPhase(GamePhase const& p) noexcept -> fbw::Phase
    {
        return static_cast<fbw::Phase>(p.index());
    }

    auto ToFbCategory(error::Category c) noexcept -> fbw::ViolationCategory
    {
        return static_cast<fbw::ViolationCategory>(c);
    }

    auto AsBytes(std::vector<std::uint8_t> const& v) noexcept -> std::span<std::byte const>
    {
        return std::as_bytes(std::span<std::uint8_t const>{v});
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb,
                flatbuffers::Offset<fbw::Envelope> env) -> std::vector<std::uint8_t>
    {
        fbb.Finish(env);

        std::vector<std::uint8_t> out(fbb.GetSize());
        std::memcpy(out.data(), fbb.GetBufferPointer(), fbb.GetSize());
        return out;
    }

    auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fbw::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Unexpected("buffer too small");

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbw::VerifyEnvelopeBuffer(verifier))
            return Unexpected("buffer failed verification");

        auto const* env = fbw::GetEnvelope(data);
        if (!env)
            return Unexpected("bad root");
        return env;
    }

    // ---------- GameState ----------

    auto WriteState(flatbuffers::FlatBufferBuilder& fbb, GameState const& s)
        -> flatbuffers::Offset<fbw::GameState>
    {
        // Children first, always in the same order, every string written even when empty.
        std::vector<flatbuffers::Offset<fbw::Player>> players;
        players.reserve(s.players.size());
        for (Player const& p : s.players)
        {
            std::vector<fbw::Token> tokens;
            tokens.reserve(p.used_tokens.size());
            for (Uuid const& t : p.used_tokens) tokens.push_back(ToFbToken(t));

            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.name);
            auto const tok_vec = fbb.CreateVectorOfStructs(tokens);
            players.push_back(fbw::CreatePlayer(fbb, id, name, p.position, p.coins, tok_vec));
        }
        auto const players_vec = fbb.CreateVector(players);

        auto const minigames_vec = fbb.CreateVectorOfStrings(s.minigames);
        auto const phase_minigame = fbb.CreateString(std::string{PhaseMinigame(s.phase)});

        std::vector<flatbuffers::Offset<fbw::Bet>> bets;
        bets.reserve(s.bets.size());
        for (auto const& [id, amount] : s.bets)
        {
            bets.push_back(fbw::CreateBet(fbb, fbb.CreateString(id), amount));
        }
        auto const bets_vec = fbb.CreateVector(bets);

        auto const backend = fbb.CreateString(s.backend_identity);
        auto const lane = fbb.CreateString(s.lane_id);

        fbw::DiceState const dice{s.dice.Min(), s.dice.Max(), s.dice.Seed(), s.dice.StateWord()};

        return fbw::CreateGameState(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*players*/ players_vec,
            /*max_players*/ s.max_players,
            /*minigames*/ minigames_vec,
            /*dice*/ &dice,
            /*phase*/ ToFbPhase(s.phase),
            /*phase_minigame*/ phase_minigame,
            /*round_started_at*/ s.round_started_at,
            /*round*/ static_cast<std::uint32_t>(s.round),
            /*bets*/ bets_vec,
            /*all_or_nothing*/ s.all_or_nothing,
            /*backend_identity*/ backend,
            /*last_interaction_time*/ s.last_interaction_time,
            /*lane_id*/ lane);
    }

    auto ReadState(fbw::GameState const* fb) -> std::expected<GameState, ParseError>
    {
        if (!fb)
            return Unexpected("missing state");

        if (fb->schema_version() != SchemaVersion)
            return Unexpected(fmt::format("unsupported schema version {}", fb->schema_version()));

        GameState s{};

        if (auto const* v = fb->players())
        {
            s.players.reserve(v->size());
            for (auto const* p : *v)
            {
                if (p->coins() < 0)
                    return Unexpected(fmt::format("negative balance for player '{}'", Str(p->id())));

                Player player{
                    .id = Str(p->id()),
                    .name = Str(p->name()),
                    .position = static_cast<std::size_t>(p->position()),
                    .coins = p->coins(),
                    .used_tokens = {}
                };
                if (auto const* tv = p->used_tokens())
                {
                    player.used_tokens.reserve(tv->size());
                    for (auto const* t : *tv) player.used_tokens.push_back(Uuid{t->hi(), t->lo()});
                }
                s.players.push_back(std::move(player));
            }
        }

        if (fb->max_players() > constants::MaxPlayers)
            return Unexpected(fmt::format("max_players {} above the cap of {}", fb->max_players(), constants::MaxPlayers));
        s.max_players = fb->max_players();
        s.minigames = ReadStrings(fb->minigames());

        auto const* dice = fb->dice();
        if (!dice)
            return Unexpected("missing dice");
        if (dice->min_value() > dice->max_value())
            return Unexpected(fmt::format("empty dice range [{}, {}]", dice->min_value(), dice->max_value()));
        s.dice = Dice::Restore(dice->min_value(), dice->max_value(), dice->seed(), dice->state());

        auto ph = FromFbPhase(fb->phase(), Str(fb->phase_minigame()));
        if (!ph)
            return std::unexpected(ph.error());
        s.phase = std::move(*ph);

        s.round_started_at = fb->round_started_at();
        s.round = fb->round();

        if (auto const* v = fb->bets())
        {
            for (auto const* b : *v)
            {
                auto const [it, inserted] = s.bets.emplace(Str(b->player_id()), b->amount());
                if (!inserted)
                    return Unexpected(fmt::format("duplicate bet for '{}'", it->first));
            }
        }

        s.all_or_nothing = fb->all_or_nothing();
        s.backend_identity = Str(fb->backend_identity());
        s.last_interaction_time = fb->last_interaction_time();
        s.lane_id = Str(fb->lane_id());
        return s;
    }

    auto EncodeState(GameState const& s) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const st = WriteState(fbb, s);
        auto const blob = fbw::CreateStateBlob(fbb, st);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::StateBlob, blob.Union());
        return Finish(fbb, env);
    }

    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<GameState, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbw::Message::StateBlob)
            return Unexpected("not a StateBlob");

        return ReadState((*env)->message_as_StateBlob()->state());
    }

    // ---------- Actions ----------

    auto WriteActionMsg(flatbuffers::FlatBufferBuilder& fbb, ActionContext const& ctx, GameAction const& a)
        -> flatbuffers::Offset<fbw::ActionMsg>
    {
        auto const [type, body] = std::visit([&]<typename T0>(T0 const& act)
            -> std::pair<fbw::Action, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, EndGameAction>)
            {
                return {fbw::Action::Action_EndGame, fbw::CreateAction_EndGame(fbb).Union()};
            }
            else if constexpr (std::is_same_v<T, InitializeAction>)
            {
                auto const names = fbb.CreateVectorOfStrings(act.minigames);
                return {fbw::Action::Action_Initialize,
                        fbw::CreateAction_Initialize(fbb, names, act.random_seed).Union()};
            }
            else if constexpr (std::is_same_v<T, RegisterPlayerAction>)
            {
                auto const name = fbb.CreateString(act.name);
                return {fbw::Action::Action_RegisterPlayer,
                        fbw::CreateAction_RegisterPlayer(fbb, name, act.deposit).Union()};
            }
            else if constexpr (std::is_same_v<T, StartGameAction>)
            {
                return {fbw::Action::Action_StartGame, fbw::CreateAction_StartGame(fbb).Union()};
            }
            else if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                return {fbw::Action::Action_PlaceBet, fbw::CreateAction_PlaceBet(fbb, act.amount).Union()};
            }
            else if constexpr (std::is_same_v<T, SpinWheelAction>)
            {
                return {fbw::Action::Action_SpinWheel, fbw::CreateAction_SpinWheel(fbb).Union()};
            }
            else if constexpr (std::is_same_v<T, StartMinigameAction>)
            {
                std::vector<flatbuffers::Offset<fbw::SetupEntry>> entries;
                entries.reserve(act.players.size());
                for (MinigameSetupEntry const& e : act.players)
                {
                    auto const id = fbb.CreateString(e.player_id);
                    auto const name = fbb.CreateString(e.name);
                    entries.push_back(fbw::CreateSetupEntry(fbb, id, name, e.amount));
                }
                auto const entries_vec = fbb.CreateVector(entries);
                auto const minigame = fbb.CreateString(act.minigame);
                return {fbw::Action::Action_StartMinigame,
                        fbw::CreateAction_StartMinigame(fbb, minigame, entries_vec).Union()};
            }
            else if constexpr (std::is_same_v<T, EndMinigameAction>)
            {
                auto const result = WriteMinigameResult(fbb, act.result);
                return {fbw::Action::Action_EndMinigame, fbw::CreateAction_EndMinigame(fbb, result).Union()};
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return {fbw::Action::Action_EndTurn, fbw::CreateAction_EndTurn(fbb).Union()};
            }
            else
            {
                static_assert(std::is_same_v<T, DistributeRewardsAction>);
                return {fbw::Action::Action_DistributeRewards, fbw::CreateAction_DistributeRewards(fbb).Union()};
            }
        }, a);

        auto const caller = fbb.CreateString(ctx.caller);
        fbw::Token const token = ToFbToken(ctx.token);
        return fbw::CreateActionMsg(fbb, caller, &token, ctx.timestamp, type, body);
    }

    auto ReadActionMsg(fbw::ActionMsg const* fb) -> std::expected<DecodedAction, ParseError>
    {
        if (!fb)
            return Unexpected("missing action message");

        DecodedAction out{};
        out.ctx.caller = Str(fb->caller());
        if (auto const* t = fb->token()) out.ctx.token = Uuid{t->hi(), t->lo()};
        out.ctx.timestamp = fb->timestamp();

        switch (fb->action_type())
        {
        case fbw::Action::Action_EndGame:
            out.action = EndGameAction{};
            return out;

        case fbw::Action::Action_Initialize:
        {
            auto const* a = fb->action_as_Action_Initialize();
            out.action = InitializeAction{.minigames = ReadStrings(a->minigames()), .random_seed = a->random_seed()};
            return out;
        }

        case fbw::Action::Action_RegisterPlayer:
        {
            auto const* a = fb->action_as_Action_RegisterPlayer();
            out.action = RegisterPlayerAction{.name = Str(a->name()), .deposit = a->deposit()};
            return out;
        }

        case fbw::Action::Action_StartGame:
            out.action = StartGameAction{};
            return out;

        case fbw::Action::Action_PlaceBet:
            out.action = PlaceBetAction{.amount = fb->action_as_Action_PlaceBet()->amount()};
            return out;

        case fbw::Action::Action_SpinWheel:
            out.action = SpinWheelAction{};
            return out;

        case fbw::Action::Action_StartMinigame:
        {
            auto const* a = fb->action_as_Action_StartMinigame();
            StartMinigameAction act{.minigame = Str(a->minigame()), .players = {}};
            if (auto const* v = a->players())
            {
                act.players.reserve(v->size());
                for (auto const* e : *v)
                {
                    act.players.push_back(MinigameSetupEntry{
                        .player_id = Str(e->player_id()),
                        .name = Str(e->name()),
                        .amount = e->amount()
                    });
                }
            }
            out.action = std::move(act);
            return out;
        }

        case fbw::Action::Action_EndMinigame:
            out.action = EndMinigameAction{.result = ReadMinigameResult(fb->action_as_Action_EndMinigame()->result())};
            return out;

        case fbw::Action::Action_EndTurn:
            out.action = EndTurnAction{};
            return out;

        case fbw::Action::Action_DistributeRewards:
            out.action = DistributeRewardsAction{};
            return out;

        default:
            return Unexpected("unknown action variant");
        }
    }

    auto BuildActionMsg(ActionContext const& ctx, GameAction const& a) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const msg = WriteActionMsg(fbb, ctx, a);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::ActionMsg, msg.Union());
        return Finish(fbb, env);
    }

    auto DecodeActionMsg(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbw::Message::ActionMsg)
            return Unexpected("not an ActionMsg");

        return ReadActionMsg((*env)->message_as_ActionMsg());
    }

    // ---------- Events ----------

    auto WriteEvents(flatbuffers::FlatBufferBuilder& fbb, EventLog const& events)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fbw::EventEntry>>>
    {
        std::vector<flatbuffers::Offset<fbw::EventEntry>> entries;
        entries.reserve(events.size());

        for (GameEvent const& ev : events)
        {
            auto const [type, body] = std::visit([&]<typename T0>(T0 const& e)
                -> std::pair<fbw::Event, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, event::GameInitialized>)
                {
                    return {fbw::Event::Event_GameInitialized,
                            fbw::CreateEvent_GameInitialized(fbb, e.random_seed).Union()};
                }
                else if constexpr (std::is_same_v<T, event::PlayerRegistered>)
                {
                    auto const name = fbb.CreateString(e.name);
                    auto const id = fbb.CreateString(e.player_id);
                    return {fbw::Event::Event_PlayerRegistered,
                            fbw::CreateEvent_PlayerRegistered(fbb, name, id).Union()};
                }
                else if constexpr (std::is_same_v<T, event::GameStarted>)
                {
                    return {fbw::Event::Event_GameStarted,
                            fbw::CreateEvent_GameStarted(fbb, static_cast<std::uint32_t>(e.player_count)).Union()};
                }
                else if constexpr (std::is_same_v<T, event::BetPlaced>)
                {
                    auto const id = fbb.CreateString(e.player_id);
                    return {fbw::Event::Event_BetPlaced, fbw::CreateEvent_BetPlaced(fbb, id, e.amount).Union()};
                }
                else if constexpr (std::is_same_v<T, event::WheelSpun>)
                {
                    return {fbw::Event::Event_WheelSpun,
                            fbw::CreateEvent_WheelSpun(fbb, static_cast<std::uint32_t>(e.round), e.outcome).Union()};
                }
                else if constexpr (std::is_same_v<T, event::CoinsChanged>)
                {
                    auto const id = fbb.CreateString(e.player_id);
                    return {fbw::Event::Event_CoinsChanged,
                            fbw::CreateEvent_CoinsChanged(fbb, id, e.amount, e.balance).Union()};
                }
                else if constexpr (std::is_same_v<T, event::PlayersSwappedCoins>)
                {
                    std::vector<flatbuffers::Offset<fbw::Swap>> swaps;
                    swaps.reserve(e.swaps.size());
                    for (auto const& [bettor, recipient] : e.swaps)
                    {
                        auto const b = fbb.CreateString(bettor);
                        auto const r = fbb.CreateString(recipient);
                        swaps.push_back(fbw::CreateSwap(fbb, b, r));
                    }
                    auto const swaps_vec = fbb.CreateVector(swaps);
                    return {fbw::Event::Event_PlayersSwappedCoins,
                            fbw::CreateEvent_PlayersSwappedCoins(fbb, swaps_vec).Union()};
                }
                else if constexpr (std::is_same_v<T, event::AllOrNothingActivated>)
                {
                    return {fbw::Event::Event_AllOrNothingActivated,
                            fbw::CreateEvent_AllOrNothingActivated(fbb).Union()};
                }
                else if constexpr (std::is_same_v<T, event::MinigameReady>)
                {
                    auto const m = fbb.CreateString(e.minigame);
                    return {fbw::Event::Event_MinigameReady, fbw::CreateEvent_MinigameReady(fbb, m).Union()};
                }
                else if constexpr (std::is_same_v<T, event::MinigameStarted>)
                {
                    auto const m = fbb.CreateString(e.minigame);
                    return {fbw::Event::Event_MinigameStarted, fbw::CreateEvent_MinigameStarted(fbb, m).Union()};
                }
                else if constexpr (std::is_same_v<T, event::MinigameEnded>)
                {
                    auto const r = WriteMinigameResult(fbb, e.result);
                    return {fbw::Event::Event_MinigameEnded, fbw::CreateEvent_MinigameEnded(fbb, r).Union()};
                }
                else
                {
                    static_assert(std::is_same_v<T, event::GameEnded>);
                    flatbuffers::Offset<flatbuffers::String> winner{};
                    if (e.winner_id) winner = fbb.CreateString(*e.winner_id);
                    return {fbw::Event::Event_GameEnded,
                            fbw::CreateEvent_GameEnded(fbb, winner, e.final_coins).Union()};
                }
            }, ev);

            entries.push_back(fbw::CreateEventEntry(fbb, type, body));
        }
        return fbb.CreateVector(entries);
    }

    auto ReadEvents(flatbuffers::Vector<flatbuffers::Offset<fbw::EventEntry>> const* fb)
        -> std::expected<EventLog, ParseError>
    {
        EventLog out;
        if (!fb) return out;
        out.reserve(fb->size());

        for (auto const* entry : *fb)
        {
            switch (entry->event_type())
            {
            case fbw::Event::Event_GameInitialized:
                out.emplace_back(event::GameInitialized{
                    .random_seed = entry->event_as_Event_GameInitialized()->random_seed()});
                break;
            case fbw::Event::Event_PlayerRegistered:
            {
                auto const* e = entry->event_as_Event_PlayerRegistered();
                out.emplace_back(event::PlayerRegistered{.name = Str(e->name()), .player_id = Str(e->player_id())});
                break;
            }
            case fbw::Event::Event_GameStarted:
                out.emplace_back(event::GameStarted{
                    .player_count = entry->event_as_Event_GameStarted()->player_count()});
                break;
            case fbw::Event::Event_BetPlaced:
            {
                auto const* e = entry->event_as_Event_BetPlaced();
                out.emplace_back(event::BetPlaced{.player_id = Str(e->player_id()), .amount = e->amount()});
                break;
            }
            case fbw::Event::Event_WheelSpun:
            {
                auto const* e = entry->event_as_Event_WheelSpun();
                out.emplace_back(event::WheelSpun{.round = e->round(), .outcome = e->outcome()});
                break;
            }
            case fbw::Event::Event_CoinsChanged:
            {
                auto const* e = entry->event_as_Event_CoinsChanged();
                out.emplace_back(event::CoinsChanged{
                    .player_id = Str(e->player_id()), .amount = e->amount(), .balance = e->balance()});
                break;
            }
            case fbw::Event::Event_PlayersSwappedCoins:
            {
                event::PlayersSwappedCoins swapped{};
                if (auto const* v = entry->event_as_Event_PlayersSwappedCoins()->swaps())
                {
                    swapped.swaps.reserve(v->size());
                    for (auto const* sw : *v) swapped.swaps.emplace_back(Str(sw->bettor()), Str(sw->recipient()));
                }
                out.emplace_back(std::move(swapped));
                break;
            }
            case fbw::Event::Event_AllOrNothingActivated:
                out.emplace_back(event::AllOrNothingActivated{});
                break;
            case fbw::Event::Event_MinigameReady:
                out.emplace_back(event::MinigameReady{
                    .minigame = Str(entry->event_as_Event_MinigameReady()->minigame())});
                break;
            case fbw::Event::Event_MinigameStarted:
                out.emplace_back(event::MinigameStarted{
                    .minigame = Str(entry->event_as_Event_MinigameStarted()->minigame())});
                break;
            case fbw::Event::Event_MinigameEnded:
                out.emplace_back(event::MinigameEnded{
                    .result = ReadMinigameResult(entry->event_as_Event_MinigameEnded()->result())});
                break;
            case fbw::Event::Event_GameEnded:
            {
                auto const* e = entry->event_as_Event_GameEnded();
                std::optional<Identity> winner{};
                if (e->winner_id()) winner = e->winner_id()->str();
                out.emplace_back(event::GameEnded{.winner_id = std::move(winner), .final_coins = e->final_coins()});
                break;
            }
            default:
                return Unexpected("unknown event variant");
            }
        }
        return out;
    }

    auto EncodeEvents(EventLog const& events) -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const vec = WriteEvents(fbb, events);
        auto const batch = fbw::CreateEventBatch(fbb, vec);
        auto const env = fbw::CreateEnvelope(fbb, fbw::Message::EventBatch, batch.Union());
        return Finish(fbb, env);
    }

    auto DecodeEvents(std::span<std::byte const> bytes) -> std::expected<EventLog, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env)
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbw::Message::EventBatch)
            return Unexpected("not an EventBatch");

        return ReadEvents((*env)->message_as_EventBatch()->events());
    }

    // ---------- Violation ----------

    auto WriteViolation(flatbuffers::FlatBufferBuilder& fbb, error::RuleViolation const& v)
        -> flatbuffers::Offset<fbw::Violation>
    {
        auto const msg = fbb.CreateString(error::describe(v));
        return fbw::CreateViolation(fbb, ToFbCategory(v.category()), static_cast<std::uint16_t>(v.code), msg);
    }
} // namespace board::core::wire
