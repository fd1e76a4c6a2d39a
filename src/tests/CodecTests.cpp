#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <vector>

#include "../core/Exception.hpp"
#include "../net/codec.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::core::net;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    auto MidHandHoldem() -> HoldemGame
    {
        HoldemGame g(HoldemConfig{.seed = 77});
        for (PlayerInfo const& p : Ids({"a", "b", "c"})) EXPECT_TRUE(g.AddPlayer(p).has_value());
        EXPECT_TRUE(g.StartRound().has_value());
        EXPECT_TRUE(g.Call("a").has_value());
        EXPECT_TRUE(g.Call("b").has_value());
        EXPECT_TRUE(g.Check("c").has_value());
        return g;
    }

    auto Copy(flatbuffers::DetachedBuffer const& buf) -> std::vector<std::byte>
    {
        std::span<std::byte const> const b = AsBytes(buf);
        return {b.begin(), b.end()};
    }
} // anonymous namespace

TEST(Codec, Snapshot_Restores_A_Replica_That_Plays_On_Identically)
{
    HoldemGame host = MidHandHoldem();
    ASSERT_EQ(host.GetState().phase, HoldemPhase::Flop);

    flatbuffers::DetachedBuffer const buf = BuildSnapshot<HoldemGame>("t1", host.Serialize(), 9);
    std::expected<SnapshotFrame<HoldemGame>, ParseError> frame = DecodeSnapshot<HoldemGame>(AsBytes(buf));
    ASSERT_TRUE(frame.has_value()) << frame.error().message;
    EXPECT_EQ(frame->msg_id, 9u);
    EXPECT_EQ(frame->session_id, "t1");

    HoldemGame mirror(HoldemConfig{.seed = 1});
    mirror.Restore(std::move(frame->snapshot));

    HoldemState const& h = host.GetState();
    HoldemState const& m = mirror.GetState();
    EXPECT_EQ(m.phase, h.phase);
    EXPECT_EQ(m.community, h.community);
    EXPECT_EQ(m.current_idx, h.current_idx);
    EXPECT_EQ(m.pot, h.pot);
    ASSERT_EQ(m.players.size(), h.players.size());
    for (std::size_t i = 0; i < h.players.size(); ++i)
    {
        EXPECT_EQ(m.players[i].id, h.players[i].id);
        EXPECT_EQ(m.players[i].hole, h.players[i].hole);
        EXPECT_EQ(m.players[i].chips, h.players[i].chips);
    }

    // same deck order on both sides: the next street deals the same card
    for (HoldemGame* g : {&host, &mirror})
    {
        for (char const* id : {"b", "c", "a"}) ASSERT_TRUE(g->Check(id).has_value());
    }
    EXPECT_EQ(mirror.GetState().community, host.GetState().community);
    EXPECT_EQ(mirror.Serialize().deck.undealt, host.Serialize().deck.undealt);
}

TEST(Codec, Slave_Snapshot_Keeps_Optional_Fields)
{
    SlaveGame g(SlaveConfig{.seed = 4});
    for (PlayerInfo const& p : Ids({"a", "b"})) ASSERT_TRUE(g.AddPlayer(p).has_value());
    ASSERT_TRUE(g.StartRound().has_value());

    SlaveState s = g.GetState();
    s.players[0].hand = Cards({"3C"});
    s.players[1].hand = Cards({"5D", "9S"});
    s.current_idx = 0;
    g.SetState(std::move(s));
    CardVec const three = Cards({"3C"});
    ASSERT_TRUE(g.Play("a", three).has_value());

    SlaveGame::Snapshot snap = g.Serialize();
    std::expected<SnapshotFrame<SlaveGame>, ParseError> frame =
        DecodeSnapshot<SlaveGame>(AsBytes(BuildSnapshot<SlaveGame>("t", snap, 1)));
    ASSERT_TRUE(frame.has_value()) << frame.error().message;

    SlaveState const& out = frame->snapshot.state;
    EXPECT_EQ(out.phase, SlavePhase::Finished);
    EXPECT_EQ(out.previous_slave, PlayerId{"b"});
    EXPECT_EQ(out.finish_order, snap.state.finish_order);
    EXPECT_EQ(out.players[0].finish_pos, std::optional<uint8_t>{0});
    EXPECT_EQ(out.players[0].title, SlaveTitle::President);
    EXPECT_EQ(out.players[1].title, SlaveTitle::Slave);
    EXPECT_EQ(out.pile, snap.state.pile);
}

TEST(Codec, Actions_Carry_Their_Payload)
{
    std::vector<uint8_t> const idx{0, 3};
    auto const kang = DecodeAction<KangGame>(AsBytes(BuildAction<KangGame>("t", "p1", KangAction{DiscardAction{idx}}, 2)));
    ASSERT_TRUE(kang.has_value()) << kang.error().message;
    EXPECT_EQ(kang->actor, "p1");
    ASSERT_TRUE(std::holds_alternative<DiscardAction>(kang->action));
    EXPECT_EQ(std::get<DiscardAction>(kang->action).indices, idx);

    auto const holdem = DecodeAction<HoldemGame>(AsBytes(BuildAction<HoldemGame>("t", "a", HoldemAction{RaiseAction{40}}, 3)));
    ASSERT_TRUE(holdem.has_value());
    EXPECT_EQ(std::get<RaiseAction>(holdem->action).amount, 40);

    Card const card{Suit::Hearts, Rank::Queen};
    auto const dummy = DecodeAction<DummyGame>(
        AsBytes(BuildAction<DummyGame>("t", "b", DummyAction{LayOffAction{card, 7}}, 4)));
    ASSERT_TRUE(dummy.has_value());
    LayOffAction const& lay = std::get<LayOffAction>(dummy->action);
    EXPECT_EQ(lay.card, card);
    EXPECT_EQ(lay.meld_id, 7u);

    CardVec const run = Cards({"3C", "4C", "5C"});
    auto const slave = DecodeAction<SlaveGame>(AsBytes(BuildAction<SlaveGame>("t", "c", SlaveAction{PlayCardsAction{run}}, 5)));
    ASSERT_TRUE(slave.has_value());
    EXPECT_EQ(std::get<PlayCardsAction>(slave->action).cards, run);

    auto const bj = DecodeAction<BlackjackGame>(AsBytes(BuildAction<BlackjackGame>("t", "d", BlackjackAction{SplitAction{1}}, 6)));
    ASSERT_TRUE(bj.has_value());
    EXPECT_EQ(std::get<SplitAction>(bj->action).hand, 1);
}

TEST(Codec, Rejects_Garbage_And_Truncated_Buffers)
{
    std::vector<std::byte> const garbage(64, std::byte{0xAB});
    EXPECT_FALSE(OpenEnvelope(garbage).has_value());
    EXPECT_FALSE(OpenEnvelope(std::span<std::byte const>{}).has_value());

    flatbuffers::DetachedBuffer const buf =
        BuildAction<PokDengGame>("t", "p1", PokDengAction{PlaceBetAction{10}}, 1);
    std::vector<std::byte> bytes = Copy(buf);
    ASSERT_TRUE(OpenEnvelope(bytes).has_value());

    std::vector<std::byte> const half(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() / 2));
    EXPECT_FALSE(DecodeAction<PokDengGame>(half).has_value());

    // file identifier sits right after the root offset
    bytes[4] = std::byte{'X'};
    std::expected<fb::Envelope const*, ParseError> const bad_id = OpenEnvelope(bytes);
    ASSERT_FALSE(bad_id.has_value());
    EXPECT_EQ(bad_id.error().message, "bad file identifier");
}

TEST(Codec, Rejects_Frames_For_Another_Game_Or_Without_Actor)
{
    flatbuffers::DetachedBuffer const bet =
        BuildAction<PokDengGame>("t", "p1", PokDengAction{PlaceBetAction{10}}, 1);
    EXPECT_FALSE(DecodeAction<KangGame>(AsBytes(bet)).has_value());
    EXPECT_FALSE(DecodeSnapshot<PokDengGame>(AsBytes(bet)).has_value());

    flatbuffers::DetachedBuffer const anonymous =
        BuildAction<PokDengGame>("t", "", PokDengAction{StayAction{}}, 2);
    std::expected<ActionFrame<PokDengGame>, ParseError> const r = DecodeAction<PokDengGame>(AsBytes(anonymous));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "action without actor");

    HoldemGame g = MidHandHoldem();
    flatbuffers::DetachedBuffer const snap = BuildSnapshot<HoldemGame>("t", g.Serialize(), 3);
    EXPECT_FALSE(DecodeSnapshot<BlackjackGame>(AsBytes(snap)).has_value());
}

TEST(Codec, Card_Values_Outside_The_Schema_Are_Rejected)
{
    EXPECT_FALSE(FromFbCard(fb::Card(fb::Suit::Hearts, static_cast<fb::Rank>(0), 0)).has_value());
    EXPECT_FALSE(FromFbCard(fb::Card(static_cast<fb::Suit>(9), fb::Rank::Ace, 0)).has_value());
    EXPECT_FALSE(FromFbCard(fb::Card(fb::Suit::Hearts, fb::Rank::Ace, static_cast<uint8_t>(constants::MaxDecks))).has_value());

    std::optional<Card> const ok = FromFbCard(ToFbCard(Card{Suit::Spades, Rank::King, 2}));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, (Card{Suit::Spades, Rank::King, 2}));
}

TEST(Codec, Violation_Frame_Carries_Code_And_Text)
{
    error::RuleViolation v = error::Viol(RVC::NotPlayersTurn);
    v.with_actor("p2").with_expected("p1");
    flatbuffers::DetachedBuffer const buf = BuildViolation("t", v, 12);

    std::expected<fb::Envelope const*, ParseError> const env = OpenEnvelope(AsBytes(buf));
    ASSERT_TRUE(env.has_value());
    fb::Violation const* msg = (*env)->message_as_Violation();
    ASSERT_NE(msg, nullptr);

    ViolationFrame const f = DecodeViolation(*msg);
    EXPECT_EQ(f.msg_id, 12u);
    EXPECT_EQ(f.session_id, "t");
    EXPECT_EQ(f.code, RVC::NotPlayersTurn);
    EXPECT_EQ(f.actor, "p2");
    EXPECT_EQ(f.text, error::describe(v));
}
