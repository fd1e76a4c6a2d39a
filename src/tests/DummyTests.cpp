#include <gtest/gtest.h>

#include "../core/DummyGame.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    auto MakeGame() -> DummyGame
    {
        DummyGame g(DummyConfig{.knock_threshold = 10, .undercut_penalty = 10, .seed = 21});
        for (PlayerInfo const& p : Ids({"a", "b"})) EXPECT_TRUE(g.AddPlayer(p).has_value());
        EXPECT_TRUE(g.StartRound().has_value());
        return g;
    }

    // Fixed hands and discard pile; `stock` is drawn first card first. "a" to act.
    auto Rig(DummyGame& g, CardVec const& a, CardVec const& b, CardVec const& discard, CardVec const& stock) -> void
    {
        DummyGame::Snapshot s = g.Serialize();
        s.state.players[0].hand = a;
        s.state.players[1].hand = b;
        s.state.discard = discard;
        s.state.melds.clear();
        s.state.current_idx = 0;
        s.state.has_drawn = false;

        CardVec dealt = a;
        dealt.insert(dealt.end(), b.begin(), b.end());
        dealt.insert(dealt.end(), discard.begin(), discard.end());
        RebuildDeck(s.deck, dealt, stock);
        g.Restore(std::move(s));
    }

    auto Meld(DummyGame& g, PlayerId const& id, std::initializer_list<std::string_view> txt) -> error::ValidateResult
    {
        CardVec const c = Cards(txt);
        return g.Meld(id, c);
    }

    auto C(std::string_view txt) -> Card
    {
        return *cardroom::core::util::ParseCard(txt);
    }
} // anonymous namespace

TEST(Dummy, Deal_Gives_Ten_Cards_Heads_Up)
{
    DummyGame g = MakeGame();
    DummyState const& s = g.GetState();
    ASSERT_EQ(s.phase, DummyPhase::Playing);
    for (DummyPlayer const& p : s.players) EXPECT_EQ(p.hand.size(), 10u);
    EXPECT_EQ(s.discard.size(), 1u);
    EXPECT_EQ(g.StockSize(), 52u - 21u);
    debug::CheckCardConservation(g);
}

TEST(Dummy, Knock_After_Drawing_And_Melding)
{
    DummyGame g = MakeGame();
    Rig(g, Cards({"2C", "3C", "4C", "7D", "7S", "7H", "5S"}), Cards({"KS", "QH", "JD"}), Cards({"9H"}),
        Cards({"2D"}));

    error::ValidateResult r = g.Knock("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Draw_Required);

    ASSERT_TRUE(g.DrawStock("a").has_value());
    r = g.DrawStock("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Draw_AlreadyDrawn);

    r = g.Knock("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Knock_DeadwoodTooHigh);

    ASSERT_TRUE(Meld(g, "a", {"2C", "3C", "4C"}).has_value());
    ASSERT_TRUE(Meld(g, "a", {"7D", "7S", "7H"}).has_value());
    EXPECT_EQ(g.GetState().players[0].deadwood, 10u);
    debug::CheckCardConservation(g);

    ASSERT_TRUE(g.Knock("a").has_value());
    DummyState const& s = g.GetState();
    ASSERT_EQ(s.phase, DummyPhase::Finished);
    EXPECT_EQ(s.winner, PlayerId{"a"});
    EXPECT_EQ(s.knocker, PlayerId{"a"});
    EXPECT_FALSE(s.undercut);
    EXPECT_EQ(s.players[0].score, 10);
    EXPECT_EQ(s.players[1].score, 30);

    ASSERT_TRUE(g.EndRound().has_value());
    EXPECT_EQ(g.GetState().starter_idx, 1);
}

TEST(Dummy, Undercut_Gives_Lower_Hand_The_Win)
{
    DummyGame g = MakeGame();
    Rig(g, Cards({"2C", "3C", "4C", "7D", "7S", "7H", "5S"}), Cards({"3H"}), Cards({"9H"}), Cards({"2D"}));

    ASSERT_TRUE(g.DrawStock("a").has_value());
    ASSERT_TRUE(Meld(g, "a", {"2C", "3C", "4C"}).has_value());
    ASSERT_TRUE(Meld(g, "a", {"7D", "7S", "7H"}).has_value());
    ASSERT_TRUE(g.Knock("a").has_value());

    DummyState const& s = g.GetState();
    EXPECT_TRUE(s.undercut);
    EXPECT_EQ(s.winner, PlayerId{"b"});
    EXPECT_EQ(s.players[1].score, 5 - 10);
    EXPECT_TRUE(s.players[0].is_knocker);
}

TEST(Dummy, Going_Out_By_Discarding_Last_Card)
{
    DummyGame g = MakeGame();
    Rig(g, Cards({"2C", "3C", "4C", "KH"}), Cards({"9S", "9D"}), Cards({"6H"}), Cards({"5C"}));

    ASSERT_TRUE(g.DrawStock("a").has_value());
    ASSERT_TRUE(Meld(g, "a", {"2C", "3C", "4C", "5C"}).has_value());
    ASSERT_TRUE(g.Discard("a", C("KH")).has_value());

    DummyState const& s = g.GetState();
    ASSERT_EQ(s.phase, DummyPhase::Finished);
    EXPECT_TRUE(s.went_out);
    EXPECT_EQ(s.winner, PlayerId{"a"});
    EXPECT_EQ(s.players[0].score, 0);
    EXPECT_EQ(s.players[1].score, 10);
    debug::CheckCardConservation(g);
}

TEST(Dummy, Lay_Off_Onto_Opponent_Meld)
{
    DummyGame g = MakeGame();
    Rig(g, Cards({"2C", "3C", "4C", "KH", "QD"}), Cards({"5C", "9C", "JS"}), Cards({"6H"}), Cards({"8D", "8S"}));

    ASSERT_TRUE(g.DrawStock("a").has_value());
    ASSERT_TRUE(Meld(g, "a", {"2C", "3C", "4C"}).has_value());
    ASSERT_TRUE(g.Discard("a", C("KH")).has_value());
    ASSERT_EQ(g.GetState().current_idx, 1);

    error::ValidateResult r = g.Discard("b", C("JS"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Draw_Required);

    ASSERT_TRUE(g.DrawDiscard("b").has_value());
    EXPECT_EQ(g.GetState().discard.size(), 1u);

    uint32_t const meld_id = g.GetState().melds.front().id;
    r = g.LayOff("b", C("9C"), meld_id);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::LayOff_DoesNotFit);

    r = g.LayOff("b", C("5C"), 99);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Meld_NotFound);

    ASSERT_TRUE(g.LayOff("b", C("5C"), meld_id).has_value());
    EXPECT_EQ(g.GetState().melds.front().cards.size(), 4u);
    debug::CheckCardConservation(g);
}

TEST(Dummy, Empty_Stock_Is_Rebuilt_From_Discards)
{
    DummyGame g = MakeGame();
    CardVec const all = BuildCards(1);
    CardVec const a(all.begin(), all.begin() + 25);
    CardVec const b(all.begin() + 25, all.begin() + 49);
    CardVec const discard(all.begin() + 49, all.end());
    Rig(g, a, b, discard, {});
    ASSERT_EQ(g.StockSize(), 0u);

    ASSERT_TRUE(g.DrawStock("a").has_value());
    DummyState const& s = g.GetState();
    EXPECT_EQ(s.players[0].hand.size(), 26u);
    ASSERT_EQ(s.discard.size(), 1u);
    EXPECT_EQ(s.discard.back(), discard.back());
    EXPECT_EQ(g.StockSize(), 1u);
    debug::CheckCardConservation(g);
}

TEST(Dummy, Meld_Validation)
{
    DummyGame g = MakeGame();
    Rig(g, Cards({"2C", "3C", "5C", "7D"}), Cards({"9S"}), Cards({"6H"}), Cards({"8D"}));

    error::ValidateResult r = Meld(g, "a", {"2C", "3C", "5C"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Meld_Invalid);

    r = Meld(g, "a", {"2C", "3C", "4C"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_NotInHand);

    r = g.DrawStock("b");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::NotPlayersTurn);
}
