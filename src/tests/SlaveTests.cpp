#include <gtest/gtest.h>

#include <algorithm>

#include "../core/SlaveGame.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    auto MakeGame(std::vector<PlayerInfo> const& seats,
                  eval::SlaveRuleset const& rules = eval::SlaveRuleset::Classic()) -> SlaveGame
    {
        SlaveGame g(SlaveConfig{.rules = rules, .seed = 11});
        for (PlayerInfo const& p : seats) EXPECT_TRUE(g.AddPlayer(p).has_value());
        EXPECT_TRUE(g.StartRound().has_value());
        return g;
    }

    // Replaces the dealt hands with short fixed ones, `first` to lead.
    auto Rig(SlaveGame& g, std::vector<CardVec> const& hands, PlyrIdxT first) -> void
    {
        SlaveState s = g.GetState();
        for (std::size_t i = 0; i < hands.size(); ++i) s.players[i].hand = hands[i];
        s.current_idx = first;
        s.table.reset();
        s.last_played_idx.reset();
        s.pile.clear();
        g.SetState(std::move(s));
    }

    auto Play(SlaveGame& g, PlayerId const& id, std::initializer_list<std::string_view> txt) -> error::ValidateResult
    {
        CardVec const c = Cards(txt);
        return g.Play(id, c);
    }
} // anonymous namespace

TEST(Slave, Full_Deal_Opens_With_Three_Of_Clubs)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c", "d"}));
    SlaveState const& s = g.GetState();
    ASSERT_EQ(s.phase, SlavePhase::Playing);
    for (SlavePlayer const& p : s.players) EXPECT_EQ(p.hand.size(), 13u);

    CardVec const& opener = s.players[s.current_idx].hand;
    EXPECT_NE(std::ranges::find(opener, Card{Suit::Clubs, Rank::Three}), opener.end());
    debug::CheckCardConservation(g);
}

TEST(Slave, Trick_Clears_When_Everyone_Else_Passes)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c"}));
    Rig(g, {Cards({"3C", "5D"}), Cards({"4H", "9S"}), Cards({"6C", "7C"})}, 0);

    ASSERT_TRUE(Play(g, "a", {"3C"}).has_value());
    ASSERT_TRUE(g.Pass("b").has_value());
    ASSERT_TRUE(g.Pass("c").has_value());

    SlaveState const& s = g.GetState();
    EXPECT_FALSE(s.table.has_value());
    EXPECT_EQ(s.current_idx, 0);
    for (SlavePlayer const& p : s.players) EXPECT_FALSE(p.passed);

    error::ValidateResult const r = g.Pass("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Pass_TableEmpty);
}

TEST(Slave, Passed_Player_Acts_Again_After_New_Play)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c"}));
    Rig(g, {Cards({"3C", "5D"}), Cards({"4H", "9S"}), Cards({"6C", "7C"})}, 0);

    ASSERT_TRUE(Play(g, "a", {"3C"}).has_value());
    ASSERT_TRUE(g.Pass("b").has_value());
    ASSERT_TRUE(Play(g, "c", {"6C"}).has_value());
    ASSERT_TRUE(g.Pass("a").has_value());
    ASSERT_TRUE(Play(g, "b", {"9S"}).has_value());

    SlaveState const& s = g.GetState();
    ASSERT_TRUE(s.table.has_value());
    EXPECT_EQ(s.last_played_idx, PlyrIdxT{1});
    EXPECT_EQ(s.pile.size(), 3u);
}

TEST(Slave, Titles_Follow_Finishing_Order)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c", "d"}));
    Rig(g, {Cards({"3C"}), Cards({"5D"}), Cards({"7H"}), Cards({"9S"})}, 0);

    ASSERT_TRUE(Play(g, "a", {"3C"}).has_value());
    ASSERT_TRUE(Play(g, "b", {"5D"}).has_value());
    ASSERT_TRUE(Play(g, "c", {"7H"}).has_value());

    SlaveState const& s = g.GetState();
    ASSERT_EQ(s.phase, SlavePhase::Finished);
    EXPECT_EQ(s.finish_order, (std::vector<PlayerId>{"a", "b", "c", "d"}));
    EXPECT_EQ(s.players[0].title, SlaveTitle::President);
    EXPECT_EQ(s.players[1].title, SlaveTitle::VicePresident);
    EXPECT_EQ(s.players[2].title, SlaveTitle::ViceSlave);
    EXPECT_EQ(s.players[3].title, SlaveTitle::Slave);
    EXPECT_EQ(s.previous_slave, PlayerId{"d"});

    // the last game's slave opens the next one
    ASSERT_TRUE(g.EndRound().has_value());
    ASSERT_TRUE(g.StartRound().has_value());
    EXPECT_EQ(g.GetState().current_idx, 3);
}

TEST(Slave, Three_Of_Clubs_Opens_Every_Game_Under_House_Rules)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c"}), eval::SlaveRuleset::House());
    Rig(g, {Cards({"3C"}), Cards({"5D"}), Cards({"7H"})}, 0);
    ASSERT_TRUE(Play(g, "a", {"3C"}).has_value());
    ASSERT_TRUE(Play(g, "b", {"5D"}).has_value());
    ASSERT_EQ(g.GetState().phase, SlavePhase::Finished);

    ASSERT_TRUE(g.EndRound().has_value());
    ASSERT_TRUE(g.StartRound().has_value());
    SlaveState const& s = g.GetState();
    CardVec const& opener = s.players[s.current_idx].hand;
    EXPECT_NE(std::ranges::find(opener, Card{Suit::Clubs, Rank::Three}), opener.end());
}

TEST(Slave, Lead_Passes_On_When_Leader_Went_Out)
{
    SlaveGame g = MakeGame(Ids({"a", "b", "c"}));
    Rig(g, {Cards({"2S"}), Cards({"3D", "4D"}), Cards({"5H", "6H"})}, 0);

    ASSERT_TRUE(Play(g, "a", {"2S"}).has_value());
    ASSERT_TRUE(g.Pass("b").has_value());
    ASSERT_TRUE(g.Pass("c").has_value());

    SlaveState const& s = g.GetState();
    EXPECT_FALSE(s.table.has_value());
    EXPECT_EQ(s.current_idx, 1);
    EXPECT_TRUE(s.players[0].out);
}

TEST(Slave, Play_Validation)
{
    SlaveGame g = MakeGame(Ids({"a", "b"}));
    Rig(g, {Cards({"3C", "5D", "8H"}), Cards({"4H", "9S"})}, 0);

    error::ValidateResult r = Play(g, "b", {"4H"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::NotPlayersTurn);

    r = Play(g, "a", {"KS"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_NotInHand);

    r = Play(g, "a", {"3C", "5D"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Play_InvalidCombination);

    r = Play(g, "a", {});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_Empty);

    ASSERT_TRUE(Play(g, "a", {"8H"}).has_value());
    r = Play(g, "b", {"4H"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Play_DoesNotBeat);
}
