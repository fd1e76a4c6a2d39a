#include <gtest/gtest.h>

#include <limits>

#include "../core/HoldemGame.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    auto MakeGame(std::vector<PlayerInfo> const& seats) -> HoldemGame
    {
        HoldemGame g(HoldemConfig{.small_blind = 5, .big_blind = 10, .starting_chips = 1000, .seed = 17});
        for (PlayerInfo const& p : seats) EXPECT_TRUE(g.AddPlayer(p).has_value());
        return g;
    }

    // Hands out fixed hole cards and stacks the board that follows.
    auto Rig(HoldemGame& g, std::vector<CardVec> const& holes, CardVec const& board) -> void
    {
        HoldemGame::Snapshot s = g.Serialize();
        CardVec dealt;
        for (std::size_t i = 0; i < holes.size(); ++i)
        {
            s.state.players[i].hole = holes[i];
            dealt.insert(dealt.end(), holes[i].begin(), holes[i].end());
        }
        RebuildDeck(s.deck, dealt, board);
        g.Restore(std::move(s));
    }

    auto Seat(HoldemGame const& g) -> PlayerId const&
    {
        return g.GetState().players[g.GetState().current_idx].id;
    }
} // anonymous namespace

TEST(Holdem, Four_Players_Turn_Order_With_Fold)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c", "d"}));
    ASSERT_TRUE(g.StartRound().has_value());
    Rig(g, {Cards({"AS", "KS"}), Cards({"4H", "9C"}), Cards({"2H", "7D"}), Cards({"3C", "8D"})},
        Cards({"QS", "JS", "10S", "2D", "3H"}));

    HoldemState const& s = g.GetState();
    EXPECT_EQ(s.button_idx, 0);
    EXPECT_EQ(s.sb_idx, 1);
    EXPECT_EQ(s.bb_idx, 2);
    EXPECT_EQ(s.pot, 15);
    debug::CheckCardConservation(g);
    debug::CheckChipConservation(g, 4000);

    // preflop starts left of the big blind
    EXPECT_EQ(Seat(g), "d");
    ASSERT_TRUE(g.Call("d").has_value());
    EXPECT_EQ(Seat(g), "a");
    ASSERT_TRUE(g.Call("a").has_value());
    EXPECT_EQ(Seat(g), "b");
    ASSERT_TRUE(g.Fold("b").has_value());
    EXPECT_EQ(Seat(g), "c");
    ASSERT_TRUE(g.Check("c").has_value());

    ASSERT_EQ(s.phase, HoldemPhase::Flop);
    EXPECT_EQ(s.community.size(), 3u);
    debug::CheckChipConservation(g, 4000);

    // post-flop starts left of the button, skipping the folded seat
    for (HoldemPhase street : {HoldemPhase::Flop, HoldemPhase::Turn, HoldemPhase::River})
    {
        ASSERT_EQ(s.phase, street);
        EXPECT_EQ(Seat(g), "c");
        ASSERT_TRUE(g.Check("c").has_value());
        EXPECT_EQ(Seat(g), "d");
        ASSERT_TRUE(g.Check("d").has_value());
        EXPECT_EQ(Seat(g), "a");
        ASSERT_TRUE(g.Check("a").has_value());
    }

    ASSERT_EQ(s.phase, HoldemPhase::Settling);
    ASSERT_TRUE(s.players[0].result.has_value());
    EXPECT_EQ(s.players[0].result->category, eval::PokerCategory::RoyalFlush);
    EXPECT_EQ(s.players[0].chips, 1025);
    EXPECT_EQ(s.players[0].payout, 25);
    EXPECT_EQ(s.players[1].payout, -5);
    EXPECT_EQ(s.players[2].payout, -10);
    EXPECT_EQ(s.players[3].payout, -10);
    debug::CheckChipConservation(g, 4000);
    debug::CheckCardConservation(g);

    ASSERT_TRUE(g.EndRound().has_value());
    EXPECT_EQ(g.GetState().button_idx, 1);
}

TEST(Holdem, Heads_Up_Button_Posts_Small_Blind)
{
    HoldemGame g = MakeGame(Ids({"a", "b"}));
    ASSERT_TRUE(g.StartRound().has_value());
    HoldemState const& s = g.GetState();
    EXPECT_EQ(s.sb_idx, 0);
    EXPECT_EQ(s.bb_idx, 1);
    EXPECT_EQ(Seat(g), "a");

    ASSERT_TRUE(g.Call("a").has_value());
    ASSERT_TRUE(g.Check("b").has_value());
    ASSERT_EQ(s.phase, HoldemPhase::Flop);
    EXPECT_EQ(Seat(g), "b");
}

TEST(Holdem, Folds_To_Big_Blind_Win_Uncontested)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c"}));
    ASSERT_TRUE(g.StartRound().has_value());
    ASSERT_TRUE(g.Fold("a").has_value());
    ASSERT_TRUE(g.Fold("b").has_value());

    HoldemState const& s = g.GetState();
    ASSERT_EQ(s.phase, HoldemPhase::Settling);
    EXPECT_EQ(s.players[2].chips, 1005);
    EXPECT_EQ(s.players[1].chips, 995);
    EXPECT_EQ(s.pot, 0);
    debug::CheckChipConservation(g, 3000);
}

TEST(Holdem, Short_Stack_All_In_Builds_Side_Pot)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c"}));
    HoldemState st = g.GetState();
    st.players[0].chips = 50;
    g.SetState(std::move(st));

    ASSERT_TRUE(g.StartRound().has_value());
    Rig(g, {Cards({"AS", "AH"}), Cards({"KS", "KH"}), Cards({"2C", "7D"})},
        Cards({"AD", "KD", "5C", "8S", "9H"}));

    ASSERT_TRUE(g.AllIn("a").has_value());
    ASSERT_TRUE(g.Call("b").has_value());
    ASSERT_TRUE(g.Call("c").has_value());
    HoldemState const& s = g.GetState();
    ASSERT_EQ(s.phase, HoldemPhase::Flop);
    debug::CheckChipConservation(g, 2050);

    EXPECT_EQ(Seat(g), "b");
    ASSERT_TRUE(g.Raise("b", 100).has_value());
    ASSERT_TRUE(g.Call("c").has_value());
    for (int street = 0; street < 2; ++street)
    {
        ASSERT_TRUE(g.Check("b").has_value());
        ASSERT_TRUE(g.Check("c").has_value());
    }

    ASSERT_EQ(s.phase, HoldemPhase::Settling);
    ASSERT_EQ(s.pots.size(), 2u);
    EXPECT_EQ(s.pots[0].amount, 150);
    EXPECT_EQ(s.pots[0].winners, std::vector<PlyrIdxT>{0});
    EXPECT_EQ(s.pots[1].amount, 200);
    EXPECT_EQ(s.pots[1].winners, std::vector<PlyrIdxT>{1});
    EXPECT_EQ(s.players[0].chips, 150);
    EXPECT_EQ(s.players[1].chips, 1050);
    EXPECT_EQ(s.players[2].chips, 850);
    debug::CheckChipConservation(g, 2050);
}

TEST(Holdem, Wager_Validation)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c"}));
    ASSERT_TRUE(g.StartRound().has_value());

    error::ValidateResult r = g.Check("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_CannotCheck);

    r = g.Raise("a", 3);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_RaiseBelowMinimum);

    r = g.Raise("a", 5000);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_ExceedsStack);

    r = g.Call("b");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::NotPlayersTurn);

    ASSERT_TRUE(g.Raise("a", 20).has_value());
    EXPECT_EQ(g.GetState().current_bet, 30);
    EXPECT_EQ(g.GetState().min_raise, 20);
}

TEST(Holdem, Oversized_Raise_Is_Rejected_Without_Touching_Stacks)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c"}));
    ASSERT_TRUE(g.StartRound().has_value());

    error::ValidateResult const r = g.Raise("a", std::numeric_limits<Chips>::max());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_ExceedsStack);

    HoldemState const& s = g.GetState();
    EXPECT_EQ(s.players[0].chips, 1000);
    EXPECT_EQ(s.pot, 15);
    EXPECT_EQ(s.current_bet, 10);
    EXPECT_EQ(Seat(g), "a");
    debug::CheckChipConservation(g, 3000);

    // the whole stack is still a legal raise
    ASSERT_TRUE(g.Raise("a", 990).has_value());
    EXPECT_TRUE(s.players[0].all_in);
    debug::CheckChipConservation(g, 3000);
}

TEST(Holdem, Short_All_In_Does_Not_Reopen_Raising)
{
    HoldemGame g = MakeGame(Ids({"a", "b", "c"}));
    ASSERT_TRUE(g.StartRound().has_value());
    HoldemState st = g.GetState();
    st.players[1].chips = 35; // small blind already posted 5
    g.SetState(std::move(st));
    Chips const total = 1000 + 40 + 1000;

    ASSERT_TRUE(g.Raise("a", 20).has_value());
    EXPECT_EQ(g.GetState().current_bet, 30);
    EXPECT_EQ(g.GetState().min_raise, 20);

    // 40 is only 10 over the bet, short of the 20 minimum
    ASSERT_TRUE(g.AllIn("b").has_value());
    EXPECT_EQ(g.GetState().current_bet, 40);
    EXPECT_EQ(g.GetState().min_raise, 20);

    // the big blind has not acted since the full raise and may still raise
    EXPECT_EQ(Seat(g), "c");
    ASSERT_TRUE(g.Call("c").has_value());

    EXPECT_EQ(Seat(g), "a");
    error::ValidateResult r = g.Raise("a", 100);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_RaiseBelowMinimum);
    r = g.AllIn("a");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Wager_RaiseBelowMinimum);
    debug::CheckChipConservation(g, total);

    ASSERT_TRUE(g.Call("a").has_value());
    HoldemState const& s = g.GetState();
    EXPECT_EQ(s.phase, HoldemPhase::Flop);
    EXPECT_EQ(s.pot, 120);
    debug::CheckChipConservation(g, total);
}
