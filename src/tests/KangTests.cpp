#include <gtest/gtest.h>

#include <array>

#include "../core/KangGame.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    // dealer "d" plus "p1" (and "p2" when three seats)
    auto MakeGame(std::size_t n_players) -> KangGame
    {
        KangGame g(KangConfig{.min_bet = 10, .max_bet = 100, .seed = 5});
        char const* names[] = {"d", "p1", "p2"};
        for (std::size_t i = 0; i < n_players; ++i)
        {
            EXPECT_TRUE(g.AddPlayer(PlayerInfo{names[i], names[i]}).has_value());
        }
        EXPECT_TRUE(g.StartRound().has_value());
        return g;
    }
} // anonymous namespace

TEST(Kang, Straight_Flush_Pays_Five_Times)
{
    KangGame g = MakeGame(2);
    // alternating p1, d
    StackNext(g, Cards({"5H", "2C", "6H", "5D", "7H", "9S", "8H", "JC", "9H", "KD"}));
    ASSERT_TRUE(g.PlaceBet("p1", 10).has_value());
    ASSERT_EQ(g.GetState().phase, KangPhase::Discarding);
    EXPECT_EQ(g.GetState().current_idx, 1);
    debug::CheckCardConservation(g);

    ASSERT_TRUE(g.KeepAll("p1").has_value());
    ASSERT_TRUE(g.KeepAll("d").has_value());

    KangState const& s = g.GetState();
    ASSERT_EQ(s.phase, KangPhase::Settling);
    ASSERT_TRUE(s.players[1].result.has_value());
    EXPECT_EQ(s.players[1].result->type, eval::DrawHandType::StraightFlush);
    EXPECT_EQ(s.players[1].payout, 50);
    EXPECT_EQ(s.players[0].payout, -50);

    ASSERT_TRUE(g.EndRound().has_value());
    EXPECT_EQ(g.GetState().dealer_idx, 1);
}

TEST(Kang, Discard_Replaces_Cards_And_Mucks_Them)
{
    KangGame g = MakeGame(2);
    StackNext(g, Cards({"5H", "2C", "6H", "5D", "7H", "9S", "8H", "JC", "9H", "KD", "AS", "AD"}));
    ASSERT_TRUE(g.PlaceBet("p1", 10).has_value());

    std::array<uint8_t, 2> const idx{0, 1};
    ASSERT_TRUE(g.Discard("p1", idx).has_value());

    KangState const& s = g.GetState();
    EXPECT_EQ(s.muck.size(), 2u);
    ASSERT_EQ(s.players[1].hand.size(), 5u);
    EXPECT_EQ(s.players[1].discarded, 2);
    EXPECT_EQ(s.players[1].hand[3], (Card{Suit::Spades, Rank::Ace}));
    EXPECT_EQ(s.players[1].hand[4], (Card{Suit::Diamonds, Rank::Ace}));
    debug::CheckCardConservation(g);
}

TEST(Kang, Same_Category_Pays_Even_Money)
{
    KangGame g = MakeGame(2);
    // p1 pair of kings, dealer pair of queens
    StackNext(g, Cards({"KH", "QC", "KS", "QD", "2H", "3S", "5C", "7D", "8D", "9C"}));
    ASSERT_TRUE(g.PlaceBet("p1", 30).has_value());
    ASSERT_TRUE(g.KeepAll("p1").has_value());
    ASSERT_TRUE(g.KeepAll("d").has_value());
    EXPECT_EQ(g.GetState().players[1].payout, 30);
}

TEST(Kang, Discard_Validation)
{
    KangGame g = MakeGame(2);
    ASSERT_TRUE(g.PlaceBet("p1", 10).has_value());

    std::array<uint8_t, 5> const too_many{0, 1, 2, 3, 4};
    error::ValidateResult r = g.Discard("p1", too_many);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_TooMany);

    std::array<uint8_t, 1> const out_of_range{7};
    r = g.Discard("p1", out_of_range);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_IndexOutOfRange);

    std::array<uint8_t, 2> const dup{2, 2};
    r = g.Discard("p1", dup);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Cards_Duplicate);

    r = g.KeepAll("d");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::NotPlayersTurn);
}

TEST(Kang, Folded_Player_Loses_Bet)
{
    KangGame g = MakeGame(3);
    ASSERT_TRUE(g.PlaceBet("p1", 20).has_value());
    ASSERT_TRUE(g.PlaceBet("p2", 10).has_value());
    ASSERT_TRUE(g.Fold("p1").has_value());
    ASSERT_TRUE(g.KeepAll("p2").has_value());
    ASSERT_TRUE(g.KeepAll("d").has_value());

    KangState const& s = g.GetState();
    ASSERT_EQ(s.phase, KangPhase::Settling);
    EXPECT_EQ(s.players[1].payout, -20);
    EXPECT_EQ(s.players[0].payout + s.players[1].payout + s.players[2].payout, 0);
}
