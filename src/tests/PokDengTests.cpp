#include <gtest/gtest.h>

#include <numeric>

#include "../core/PokDengGame.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace cardroom::core;
using namespace cardroom::test;
using RVC = cardroom::core::error::RuleViolationCode;

namespace
{
    auto MakeGame(std::size_t n_players) -> PokDengGame
    {
        PokDengGame g(PokDengConfig{.min_bet = 10, .max_bet = 100, .seed = 99});
        char const* names[] = {"d", "p1", "p2", "p3", "p4"};
        for (std::size_t i = 0; i < n_players; ++i)
        {
            EXPECT_TRUE(g.AddPlayer(PlayerInfo{names[i], names[i]}).has_value());
        }
        return g;
    }

    auto NetPayout(PokDengState const& s) -> Chips
    {
        return std::accumulate(s.players.begin(), s.players.end(), Chips{0},
                               [](Chips acc, PokDengPlayer const& p) { return acc + p.payout; });
    }
} // anonymous namespace

TEST(PokDeng, Three_Bettors_Stay_Payouts_Sum_To_Zero)
{
    PokDengGame g = MakeGame(4);
    ASSERT_TRUE(g.StartRound().has_value());
    EXPECT_EQ(g.GetState().phase, PokDengPhase::Betting);

    // first pass p1 p2 p3 d, second pass p1 p2 p3 d
    StackNext(g, Cards({"2C", "4D", "KS", "6S", "3C", "3H", "5H", "10D"}));

    for (char const* id : {"p1", "p2", "p3"}) ASSERT_TRUE(g.PlaceBet(id, 10).has_value());
    ASSERT_EQ(g.GetState().phase, PokDengPhase::Playing);
    EXPECT_EQ(g.GetState().pot, 30);
    debug::CheckCardConservation(g);

    for (char const* id : {"p1", "p2", "p3", "d"}) ASSERT_TRUE(g.Stay(id).has_value()) << id;
    PokDengState const& s = g.GetState();
    ASSERT_EQ(s.phase, PokDengPhase::Settling);

    EXPECT_EQ(s.players[1].payout, -10); // 5 vs 6
    EXPECT_EQ(s.players[2].payout, 10);  // 7 vs 6
    EXPECT_EQ(s.players[3].payout, -10); // 5 vs 6
    EXPECT_EQ(s.players[0].payout, 10);
    EXPECT_EQ(NetPayout(s), 0);

    ASSERT_TRUE(g.EndRound().has_value());
    EXPECT_EQ(g.GetState().phase, PokDengPhase::Finished);
    EXPECT_EQ(g.GetState().dealer_idx, 1);
    EXPECT_TRUE(g.GetState().players[1].is_dealer);
}

TEST(PokDeng, Natural_Skips_Drawing)
{
    PokDengGame g = MakeGame(3);
    ASSERT_TRUE(g.StartRound().has_value());
    // p1 holds 4C 5D = natural nine
    StackNext(g, Cards({"4C", "2D", "6S", "5D", "3H", "KD"}));

    ASSERT_TRUE(g.PlaceBet("p1", 20).has_value());
    ASSERT_TRUE(g.PlaceBet("p2", 10).has_value());

    PokDengState const& s = g.GetState();
    ASSERT_EQ(s.phase, PokDengPhase::Settling);
    ASSERT_TRUE(s.players[1].result.has_value());
    EXPECT_TRUE(s.players[1].result->natural);
    EXPECT_EQ(s.players[1].payout, 40); // pok nine pays double
    EXPECT_EQ(s.players[2].payout, -10); // 5 vs 6
    EXPECT_EQ(NetPayout(s), 0);
}

TEST(PokDeng, Drawing_Adds_A_Third_Card)
{
    PokDengGame g = MakeGame(2);
    ASSERT_TRUE(g.StartRound().has_value());
    StackNext(g, Cards({"2C", "3D", "4H", "KS", "5S"}));
    ASSERT_TRUE(g.PlaceBet("p1", 10).has_value());
    ASSERT_EQ(g.GetState().phase, PokDengPhase::Playing);

    ASSERT_TRUE(g.Draw("p1").has_value());
    EXPECT_EQ(g.GetState().players[1].hand.size(), 3u);
    EXPECT_EQ(g.GetState().players[1].hand.back(), (Card{Suit::Spades, Rank::Five}));
    debug::CheckCardConservation(g);

    error::ValidateResult const again = g.Draw("p1");
    ASSERT_FALSE(again.has_value());
}

TEST(PokDeng, Rejects_Out_Of_Turn_And_Bad_Bets)
{
    PokDengGame g = MakeGame(3);
    ASSERT_TRUE(g.StartRound().has_value());
    StackNext(g, Cards({"2C", "2D", "3S", "3D", "4H", "4S"}));

    error::ValidateResult r = g.PlaceBet("d", 10);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Bet_DealerCannotBet);

    r = g.PlaceBet("p1", 500);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Bet_OutOfRange);

    r = g.Stay("p1");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::WrongPhase);

    ASSERT_TRUE(g.PlaceBet("p1", 10).has_value());
    r = g.PlaceBet("p1", 10);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Bet_AlreadyPlaced);

    ASSERT_TRUE(g.PlaceBet("p2", 10).has_value());
    ASSERT_EQ(g.GetState().phase, PokDengPhase::Playing);

    r = g.Stay("p2");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::NotPlayersTurn);

    r = g.Stay("ghost");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::UnknownPlayer);
}

TEST(PokDeng, Everyone_Folding_Settles_Without_Deal)
{
    PokDengGame g = MakeGame(3);
    ASSERT_TRUE(g.StartRound().has_value());
    ASSERT_TRUE(g.Fold("p1").has_value());
    ASSERT_TRUE(g.Fold("p2").has_value());
    EXPECT_EQ(g.GetState().phase, PokDengPhase::Settling);
    EXPECT_EQ(NetPayout(g.GetState()), 0);
}

TEST(PokDeng, Roster_Changes_Only_Between_Rounds)
{
    PokDengGame g = MakeGame(2);
    error::ValidateResult r = g.AddPlayer(PlayerInfo{"p1", "again"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Roster_DuplicatePlayer);

    ASSERT_TRUE(g.StartRound().has_value());
    r = g.AddPlayer(PlayerInfo{"late", "late"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::WrongPhase);
}

TEST(PokDeng, Start_Needs_Two_Players)
{
    PokDengGame g = MakeGame(1);
    error::ValidateResult const r = g.StartRound();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Roster_NotEnoughPlayers);
}
