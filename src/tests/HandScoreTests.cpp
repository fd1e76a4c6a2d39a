#include <gtest/gtest.h>

#include <initializer_list>
#include <string_view>

#include "../core/Util.hpp"
#include "../eval/BlackjackScore.hpp"
#include "../eval/DrawHandEvaluator.hpp"
#include "../eval/MeldRules.hpp"

using namespace cardroom::core;
using namespace cardroom::core::eval;

namespace
{
    auto Cards(std::initializer_list<std::string_view> txt) -> CardVec
    {
        CardVec out;
        for (std::string_view t : txt) out.push_back(*util::ParseCard(t));
        return out;
    }

    auto Draw(std::initializer_list<std::string_view> txt) -> DrawHand
    {
        CardVec const c = Cards(txt);
        return EvaluateDrawHand(c);
    }
} // anonymous namespace

TEST(DrawHand, Ladder_And_Multipliers)
{
    DrawHand const sf = Draw({"5H", "6H", "7H", "8H", "9H"});
    EXPECT_EQ(sf.type, DrawHandType::StraightFlush);
    EXPECT_EQ(sf.multiplier, 5);

    DrawHand const kang = Draw({"5H", "5S", "5C", "9H", "9D"});
    EXPECT_EQ(kang.type, DrawHandType::Kang);
    EXPECT_EQ(kang.multiplier, 3);

    DrawHand const quads = Draw({"5H", "5S", "5C", "5D", "9D"});
    EXPECT_EQ(quads.type, DrawHandType::Tong);

    EXPECT_EQ(Draw({"2H", "6H", "7H", "8H", "KH"}).multiplier, 2);
    EXPECT_EQ(Draw({"2H", "2S", "7H", "8H", "KH"}).multiplier, 1);
}

TEST(DrawHand, Full_House_Outranks_Four_Of_A_Kind)
{
    DrawHand const kang = Draw({"3H", "3S", "3C", "4H", "4D"});
    DrawHand const tong = Draw({"AH", "AS", "AC", "AD", "KD"});
    EXPECT_EQ(CompareDrawHands(kang, tong), std::strong_ordering::greater);
}

TEST(DrawHand, Same_Type_Uses_Tiebreak)
{
    DrawHand const a = Draw({"9H", "9S", "KC", "4H", "2D"});
    DrawHand const b = Draw({"9D", "9C", "QC", "4S", "3D"});
    EXPECT_EQ(CompareDrawHands(a, b), std::strong_ordering::greater);
    EXPECT_EQ(CompareDrawHands(b, a), std::strong_ordering::less);
}

TEST(BlackjackScore, Aces_Soften_And_Harden)
{
    CardVec const soft17 = Cards({"AH", "6S"});
    BlackjackTotal const t = ScoreBlackjack(soft17);
    EXPECT_EQ(t.total, 17);
    EXPECT_TRUE(t.soft);

    CardVec const hard = Cards({"AH", "6S", "KD"});
    BlackjackTotal const h = ScoreBlackjack(hard);
    EXPECT_EQ(h.total, 17);
    EXPECT_FALSE(h.soft);

    CardVec const two_aces = Cards({"AH", "AS"});
    EXPECT_EQ(ScoreBlackjack(two_aces).total, 12);
}

TEST(BlackjackScore, Natural_Needs_Two_Cards)
{
    CardVec const natural = Cards({"AH", "QS"});
    CardVec const three = Cards({"7H", "7S", "7D"});
    EXPECT_TRUE(IsNatural(natural));
    EXPECT_FALSE(IsNatural(three));
    EXPECT_EQ(ScoreBlackjack(three).total, 21);
}

TEST(BlackjackScore, Bust)
{
    CardVec const bust = Cards({"KH", "QS", "2D"});
    EXPECT_TRUE(IsBust(bust));
    CardVec const ok = Cards({"AH", "AS", "KD", "9C"});
    EXPECT_FALSE(IsBust(ok));
}

TEST(MeldRules, Deadwood_Points)
{
    EXPECT_EQ(Deadwood(Cards({"AH", "2S", "9D", "10C", "KH"})), 15u + 5u + 5u + 10u + 10u);
    EXPECT_EQ(Deadwood(Cards({})), 0u);
}

TEST(MeldRules, Sets_And_Runs)
{
    EXPECT_EQ(ClassifyMeld(Cards({"7H", "7S", "7D"})), MeldType::Set);
    EXPECT_EQ(ClassifyMeld(Cards({"AH", "2H", "3H"})), MeldType::Run);
    EXPECT_EQ(ClassifyMeld(Cards({"JH", "QH", "KH", "10H"})), MeldType::Run);

    EXPECT_FALSE(ClassifyMeld(Cards({"QH", "KH", "AH"}))); // ace is low only
    EXPECT_FALSE(ClassifyMeld(Cards({"7H", "7H", "7D"})));
    EXPECT_FALSE(ClassifyMeld(Cards({"7H", "8S", "9H"})));
    EXPECT_FALSE(ClassifyMeld(Cards({"7H", "7S"})));
}

TEST(MeldRules, Lay_Off_Extends_Ends_Or_Fills_Set)
{
    CardVec const run = Cards({"4S", "5S", "6S"});
    EXPECT_TRUE(CanLayOff(*util::ParseCard("3S"), MeldType::Run, run));
    EXPECT_TRUE(CanLayOff(*util::ParseCard("7S"), MeldType::Run, run));
    EXPECT_FALSE(CanLayOff(*util::ParseCard("8S"), MeldType::Run, run));
    EXPECT_FALSE(CanLayOff(*util::ParseCard("7H"), MeldType::Run, run));

    CardVec const set = Cards({"9H", "9S", "9D"});
    EXPECT_TRUE(CanLayOff(*util::ParseCard("9C"), MeldType::Set, set));
    EXPECT_FALSE(CanLayOff(*util::ParseCard("9H"), MeldType::Set, set));

    CardVec const full = Cards({"9H", "9S", "9D", "9C"});
    EXPECT_FALSE(CanLayOff(Card{Suit::Clubs, Rank::Nine, 1}, MeldType::Set, full));
}

TEST(MeldRules, Finds_Every_Meld_In_Hand)
{
    CardVec const hand = Cards({"3H", "4H", "5H", "6H", "KS", "KD", "KC", "2C"});
    std::vector<CardVec> const melds = FindPossibleMelds(hand);
    // one set of kings, runs 3-5, 4-6, 3-6
    EXPECT_EQ(melds.size(), 4u);
    for (CardVec const& m : melds) EXPECT_TRUE(ClassifyMeld(m).has_value());
}
