#include <gtest/gtest.h>

#include <initializer_list>
#include <string_view>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"
#include "../eval/PokerEvaluator.hpp"

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

    auto Best(std::initializer_list<std::string_view> txt) -> PokerHand
    {
        CardVec const c = Cards(txt);
        return EvaluateBest(c);
    }
} // anonymous namespace

TEST(PokerEvaluator, Royal_Flush_From_Hole_And_Board)
{
    CardVec const hole = Cards({"AS", "KS"});
    CardVec const board = Cards({"QS", "JS", "10S", "2D", "3C"});
    PokerHand const h = EvaluateHoldem(hole, board);
    EXPECT_EQ(h.category, PokerCategory::RoyalFlush);
    EXPECT_EQ(h.cards.size(), 5u);
}

TEST(PokerEvaluator, Hands_Without_Suited_Run_Rank_Lower_Than_Royal)
{
    CardVec const board = Cards({"QS", "JS", "10S", "2D", "3C"});
    PokerHand const royal = EvaluateHoldem(Cards({"AS", "KS"}), board);

    for (auto const& hole : {Cards({"AH", "KS"}), Cards({"QH", "QD"}), Cards({"9S", "8S"}), Cards({"2H", "2C"})})
    {
        PokerHand const h = EvaluateHoldem(hole, board);
        EXPECT_NE(h.category, PokerCategory::RoyalFlush);
        EXPECT_EQ(ComparePokerHands(h, royal), std::strong_ordering::less) << Describe(h);
    }
}

TEST(PokerEvaluator, Categories)
{
    EXPECT_EQ(Best({"9S", "8S", "7S", "6S", "5S"}).category, PokerCategory::StraightFlush);
    EXPECT_EQ(Best({"9S", "9H", "9D", "9C", "5S"}).category, PokerCategory::FourOfAKind);
    EXPECT_EQ(Best({"9S", "9H", "9D", "5C", "5S"}).category, PokerCategory::FullHouse);
    EXPECT_EQ(Best({"2S", "8S", "JS", "6S", "5S"}).category, PokerCategory::Flush);
    EXPECT_EQ(Best({"9S", "8H", "7S", "6D", "5S"}).category, PokerCategory::Straight);
    EXPECT_EQ(Best({"9S", "9H", "9D", "6C", "5S"}).category, PokerCategory::ThreeOfAKind);
    EXPECT_EQ(Best({"9S", "9H", "6D", "6C", "5S"}).category, PokerCategory::TwoPair);
    EXPECT_EQ(Best({"9S", "9H", "7D", "6C", "5S"}).category, PokerCategory::OnePair);
    EXPECT_EQ(Best({"KS", "9H", "7D", "6C", "5S"}).category, PokerCategory::HighCard);
}

TEST(PokerEvaluator, Wheel_Is_Five_High_Straight)
{
    PokerHand const wheel = Best({"AS", "2H", "3D", "4C", "5S"});
    PokerHand const six = Best({"6S", "2H", "3D", "4C", "5S"});
    ASSERT_EQ(wheel.category, PokerCategory::Straight);
    EXPECT_EQ(wheel.tiebreak[0], 5);
    EXPECT_EQ(ComparePokerHands(six, wheel), std::strong_ordering::greater);
}

TEST(PokerEvaluator, Kickers_Compare_Fully)
{
    PokerHand const a = Best({"AS", "AH", "KD", "QC", "4S"});
    PokerHand const b = Best({"AD", "AC", "KS", "QH", "3S"});
    EXPECT_EQ(ComparePokerHands(a, b), std::strong_ordering::greater);

    PokerHand const c = Best({"AD", "AC", "KS", "QH", "4H"});
    EXPECT_EQ(ComparePokerHands(a, c), std::strong_ordering::equal);
}

TEST(PokerEvaluator, Two_Pair_Orders_High_Pair_First)
{
    PokerHand const h = Best({"3S", "3H", "KD", "KC", "9S"});
    EXPECT_EQ(h.tiebreak[0], 13);
    EXPECT_EQ(h.tiebreak[1], 3);
    EXPECT_EQ(h.tiebreak[2], 9);
}

TEST(PokerEvaluator, Best_Of_Seven_Picks_Strongest_Five)
{
    PokerHand const h = Best({"2C", "2D", "2H", "7S", "7D", "KS", "KD"});
    ASSERT_EQ(h.category, PokerCategory::FullHouse);
    EXPECT_EQ(h.tiebreak[0], 2);
    EXPECT_EQ(h.tiebreak[1], 13);
}

TEST(PokerEvaluator, Fewer_Than_Five_Cards_Throws)
{
    CardVec const four = Cards({"2C", "2D", "2H", "7S"});
    EXPECT_THROW(EvaluateBest(four), error::RulesError);
}
