#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <string_view>

#include "../core/Util.hpp"
#include "../eval/ComboFinder.hpp"

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

    auto Play(std::initializer_list<std::string_view> txt, SlaveRuleset const& rules = SlaveRuleset::Classic())
        -> SlavePlay
    {
        CardVec const c = Cards(txt);
        return *MakePlay(c, rules);
    }

    auto CountType(std::vector<SlavePlay> const& plays, SlavePlayType t) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(plays, [t](SlavePlay const& p) { return p.type == t; }));
    }
} // anonymous namespace

TEST(ComboFinder, Rank_Values_Put_Two_On_Top)
{
    EXPECT_EQ(SlaveRankValue(Rank::Three), 1);
    EXPECT_EQ(SlaveRankValue(Rank::King), 11);
    EXPECT_EQ(SlaveRankValue(Rank::Ace), 12);
    EXPECT_EQ(SlaveRankValue(Rank::Two), 13);
}

TEST(ComboFinder, Suit_Breaks_Ties_Only_When_Enabled)
{
    Card const three_clubs{Suit::Clubs, Rank::Three};
    Card const three_spades{Suit::Spades, Rank::Three};
    EXPECT_EQ(SlaveCardValue(three_clubs, true), 11);
    EXPECT_EQ(SlaveCardValue(three_spades, true), 14);
    EXPECT_EQ(SlaveCardValue(three_clubs, false), SlaveCardValue(three_spades, false));
}

TEST(ComboFinder, Classify)
{
    EXPECT_EQ(ClassifyPlay(Cards({"7H"})), SlavePlayType::Single);
    EXPECT_EQ(ClassifyPlay(Cards({"7H", "7S"})), SlavePlayType::Pair);
    EXPECT_EQ(ClassifyPlay(Cards({"7H", "7S", "7C"})), SlavePlayType::Triple);
    EXPECT_EQ(ClassifyPlay(Cards({"7H", "7S", "7C", "7D"})), SlavePlayType::Quadruple);
    EXPECT_EQ(ClassifyPlay(Cards({"5H", "6S", "7C"})), SlavePlayType::Run);
    EXPECT_EQ(ClassifyPlay(Cards({"QH", "KS", "AC"})), SlavePlayType::Run);

    EXPECT_FALSE(ClassifyPlay(Cards({})));
    EXPECT_FALSE(ClassifyPlay(Cards({"7H", "8S"})));
    EXPECT_FALSE(ClassifyPlay(Cards({"KH", "AS", "2C"}))); // deuce never runs
    EXPECT_FALSE(ClassifyPlay(Cards({"5H", "6S", "8C"})));
}

TEST(ComboFinder, Quads_Yield_Every_Group_Subset)
{
    CardVec const hand = Cards({"9C", "9D", "9H", "9S"});
    std::vector<SlavePlay> const plays = FindPlayable(hand, std::nullopt, SlaveRuleset::Classic());
    EXPECT_EQ(CountType(plays, SlavePlayType::Quadruple), 1u);
    EXPECT_EQ(CountType(plays, SlavePlayType::Triple), 4u);
    EXPECT_EQ(CountType(plays, SlavePlayType::Pair), 6u);
    EXPECT_EQ(CountType(plays, SlavePlayType::Single), 4u);
    EXPECT_EQ(CountType(plays, SlavePlayType::Run), 0u);
}

TEST(ComboFinder, Single_Must_Be_Strictly_Greater)
{
    SlaveRuleset const rules = SlaveRuleset::Classic();
    SlavePlay const current = Play({"8H"});
    CardVec const hand = Cards({"8H", "8C", "8S", "5D"});
    std::vector<SlavePlay> const singles = [&]
    {
        std::vector<SlavePlay> out;
        for (SlavePlay& p : FindPlayable(hand, current, rules))
        {
            if (p.type == SlavePlayType::Single) out.push_back(std::move(p));
        }
        return out;
    }();
    ASSERT_EQ(singles.size(), 1u);
    EXPECT_EQ(singles.front().cards.front(), (Card{Suit::Spades, Rank::Eight}));
}

TEST(ComboFinder, Runs_Enumerate_Every_Sub_Run)
{
    CardVec const hand = Cards({"3C", "4D", "5H", "6S", "2S"});
    std::vector<CardVec> const runs = FindRuns(hand, 3);
    // 3-4-5, 4-5-6, 3-4-5-6
    EXPECT_EQ(runs.size(), 3u);
}

TEST(ComboFinder, Runs_Only_Beat_Runs_Of_Same_Length)
{
    SlaveRuleset const rules = SlaveRuleset::Classic();
    SlavePlay const short_run = Play({"3C", "4D", "5H"});
    SlavePlay const higher_short = Play({"4C", "5D", "6H"});
    SlavePlay const long_run = Play({"7C", "8D", "9H", "10S"});
    EXPECT_TRUE(Beats(higher_short, short_run, rules));
    EXPECT_FALSE(Beats(long_run, short_run, rules));
    EXPECT_FALSE(Beats(short_run, higher_short, rules));
}

TEST(ComboFinder, Bomb_Reach_Depends_On_Ruleset)
{
    SlavePlay const bomb = Play({"5C", "5D", "5H", "5S"});
    SlavePlay const pair = Play({"2C", "2D"});
    SlavePlay const triple = Play({"KC", "KD", "KH"});

    EXPECT_TRUE(Beats(bomb, pair, SlaveRuleset::Classic()));
    EXPECT_FALSE(Beats(bomb, triple, SlaveRuleset::Classic()));
    EXPECT_TRUE(Beats(bomb, triple, SlaveRuleset::House()));
}

TEST(ComboFinder, Triple_Beats_Single_Only_In_Classic)
{
    SlavePlay const single = Play({"2S"});
    SlavePlay const triple = Play({"4C", "4D", "4H"});
    EXPECT_TRUE(Beats(triple, single, SlaveRuleset::Classic()));
    EXPECT_FALSE(Beats(triple, single, SlaveRuleset::House()));
}
