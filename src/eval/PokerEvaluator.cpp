//
// Created by Malik T on 03/09/2025.
//

#include "PokerEvaluator.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace cardroom::core::eval
{
    auto PokerValue(Rank const r) noexcept -> uint8_t
    {
        return r == Rank::Ace ? 14 : RankNumber(r);
    }

    auto ToString(PokerCategory const c) -> std::string_view
    {
        switch (c)
        {
        case PokerCategory::HighCard: return "High Card";
        case PokerCategory::OnePair: return "One Pair";
        case PokerCategory::TwoPair: return "Two Pair";
        case PokerCategory::ThreeOfAKind: return "Three of a Kind";
        case PokerCategory::Straight: return "Straight";
        case PokerCategory::Flush: return "Flush";
        case PokerCategory::FullHouse: return "Full House";
        case PokerCategory::FourOfAKind: return "Four of a Kind";
        case PokerCategory::StraightFlush: return "Straight Flush";
        case PokerCategory::RoyalFlush: return "Royal Flush";
        }
        return "Unknown";
    }

    auto Describe(PokerHand const& h) -> std::string
    {
        return fmt::format("{} {}", ToString(h.category), util::ToString(h.cards));
    }

    namespace
    {
        struct Group
        {
            uint8_t count;
            uint8_t value;
        };

        // Returns the straight's top card, 0 if the values are not a straight.
        auto StraightHigh(std::array<uint8_t, 5> const& desc) -> uint8_t
        {
            bool consecutive = true;
            for (std::size_t i = 1; i < desc.size(); ++i)
            {
                if (desc[i - 1] != desc[i] + 1)
                {
                    consecutive = false;
                    break;
                }
            }
            if (consecutive) return desc[0];
            // A-5-4-3-2
            if (desc == std::array<uint8_t, 5>{14, 5, 4, 3, 2}) return 5;
            return 0;
        }
    }

    auto EvaluateFive(std::span<Card const> five) -> PokerHand
    {
        CRM_ASSERT(five.size() == 5, "EvaluateFive needs exactly five cards");

        std::array<uint8_t, 5> desc{};
        for (std::size_t i = 0; i < 5; ++i) desc[i] = PokerValue(five[i].rank());
        std::ranges::sort(desc, std::greater<>{});

        std::array<uint8_t, 15> counts{};
        for (uint8_t const v : desc) ++counts[v];

        // (count desc, value desc): quads before kicker, trips before pair, high pair first
        std::vector<Group> groups;
        for (uint8_t v = 14; v >= 2; --v)
        {
            if (counts[v]) groups.push_back(Group{counts[v], v});
        }
        std::ranges::stable_sort(groups, [](Group const& a, Group const& b) { return a.count > b.count; });

        bool const flush = std::ranges::all_of(five, [&](Card const& c) { return c.suit() == five[0].suit(); });
        uint8_t const straight_high = groups.size() == 5 ? StraightHigh(desc) : 0;

        PokerHand hand{};
        hand.cards.assign(five.begin(), five.end());

        if (straight_high != 0)
        {
            hand.tiebreak = {straight_high, 0, 0, 0, 0};
            if (flush)
                hand.category = straight_high == 14 ? PokerCategory::RoyalFlush : PokerCategory::StraightFlush;
            else
                hand.category = PokerCategory::Straight;
            return hand;
        }

        for (std::size_t i = 0; i < groups.size(); ++i) hand.tiebreak[i] = groups[i].value;

        if (groups[0].count == 4) hand.category = PokerCategory::FourOfAKind;
        else if (groups[0].count == 3 && groups[1].count == 2) hand.category = PokerCategory::FullHouse;
        else if (flush) hand.category = PokerCategory::Flush;
        else if (groups[0].count == 3) hand.category = PokerCategory::ThreeOfAKind;
        else if (groups[0].count == 2 && groups[1].count == 2) hand.category = PokerCategory::TwoPair;
        else if (groups[0].count == 2) hand.category = PokerCategory::OnePair;
        else hand.category = PokerCategory::HighCard;
        return hand;
    }

    auto EvaluateBest(std::span<Card const> cards) -> PokerHand
    {
        if (cards.size() < 5)
            CRM_THROW(error::Code::Rules, fmt::format("Poker evaluation needs five cards, got {}", cards.size()));

        PokerHand best{};
        bool have_best = false;
        util::ForEachCombination(cards.size(), 5, [&](std::span<std::size_t const> idx)
        {
            CardVec const five = util::Pick(cards, idx);
            PokerHand h = EvaluateFive(five);
            if (!have_best || ComparePokerHands(h, best) == std::strong_ordering::greater)
            {
                best = std::move(h);
                have_best = true;
            }
        });
        return best;
    }

    auto EvaluateHoldem(std::span<Card const> hole, std::span<Card const> community) -> PokerHand
    {
        CardVec all(hole.begin(), hole.end());
        all.insert(all.end(), community.begin(), community.end());
        return EvaluateBest(all);
    }

    auto ComparePokerHands(PokerHand const& a, PokerHand const& b) noexcept -> std::strong_ordering
    {
        if (a.category != b.category)
            return static_cast<uint8_t>(a.category) <=> static_cast<uint8_t>(b.category);
        return a.tiebreak <=> b.tiebreak;
    }
}
