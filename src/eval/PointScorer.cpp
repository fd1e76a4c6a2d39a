//
// Created by Malik T on 02/09/2025.
//

#include "PointScorer.hpp"

#include <algorithm>
#include <array>

namespace cardroom::core::eval
{
    auto CardPoints(Card const& c) noexcept -> uint8_t
    {
        uint8_t const r = RankNumber(c.rank());
        return r >= 10 ? 0 : r;
    }

    auto Multiplier(PointHandType const t) noexcept -> uint8_t
    {
        switch (t)
        {
        case PointHandType::Tong:
        case PointHandType::StraightFlush: return 5;
        case PointHandType::Flush:
        case PointHandType::Straight: return 3;
        case PointHandType::Pair:
        case PointHandType::Pok8:
        case PointHandType::Pok9: return 2;
        case PointHandType::Normal: return 1;
        }
        return 1;
    }

    auto ToString(PointHandType const t) -> std::string_view
    {
        switch (t)
        {
        case PointHandType::Normal: return "normal";
        case PointHandType::Pair: return "pair";
        case PointHandType::Pok8: return "pok8";
        case PointHandType::Pok9: return "pok9";
        case PointHandType::Flush: return "flush";
        case PointHandType::Straight: return "straight";
        case PointHandType::Tong: return "tong";
        case PointHandType::StraightFlush: return "straight_flush";
        }
        return "unknown";
    }

    static auto ClassifyThree(std::span<Card const> cards) -> PointHandType
    {
        if (cards[0].rank() == cards[1].rank() && cards[1].rank() == cards[2].rank())
            return PointHandType::Tong;

        std::array<uint8_t, 3> r{RankNumber(cards[0].rank()), RankNumber(cards[1].rank()), RankNumber(cards[2].rank())};
        std::ranges::sort(r);
        // ace counts low only: A-2-3 runs, Q-K-A does not
        bool const sequential = r[1] == r[0] + 1 && r[2] == r[1] + 1;
        bool const same_suit = cards[0].suit() == cards[1].suit() && cards[1].suit() == cards[2].suit();

        if (sequential && same_suit) return PointHandType::StraightFlush;
        if (same_suit) return PointHandType::Flush;
        if (sequential) return PointHandType::Straight;
        return PointHandType::Normal;
    }

    auto ScorePointHand(std::span<Card const> cards) -> PointHand
    {
        PointHand hand{};
        if (cards.size() < 2) return hand;

        unsigned sum = 0;
        for (Card const& c : cards) sum += CardPoints(c);
        hand.points = static_cast<uint8_t>(sum % 10);

        if (cards.size() == 2)
        {
            hand.natural = hand.points >= 8;
            if (hand.points == 9) hand.type = PointHandType::Pok9;
            else if (hand.points == 8) hand.type = PointHandType::Pok8;
            else if (cards[0].rank() == cards[1].rank()) hand.type = PointHandType::Pair;
        }
        else if (cards.size() == 3)
        {
            hand.type = ClassifyThree(cards);
        }

        hand.multiplier = Multiplier(hand.type);
        return hand;
    }

    auto ComparePointHands(PointHand const& a, PointHand const& b) noexcept -> std::strong_ordering
    {
        if (a.natural != b.natural) return a.natural ? std::strong_ordering::greater : std::strong_ordering::less;
        if (a.points != b.points) return a.points <=> b.points;
        return static_cast<uint8_t>(a.type) <=> static_cast<uint8_t>(b.type);
    }
}
