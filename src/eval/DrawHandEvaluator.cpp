//
// Created by Malik T on 06/09/2025.
//

#include "DrawHandEvaluator.hpp"

#include "PokerEvaluator.hpp"

namespace cardroom::core::eval
{
    auto Multiplier(DrawHandType const t) noexcept -> uint8_t
    {
        switch (t)
        {
        case DrawHandType::StraightFlush: return 5;
        case DrawHandType::Kang:
        case DrawHandType::Tong: return 3;
        case DrawHandType::Flush:
        case DrawHandType::Straight:
        case DrawHandType::TwoPair: return 2;
        case DrawHandType::Pair:
        case DrawHandType::HighCard: return 1;
        }
        return 1;
    }

    auto ToString(DrawHandType const t) -> std::string_view
    {
        switch (t)
        {
        case DrawHandType::HighCard: return "high_card";
        case DrawHandType::Pair: return "pair";
        case DrawHandType::TwoPair: return "two_pair";
        case DrawHandType::Straight: return "straight";
        case DrawHandType::Flush: return "flush";
        case DrawHandType::Tong: return "tong";
        case DrawHandType::Kang: return "kang";
        case DrawHandType::StraightFlush: return "straight_flush";
        }
        return "unknown";
    }

    // Same grouping as the poker evaluator, different category ladder.
    auto EvaluateDrawHand(std::span<Card const> five) -> DrawHand
    {
        PokerHand const ph = EvaluateFive(five);

        DrawHand hand{};
        hand.tiebreak = ph.tiebreak;
        switch (ph.category)
        {
        case PokerCategory::RoyalFlush:
        case PokerCategory::StraightFlush: hand.type = DrawHandType::StraightFlush; break;
        case PokerCategory::FullHouse: hand.type = DrawHandType::Kang; break;
        case PokerCategory::FourOfAKind:
        case PokerCategory::ThreeOfAKind: hand.type = DrawHandType::Tong; break;
        case PokerCategory::Flush: hand.type = DrawHandType::Flush; break;
        case PokerCategory::Straight: hand.type = DrawHandType::Straight; break;
        case PokerCategory::TwoPair: hand.type = DrawHandType::TwoPair; break;
        case PokerCategory::OnePair: hand.type = DrawHandType::Pair; break;
        case PokerCategory::HighCard: hand.type = DrawHandType::HighCard; break;
        }
        hand.multiplier = Multiplier(hand.type);
        return hand;
    }

    auto CompareDrawHands(DrawHand const& a, DrawHand const& b) noexcept -> std::strong_ordering
    {
        if (a.type != b.type)
            return static_cast<uint16_t>(a.type) <=> static_cast<uint16_t>(b.type);
        return a.tiebreak <=> b.tiebreak;
    }
}
