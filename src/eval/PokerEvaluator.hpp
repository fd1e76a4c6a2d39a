//
// Created by Malik T on 03/09/2025.
//

#ifndef CARDROOM_POKEREVALUATOR_HPP
#define CARDROOM_POKEREVALUATOR_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    enum class PokerCategory : uint8_t
    {
        HighCard = 1,
        OnePair,
        TwoPair,
        ThreeOfAKind,
        Straight,
        Flush,
        FullHouse,
        FourOfAKind,
        StraightFlush,
        RoyalFlush
    };

    // Ace high = 14; the wheel straight is reported with a high card of 5.
    struct PokerHand
    {
        PokerCategory category{PokerCategory::HighCard};
        // Group-ordered card values, most significant first, zero padded.
        std::array<uint8_t, 5> tiebreak{};
        CardVec cards; // the five cards that make the hand
    };

    auto PokerValue(Rank r) noexcept -> uint8_t;
    auto ToString(PokerCategory c) -> std::string_view;
    auto Describe(PokerHand const& h) -> std::string;

    // Exactly five cards.
    auto EvaluateFive(std::span<Card const> five) -> PokerHand;

    // Best five out of 5..7 cards. Throws RulesError for fewer than five.
    auto EvaluateBest(std::span<Card const> cards) -> PokerHand;
    auto EvaluateHoldem(std::span<Card const> hole, std::span<Card const> community) -> PokerHand;

    auto ComparePokerHands(PokerHand const& a, PokerHand const& b) noexcept -> std::strong_ordering;
}

#endif //CARDROOM_POKEREVALUATOR_HPP
