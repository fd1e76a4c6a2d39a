//
// Created by Malik T on 06/09/2025.
//

#ifndef CARDROOM_DRAWHANDEVALUATOR_HPP
#define CARDROOM_DRAWHANDEVALUATOR_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string_view>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    // Kang categories with their comparison weight.
    enum class DrawHandType : uint16_t
    {
        HighCard = 100,
        Pair = 200,
        TwoPair = 300,
        Straight = 400,
        Flush = 500,
        Tong = 600, // three or four of a kind
        Kang = 800, // full house
        StraightFlush = 900
    };

    struct DrawHand
    {
        DrawHandType type{DrawHandType::HighCard};
        uint8_t multiplier{1};
        std::array<uint8_t, 5> tiebreak{};
    };

    auto Multiplier(DrawHandType t) noexcept -> uint8_t;
    auto ToString(DrawHandType t) -> std::string_view;

    // Five cards exactly.
    auto EvaluateDrawHand(std::span<Card const> five) -> DrawHand;
    auto CompareDrawHands(DrawHand const& a, DrawHand const& b) noexcept -> std::strong_ordering;
}

#endif //CARDROOM_DRAWHANDEVALUATOR_HPP
