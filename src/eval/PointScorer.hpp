//
// Created by Malik T on 02/09/2025.
//

#ifndef CARDROOM_POINTSCORER_HPP
#define CARDROOM_POINTSCORER_HPP

#include <compare>
#include <cstdint>
#include <span>
#include <string_view>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    // Declaration order is the tie-break order between equal point totals.
    enum class PointHandType : uint8_t
    {
        Normal = 0,
        Pair,
        Pok8,
        Pok9,
        Flush,
        Straight,
        Tong,
        StraightFlush
    };

    struct PointHand
    {
        uint8_t points{};
        PointHandType type{PointHandType::Normal};
        uint8_t multiplier{1};
        bool natural{false}; // two cards totalling 8 or 9
    };

    // A = 1, 2..9 face value, 10/J/Q/K = 0
    auto CardPoints(Card const& c) noexcept -> uint8_t;
    auto Multiplier(PointHandType t) noexcept -> uint8_t;
    auto ToString(PointHandType t) -> std::string_view;

    auto ScorePointHand(std::span<Card const> cards) -> PointHand;

    // Natural beats non-natural, then points, then category.
    auto ComparePointHands(PointHand const& a, PointHand const& b) noexcept -> std::strong_ordering;
}

#endif //CARDROOM_POINTSCORER_HPP
