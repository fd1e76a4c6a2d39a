//
// Created by Malik T on 08/09/2025.
//

#ifndef CARDROOM_BLACKJACKSCORE_HPP
#define CARDROOM_BLACKJACKSCORE_HPP

#include <cstdint>
#include <span>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    inline constexpr uint8_t BlackjackTarget = 21;

    struct BlackjackTotal
    {
        uint8_t total{};
        bool soft{false}; // an ace still counts 11
    };

    // Ace 11 (dropped to 1 while over 21), face cards 10.
    auto ScoreBlackjack(std::span<Card const> cards) noexcept -> BlackjackTotal;
    auto IsBust(std::span<Card const> cards) noexcept -> bool;
    // Two cards totalling 21.
    auto IsNatural(std::span<Card const> cards) noexcept -> bool;
}

#endif //CARDROOM_BLACKJACKSCORE_HPP
