//
// Created by Malik T on 10/09/2025.
//

#ifndef CARDROOM_MELDRULES_HPP
#define CARDROOM_MELDRULES_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    enum class MeldType : uint8_t
    {
        Set = 0, // 3-4 of one rank, distinct suits
        Run // 3+ consecutive of one suit, ace low
    };

    auto ToString(MeldType t) -> std::string_view;

    // A = 15, 2..9 = 5, 10/J/Q/K = 10
    auto DeadwoodPoints(Card const& c) noexcept -> uint8_t;
    auto Deadwood(std::span<Card const> hand) noexcept -> unsigned;

    auto IsSet(std::span<Card const> cards) -> bool;
    auto IsRun(std::span<Card const> cards) -> bool;
    auto ClassifyMeld(std::span<Card const> cards) -> std::optional<MeldType>;

    // Whether `card` extends an existing meld of the given type.
    auto CanLayOff(Card const& card, MeldType type, std::span<Card const> meld) -> bool;

    // Every set and run available in a hand.
    auto FindPossibleMelds(std::span<Card const> hand) -> std::vector<CardVec>;
}

#endif //CARDROOM_MELDRULES_HPP
