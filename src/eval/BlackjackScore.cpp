//
// Created by Malik T on 08/09/2025.
//

#include "BlackjackScore.hpp"

namespace cardroom::core::eval
{
    auto ScoreBlackjack(std::span<Card const> cards) noexcept -> BlackjackTotal
    {
        unsigned total = 0;
        unsigned aces = 0;
        for (Card const& c : cards)
        {
            uint8_t const r = RankNumber(c.rank());
            if (c.rank() == Rank::Ace)
            {
                total += 11;
                ++aces;
            }
            else
            {
                total += r >= 10 ? 10 : r;
            }
        }
        while (total > BlackjackTarget && aces > 0)
        {
            total -= 10;
            --aces;
        }
        return BlackjackTotal{.total = static_cast<uint8_t>(total), .soft = aces > 0};
    }

    auto IsBust(std::span<Card const> cards) noexcept -> bool
    {
        return ScoreBlackjack(cards).total > BlackjackTarget;
    }

    auto IsNatural(std::span<Card const> cards) noexcept -> bool
    {
        return cards.size() == 2 && ScoreBlackjack(cards).total == BlackjackTarget;
    }
}
