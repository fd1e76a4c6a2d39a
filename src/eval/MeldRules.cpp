//
// Created by Malik T on 10/09/2025.
//

#include "MeldRules.hpp"

#include <algorithm>
#include <array>

#include "../core/Util.hpp"

namespace cardroom::core::eval
{
    auto ToString(MeldType const t) -> std::string_view
    {
        switch (t)
        {
        case MeldType::Set: return "set";
        case MeldType::Run: return "run";
        }
        return "unknown";
    }

    auto DeadwoodPoints(Card const& c) noexcept -> uint8_t
    {
        if (c.rank() == Rank::Ace) return 15;
        return RankNumber(c.rank()) >= 10 ? 10 : 5;
    }

    auto Deadwood(std::span<Card const> hand) noexcept -> unsigned
    {
        unsigned sum = 0;
        for (Card const& c : hand) sum += DeadwoodPoints(c);
        return sum;
    }

    auto IsSet(std::span<Card const> cards) -> bool
    {
        if (cards.size() < 3 || cards.size() > 4) return false;
        std::array<bool, constants::SuitCount> seen{};
        for (Card const& c : cards)
        {
            if (c.rank() != cards[0].rank()) return false;
            auto const s = static_cast<std::size_t>(c.suit());
            if (seen[s]) return false;
            seen[s] = true;
        }
        return true;
    }

    auto IsRun(std::span<Card const> cards) -> bool
    {
        if (cards.size() < 3) return false;
        std::vector<uint8_t> ranks;
        ranks.reserve(cards.size());
        for (Card const& c : cards)
        {
            if (c.suit() != cards[0].suit()) return false;
            ranks.push_back(RankNumber(c.rank()));
        }
        std::ranges::sort(ranks);
        for (std::size_t i = 1; i < ranks.size(); ++i)
        {
            if (ranks[i] != ranks[i - 1] + 1) return false;
        }
        return true;
    }

    auto ClassifyMeld(std::span<Card const> cards) -> std::optional<MeldType>
    {
        if (IsSet(cards)) return MeldType::Set;
        if (IsRun(cards)) return MeldType::Run;
        return std::nullopt;
    }

    auto CanLayOff(Card const& card, MeldType const type, std::span<Card const> meld) -> bool
    {
        if (meld.empty()) return false;

        if (type == MeldType::Set)
        {
            if (meld.size() >= 4 || card.rank() != meld[0].rank()) return false;
            return std::ranges::none_of(meld, [&](Card const& c) { return c.suit() == card.suit(); });
        }

        if (card.suit() != meld[0].suit()) return false;
        auto const [lo, hi] = std::ranges::minmax(meld, {}, [](Card const& c) { return RankNumber(c.rank()); });
        uint8_t const r = RankNumber(card.rank());
        return r + 1 == RankNumber(lo.rank()) || r == RankNumber(hi.rank()) + 1;
    }

    auto FindPossibleMelds(std::span<Card const> hand) -> std::vector<CardVec>
    {
        std::vector<CardVec> out;

        // sets: every 3- and 4-card subset of a rank group with distinct suits
        std::array<CardVec, constants::RankCount + 1> by_rank{};
        for (Card const& c : hand) by_rank[RankNumber(c.rank())].push_back(c);
        for (CardVec const& group : by_rank)
        {
            for (std::size_t k = 3; k <= 4 && k <= group.size(); ++k)
            {
                for (CardVec& combo : util::Combinations(group, k))
                {
                    if (IsSet(combo)) out.push_back(std::move(combo));
                }
            }
        }

        // runs: every stretch of length >= 3 inside a same-suit consecutive sequence
        for (std::size_t s = 0; s < constants::SuitCount; ++s)
        {
            std::array<std::optional<Card>, constants::RankCount + 1> slot{};
            for (Card const& c : hand)
            {
                if (static_cast<std::size_t>(c.suit()) == s) slot[RankNumber(c.rank())] = c;
            }

            std::size_t r = 1;
            while (r <= constants::RankCount)
            {
                if (!slot[r])
                {
                    ++r;
                    continue;
                }
                std::size_t end = r;
                while (end + 1 <= constants::RankCount && slot[end + 1]) ++end;

                for (std::size_t from = r; from + 2 <= end; ++from)
                {
                    for (std::size_t to = from + 2; to <= end; ++to)
                    {
                        CardVec run;
                        for (std::size_t i = from; i <= to; ++i) run.push_back(*slot[i]);
                        out.push_back(std::move(run));
                    }
                }
                r = end + 1;
            }
        }
        return out;
    }
}
