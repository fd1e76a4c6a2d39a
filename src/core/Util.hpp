//
// Created by Malik T on 14/08/2025.
//

#ifndef CARDROOM_UTIL_HPP
#define CARDROOM_UTIL_HPP

#include <algorithm>
#include <bitset>
#include <numeric>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "Types.hpp"

namespace cardroom::core::util
{
    template <typename>
    inline constexpr bool always_false_v = false;

    inline auto CardToUID(Card const& c) -> std::size_t
    {
        return static_cast<std::size_t>(c.copy()) * constants::CardsPerDeck
            + static_cast<std::size_t>(c.suit()) * constants::RankCount
            + (static_cast<std::size_t>(c.rank()) - 1);
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_{}, contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            std::size_t const uid = CardToUID(c);
            contains_dup_ |= cards_.test(uid);
            cards_.set(uid);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        std::bitset<constants::MaxDecks * constants::CardsPerDeck> cards_;
        bool contains_dup_;
    };

    inline auto ContainsDup(std::span<Card const> cards) -> bool
    {
        CardUniqueChecker checker{};
        for (Card const& c : cards) checker.Add(c);
        return checker.ContainsDup();
    }

    // Visits every k-subset of {0..n-1} in lexicographic order without recursion.
    template <typename Fn>
    auto ForEachCombination(std::size_t n, std::size_t k, Fn&& fn) -> void
    {
        if (k > n) return;
        std::vector<std::size_t> idx(k);
        std::iota(idx.begin(), idx.end(), std::size_t{0});
        for (;;)
        {
            fn(std::span<std::size_t const>{idx});
            std::size_t i = k;
            while (i > 0 && idx[i - 1] == n - k + (i - 1)) --i;
            if (i == 0) return;
            ++idx[i - 1];
            for (std::size_t j = i; j < k; ++j) idx[j] = idx[j - 1] + 1;
        }
    }

    inline auto Pick(std::span<Card const> cards, std::span<std::size_t const> idx) -> CardVec
    {
        CardVec out;
        out.reserve(idx.size());
        for (std::size_t const i : idx) out.push_back(cards[i]);
        return out;
    }

    // Every subset of a card list of the given size.
    inline auto Combinations(std::span<Card const> cards, std::size_t k) -> std::vector<CardVec>
    {
        std::vector<CardVec> out;
        ForEachCombination(cards.size(), k, [&](std::span<std::size_t const> idx)
        {
            out.push_back(Pick(cards, idx));
        });
        return out;
    }

    // Next seat after `from` satisfying `eligible`, wrapping; may return `from` itself.
    template <typename Pred>
    auto NextSeatWhere(PlyrIdxT from, std::size_t count, Pred&& eligible) -> std::optional<PlyrIdxT>
    {
        for (std::size_t step = 1; step <= count; ++step)
        {
            auto const seat = static_cast<PlyrIdxT>((from + step) % count);
            if (eligible(seat)) return seat;
        }
        return std::nullopt;
    }

    // Removes one instance of each card from hand. Cards must all be present.
    inline auto RemoveCards(CardVec& hand, std::span<Card const> cards) -> bool
    {
        for (Card const& c : cards)
        {
            auto const it = std::ranges::find(hand, c);
            if (it == hand.end()) return false;
            hand.erase(it);
        }
        return true;
    }

    inline auto ToString(Suit s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Clubs: return "C";
        case Suit::Diamonds: return "D";
        case Suit::Hearts: return "H";
        case Suit::Spades: return "S";
        }
        return "?";
    }

    inline auto ToString(Rank r) -> std::string_view
    {
        switch (r)
        {
        case Rank::Ace: return "A";
        case Rank::Two: return "2";
        case Rank::Three: return "3";
        case Rank::Four: return "4";
        case Rank::Five: return "5";
        case Rank::Six: return "6";
        case Rank::Seven: return "7";
        case Rank::Eight: return "8";
        case Rank::Nine: return "9";
        case Rank::Ten: return "10";
        case Rank::Jack: return "J";
        case Rank::Queen: return "Q";
        case Rank::King: return "K";
        }
        return "?";
    }

    // "10H", "AS"; copy index appended as "#n" when non-zero
    inline auto ToString(Card const& c) -> std::string
    {
        std::string s{ToString(c.rank())};
        s += ToString(c.suit());
        if (c.copy() != 0)
        {
            s += '#';
            s += std::to_string(c.copy());
        }
        return s;
    }

    inline auto ToString(std::span<Card const> cards) -> std::string
    {
        std::string s = "[";
        for (std::size_t i = 0; i < cards.size(); ++i)
        {
            if (i) s += ' ';
            s += ToString(cards[i]);
        }
        s += ']';
        return s;
    }

    // Parses "AS", "10h", "TD", "qc". Returns nullopt for anything else.
    inline auto ParseCard(std::string_view text, uint8_t copy = 0) -> std::optional<Card>
    {
        if (text.size() < 2 || text.size() > 3) return std::nullopt;

        std::optional<Suit> suit;
        switch (text.back())
        {
        case 'C': case 'c': suit = Suit::Clubs; break;
        case 'D': case 'd': suit = Suit::Diamonds; break;
        case 'H': case 'h': suit = Suit::Hearts; break;
        case 'S': case 's': suit = Suit::Spades; break;
        default: return std::nullopt;
        }

        std::string_view const r = text.substr(0, text.size() - 1);
        std::optional<Rank> rank;
        if (r == "10" || r == "T" || r == "t") rank = Rank::Ten;
        else if (r.size() == 1)
        {
            switch (r[0])
            {
            case 'A': case 'a': rank = Rank::Ace; break;
            case 'J': case 'j': rank = Rank::Jack; break;
            case 'Q': case 'q': rank = Rank::Queen; break;
            case 'K': case 'k': rank = Rank::King; break;
            default:
                if (r[0] >= '2' && r[0] <= '9') rank = static_cast<Rank>(r[0] - '0');
                break;
            }
        }
        if (!rank) return std::nullopt;
        return Card{*suit, *rank, copy};
    }
}

#endif //CARDROOM_UTIL_HPP
