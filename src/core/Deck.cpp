//
// Created by Malik T on 16/08/2025.
//

#include "Deck.hpp"

#include <algorithm>

#include "Exception.hpp"
#include "Util.hpp"

namespace cardroom::core
{
    auto BuildCards(uint8_t const n_decks) -> CardVec
    {
        CardVec cards;
        cards.reserve(n_decks * constants::CardsPerDeck);
        for (uint8_t d{}; d < n_decks; ++d)
        {
            for (std::size_t s{}; s < constants::SuitCount; ++s)
            {
                for (std::size_t r{1}; r <= constants::RankCount; ++r)
                {
                    cards.emplace_back(static_cast<Suit>(s), static_cast<Rank>(r), d);
                }
            }
        }
        return cards;
    }

    Deck::Deck(uint8_t const n_decks, uint64_t const seed) :
        n_decks_(n_decks),
        rng_{seed},
        undealt_(BuildCards(n_decks))
    {
        if (n_decks_ == 0 || n_decks_ > constants::MaxDecks)
            CRM_THROW(error::Code::Rules, fmt::format("Deck count {} outside 1..{}", n_decks_, constants::MaxDecks));
        Shuffle();
    }

    auto Deck::Shuffle() -> void
    {
        // Fisher-Yates, back to front
        for (std::size_t i = undealt_.size(); i > 1; --i)
        {
            std::uniform_int_distribution<std::size_t> pick(0, i - 1);
            std::swap(undealt_[i - 1], undealt_[pick(rng_)]);
        }
    }

    auto Deck::Deal() -> std::optional<Card>
    {
        if (undealt_.empty()) return std::nullopt;
        Card const c = undealt_.back();
        undealt_.pop_back();
        dealt_.push_back(c);
        return c;
    }

    auto Deck::DealMany(std::size_t const n) -> CardVec
    {
        CardVec out;
        out.reserve(std::min(n, undealt_.size()));
        for (std::size_t i{}; i < n; ++i)
        {
            std::optional<Card> c = Deal();
            if (!c) break;
            out.push_back(*c);
        }
        return out;
    }

    auto Deck::Reset() -> void
    {
        undealt_.insert(undealt_.end(), dealt_.begin(), dealt_.end());
        dealt_.clear();
        Shuffle();
    }

    auto Deck::Recycle(std::span<Card const> cards) -> void
    {
        for (Card const& c : cards)
        {
            auto const it = std::ranges::find(dealt_, c);
            if (it == dealt_.end())
                CRM_THROW(error::Code::State, fmt::format("Recycled card {} was never dealt", util::ToString(c)));
            dealt_.erase(it);
            undealt_.push_back(c);
        }
        Shuffle();
    }

    auto Deck::Serialize() const -> DeckSnapshot
    {
        return DeckSnapshot{.undealt = undealt_, .dealt = dealt_};
    }

    auto Deck::Restore(DeckSnapshot snapshot) -> void
    {
        std::size_t const expected = n_decks_ * constants::CardsPerDeck;
        if (snapshot.undealt.size() + snapshot.dealt.size() != expected)
            CRM_THROW(error::Code::State, fmt::format("Deck snapshot holds {} cards, expected {}",
                                                      snapshot.undealt.size() + snapshot.dealt.size(), expected));

        util::CardUniqueChecker checker{};
        auto const foreign = [this](Card const& c) { return c.copy() >= n_decks_; };
        if (std::ranges::any_of(snapshot.undealt, foreign) || std::ranges::any_of(snapshot.dealt, foreign))
            CRM_THROW(error::Code::State, "Deck snapshot references a deck outside this shoe");
        for (Card const& c : snapshot.undealt) checker.Add(c);
        for (Card const& c : snapshot.dealt) checker.Add(c);
        if (checker.ContainsDup())
            CRM_THROW(error::Code::State, "Deck snapshot contains duplicate cards");

        undealt_ = std::move(snapshot.undealt);
        dealt_ = std::move(snapshot.dealt);
    }
}
