//
// Created by Malik T on 16/08/2025.
//

#ifndef CARDROOM_DECK_HPP
#define CARDROOM_DECK_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <vector>

#include "Types.hpp"

namespace cardroom::core
{
    // Flattened deck contents as they travel in a snapshot. Top of undealt is back().
    struct DeckSnapshot
    {
        CardVec undealt;
        CardVec dealt;
    };

    // Ordered, finite multiset of n_decks * 52 cards.
    // undealt + dealt always equals the multiset the deck was built with.
    class Deck
    {
    public:
        Deck() = delete;
        explicit Deck(uint8_t n_decks, uint64_t seed);

        auto Shuffle() -> void;

        // Empty optional once the deck is exhausted; never throws.
        auto Deal() -> std::optional<Card>;
        // Stops early when the deck runs out.
        auto DealMany(std::size_t n) -> CardVec;

        auto Reset() -> void;

        // Returns the given dealt cards to undealt and reshuffles undealt.
        // Throws StateError if a card was not dealt from this deck.
        auto Recycle(std::span<Card const> cards) -> void;

        [[nodiscard]] auto Serialize() const -> DeckSnapshot;
        // Throws StateError if the snapshot is not a permutation of this deck.
        auto Restore(DeckSnapshot snapshot) -> void;

        [[nodiscard]] auto Remaining() const noexcept -> std::size_t { return undealt_.size(); }
        [[nodiscard]] auto DealtCount() const noexcept -> std::size_t { return dealt_.size(); }
        [[nodiscard]] auto Size() const noexcept -> std::size_t { return undealt_.size() + dealt_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return undealt_.empty(); }
        [[nodiscard]] auto DeckCount() const noexcept -> uint8_t { return n_decks_; }

    private:
        uint8_t n_decks_;
        std::mt19937_64 rng_;
        CardVec undealt_;
        CardVec dealt_;
    };

    // Builds n_decks full decks in suit-major order (unshuffled).
    auto BuildCards(uint8_t n_decks) -> CardVec;
}

#endif //CARDROOM_DECK_HPP
