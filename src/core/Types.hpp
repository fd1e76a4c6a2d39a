//
// Created by Malik T on 14/08/2025.
//

#ifndef CARDROOM_TYPES_HPP
#define CARDROOM_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cardroom::core::constants
{
    inline constexpr std::size_t SuitCount = 4;
    inline constexpr std::size_t RankCount = 13;
    inline constexpr std::size_t CardsPerDeck = SuitCount * RankCount;
    // upper bound on shoe size, used by the duplicate checker
    inline constexpr std::size_t MaxDecks = 8;
}

namespace cardroom::core
{
    // Declaration order is the suit order used by Slave tie-breaks.
    enum class Suit : uint8_t
    {
        Clubs = 0,
        Diamonds,
        Hearts,
        Spades
    };

    enum class Rank : uint8_t
    {
        Ace = 1,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };

    // Value type. copy() tells apart identical faces from different decks of a shoe.
    class Card
    {
    public:
        Card() = delete;
        constexpr Card(Suit suit, Rank rank, uint8_t copy = 0) noexcept :
            suit_(suit), rank_(rank), copy_(copy) {}

        [[nodiscard]] constexpr auto suit() const noexcept -> Suit { return suit_; }
        [[nodiscard]] constexpr auto rank() const noexcept -> Rank { return rank_; }
        [[nodiscard]] constexpr auto copy() const noexcept -> uint8_t { return copy_; }

    private:
        Suit suit_;
        Rank rank_;
        uint8_t copy_;
    };

    constexpr auto operator==(Card const& a, Card const& b) noexcept -> bool
    {
        return a.suit() == b.suit() && a.rank() == b.rank() && a.copy() == b.copy();
    }

    constexpr auto RankNumber(Rank r) noexcept -> uint8_t { return static_cast<uint8_t>(r); }

    using CardVec = std::vector<Card>;
    using PlayerId = std::string;
    using Chips = int64_t;
    using PlyrIdxT = uint8_t;

    // Roster entry handed over by session management.
    struct PlayerInfo
    {
        PlayerId id;
        std::string display_name;
    };

    enum class GameKind : uint8_t
    {
        PokDeng = 0,
        Kang,
        Holdem,
        Blackjack,
        Slave,
        Dummy
    };

    inline auto ToString(GameKind k) -> std::string_view
    {
        switch (k)
        {
        case GameKind::PokDeng: return "pokdeng";
        case GameKind::Kang: return "kang";
        case GameKind::Holdem: return "holdem";
        case GameKind::Blackjack: return "blackjack";
        case GameKind::Slave: return "slave";
        case GameKind::Dummy: return "dummy";
        }
        return "unknown";
    }
}

#endif //CARDROOM_TYPES_HPP
