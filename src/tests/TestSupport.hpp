#ifndef CARDROOM_TESTSUPPORT_HPP
#define CARDROOM_TESTSUPPORT_HPP

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../core/Deck.hpp"
#include "../core/Types.hpp"
#include "../core/Util.hpp"

namespace cardroom::test
{
    using core::Card;
    using core::CardVec;

    inline auto Cards(std::initializer_list<std::string_view> txt) -> CardVec
    {
        CardVec out;
        for (std::string_view t : txt)
        {
            std::optional<Card> const c = core::util::ParseCard(t);
            if (!c) throw std::invalid_argument("bad card text: " + std::string(t));
            out.push_back(*c);
        }
        return out;
    }

    // Rearranges undealt so the next deals come out in `order`, first card first.
    inline auto StackDeck(core::DeckSnapshot& deck, CardVec const& order) -> void
    {
        for (Card const& c : order)
        {
            auto const it = std::ranges::find(deck.undealt, c);
            if (it == deck.undealt.end()) throw std::invalid_argument("card already dealt: " + core::util::ToString(c));
            deck.undealt.erase(it);
        }
        deck.undealt.insert(deck.undealt.end(), order.rbegin(), order.rend());
    }

    // Same, applied to a live engine through Serialize/Restore.
    template <typename Game>
    auto StackNext(Game& g, CardVec const& order) -> void
    {
        typename Game::Snapshot s = g.Serialize();
        StackDeck(s.deck, order);
        g.Restore(std::move(s));
    }

    // Replaces the deck wholesale: `dealt` is what already sits in the state, `next` comes out first.
    inline auto RebuildDeck(core::DeckSnapshot& deck, CardVec const& dealt, CardVec const& next,
                            uint8_t n_decks = 1) -> void
    {
        CardVec rest = core::BuildCards(n_decks);
        for (CardVec const* group : {&dealt, &next})
        {
            for (Card const& c : *group)
            {
                auto const it = std::ranges::find(rest, c);
                if (it == rest.end()) throw std::invalid_argument("card listed twice: " + core::util::ToString(c));
                rest.erase(it);
            }
        }
        rest.insert(rest.end(), next.rbegin(), next.rend());
        deck.undealt = std::move(rest);
        deck.dealt = dealt;
    }

    inline auto Ids(std::initializer_list<std::string_view> ids) -> std::vector<core::PlayerInfo>
    {
        std::vector<core::PlayerInfo> out;
        for (std::string_view id : ids) out.push_back(core::PlayerInfo{std::string(id), std::string(id)});
        return out;
    }
}

#endif //CARDROOM_TESTSUPPORT_HPP
