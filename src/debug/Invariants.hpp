//
// Created by Malik T on 20/09/2025.
//

#ifndef CARDROOM_INVARIANTS_HPP
#define CARDROOM_INVARIANTS_HPP

#include <algorithm>
#include <numeric>
#include <string_view>
#include <tuple>

#include "../core/BlackjackGame.hpp"
#include "../core/Deck.hpp"
#include "../core/DummyGame.hpp"
#include "../core/Exception.hpp"
#include "../core/HoldemGame.hpp"
#include "../core/KangGame.hpp"
#include "../core/PokDengGame.hpp"
#include "../core/SlaveGame.hpp"
#include "../core/Util.hpp"

namespace cardroom::core::debug
{
    // A second layer of checks used by tests and self-play. Every card the deck reports as
    // dealt must sit in exactly one visible zone of the state. Throws AssertionError.
    namespace detail
    {
        inline auto CardKey(Card const& c) -> std::tuple<uint8_t, uint8_t, uint8_t>
        {
            return {c.copy(), static_cast<uint8_t>(c.suit()), RankNumber(c.rank())};
        }

        // exact: zones hold every dealt card. Otherwise zones only need to be a subset
        // (blackjack keeps no discard tray between reshuffles).
        inline auto CheckZones(std::string_view game, CardVec zones, DeckSnapshot const& deck, bool exact) -> void
        {
            CRM_ASSERT(!util::ContainsDup(std::span<Card const>{zones}),
                       fmt::format("{}: a card sits in two zones", game));

            CardVec dealt = deck.dealt;
            auto const by_key = [](Card const& a, Card const& b) { return CardKey(a) < CardKey(b); };
            std::ranges::sort(zones, by_key);
            std::ranges::sort(dealt, by_key);

            if (exact)
            {
                CRM_ASSERT(zones.size() == dealt.size(),
                           fmt::format("{}: {} cards in zones, deck dealt {}", game, zones.size(), dealt.size()));
                CRM_ASSERT(std::ranges::equal(zones, dealt),
                           fmt::format("{}: zone cards differ from dealt cards", game));
            }
            else
            {
                CRM_ASSERT(std::ranges::includes(dealt, zones, by_key),
                           fmt::format("{}: a zone card was never dealt", game));
            }
        }

        inline auto Append(CardVec& out, CardVec const& in) -> void
        {
            out.insert(out.end(), in.begin(), in.end());
        }
    }

    inline auto CheckCardConservation(PokDengGame const& g) -> void
    {
        PokDengGame::Snapshot const s = g.Serialize();
        CardVec zones;
        for (PokDengPlayer const& p : s.state.players) detail::Append(zones, p.hand);
        detail::CheckZones("pokdeng", std::move(zones), s.deck, true);
    }

    inline auto CheckCardConservation(KangGame const& g) -> void
    {
        KangGame::Snapshot const s = g.Serialize();
        CardVec zones = s.state.muck;
        for (KangPlayer const& p : s.state.players) detail::Append(zones, p.hand);
        detail::CheckZones("kang", std::move(zones), s.deck, true);
    }

    inline auto CheckCardConservation(HoldemGame const& g) -> void
    {
        HoldemGame::Snapshot const s = g.Serialize();
        CardVec zones = s.state.community;
        for (HoldemPlayer const& p : s.state.players) detail::Append(zones, p.hole);
        detail::CheckZones("holdem", std::move(zones), s.deck, true);
    }

    inline auto CheckCardConservation(BlackjackGame const& g) -> void
    {
        BlackjackGame::Snapshot const s = g.Serialize();
        CardVec zones = s.state.dealer_hand;
        for (BlackjackPlayer const& p : s.state.players)
        {
            for (BlackjackHand const& h : p.hands) detail::Append(zones, h.cards);
        }
        detail::CheckZones("blackjack", std::move(zones), s.deck, false);
    }

    inline auto CheckCardConservation(SlaveGame const& g) -> void
    {
        SlaveGame::Snapshot const s = g.Serialize();
        CardVec zones = s.state.pile; // the table play is a view into the pile
        for (SlavePlayer const& p : s.state.players) detail::Append(zones, p.hand);
        detail::CheckZones("slave", std::move(zones), s.deck, true);
    }

    inline auto CheckCardConservation(DummyGame const& g) -> void
    {
        DummyGame::Snapshot const s = g.Serialize();
        CardVec zones = s.state.discard;
        for (DummyPlayer const& p : s.state.players) detail::Append(zones, p.hand);
        for (DummyMeld const& m : s.state.melds) detail::Append(zones, m.cards);
        detail::CheckZones("dummy", std::move(zones), s.deck, true);
    }

    // Chips never leave the table: stacks plus the live pot equal what was bought in.
    inline auto CheckChipConservation(HoldemGame const& g, Chips const total) -> void
    {
        HoldemState const& s = g.GetState();
        Chips const stacks = std::accumulate(s.players.begin(), s.players.end(), Chips{0},
                                             [](Chips acc, HoldemPlayer const& p) { return acc + p.chips; });
        CRM_ASSERT(stacks + s.pot == total,
                   fmt::format("holdem: {} in stacks + {} in pot != {}", stacks, s.pot, total));
    }
}

#endif //CARDROOM_INVARIANTS_HPP
