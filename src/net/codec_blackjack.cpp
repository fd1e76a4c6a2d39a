//
// Created by Malik T on 14/09/2025.
//

#include "codec.hpp"

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)BlackjackPhase::Finished == (int)fb::BlackjackPhase::Finished);

    namespace
    {
        auto PackHand(flatbuffers::FlatBufferBuilder& fbb, BlackjackHand const& h)
            -> flatbuffers::Offset<fb::BlackjackHand>
        {
            auto const cards = PackCards(fbb, h.cards);
            return fb::CreateBlackjackHand(fbb, cards, h.bet, h.payout, h.finished, h.doubled,
                                           h.from_split, h.surrendered);
        }

        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, BlackjackPlayer const& p)
            -> flatbuffers::Offset<fb::BlackjackPlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            std::vector<flatbuffers::Offset<fb::BlackjackHand>> hands;
            hands.reserve(p.hands.size());
            for (BlackjackHand const& h : p.hands) hands.push_back(PackHand(fbb, h));
            auto const hv = fbb.CreateVector(hands);
            return fb::CreateBlackjackPlayer(fbb, id, name, hv, p.bet, p.payout, p.has_bet, p.decided,
                                             p.current_hand);
        }

        auto UnpackPlayer(fb::BlackjackPlayer const& p) -> std::expected<BlackjackPlayer, ParseError>
        {
            BlackjackPlayer out{
                .id = Str(p.id()),
                .display_name = Str(p.display_name()),
                .hands = {},
                .bet = p.bet(),
                .payout = p.payout(),
                .has_bet = p.has_bet(),
                .decided = p.decided(),
                .current_hand = p.current_hand()
            };
            if (auto const* v = p.hands())
            {
                out.hands.reserve(v->size());
                for (fb::BlackjackHand const* h : *v)
                {
                    std::expected<CardVec, ParseError> cards = UnpackCards(h->cards());
                    if (!cards) return std::unexpected(cards.error());
                    out.hands.push_back(BlackjackHand{
                        .cards = std::move(*cards),
                        .bet = h->bet(),
                        .payout = h->payout(),
                        .finished = h->finished(),
                        .doubled = h->doubled(),
                        .from_split = h->from_split(),
                        .surrendered = h->surrendered()
                    });
                }
            }
            if (!out.hands.empty() && out.current_hand >= out.hands.size())
                return std::unexpected(ParseError{"Blackjack hand index out of range"});
            return out;
        }
    } // namespace

    auto GameCodec<BlackjackGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, BlackjackState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::BlackjackPlayer>> players;
        players.reserve(s.players.size());
        for (BlackjackPlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);
        auto const dealer = PackCards(fbb, s.dealer_hand);

        return fb::CreateBlackjackState(fbb, static_cast<fb::BlackjackPhase>(s.phase), pv, dealer,
                                        s.hole_revealed, s.current_idx, s.min_bet, s.max_bet,
                                        s.house_payout, s.round).Union();
    }

    auto GameCodec<BlackjackGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<BlackjackState, ParseError>
    {
        fb::BlackjackState const* s = msg.state_as_BlackjackState();
        if (!s) return std::unexpected(ParseError{"missing Blackjack state"});

        std::optional<BlackjackPhase> const phase = EnumFromFb<BlackjackPhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"Blackjack phase out of range"});

        BlackjackState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::BlackjackPlayer const* p : *v)
            {
                std::expected<BlackjackPlayer, ParseError> player = UnpackPlayer(*p);
                if (!player) return std::unexpected(player.error());
                out.players.push_back(std::move(*player));
            }
        }
        std::expected<CardVec, ParseError> dealer = UnpackCards(s->dealer_hand());
        if (!dealer) return std::unexpected(dealer.error());
        out.dealer_hand = std::move(*dealer);

        out.hole_revealed = s->hole_revealed();
        out.current_idx = s->current_idx();
        if (!SeatInRange(out.current_idx, out.players.size()))
            return std::unexpected(ParseError{"Blackjack seat index out of range"});
        out.min_bet = s->min_bet();
        out.max_bet = s->max_bet();
        out.house_payout = s->house_payout();
        out.round = s->round();
        return out;
    }

    auto GameCodec<BlackjackGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, BlackjackAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::PlaceBet,
                                                 fb::CreatePlaceBet(fbb, act.amount).Union()).Union();
            else if constexpr (std::is_same_v<T, HitAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::Hit,
                                                 fb::CreateHit(fbb, act.hand).Union()).Union();
            else if constexpr (std::is_same_v<T, StandAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::Stand,
                                                 fb::CreateStand(fbb, act.hand).Union()).Union();
            else if constexpr (std::is_same_v<T, DoubleAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::DoubleDown,
                                                 fb::CreateDoubleDown(fbb, act.hand).Union()).Union();
            else if constexpr (std::is_same_v<T, SplitAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::Split,
                                                 fb::CreateSplit(fbb, act.hand).Union()).Union();
            else if constexpr (std::is_same_v<T, SurrenderAction>)
                return fb::CreateBlackjackIntent(fbb, fb::BlackjackAct::Surrender,
                                                 fb::CreateSurrender(fbb).Union()).Union();
            else
                static_assert(util::always_false_v<T>, "Unhandled Blackjack action");
        }, a);
    }

    auto GameCodec<BlackjackGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<BlackjackAction, ParseError>
    {
        fb::BlackjackIntent const* intent = msg.intent_as_BlackjackIntent();
        if (!intent) return std::unexpected(ParseError{"missing Blackjack intent"});

        switch (intent->act_type())
        {
        case fb::BlackjackAct::PlaceBet:
            if (auto const* b = intent->act_as_PlaceBet()) return PlaceBetAction{.amount = b->amount()};
            break;
        case fb::BlackjackAct::Hit:
            if (auto const* h = intent->act_as_Hit()) return HitAction{.hand = h->hand()};
            break;
        case fb::BlackjackAct::Stand:
            if (auto const* st = intent->act_as_Stand()) return StandAction{.hand = st->hand()};
            break;
        case fb::BlackjackAct::DoubleDown:
            if (auto const* d = intent->act_as_DoubleDown()) return DoubleAction{.hand = d->hand()};
            break;
        case fb::BlackjackAct::Split:
            if (auto const* sp = intent->act_as_Split()) return SplitAction{.hand = sp->hand()};
            break;
        case fb::BlackjackAct::Surrender:
            return SurrenderAction{};
        default:
            return std::unexpected(ParseError{"unknown Blackjack action"});
        }
        return std::unexpected(ParseError{"Blackjack action without payload"});
    }
} // namespace cardroom::core::net
