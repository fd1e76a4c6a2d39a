//
// Created by Malik T on 15/09/2025.
//

#include "codec.hpp"

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)DummyPhase::Finished == (int)fb::DummyPhase::Finished);
    static_assert((int)eval::MeldType::Run == (int)fb::MeldType::Run);

    namespace
    {
        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, DummyPlayer const& p)
            -> flatbuffers::Offset<fb::DummyPlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            auto const hand = PackCards(fbb, p.hand);
            return fb::CreateDummyPlayer(fbb, id, name, hand, p.deadwood, p.score, p.is_knocker);
        }

        auto PackMeld(flatbuffers::FlatBufferBuilder& fbb, DummyMeld const& m)
            -> flatbuffers::Offset<fb::DummyMeld>
        {
            auto const cards = PackCards(fbb, m.cards);
            auto const owner = fbb.CreateString(m.owner);
            return fb::CreateDummyMeld(fbb, m.id, static_cast<fb::MeldType>(m.type), cards, owner);
        }

        auto OptionalId(flatbuffers::String const* s) -> std::optional<PlayerId>
        {
            if (!s || s->size() == 0) return std::nullopt;
            return s->str();
        }

        auto Single(fb::Card const* c) -> std::expected<Card, ParseError>
        {
            if (!c) return std::unexpected(ParseError{"missing card"});
            std::optional<Card> const card = FromFbCard(*c);
            if (!card) return std::unexpected(ParseError{"card out of range"});
            return *card;
        }
    } // namespace

    auto GameCodec<DummyGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, DummyState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::DummyPlayer>> players;
        players.reserve(s.players.size());
        for (DummyPlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);
        auto const discard = PackCards(fbb, s.discard);

        std::vector<flatbuffers::Offset<fb::DummyMeld>> melds;
        melds.reserve(s.melds.size());
        for (DummyMeld const& m : s.melds) melds.push_back(PackMeld(fbb, m));
        auto const mv = fbb.CreateVector(melds);

        auto const winner = fbb.CreateString(s.winner.value_or(PlayerId{}));
        auto const knocker = fbb.CreateString(s.knocker.value_or(PlayerId{}));

        return fb::CreateDummyState(fbb, static_cast<fb::DummyPhase>(s.phase), pv, discard, mv,
                                    s.current_idx, s.starter_idx, s.has_drawn, s.next_meld_id,
                                    winner, knocker, s.undercut, s.went_out, s.round).Union();
    }

    auto GameCodec<DummyGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<DummyState, ParseError>
    {
        fb::DummyState const* s = msg.state_as_DummyState();
        if (!s) return std::unexpected(ParseError{"missing Dummy state"});

        std::optional<DummyPhase> const phase = EnumFromFb<DummyPhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"Dummy phase out of range"});

        DummyState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::DummyPlayer const* p : *v)
            {
                std::expected<CardVec, ParseError> hand = UnpackCards(p->hand());
                if (!hand) return std::unexpected(hand.error());
                out.players.push_back(DummyPlayer{
                    .id = Str(p->id()),
                    .display_name = Str(p->display_name()),
                    .hand = std::move(*hand),
                    .deadwood = p->deadwood(),
                    .score = p->score(),
                    .is_knocker = p->is_knocker()
                });
            }
        }
        std::expected<CardVec, ParseError> discard = UnpackCards(s->discard());
        if (!discard) return std::unexpected(discard.error());
        out.discard = std::move(*discard);

        if (auto const* v = s->melds())
        {
            out.melds.reserve(v->size());
            for (fb::DummyMeld const* m : *v)
            {
                std::optional<eval::MeldType> const type = EnumFromFb<eval::MeldType>(m->meld_type());
                if (!type) return std::unexpected(ParseError{"meld type out of range"});
                std::expected<CardVec, ParseError> cards = UnpackCards(m->cards());
                if (!cards) return std::unexpected(cards.error());
                out.melds.push_back(DummyMeld{
                    .id = m->id(), .type = *type, .cards = std::move(*cards), .owner = Str(m->owner())
                });
            }
        }

        out.current_idx = s->current_idx();
        out.starter_idx = s->starter_idx();
        if (!SeatInRange(out.current_idx, out.players.size()) || !SeatInRange(out.starter_idx, out.players.size()))
            return std::unexpected(ParseError{"Dummy seat index out of range"});
        out.has_drawn = s->has_drawn();
        out.next_meld_id = s->next_meld_id();
        out.winner = OptionalId(s->winner());
        out.knocker = OptionalId(s->knocker());
        out.undercut = s->undercut();
        out.went_out = s->went_out();
        out.round = s->round();
        return out;
    }

    auto GameCodec<DummyGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, DummyAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DrawStockAction>)
                return fb::CreateDummyIntent(fbb, fb::DummyAct::DrawStock,
                                             fb::CreateDrawStock(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, DrawDiscardAction>)
                return fb::CreateDummyIntent(fbb, fb::DummyAct::DrawDiscard,
                                             fb::CreateDrawDiscard(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, MeldAction>)
            {
                auto const cards = PackCards(fbb, act.cards);
                return fb::CreateDummyIntent(fbb, fb::DummyAct::Meld,
                                             fb::CreateMeld(fbb, cards).Union()).Union();
            }
            else if constexpr (std::is_same_v<T, LayOffAction>)
            {
                fb::Card const card = ToFbCard(act.card);
                return fb::CreateDummyIntent(fbb, fb::DummyAct::LayOff,
                                             fb::CreateLayOff(fbb, &card, act.meld_id).Union()).Union();
            }
            else if constexpr (std::is_same_v<T, DiscardCardAction>)
            {
                fb::Card const card = ToFbCard(act.card);
                return fb::CreateDummyIntent(fbb, fb::DummyAct::DiscardCard,
                                             fb::CreateDiscardCard(fbb, &card).Union()).Union();
            }
            else if constexpr (std::is_same_v<T, KnockAction>)
                return fb::CreateDummyIntent(fbb, fb::DummyAct::Knock, fb::CreateKnock(fbb).Union()).Union();
            else
                static_assert(util::always_false_v<T>, "Unhandled Dummy action");
        }, a);
    }

    auto GameCodec<DummyGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<DummyAction, ParseError>
    {
        fb::DummyIntent const* intent = msg.intent_as_DummyIntent();
        if (!intent) return std::unexpected(ParseError{"missing Dummy intent"});

        switch (intent->act_type())
        {
        case fb::DummyAct::DrawStock:
            return DrawStockAction{};
        case fb::DummyAct::DrawDiscard:
            return DrawDiscardAction{};
        case fb::DummyAct::Meld:
            if (auto const* m = intent->act_as_Meld())
            {
                std::expected<CardVec, ParseError> cards = UnpackCards(m->cards());
                if (!cards) return std::unexpected(cards.error());
                return MeldAction{.cards = std::move(*cards)};
            }
            break;
        case fb::DummyAct::LayOff:
            if (auto const* l = intent->act_as_LayOff())
            {
                std::expected<Card, ParseError> card = Single(l->card());
                if (!card) return std::unexpected(card.error());
                return LayOffAction{.card = *card, .meld_id = l->meld_id()};
            }
            break;
        case fb::DummyAct::DiscardCard:
            if (auto const* d = intent->act_as_DiscardCard())
            {
                std::expected<Card, ParseError> card = Single(d->card());
                if (!card) return std::unexpected(card.error());
                return DiscardCardAction{.card = *card};
            }
            break;
        case fb::DummyAct::Knock:
            return KnockAction{};
        default:
            return std::unexpected(ParseError{"unknown Dummy action"});
        }
        return std::unexpected(ParseError{"Dummy action without payload"});
    }
} // namespace cardroom::core::net
