//
// Created by Malik T on 15/09/2025.
//

#include "codec.hpp"

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)SlavePhase::Finished == (int)fb::SlavePhase::Finished);
    static_assert((int)SlaveTitle::Slave == (int)fb::SlaveTitle::Slave);
    static_assert((int)eval::SlavePlayType::Run == (int)fb::SlavePlayType::Run);

    namespace
    {
        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, SlavePlayer const& p)
            -> flatbuffers::Offset<fb::SlavePlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            auto const hand = PackCards(fbb, p.hand);
            return fb::CreateSlavePlayer(fbb, id, name, hand, p.passed, p.out,
                                         p.finish_pos.has_value(), p.finish_pos.value_or(0),
                                         static_cast<fb::SlaveTitle>(p.title));
        }

        auto UnpackPlayer(fb::SlavePlayer const& p) -> std::expected<SlavePlayer, ParseError>
        {
            std::expected<CardVec, ParseError> hand = UnpackCards(p.hand());
            if (!hand) return std::unexpected(hand.error());
            std::optional<SlaveTitle> const title = EnumFromFb<SlaveTitle>(p.title());
            if (!title) return std::unexpected(ParseError{"Slave title out of range"});

            SlavePlayer out{
                .id = Str(p.id()),
                .display_name = Str(p.display_name()),
                .hand = std::move(*hand),
                .passed = p.passed(),
                .out = p.out(),
                .finish_pos = std::nullopt,
                .title = *title
            };
            if (p.has_finish_pos()) out.finish_pos = p.finish_pos();
            return out;
        }

        auto UnpackPlay(fb::SlavePlay const& t) -> std::expected<eval::SlavePlay, ParseError>
        {
            std::expected<CardVec, ParseError> cards = UnpackCards(t.cards());
            if (!cards) return std::unexpected(cards.error());
            std::optional<eval::SlavePlayType> const type = EnumFromFb<eval::SlavePlayType>(t.play_type());
            if (!type) return std::unexpected(ParseError{"Slave play type out of range"});
            return eval::SlavePlay{.cards = std::move(*cards), .type = *type, .value = t.value()};
        }
    } // namespace

    auto GameCodec<SlaveGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, SlaveState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::SlavePlayer>> players;
        players.reserve(s.players.size());
        for (SlavePlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);

        flatbuffers::Offset<fb::SlavePlay> on_table{};
        if (s.table)
        {
            auto const cards = PackCards(fbb, s.table->cards);
            on_table = fb::CreateSlavePlay(fbb, cards, static_cast<fb::SlavePlayType>(s.table->type), s.table->value);
        }
        auto const pile = PackCards(fbb, s.pile);
        auto const order = fbb.CreateVectorOfStrings(s.finish_order);
        auto const prev = fbb.CreateString(s.previous_slave.value_or(PlayerId{}));

        return fb::CreateSlaveState(fbb, static_cast<fb::SlavePhase>(s.phase), pv, on_table,
                                    s.last_played_idx.has_value(), s.last_played_idx.value_or(0),
                                    pile, order, prev, s.current_idx, s.round).Union();
    }

    auto GameCodec<SlaveGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<SlaveState, ParseError>
    {
        fb::SlaveState const* s = msg.state_as_SlaveState();
        if (!s) return std::unexpected(ParseError{"missing Slave state"});

        std::optional<SlavePhase> const phase = EnumFromFb<SlavePhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"Slave phase out of range"});

        SlaveState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::SlavePlayer const* p : *v)
            {
                std::expected<SlavePlayer, ParseError> player = UnpackPlayer(*p);
                if (!player) return std::unexpected(player.error());
                out.players.push_back(std::move(*player));
            }
        }
        if (fb::SlavePlay const* t = s->on_table())
        {
            std::expected<eval::SlavePlay, ParseError> play = UnpackPlay(*t);
            if (!play) return std::unexpected(play.error());
            out.table = std::move(*play);
        }
        if (s->has_last_played())
        {
            if (s->last_played_idx() >= out.players.size())
                return std::unexpected(ParseError{"Slave seat index out of range"});
            out.last_played_idx = s->last_played_idx();
        }
        std::expected<CardVec, ParseError> pile = UnpackCards(s->pile());
        if (!pile) return std::unexpected(pile.error());
        out.pile = std::move(*pile);

        if (auto const* order = s->finish_order())
        {
            for (flatbuffers::String const* id : *order) out.finish_order.push_back(id->str());
        }
        if (std::string prev = Str(s->previous_slave()); !prev.empty()) out.previous_slave = std::move(prev);

        out.current_idx = s->current_idx();
        if (!SeatInRange(out.current_idx, out.players.size()))
            return std::unexpected(ParseError{"Slave seat index out of range"});
        out.round = s->round();
        return out;
    }

    auto GameCodec<SlaveGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, SlaveAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PassAction>)
                return fb::CreateSlaveIntent(fbb, fb::SlaveAct::Pass, fb::CreatePass(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, PlayCardsAction>)
            {
                auto const cards = PackCards(fbb, act.cards);
                return fb::CreateSlaveIntent(fbb, fb::SlaveAct::PlayCards,
                                             fb::CreatePlayCards(fbb, cards).Union()).Union();
            }
            else
                static_assert(util::always_false_v<T>, "Unhandled Slave action");
        }, a);
    }

    auto GameCodec<SlaveGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<SlaveAction, ParseError>
    {
        fb::SlaveIntent const* intent = msg.intent_as_SlaveIntent();
        if (!intent) return std::unexpected(ParseError{"missing Slave intent"});

        switch (intent->act_type())
        {
        case fb::SlaveAct::Pass:
            return PassAction{};
        case fb::SlaveAct::PlayCards:
            if (auto const* p = intent->act_as_PlayCards())
            {
                std::expected<CardVec, ParseError> cards = UnpackCards(p->cards());
                if (!cards) return std::unexpected(cards.error());
                return PlayCardsAction{.cards = std::move(*cards)};
            }
            break;
        default:
            return std::unexpected(ParseError{"unknown Slave action"});
        }
        return std::unexpected(ParseError{"Slave action without payload"});
    }
} // namespace cardroom::core::net
