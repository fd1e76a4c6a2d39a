//
// Created by Malik T on 13/09/2025.
//

#include "codec.hpp"

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)PokDengPhase::Finished == (int)fb::PokDengPhase::Finished);
    static_assert((int)eval::PointHandType::StraightFlush == (int)fb::PointHandType::StraightFlush);

    namespace
    {
        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, PokDengPlayer const& p)
            -> flatbuffers::Offset<fb::PokDengPlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            auto const hand = PackCards(fbb, p.hand);
            std::optional<fb::PointHand> result{};
            if (p.result)
            {
                result.emplace(p.result->points, static_cast<fb::PointHandType>(p.result->type),
                               p.result->multiplier, p.result->natural);
            }
            return fb::CreatePokDengPlayer(fbb, id, name, hand, p.bet, p.payout,
                                           p.is_dealer, p.folded, p.has_bet, p.has_drawn,
                                           result ? &*result : nullptr);
        }

        auto UnpackPlayer(fb::PokDengPlayer const& p) -> std::expected<PokDengPlayer, ParseError>
        {
            std::expected<CardVec, ParseError> hand = UnpackCards(p.hand());
            if (!hand) return std::unexpected(hand.error());

            PokDengPlayer out{
                .id = Str(p.id()),
                .display_name = Str(p.display_name()),
                .hand = std::move(*hand),
                .bet = p.bet(),
                .payout = p.payout(),
                .is_dealer = p.is_dealer(),
                .folded = p.folded(),
                .has_bet = p.has_bet(),
                .has_drawn = p.has_drawn()
            };
            if (fb::PointHand const* r = p.result())
            {
                std::optional<eval::PointHandType> const type = EnumFromFb<eval::PointHandType>(r->hand_type());
                if (!type) return std::unexpected(ParseError{"point hand type out of range"});
                out.result = eval::PointHand{
                    .points = r->points(), .type = *type, .multiplier = r->multiplier(), .natural = r->natural()
                };
            }
            return out;
        }
    } // namespace

    auto GameCodec<PokDengGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, PokDengState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::PokDengPlayer>> players;
        players.reserve(s.players.size());
        for (PokDengPlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);

        return fb::CreatePokDengState(fbb, static_cast<fb::PokDengPhase>(s.phase), pv,
                                      s.dealer_idx, s.current_idx, s.pot, s.min_bet, s.max_bet,
                                      s.round).Union();
    }

    auto GameCodec<PokDengGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<PokDengState, ParseError>
    {
        fb::PokDengState const* s = msg.state_as_PokDengState();
        if (!s) return std::unexpected(ParseError{"missing PokDeng state"});

        std::optional<PokDengPhase> const phase = EnumFromFb<PokDengPhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"PokDeng phase out of range"});

        PokDengState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::PokDengPlayer const* p : *v)
            {
                std::expected<PokDengPlayer, ParseError> player = UnpackPlayer(*p);
                if (!player) return std::unexpected(player.error());
                out.players.push_back(std::move(*player));
            }
        }
        out.dealer_idx = s->dealer_idx();
        out.current_idx = s->current_idx();
        if (!SeatInRange(out.dealer_idx, out.players.size()) || !SeatInRange(out.current_idx, out.players.size()))
            return std::unexpected(ParseError{"PokDeng seat index out of range"});
        out.pot = s->pot();
        out.min_bet = s->min_bet();
        out.max_bet = s->max_bet();
        out.round = s->round();
        return out;
    }

    auto GameCodec<PokDengGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, PokDengAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
                return fb::CreatePokDengIntent(fbb, fb::PokDengAct::PlaceBet,
                                               fb::CreatePlaceBet(fbb, act.amount).Union()).Union();
            else if constexpr (std::is_same_v<T, DrawCardAction>)
                return fb::CreatePokDengIntent(fbb, fb::PokDengAct::DrawCard,
                                               fb::CreateDrawCard(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, StayAction>)
                return fb::CreatePokDengIntent(fbb, fb::PokDengAct::Stay,
                                               fb::CreateStay(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, FoldAction>)
                return fb::CreatePokDengIntent(fbb, fb::PokDengAct::Fold,
                                               fb::CreateFold(fbb).Union()).Union();
            else
                static_assert(util::always_false_v<T>, "Unhandled PokDeng action");
        }, a);
    }

    auto GameCodec<PokDengGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<PokDengAction, ParseError>
    {
        fb::PokDengIntent const* intent = msg.intent_as_PokDengIntent();
        if (!intent) return std::unexpected(ParseError{"missing PokDeng intent"});

        switch (intent->act_type())
        {
        case fb::PokDengAct::PlaceBet:
            if (auto const* b = intent->act_as_PlaceBet()) return PlaceBetAction{.amount = b->amount()};
            break;
        case fb::PokDengAct::DrawCard:
            return DrawCardAction{};
        case fb::PokDengAct::Stay:
            return StayAction{};
        case fb::PokDengAct::Fold:
            return FoldAction{};
        default:
            return std::unexpected(ParseError{"unknown PokDeng action"});
        }
        return std::unexpected(ParseError{"PokDeng action without payload"});
    }
} // namespace cardroom::core::net
