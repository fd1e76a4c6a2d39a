//
// Created by Malik T on 13/09/2025.
//

#include "codec.hpp"

#include <algorithm>
#include <string_view>

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)KangPhase::Finished == (int)fb::KangPhase::Finished);
    static_assert((int)eval::DrawHandType::Kang == (int)fb::DrawHandType::Kang);
    static_assert((int)eval::DrawHandType::StraightFlush == (int)fb::DrawHandType::StraightFlush);

    namespace
    {
        auto PackResult(flatbuffers::FlatBufferBuilder& fbb, eval::DrawHand const& h)
            -> flatbuffers::Offset<fb::DrawHand>
        {
            auto const tb = fbb.CreateVector(h.tiebreak.data(), h.tiebreak.size());
            return fb::CreateDrawHand(fbb, static_cast<fb::DrawHandType>(h.type), h.multiplier, tb);
        }

        auto UnpackResult(fb::DrawHand const& h) -> std::expected<eval::DrawHand, ParseError>
        {
            // sparse enum: range checks are not enough
            if (std::string_view{fb::EnumNameDrawHandType(h.hand_type())}.empty())
                return std::unexpected(ParseError{"draw hand type out of range"});

            eval::DrawHand out{};
            out.type = static_cast<eval::DrawHandType>(h.hand_type());
            out.multiplier = h.multiplier();
            if (auto const* tb = h.tiebreak())
            {
                if (tb->size() > out.tiebreak.size())
                    return std::unexpected(ParseError{"draw hand tiebreak too long"});
                std::ranges::copy(*tb, out.tiebreak.begin());
            }
            return out;
        }

        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, KangPlayer const& p)
            -> flatbuffers::Offset<fb::KangPlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            auto const hand = PackCards(fbb, p.hand);
            flatbuffers::Offset<fb::DrawHand> result{};
            if (p.result) result = PackResult(fbb, *p.result);
            return fb::CreateKangPlayer(fbb, id, name, hand, p.bet, p.payout, p.is_dealer, p.folded,
                                        p.has_bet, p.has_acted, p.discarded, result);
        }

        auto UnpackPlayer(fb::KangPlayer const& p) -> std::expected<KangPlayer, ParseError>
        {
            std::expected<CardVec, ParseError> hand = UnpackCards(p.hand());
            if (!hand) return std::unexpected(hand.error());

            KangPlayer out{
                .id = Str(p.id()),
                .display_name = Str(p.display_name()),
                .hand = std::move(*hand),
                .bet = p.bet(),
                .payout = p.payout(),
                .is_dealer = p.is_dealer(),
                .folded = p.folded(),
                .has_bet = p.has_bet(),
                .has_acted = p.has_acted(),
                .discarded = p.discarded()
            };
            if (fb::DrawHand const* r = p.result())
            {
                std::expected<eval::DrawHand, ParseError> result = UnpackResult(*r);
                if (!result) return std::unexpected(result.error());
                out.result = *result;
            }
            return out;
        }
    } // namespace

    auto GameCodec<KangGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, KangState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::KangPlayer>> players;
        players.reserve(s.players.size());
        for (KangPlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);
        auto const muck = PackCards(fbb, s.muck);

        return fb::CreateKangState(fbb, static_cast<fb::KangPhase>(s.phase), pv, muck,
                                   s.dealer_idx, s.current_idx, s.pot, s.min_bet, s.max_bet,
                                   s.round).Union();
    }

    auto GameCodec<KangGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<KangState, ParseError>
    {
        fb::KangState const* s = msg.state_as_KangState();
        if (!s) return std::unexpected(ParseError{"missing Kang state"});

        std::optional<KangPhase> const phase = EnumFromFb<KangPhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"Kang phase out of range"});

        KangState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::KangPlayer const* p : *v)
            {
                std::expected<KangPlayer, ParseError> player = UnpackPlayer(*p);
                if (!player) return std::unexpected(player.error());
                out.players.push_back(std::move(*player));
            }
        }
        std::expected<CardVec, ParseError> muck = UnpackCards(s->muck());
        if (!muck) return std::unexpected(muck.error());
        out.muck = std::move(*muck);

        out.dealer_idx = s->dealer_idx();
        out.current_idx = s->current_idx();
        if (!SeatInRange(out.dealer_idx, out.players.size()) || !SeatInRange(out.current_idx, out.players.size()))
            return std::unexpected(ParseError{"Kang seat index out of range"});
        out.pot = s->pot();
        out.min_bet = s->min_bet();
        out.max_bet = s->max_bet();
        out.round = s->round();
        return out;
    }

    auto GameCodec<KangGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, KangAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
                return fb::CreateKangIntent(fbb, fb::KangAct::PlaceBet,
                                            fb::CreatePlaceBet(fbb, act.amount).Union()).Union();
            else if constexpr (std::is_same_v<T, DiscardAction>)
            {
                auto const idx = fbb.CreateVector(act.indices);
                return fb::CreateKangIntent(fbb, fb::KangAct::Discard,
                                            fb::CreateDiscard(fbb, idx).Union()).Union();
            }
            else if constexpr (std::is_same_v<T, KeepAllAction>)
                return fb::CreateKangIntent(fbb, fb::KangAct::KeepAll,
                                            fb::CreateKeepAll(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, FoldAction>)
                return fb::CreateKangIntent(fbb, fb::KangAct::Fold,
                                            fb::CreateFold(fbb).Union()).Union();
            else
                static_assert(util::always_false_v<T>, "Unhandled Kang action");
        }, a);
    }

    auto GameCodec<KangGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<KangAction, ParseError>
    {
        fb::KangIntent const* intent = msg.intent_as_KangIntent();
        if (!intent) return std::unexpected(ParseError{"missing Kang intent"});

        switch (intent->act_type())
        {
        case fb::KangAct::PlaceBet:
            if (auto const* b = intent->act_as_PlaceBet()) return PlaceBetAction{.amount = b->amount()};
            break;
        case fb::KangAct::Discard:
            if (auto const* d = intent->act_as_Discard()) return DiscardAction{.indices = Bytes(d->indices())};
            break;
        case fb::KangAct::KeepAll:
            return KeepAllAction{};
        case fb::KangAct::Fold:
            return FoldAction{};
        default:
            return std::unexpected(ParseError{"unknown Kang action"});
        }
        return std::unexpected(ParseError{"Kang action without payload"});
    }
} // namespace cardroom::core::net
