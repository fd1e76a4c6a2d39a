//
// Created by Malik T on 14/09/2025.
//

#include "codec.hpp"

#include <algorithm>

#include "../core/Util.hpp"

namespace cardroom::core::net
{
    static_assert((int)HoldemPhase::Finished == (int)fb::HoldemPhase::Finished);
    static_assert((int)eval::PokerCategory::HighCard == (int)fb::PokerCategory::HighCard);
    static_assert((int)eval::PokerCategory::RoyalFlush == (int)fb::PokerCategory::RoyalFlush);

    namespace
    {
        auto PackResult(flatbuffers::FlatBufferBuilder& fbb, eval::PokerHand const& h)
            -> flatbuffers::Offset<fb::PokerHand>
        {
            auto const tb = fbb.CreateVector(h.tiebreak.data(), h.tiebreak.size());
            auto const cards = PackCards(fbb, h.cards);
            return fb::CreatePokerHand(fbb, static_cast<fb::PokerCategory>(h.category), tb, cards);
        }

        auto UnpackResult(fb::PokerHand const& h) -> std::expected<eval::PokerHand, ParseError>
        {
            std::optional<eval::PokerCategory> const cat = EnumFromFb<eval::PokerCategory>(h.category());
            if (!cat) return std::unexpected(ParseError{"poker category out of range"});

            eval::PokerHand out{};
            out.category = *cat;
            if (auto const* tb = h.tiebreak())
            {
                if (tb->size() > out.tiebreak.size())
                    return std::unexpected(ParseError{"poker tiebreak too long"});
                std::ranges::copy(*tb, out.tiebreak.begin());
            }
            std::expected<CardVec, ParseError> cards = UnpackCards(h.cards());
            if (!cards) return std::unexpected(cards.error());
            out.cards = std::move(*cards);
            return out;
        }

        auto PackPlayer(flatbuffers::FlatBufferBuilder& fbb, HoldemPlayer const& p)
            -> flatbuffers::Offset<fb::HoldemPlayer>
        {
            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.display_name);
            auto const hole = PackCards(fbb, p.hole);
            flatbuffers::Offset<fb::PokerHand> result{};
            if (p.result) result = PackResult(fbb, *p.result);
            return fb::CreateHoldemPlayer(fbb, id, name, hole, p.chips, p.bet, p.contributed, p.won, p.payout,
                                          p.folded, p.all_in, p.has_acted, p.sitting_out, result);
        }

        auto UnpackPlayer(fb::HoldemPlayer const& p) -> std::expected<HoldemPlayer, ParseError>
        {
            std::expected<CardVec, ParseError> hole = UnpackCards(p.hole());
            if (!hole) return std::unexpected(hole.error());

            HoldemPlayer out{
                .id = Str(p.id()),
                .display_name = Str(p.display_name()),
                .hole = std::move(*hole),
                .chips = p.chips(),
                .bet = p.bet(),
                .contributed = p.contributed(),
                .won = p.won(),
                .payout = p.payout(),
                .folded = p.folded(),
                .all_in = p.all_in(),
                .has_acted = p.has_acted(),
                .sitting_out = p.sitting_out()
            };
            if (fb::PokerHand const* r = p.result())
            {
                std::expected<eval::PokerHand, ParseError> result = UnpackResult(*r);
                if (!result) return std::unexpected(result.error());
                out.result = std::move(*result);
            }
            return out;
        }

        auto UnpackSeats(flatbuffers::Vector<std::uint8_t> const* v, std::size_t const count)
            -> std::expected<std::vector<PlyrIdxT>, ParseError>
        {
            std::vector<PlyrIdxT> out = Bytes(v);
            if (std::ranges::any_of(out, [count](PlyrIdxT i) { return i >= count; }))
                return std::unexpected(ParseError{"pot seat out of range"});
            return out;
        }
    } // namespace

    auto GameCodec<HoldemGame>::PackState(flatbuffers::FlatBufferBuilder& fbb, HoldemState const& s)
        -> flatbuffers::Offset<void>
    {
        std::vector<flatbuffers::Offset<fb::HoldemPlayer>> players;
        players.reserve(s.players.size());
        for (HoldemPlayer const& p : s.players) players.push_back(PackPlayer(fbb, p));
        auto const pv = fbb.CreateVector(players);
        auto const community = PackCards(fbb, s.community);

        std::vector<flatbuffers::Offset<fb::HoldemPot>> pots;
        pots.reserve(s.pots.size());
        for (HoldemPot const& pot : s.pots)
        {
            auto const eligible = fbb.CreateVector(pot.eligible);
            auto const winners = fbb.CreateVector(pot.winners);
            pots.push_back(fb::CreateHoldemPot(fbb, pot.amount, eligible, winners));
        }
        auto const potv = fbb.CreateVector(pots);

        return fb::CreateHoldemState(fbb, static_cast<fb::HoldemPhase>(s.phase), pv, community, potv,
                                     s.button_idx, s.sb_idx, s.bb_idx, s.current_idx,
                                     s.current_bet, s.min_raise, s.pot, s.small_blind, s.big_blind,
                                     s.round).Union();
    }

    auto GameCodec<HoldemGame>::UnpackState(fb::SnapshotMsg const& msg) -> std::expected<HoldemState, ParseError>
    {
        fb::HoldemState const* s = msg.state_as_HoldemState();
        if (!s) return std::unexpected(ParseError{"missing Hold'em state"});

        std::optional<HoldemPhase> const phase = EnumFromFb<HoldemPhase>(s->phase());
        if (!phase) return std::unexpected(ParseError{"Hold'em phase out of range"});

        HoldemState out{};
        out.phase = *phase;
        if (auto const* v = s->players())
        {
            out.players.reserve(v->size());
            for (fb::HoldemPlayer const* p : *v)
            {
                std::expected<HoldemPlayer, ParseError> player = UnpackPlayer(*p);
                if (!player) return std::unexpected(player.error());
                out.players.push_back(std::move(*player));
            }
        }
        std::expected<CardVec, ParseError> community = UnpackCards(s->community());
        if (!community) return std::unexpected(community.error());
        out.community = std::move(*community);

        if (auto const* v = s->pots())
        {
            out.pots.reserve(v->size());
            for (fb::HoldemPot const* pot : *v)
            {
                std::expected<std::vector<PlyrIdxT>, ParseError> eligible = UnpackSeats(pot->eligible(), out.players.size());
                if (!eligible) return std::unexpected(eligible.error());
                std::expected<std::vector<PlyrIdxT>, ParseError> winners = UnpackSeats(pot->winners(), out.players.size());
                if (!winners) return std::unexpected(winners.error());
                out.pots.push_back(HoldemPot{
                    .amount = pot->amount(), .eligible = std::move(*eligible), .winners = std::move(*winners)
                });
            }
        }

        out.button_idx = s->button_idx();
        out.sb_idx = s->sb_idx();
        out.bb_idx = s->bb_idx();
        out.current_idx = s->current_idx();
        for (PlyrIdxT const idx : {out.button_idx, out.sb_idx, out.bb_idx, out.current_idx})
        {
            if (!SeatInRange(idx, out.players.size()))
                return std::unexpected(ParseError{"Hold'em seat index out of range"});
        }
        out.current_bet = s->current_bet();
        out.min_raise = s->min_raise();
        out.pot = s->pot();
        out.small_blind = s->small_blind();
        out.big_blind = s->big_blind();
        out.round = s->round();
        return out;
    }

    auto GameCodec<HoldemGame>::PackAction(flatbuffers::FlatBufferBuilder& fbb, HoldemAction const& a)
        -> flatbuffers::Offset<void>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::Offset<void>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, FoldAction>)
                return fb::CreateHoldemIntent(fbb, fb::HoldemAct::Fold, fb::CreateFold(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, CheckAction>)
                return fb::CreateHoldemIntent(fbb, fb::HoldemAct::Check, fb::CreateCheck(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, CallAction>)
                return fb::CreateHoldemIntent(fbb, fb::HoldemAct::Call, fb::CreateCall(fbb).Union()).Union();
            else if constexpr (std::is_same_v<T, RaiseAction>)
                return fb::CreateHoldemIntent(fbb, fb::HoldemAct::Raise,
                                              fb::CreateRaise(fbb, act.amount).Union()).Union();
            else if constexpr (std::is_same_v<T, AllInAction>)
                return fb::CreateHoldemIntent(fbb, fb::HoldemAct::AllIn, fb::CreateAllIn(fbb).Union()).Union();
            else
                static_assert(util::always_false_v<T>, "Unhandled Hold'em action");
        }, a);
    }

    auto GameCodec<HoldemGame>::UnpackAction(fb::ActionMsg const& msg) -> std::expected<HoldemAction, ParseError>
    {
        fb::HoldemIntent const* intent = msg.intent_as_HoldemIntent();
        if (!intent) return std::unexpected(ParseError{"missing Hold'em intent"});

        switch (intent->act_type())
        {
        case fb::HoldemAct::Fold:
            return FoldAction{};
        case fb::HoldemAct::Check:
            return CheckAction{};
        case fb::HoldemAct::Call:
            return CallAction{};
        case fb::HoldemAct::Raise:
            if (auto const* r = intent->act_as_Raise()) return RaiseAction{.amount = r->amount()};
            break;
        case fb::HoldemAct::AllIn:
            return AllInAction{};
        default:
            return std::unexpected(ParseError{"unknown Hold'em action"});
        }
        return std::unexpected(ParseError{"Hold'em action without payload"});
    }
} // namespace cardroom::core::net
