//
// Created by Malik T on 01/09/2025.
//

#include "DummyGame.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

#include "Util.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    auto SortDummyHand(CardVec& hand) -> void
    {
        std::ranges::sort(hand, [](Card const& a, Card const& b)
        {
            if (a.suit() != b.suit()) return a.suit() < b.suit();
            return a.rank() < b.rank();
        });
    }

    DummyGame::DummyGame(DummyConfig const& config) :
        cfg_(config),
        deck_(1, cfg_.seed)
    {
        if (cfg_.min_players < 2 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("Dummy seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        // every hand plus the first discard
        std::size_t const heads_up = 2u * cfg_.heads_up_hand + 1;
        std::size_t const full = static_cast<std::size_t>(cfg_.max_players) * cfg_.table_hand + 1;
        if (heads_up > deck_.Size() || full > deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("Dummy hands of {}/{} do not fit one deck for {} players",
                                                      cfg_.heads_up_hand, cfg_.table_hand, cfg_.max_players));
        if (cfg_.heads_up_hand == 0 || cfg_.table_hand == 0)
            CRM_THROW(error::Code::Rules, "Dummy hands cannot be empty");
    }

    auto DummyGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase == DummyPhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(DummyPlayer{.id = info.id, .display_name = info.display_name});
        return {};
    }

    auto DummyGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase == DummyPhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(id));
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, id);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(id));

        state_.players.erase(state_.players.begin() + *seat);
        if (*seat < state_.starter_idx) --state_.starter_idx;
        if (state_.starter_idx >= state_.players.size()) state_.starter_idx = 0;
        return {};
    }

    auto DummyGame::StartRound() -> CheckResult
    {
        if (state_.phase == DummyPhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        if (state_.players.size() < cfg_.min_players)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers)
                                   .with_attempted(static_cast<uint8_t>(state_.players.size())));

        deck_.Reset();
        for (DummyPlayer& p : state_.players)
        {
            p.hand.clear();
            p.deadwood = 0;
            p.score = 0;
            p.is_knocker = false;
        }

        std::size_t const n = state_.players.size();
        uint8_t const hand_size = n == 2 ? cfg_.heads_up_hand : cfg_.table_hand;
        for (uint8_t pass = 0; pass < hand_size; ++pass)
        {
            for (std::size_t step = 0; step < n; ++step)
                state_.players[(state_.starter_idx + step) % n].hand.push_back(DealOne());
        }
        for (DummyPlayer& p : state_.players)
        {
            SortDummyHand(p.hand);
            p.deadwood = eval::Deadwood(p.hand);
        }

        state_.discard = {DealOne()};
        state_.melds.clear();
        state_.next_meld_id = 1;
        state_.current_idx = state_.starter_idx;
        state_.has_drawn = false;
        state_.winner.reset();
        state_.knocker.reset();
        state_.undercut = false;
        state_.went_out = false;
        ++state_.round;
        state_.phase = DummyPhase::Playing;
        return {};
    }

    auto DummyGame::EndRound() -> CheckResult
    {
        if (state_.phase != DummyPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        state_.starter_idx = static_cast<PlyrIdxT>((state_.starter_idx + 1) % state_.players.size());
        state_.phase = DummyPhase::Waiting;
        return {};
    }

    auto DummyGame::DrawStock(PlayerId const& id) -> CheckResult
    {
        return Apply(id, DrawStockAction{});
    }

    auto DummyGame::DrawDiscard(PlayerId const& id) -> CheckResult
    {
        return Apply(id, DrawDiscardAction{});
    }

    auto DummyGame::Meld(PlayerId const& id, std::span<Card const> cards) -> CheckResult
    {
        return Apply(id, MeldAction{CardVec(cards.begin(), cards.end())});
    }

    auto DummyGame::LayOff(PlayerId const& id, Card const& card, uint32_t const meld_id) -> CheckResult
    {
        return Apply(id, LayOffAction{card, meld_id});
    }

    auto DummyGame::Discard(PlayerId const& id, Card const& card) -> CheckResult
    {
        return Apply(id, DiscardCardAction{card});
    }

    auto DummyGame::Knock(PlayerId const& id) -> CheckResult
    {
        return Apply(id, KnockAction{});
    }

    auto DummyGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto DummyGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));
        if (state_.phase != DummyPhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(actor));
        if (*seat != state_.current_idx)
            return std::unexpected(Viol(RVC::NotPlayersTurn)
                                   .with_actor(actor)
                                   .with_expected(state_.players[state_.current_idx].id));

        DummyPlayer const& p = state_.players[*seat];
        auto const holds = [&p](Card const& c) { return std::ranges::find(p.hand, c) != p.hand.end(); };

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, DrawStockAction>)
            {
                if (state_.has_drawn)
                    return std::unexpected(Viol(RVC::Draw_AlreadyDrawn).with_actor(actor));
                // an empty stock is rebuilt from every discard but the top one
                if (deck_.Empty() && state_.discard.size() <= 1)
                    return std::unexpected(Viol(RVC::Draw_StockEmpty).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, DrawDiscardAction>)
            {
                if (state_.has_drawn)
                    return std::unexpected(Viol(RVC::Draw_AlreadyDrawn).with_actor(actor));
                if (state_.discard.empty())
                    return std::unexpected(Viol(RVC::Draw_DiscardEmpty).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, MeldAction>)
            {
                if (act.cards.empty())
                    return std::unexpected(Viol(RVC::Cards_Empty).with_actor(actor));
                if (util::ContainsDup(act.cards))
                    return std::unexpected(Viol(RVC::Cards_Duplicate).with_actor(actor));
                for (Card const& c : act.cards)
                {
                    if (!holds(c))
                        return std::unexpected(Viol(RVC::Cards_NotInHand).with_actor(actor).with_card(c));
                }
                if (!eval::ClassifyMeld(act.cards))
                    return std::unexpected(Viol(RVC::Meld_Invalid)
                                           .with_actor(actor)
                                           .with_attempted(static_cast<uint8_t>(act.cards.size())));
                return {};
            }
            else if constexpr (std::is_same_v<T, LayOffAction>)
            {
                if (!holds(act.card))
                    return std::unexpected(Viol(RVC::Cards_NotInHand).with_actor(actor).with_card(act.card));
                std::optional<std::size_t> const meld = FindMeld(act.meld_id);
                if (!meld)
                    return std::unexpected(Viol(RVC::Meld_NotFound).with_actor(actor));
                DummyMeld const& m = state_.melds[*meld];
                if (!eval::CanLayOff(act.card, m.type, m.cards))
                    return std::unexpected(Viol(RVC::LayOff_DoesNotFit).with_actor(actor).with_card(act.card));
                return {};
            }
            else if constexpr (std::is_same_v<T, DiscardCardAction>)
            {
                if (!state_.has_drawn)
                    return std::unexpected(Viol(RVC::Draw_Required).with_actor(actor));
                if (!holds(act.card))
                    return std::unexpected(Viol(RVC::Cards_NotInHand).with_actor(actor).with_card(act.card));
                return {};
            }
            else if constexpr (std::is_same_v<T, KnockAction>)
            {
                if (!state_.has_drawn)
                    return std::unexpected(Viol(RVC::Draw_Required).with_actor(actor));
                unsigned const deadwood = eval::Deadwood(p.hand);
                if (deadwood > cfg_.knock_threshold)
                    return std::unexpected(Viol(RVC::Knock_DeadwoodTooHigh)
                                           .with_actor(actor)
                                           .with_amount(deadwood)
                                           .with_range(0, cfg_.knock_threshold));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "Dummy action not handled in Validate");
            }
        }, a);
    }

    auto DummyGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        DummyPlayer& p = state_.players[seat];
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, DrawStockAction>)
            {
                if (deck_.Empty()) RefillStock();
                p.hand.push_back(DealOne());
                state_.has_drawn = true;
            }
            else if constexpr (std::is_same_v<T, DrawDiscardAction>)
            {
                p.hand.push_back(state_.discard.back());
                state_.discard.pop_back();
                state_.has_drawn = true;
            }
            else if constexpr (std::is_same_v<T, MeldAction>)
            {
                bool const removed = util::RemoveCards(p.hand, act.cards);
                CRM_ASSERT(removed, "Validated meld cards missing from hand");
                CardVec cards = act.cards;
                SortDummyHand(cards);
                state_.melds.push_back(DummyMeld{
                    .id = state_.next_meld_id++,
                    .type = *eval::ClassifyMeld(cards),
                    .cards = std::move(cards),
                    .owner = p.id
                });
            }
            else if constexpr (std::is_same_v<T, LayOffAction>)
            {
                bool const removed = util::RemoveCards(p.hand, std::span<Card const>{&act.card, 1});
                CRM_ASSERT(removed, "Validated lay-off card missing from hand");
                DummyMeld& m = state_.melds[*FindMeld(act.meld_id)];
                m.cards.push_back(act.card);
                SortDummyHand(m.cards);
            }
            else if constexpr (std::is_same_v<T, DiscardCardAction>)
            {
                bool const removed = util::RemoveCards(p.hand, std::span<Card const>{&act.card, 1});
                CRM_ASSERT(removed, "Validated discard missing from hand");
                state_.discard.push_back(act.card);
                state_.has_drawn = false;
                state_.current_idx = static_cast<PlyrIdxT>((seat + 1) % state_.players.size());
            }
            else if constexpr (std::is_same_v<T, KnockAction>)
            {
                ScoreKnock(seat);
            }
            else
            {
                static_assert(util::always_false_v<T>, "Dummy action not handled in Mutate");
            }
        }, a);

        SortDummyHand(p.hand);
        p.deadwood = eval::Deadwood(p.hand);
    }

    auto DummyGame::Advance() -> void
    {
        if (state_.phase != DummyPhase::Playing) return;
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            if (state_.players[i].hand.empty())
            {
                FinishOut(static_cast<PlyrIdxT>(i));
                return;
            }
        }
    }

    auto DummyGame::RefillStock() -> void
    {
        CardVec const below(state_.discard.begin(), state_.discard.end() - 1);
        state_.discard.erase(state_.discard.begin(), state_.discard.end() - 1);
        deck_.Recycle(below);
    }

    auto DummyGame::ScoreKnock(PlyrIdxT const knocker) -> void
    {
        unsigned lowest = std::numeric_limits<unsigned>::max();
        std::optional<PlyrIdxT> lowest_seat;
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            DummyPlayer& p = state_.players[i];
            p.deadwood = eval::Deadwood(p.hand);
            p.score = static_cast<int>(p.deadwood);
            if (i != knocker && p.deadwood < lowest)
            {
                lowest = p.deadwood;
                lowest_seat = static_cast<PlyrIdxT>(i);
            }
        }

        DummyPlayer& k = state_.players[knocker];
        k.is_knocker = true;
        state_.knocker = k.id;
        if (k.deadwood <= lowest)
        {
            state_.winner = k.id;
        }
        else
        {
            DummyPlayer& w = state_.players[*lowest_seat];
            w.score -= cfg_.undercut_penalty;
            state_.winner = w.id;
            state_.undercut = true;
        }
        state_.phase = DummyPhase::Finished;
    }

    auto DummyGame::FinishOut(PlyrIdxT const winner) -> void
    {
        for (DummyPlayer& p : state_.players)
        {
            p.deadwood = eval::Deadwood(p.hand);
            p.score = static_cast<int>(p.deadwood);
        }
        state_.winner = state_.players[winner].id;
        state_.went_out = true;
        state_.phase = DummyPhase::Finished;
    }

    auto DummyGame::FindMeld(uint32_t const id) const -> std::optional<std::size_t>
    {
        for (std::size_t i = 0; i < state_.melds.size(); ++i)
        {
            if (state_.melds[i].id == id) return i;
        }
        return std::nullopt;
    }

    auto DummyGame::DealOne() -> Card
    {
        std::optional<Card> const c = deck_.Deal();
        if (!c) CRM_THROW(error::Code::State, "Dummy stock exhausted");
        return *c;
    }

    auto DummyGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto DummyGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
