//
// Created by Malik T on 22/08/2025.
//

#include "KangGame.hpp"

#include <algorithm>
#include <functional>
#include <type_traits>

#include "Util.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    KangGame::KangGame(KangConfig const& config) :
        cfg_(config),
        deck_(1, cfg_.seed)
    {
        if (cfg_.min_players < 2 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("Kang seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        if (cfg_.hand_size != 5)
            CRM_THROW(error::Code::Rules, fmt::format("Kang hands hold five cards, not {}", cfg_.hand_size));
        if (cfg_.max_discard == 0 || cfg_.max_discard >= cfg_.hand_size)
            CRM_THROW(error::Code::Rules, fmt::format("Kang discard limit {} is invalid", cfg_.max_discard));
        // the deal plus a full discard for every seat must fit in one deck
        std::size_t const worst = static_cast<std::size_t>(cfg_.max_players) * (cfg_.hand_size + cfg_.max_discard);
        if (worst > deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("Kang cannot seat {} players: {} cards needed",
                                                      cfg_.max_players, worst));
        if (cfg_.min_bet <= 0 || cfg_.min_bet > cfg_.max_bet)
            CRM_THROW(error::Code::Rules, fmt::format("Kang bet limits [{},{}] are invalid",
                                                      cfg_.min_bet, cfg_.max_bet));
        state_.min_bet = cfg_.min_bet;
        state_.max_bet = cfg_.max_bet;
    }

    auto KangGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase != KangPhase::Waiting && state_.phase != KangPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(KangPlayer{
            .id = info.id,
            .display_name = info.display_name,
            .is_dealer = state_.players.empty()
        });
        return {};
    }

    auto KangGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase != KangPhase::Waiting && state_.phase != KangPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(id));
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, id);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(id));

        state_.players.erase(state_.players.begin() + *seat);
        if (*seat < state_.dealer_idx) --state_.dealer_idx;
        if (state_.dealer_idx >= state_.players.size()) state_.dealer_idx = 0;
        for (std::size_t i = 0; i < state_.players.size(); ++i)
            state_.players[i].is_dealer = i == state_.dealer_idx;
        return {};
    }

    auto KangGame::StartRound() -> CheckResult
    {
        if (state_.phase != KangPhase::Waiting && state_.phase != KangPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        if (state_.players.size() < cfg_.min_players)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers)
                                   .with_attempted(static_cast<uint8_t>(state_.players.size())));

        deck_.Reset();
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            KangPlayer& p = state_.players[i];
            p.hand.clear();
            p.bet = 0;
            p.payout = 0;
            p.folded = false;
            p.has_bet = false;
            p.has_acted = false;
            p.discarded = 0;
            p.result.reset();
            p.is_dealer = i == state_.dealer_idx;
        }
        state_.muck.clear();
        state_.pot = 0;
        state_.current_idx = state_.dealer_idx;
        ++state_.round;
        state_.phase = KangPhase::Betting;
        return {};
    }

    auto KangGame::EndRound() -> CheckResult
    {
        if (state_.phase != KangPhase::Settling)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));

        state_.phase = KangPhase::Finished;
        state_.dealer_idx = static_cast<PlyrIdxT>((state_.dealer_idx + 1) % state_.players.size());
        for (std::size_t i = 0; i < state_.players.size(); ++i)
            state_.players[i].is_dealer = i == state_.dealer_idx;
        return {};
    }

    auto KangGame::PlaceBet(PlayerId const& id, Chips const amount) -> CheckResult
    {
        return Apply(id, PlaceBetAction{amount});
    }

    auto KangGame::Discard(PlayerId const& id, std::span<uint8_t const> indices) -> CheckResult
    {
        return Apply(id, DiscardAction{std::vector<uint8_t>(indices.begin(), indices.end())});
    }

    auto KangGame::KeepAll(PlayerId const& id) -> CheckResult
    {
        return Apply(id, KeepAllAction{});
    }

    auto KangGame::Fold(PlayerId const& id) -> CheckResult
    {
        return Apply(id, FoldAction{});
    }

    auto KangGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto KangGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));

        KangPlayer const& p = state_.players[*seat];
        bool const is_turn = *seat == state_.current_idx;
        KangPhase const phase = state_.phase;

        auto const check_turn = [&]() -> CheckResult
        {
            if (phase != KangPhase::Discarding)
                return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
            if (!is_turn)
                return std::unexpected(Viol(RVC::NotPlayersTurn)
                                       .with_actor(actor)
                                       .with_expected(state_.players[state_.current_idx].id));
            if (p.has_acted)
                return std::unexpected(Viol(RVC::Turn_AlreadyActed).with_actor(actor));
            return {};
        };

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                if (phase != KangPhase::Betting)
                    return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
                if (p.is_dealer)
                    return std::unexpected(Viol(RVC::Bet_DealerCannotBet).with_actor(actor));
                if (p.folded)
                    return std::unexpected(Viol(RVC::Turn_PlayerFolded).with_actor(actor));
                if (p.has_bet)
                    return std::unexpected(Viol(RVC::Bet_AlreadyPlaced).with_actor(actor).with_amount(p.bet));
                if (act.amount < state_.min_bet || act.amount > state_.max_bet)
                    return std::unexpected(Viol(RVC::Bet_OutOfRange)
                                           .with_actor(actor)
                                           .with_amount(act.amount)
                                           .with_range(state_.min_bet, state_.max_bet));
                return {};
            }
            else if constexpr (std::is_same_v<T, DiscardAction>)
            {
                if (CheckResult v = check_turn(); !v) return v;
                auto const count = static_cast<uint8_t>(std::min<std::size_t>(act.indices.size(), 255));
                if (act.indices.empty())
                    return std::unexpected(Viol(RVC::Cards_Empty).with_actor(actor));
                if (act.indices.size() > cfg_.max_discard)
                    return std::unexpected(Viol(RVC::Cards_TooMany).with_actor(actor).with_attempted(count));
                std::vector<bool> seen(p.hand.size(), false);
                for (uint8_t const idx : act.indices)
                {
                    if (idx >= p.hand.size())
                        return std::unexpected(Viol(RVC::Cards_IndexOutOfRange)
                                               .with_actor(actor)
                                               .with_attempted(idx));
                    if (seen[idx])
                        return std::unexpected(Viol(RVC::Cards_Duplicate)
                                               .with_actor(actor)
                                               .with_card(p.hand[idx]));
                    seen[idx] = true;
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, KeepAllAction>)
            {
                return check_turn();
            }
            else if constexpr (std::is_same_v<T, FoldAction>)
            {
                if (phase != KangPhase::Betting && phase != KangPhase::Discarding)
                    return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
                if (p.is_dealer)
                    return std::unexpected(Viol(RVC::Turn_DealerCannotFold).with_actor(actor));
                if (p.folded)
                    return std::unexpected(Viol(RVC::Turn_PlayerFolded).with_actor(actor));
                if (phase == KangPhase::Discarding && !is_turn)
                    return std::unexpected(Viol(RVC::NotPlayersTurn)
                                           .with_actor(actor)
                                           .with_expected(state_.players[state_.current_idx].id));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "Kang action not handled in Validate");
            }
        }, a);
    }

    auto KangGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        KangPlayer& p = state_.players[seat];
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                p.bet = act.amount;
                p.has_bet = true;
                state_.pot += act.amount;
            }
            else if constexpr (std::is_same_v<T, DiscardAction>)
            {
                // highest position first so earlier positions stay valid
                std::vector<uint8_t> order = act.indices;
                std::ranges::sort(order, std::greater<>{});
                for (uint8_t const idx : order)
                {
                    state_.muck.push_back(p.hand[idx]);
                    p.hand.erase(p.hand.begin() + idx);
                }
                for (std::size_t i = 0; i < order.size(); ++i) p.hand.push_back(DealOne());
                p.discarded = static_cast<uint8_t>(order.size());
                p.has_acted = true;
            }
            else if constexpr (std::is_same_v<T, KeepAllAction>)
            {
                p.has_acted = true;
            }
            else if constexpr (std::is_same_v<T, FoldAction>)
            {
                p.folded = true;
            }
            else
            {
                static_assert(util::always_false_v<T>, "Kang action not handled in Mutate");
            }
        }, a);
    }

    auto KangGame::Advance() -> void
    {
        if (state_.phase == KangPhase::Betting)
        {
            bool const waiting = std::ranges::any_of(state_.players, [](KangPlayer const& p)
            {
                return !p.is_dealer && !p.folded && !p.has_bet;
            });
            if (waiting) return;

            bool const anyone_in = std::ranges::any_of(state_.players, [](KangPlayer const& p)
            {
                return !p.is_dealer && !p.folded;
            });
            if (anyone_in) DealHands();
            else Showdown();
            return;
        }

        if (state_.phase == KangPhase::Discarding)
        {
            std::optional<PlyrIdxT> const next = NextToAct(state_.current_idx);
            if (next) state_.current_idx = *next;
            else Showdown();
        }
    }

    auto KangGame::DealHands() -> void
    {
        state_.phase = KangPhase::Dealing;
        std::size_t const n = state_.players.size();
        for (uint8_t pass = 0; pass < cfg_.hand_size; ++pass)
        {
            for (std::size_t step = 1; step <= n; ++step)
            {
                KangPlayer& p = state_.players[(state_.dealer_idx + step) % n];
                if (!p.folded) p.hand.push_back(DealOne());
            }
        }

        state_.phase = KangPhase::Discarding;
        std::optional<PlyrIdxT> const first = NextToAct(state_.dealer_idx);
        CRM_ASSERT(first.has_value(), "No seat left to discard after the deal");
        state_.current_idx = *first;
    }

    auto KangGame::Showdown() -> void
    {
        state_.phase = KangPhase::Showdown;
        KangPlayer& dealer = state_.players[state_.dealer_idx];
        if (dealer.hand.size() == cfg_.hand_size)
        {
            for (KangPlayer& p : state_.players)
            {
                if (!p.folded) p.result = eval::EvaluateDrawHand(p.hand);
            }
        }

        Chips dealer_net = 0;
        for (KangPlayer& p : state_.players)
        {
            if (p.is_dealer) continue;
            if (p.folded)
            {
                p.payout = -p.bet;
            }
            else
            {
                CRM_ASSERT(p.result && dealer.result, "Kang showdown without evaluated hands");
                eval::DrawHand const& mine = *p.result;
                eval::DrawHand const& theirs = *dealer.result;
                if (mine.type != theirs.type)
                {
                    p.payout = mine.type > theirs.type ? p.bet * mine.multiplier : -p.bet;
                }
                else
                {
                    std::strong_ordering const cmp = eval::CompareDrawHands(mine, theirs);
                    if (cmp > 0) p.payout = p.bet;
                    else if (cmp < 0) p.payout = -p.bet;
                    else p.payout = 0;
                }
            }
            dealer_net -= p.payout;
        }
        dealer.payout = dealer_net;
        state_.phase = KangPhase::Settling;
    }

    auto KangGame::NextToAct(PlyrIdxT const from) const -> std::optional<PlyrIdxT>
    {
        return util::NextSeatWhere(from, state_.players.size(), [this](PlyrIdxT const seat)
        {
            KangPlayer const& p = state_.players[seat];
            return !p.folded && !p.has_acted;
        });
    }

    auto KangGame::DealOne() -> Card
    {
        std::optional<Card> const c = deck_.Deal();
        if (!c) CRM_THROW(error::Code::State, "Kang deck exhausted mid-round");
        return *c;
    }

    auto KangGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto KangGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
