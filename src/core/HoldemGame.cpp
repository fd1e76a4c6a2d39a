//
// Created by Malik T on 25/08/2025.
//

#include "HoldemGame.hpp"

#include <algorithm>
#include <numeric>
#include <type_traits>

#include "Util.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    namespace
    {
        auto IsBettingStreet(HoldemPhase p) -> bool
        {
            return p == HoldemPhase::Preflop || p == HoldemPhase::Flop
                || p == HoldemPhase::Turn || p == HoldemPhase::River;
        }
    }

    HoldemGame::HoldemGame(HoldemConfig const& config) :
        cfg_(config),
        deck_(1, cfg_.seed)
    {
        if (cfg_.min_players < 2 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("Hold'em seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        // two hole cards each plus five on the board
        if (static_cast<std::size_t>(cfg_.max_players) * 2 + 5 > deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("Hold'em cannot seat {} players", cfg_.max_players));
        if (cfg_.small_blind <= 0 || cfg_.big_blind < cfg_.small_blind)
            CRM_THROW(error::Code::Rules, fmt::format("Hold'em blinds {}/{} are invalid",
                                                      cfg_.small_blind, cfg_.big_blind));
        if (cfg_.starting_chips < cfg_.big_blind)
            CRM_THROW(error::Code::Rules, fmt::format("Starting stack {} is below the big blind",
                                                      cfg_.starting_chips));
        state_.small_blind = cfg_.small_blind;
        state_.big_blind = cfg_.big_blind;
        state_.min_raise = cfg_.big_blind;
    }

    auto HoldemGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase != HoldemPhase::Waiting && state_.phase != HoldemPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(HoldemPlayer{
            .id = info.id,
            .display_name = info.display_name,
            .chips = cfg_.starting_chips
        });
        return {};
    }

    auto HoldemGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase != HoldemPhase::Waiting && state_.phase != HoldemPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(id));
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, id);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(id));

        state_.players.erase(state_.players.begin() + *seat);
        if (*seat < state_.button_idx) --state_.button_idx;
        if (state_.button_idx >= state_.players.size()) state_.button_idx = 0;
        return {};
    }

    auto HoldemGame::StartRound() -> CheckResult
    {
        if (state_.phase != HoldemPhase::Waiting && state_.phase != HoldemPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        auto const funded = static_cast<std::size_t>(std::ranges::count_if(state_.players, [](HoldemPlayer const& p)
        {
            return p.chips > 0;
        }));
        if (state_.players.size() < cfg_.min_players || funded < 2)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers).with_attempted(static_cast<uint8_t>(funded)));

        deck_.Reset();
        for (HoldemPlayer& p : state_.players)
        {
            p.hole.clear();
            p.bet = 0;
            p.contributed = 0;
            p.won = 0;
            p.payout = 0;
            p.sitting_out = p.chips == 0;
            p.folded = p.sitting_out;
            p.all_in = false;
            p.has_acted = false;
            p.result.reset();
        }
        state_.community.clear();
        state_.pots.clear();
        state_.pot = 0;
        state_.current_bet = 0;
        state_.min_raise = cfg_.big_blind;
        ++state_.round;

        if (state_.players[state_.button_idx].chips == 0)
            state_.button_idx = *NextWithChips(state_.button_idx);

        // heads-up the button posts the small blind
        if (funded == 2)
        {
            state_.sb_idx = state_.button_idx;
            state_.bb_idx = *NextWithChips(state_.button_idx);
        }
        else
        {
            state_.sb_idx = *NextWithChips(state_.button_idx);
            state_.bb_idx = *NextWithChips(state_.sb_idx);
        }
        Commit(state_.players[state_.sb_idx], std::min(cfg_.small_blind, state_.players[state_.sb_idx].chips));
        Commit(state_.players[state_.bb_idx], std::min(cfg_.big_blind, state_.players[state_.bb_idx].chips));
        state_.current_bet = cfg_.big_blind;

        std::size_t const n = state_.players.size();
        for (int pass = 0; pass < 2; ++pass)
        {
            for (std::size_t step = 1; step <= n; ++step)
            {
                HoldemPlayer& p = state_.players[(state_.button_idx + step) % n];
                if (!p.sitting_out) p.hole.push_back(DealOne());
            }
        }

        state_.phase = HoldemPhase::Preflop;
        std::optional<PlyrIdxT> const first = NextToAct(state_.bb_idx);
        if (first) state_.current_idx = *first;
        else EndStreet(); // blinds put everyone all in
        return {};
    }

    auto HoldemGame::EndRound() -> CheckResult
    {
        if (state_.phase != HoldemPhase::Settling)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));

        state_.phase = HoldemPhase::Finished;
        std::optional<PlyrIdxT> const next = NextWithChips(state_.button_idx);
        state_.button_idx = next ? *next : static_cast<PlyrIdxT>((state_.button_idx + 1) % state_.players.size());
        return {};
    }

    auto HoldemGame::Fold(PlayerId const& id) -> CheckResult
    {
        return Apply(id, FoldAction{});
    }

    auto HoldemGame::Check(PlayerId const& id) -> CheckResult
    {
        return Apply(id, CheckAction{});
    }

    auto HoldemGame::Call(PlayerId const& id) -> CheckResult
    {
        return Apply(id, CallAction{});
    }

    auto HoldemGame::Raise(PlayerId const& id, Chips const by) -> CheckResult
    {
        return Apply(id, RaiseAction{by});
    }

    auto HoldemGame::AllIn(PlayerId const& id) -> CheckResult
    {
        return Apply(id, AllInAction{});
    }

    auto HoldemGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto HoldemGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));
        if (!IsBettingStreet(state_.phase))
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(actor));

        HoldemPlayer const& p = state_.players[*seat];
        if (p.folded)
            return std::unexpected(Viol(RVC::Turn_PlayerFolded).with_actor(actor));
        if (*seat != state_.current_idx)
            return std::unexpected(Viol(RVC::NotPlayersTurn)
                                   .with_actor(actor)
                                   .with_expected(state_.players[state_.current_idx].id));

        Chips const to_call = state_.current_bet - p.bet;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, FoldAction>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, CheckAction>)
            {
                if (to_call > 0)
                    return std::unexpected(Viol(RVC::Wager_CannotCheck).with_actor(actor).with_amount(to_call));
                return {};
            }
            else if constexpr (std::is_same_v<T, CallAction>)
            {
                if (to_call <= 0)
                    return std::unexpected(Viol(RVC::Wager_NothingToCall).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, RaiseAction>)
            {
                // compared against the stack before adding, the amount comes off the wire
                if (act.amount <= 0 || act.amount > p.chips - to_call)
                    return std::unexpected(Viol(RVC::Wager_ExceedsStack)
                                           .with_actor(actor)
                                           .with_amount(act.amount)
                                           .with_range(state_.min_raise, p.chips - to_call));
                if (!ActionReopened(p, to_call))
                    return std::unexpected(Viol(RVC::Wager_RaiseBelowMinimum)
                                           .with_actor(actor)
                                           .with_amount(act.amount));
                // a short raise is only allowed when it is the whole stack
                if (act.amount < state_.min_raise && act.amount != p.chips - to_call)
                    return std::unexpected(Viol(RVC::Wager_RaiseBelowMinimum)
                                           .with_actor(actor)
                                           .with_amount(act.amount)
                                           .with_range(state_.min_raise, p.chips - to_call));
                return {};
            }
            else if constexpr (std::is_same_v<T, AllInAction>)
            {
                if (p.chips <= 0)
                    return std::unexpected(Viol(RVC::Wager_NoChips).with_actor(actor));
                // going all in for more than the call is a raise
                if (p.chips > to_call && !ActionReopened(p, to_call))
                    return std::unexpected(Viol(RVC::Wager_RaiseBelowMinimum)
                                           .with_actor(actor)
                                           .with_amount(p.chips - to_call));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "Hold'em action not handled in Validate");
            }
        }, a);
    }

    auto HoldemGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        HoldemPlayer& p = state_.players[seat];
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, FoldAction>)
            {
                p.folded = true;
            }
            else if constexpr (std::is_same_v<T, CheckAction>)
            {
            }
            else if constexpr (std::is_same_v<T, CallAction>)
            {
                Commit(p, std::min(state_.current_bet - p.bet, p.chips));
            }
            else if constexpr (std::is_same_v<T, RaiseAction>)
            {
                RaiseTo(seat, state_.current_bet + act.amount);
            }
            else if constexpr (std::is_same_v<T, AllInAction>)
            {
                RaiseTo(seat, p.bet + p.chips);
            }
            else
            {
                static_assert(util::always_false_v<T>, "Hold'em action not handled in Mutate");
            }
        }, a);
        p.has_acted = true;
    }

    auto HoldemGame::Advance() -> void
    {
        auto const live = std::ranges::count_if(state_.players, [](HoldemPlayer const& p) { return !p.folded; });
        if (live == 1)
        {
            AwardUncontested();
            return;
        }

        std::optional<PlyrIdxT> const next = NextToAct(state_.current_idx);
        if (next) state_.current_idx = *next;
        else EndStreet();
    }

    auto HoldemGame::Commit(HoldemPlayer& p, Chips const amount) -> void
    {
        p.chips -= amount;
        p.bet += amount;
        p.contributed += amount;
        state_.pot += amount;
        if (p.chips == 0) p.all_in = true;
    }

    auto HoldemGame::RaiseTo(PlyrIdxT const seat, Chips const target) -> void
    {
        HoldemPlayer& p = state_.players[seat];
        Commit(p, target - p.bet);
        if (p.bet <= state_.current_bet) return; // all in for no more than a call

        Chips const size = p.bet - state_.current_bet;
        state_.current_bet = p.bet;
        if (size < state_.min_raise) return; // incomplete raise does not reopen the action

        state_.min_raise = size;
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            if (i != seat) state_.players[i].has_acted = false;
        }
    }

    auto HoldemGame::EndStreet() -> void
    {
        for (;;)
        {
            for (HoldemPlayer& p : state_.players)
            {
                p.bet = 0;
                p.has_acted = false;
            }
            state_.current_bet = 0;
            state_.min_raise = cfg_.big_blind;

            switch (state_.phase)
            {
            case HoldemPhase::Preflop:
                for (int i = 0; i < 3; ++i) state_.community.push_back(DealOne());
                state_.phase = HoldemPhase::Flop;
                break;
            case HoldemPhase::Flop:
                state_.community.push_back(DealOne());
                state_.phase = HoldemPhase::Turn;
                break;
            case HoldemPhase::Turn:
                state_.community.push_back(DealOne());
                state_.phase = HoldemPhase::River;
                break;
            case HoldemPhase::River:
                Showdown();
                return;
            default:
                CRM_THROW(error::Code::State, fmt::format("Street ended in phase {}", ToString(state_.phase)));
            }

            auto const can_act = std::ranges::count_if(state_.players, [](HoldemPlayer const& p)
            {
                return !p.folded && !p.all_in;
            });
            // with fewer than two players able to bet the board runs out
            if (can_act >= 2)
            {
                state_.current_idx = *NextToAct(state_.button_idx);
                return;
            }
        }
    }

    auto HoldemGame::AwardUncontested() -> void
    {
        auto const it = std::ranges::find_if(state_.players, [](HoldemPlayer const& p) { return !p.folded; });
        auto const winner = static_cast<PlyrIdxT>(it - state_.players.begin());

        HoldemPot pot{.amount = state_.pot, .eligible = {winner}, .winners = {winner}};
        state_.players[winner].won = state_.pot;
        state_.players[winner].chips += state_.pot;
        state_.pots = {std::move(pot)};
        state_.pot = 0;
        for (HoldemPlayer& p : state_.players) p.payout = p.won - p.contributed;
        state_.phase = HoldemPhase::Settling;
    }

    auto HoldemGame::BuildPots() const -> std::vector<HoldemPot>
    {
        std::vector<Chips> levels;
        for (HoldemPlayer const& p : state_.players)
        {
            if (!p.folded && p.contributed > 0) levels.push_back(p.contributed);
        }
        std::ranges::sort(levels);
        auto const dup = std::ranges::unique(levels);
        levels.erase(dup.begin(), dup.end());

        std::vector<HoldemPot> pots;
        Chips prev = 0;
        Chips assigned = 0;
        for (Chips const level : levels)
        {
            HoldemPot pot;
            for (std::size_t i = 0; i < state_.players.size(); ++i)
            {
                HoldemPlayer const& p = state_.players[i];
                pot.amount += std::min(p.contributed, level) - std::min(p.contributed, prev);
                if (!p.folded && p.contributed >= level) pot.eligible.push_back(static_cast<PlyrIdxT>(i));
            }
            assigned += pot.amount;
            prev = level;
            pots.push_back(std::move(pot));
        }
        // folded money above the highest live contribution
        CRM_ASSERT(!pots.empty(), "Showdown with no live contributions");
        pots.back().amount += state_.pot - assigned;
        return pots;
    }

    auto HoldemGame::Showdown() -> void
    {
        state_.phase = HoldemPhase::Showdown;
        for (HoldemPlayer& p : state_.players)
        {
            if (!p.folded) p.result = eval::EvaluateHoldem(p.hole, state_.community);
        }

        std::size_t const n = state_.players.size();
        auto const order = [&](PlyrIdxT seat) { return (seat + n - state_.button_idx - 1) % n; };

        state_.pots = BuildPots();
        for (HoldemPot& pot : state_.pots)
        {
            for (PlyrIdxT const seat : pot.eligible)
            {
                if (pot.winners.empty())
                {
                    pot.winners.push_back(seat);
                    continue;
                }
                std::strong_ordering const cmp = eval::ComparePokerHands(*state_.players[seat].result,
                                                                         *state_.players[pot.winners.front()].result);
                if (cmp > 0) pot.winners = {seat};
                else if (cmp == 0) pot.winners.push_back(seat);
            }
            std::ranges::sort(pot.winners, {}, order);

            Chips const share = pot.amount / static_cast<Chips>(pot.winners.size());
            Chips const odd = pot.amount % static_cast<Chips>(pot.winners.size());
            for (PlyrIdxT const seat : pot.winners)
            {
                state_.players[seat].won += share;
                state_.players[seat].chips += share;
            }
            state_.players[pot.winners.front()].won += odd;
            state_.players[pot.winners.front()].chips += odd;
        }

        state_.pot = 0;
        for (HoldemPlayer& p : state_.players) p.payout = p.won - p.contributed;
        state_.phase = HoldemPhase::Settling;
    }

    auto HoldemGame::NeedsAction(HoldemPlayer const& p) const noexcept -> bool
    {
        return !p.folded && !p.all_in && (!p.has_acted || p.bet < state_.current_bet);
    }

    // A full raise clears has_acted for everyone else, so a seat that already acted and
    // still owes chips has only seen short all-ins since: it may call or fold.
    auto HoldemGame::ActionReopened(HoldemPlayer const& p, Chips const to_call) const noexcept -> bool
    {
        return !p.has_acted || to_call <= 0;
    }

    auto HoldemGame::NextToAct(PlyrIdxT const from) const -> std::optional<PlyrIdxT>
    {
        return util::NextSeatWhere(from, state_.players.size(), [this](PlyrIdxT const seat)
        {
            return NeedsAction(state_.players[seat]);
        });
    }

    auto HoldemGame::NextWithChips(PlyrIdxT const from) const -> std::optional<PlyrIdxT>
    {
        return util::NextSeatWhere(from, state_.players.size(), [this](PlyrIdxT const seat)
        {
            return state_.players[seat].chips > 0;
        });
    }

    auto HoldemGame::DealOne() -> Card
    {
        std::optional<Card> const c = deck_.Deal();
        if (!c) CRM_THROW(error::Code::State, "Hold'em deck exhausted mid-hand");
        return *c;
    }

    auto HoldemGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto HoldemGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
