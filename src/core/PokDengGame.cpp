//
// Created by Malik T on 21/08/2025.
//

#include "PokDengGame.hpp"

#include <algorithm>
#include <type_traits>

#include "Util.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    PokDengGame::PokDengGame(PokDengConfig const& config) :
        cfg_(config),
        deck_(1, cfg_.seed)
    {
        if (cfg_.min_players < 2 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("PokDeng seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        // every seat may end up holding three cards
        if (static_cast<std::size_t>(cfg_.max_players) * 3 > deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("PokDeng cannot seat {} players from one deck",
                                                      cfg_.max_players));
        if (cfg_.min_bet <= 0 || cfg_.min_bet > cfg_.max_bet)
            CRM_THROW(error::Code::Rules, fmt::format("PokDeng bet limits [{},{}] are invalid",
                                                      cfg_.min_bet, cfg_.max_bet));
        state_.min_bet = cfg_.min_bet;
        state_.max_bet = cfg_.max_bet;
    }

    auto PokDengGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase != PokDengPhase::Waiting && state_.phase != PokDengPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(PokDengPlayer{
            .id = info.id,
            .display_name = info.display_name,
            .is_dealer = state_.players.empty()
        });
        return {};
    }

    auto PokDengGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase != PokDengPhase::Waiting && state_.phase != PokDengPhase::Finished)
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

    auto PokDengGame::StartRound() -> CheckResult
    {
        if (state_.phase != PokDengPhase::Waiting && state_.phase != PokDengPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        if (state_.players.size() < cfg_.min_players)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers)
                                   .with_attempted(static_cast<uint8_t>(state_.players.size())));

        deck_.Reset();
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            PokDengPlayer& p = state_.players[i];
            p.hand.clear();
            p.bet = 0;
            p.payout = 0;
            p.folded = false;
            p.has_bet = false;
            p.has_drawn = false;
            p.result.reset();
            p.is_dealer = i == state_.dealer_idx;
        }
        state_.pot = 0;
        state_.current_idx = state_.dealer_idx;
        ++state_.round;
        state_.phase = PokDengPhase::Betting;
        return {};
    }

    auto PokDengGame::EndRound() -> CheckResult
    {
        if (state_.phase != PokDengPhase::Settling)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));

        state_.phase = PokDengPhase::Finished;
        state_.dealer_idx = static_cast<PlyrIdxT>((state_.dealer_idx + 1) % state_.players.size());
        for (std::size_t i = 0; i < state_.players.size(); ++i)
            state_.players[i].is_dealer = i == state_.dealer_idx;
        return {};
    }

    auto PokDengGame::PlaceBet(PlayerId const& id, Chips const amount) -> CheckResult
    {
        return Apply(id, PlaceBetAction{amount});
    }

    auto PokDengGame::Draw(PlayerId const& id) -> CheckResult
    {
        return Apply(id, DrawCardAction{});
    }

    auto PokDengGame::Stay(PlayerId const& id) -> CheckResult
    {
        return Apply(id, StayAction{});
    }

    auto PokDengGame::Fold(PlayerId const& id) -> CheckResult
    {
        return Apply(id, FoldAction{});
    }

    auto PokDengGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto PokDengGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));

        PokDengPlayer const& p = state_.players[*seat];
        bool const is_turn = *seat == state_.current_idx;
        PokDengPhase const phase = state_.phase;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                if (phase != PokDengPhase::Betting)
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
            else if constexpr (std::is_same_v<T, DrawCardAction> || std::is_same_v<T, StayAction>)
            {
                if (phase != PokDengPhase::Playing)
                    return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
                if (!is_turn)
                    return std::unexpected(Viol(RVC::NotPlayersTurn)
                                           .with_actor(actor)
                                           .with_expected(state_.players[state_.current_idx].id));
                if (p.has_drawn || p.hand.size() >= 3)
                    return std::unexpected(Viol(RVC::Turn_AlreadyActed).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, FoldAction>)
            {
                if (phase != PokDengPhase::Betting && phase != PokDengPhase::Playing)
                    return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
                if (p.is_dealer)
                    return std::unexpected(Viol(RVC::Turn_DealerCannotFold).with_actor(actor));
                if (p.folded)
                    return std::unexpected(Viol(RVC::Turn_PlayerFolded).with_actor(actor));
                if (phase == PokDengPhase::Playing && !is_turn)
                    return std::unexpected(Viol(RVC::NotPlayersTurn)
                                           .with_actor(actor)
                                           .with_expected(state_.players[state_.current_idx].id));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "PokDeng action not handled in Validate");
            }
        }, a);
    }

    auto PokDengGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        PokDengPlayer& p = state_.players[seat];
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                p.bet = act.amount;
                p.has_bet = true;
                state_.pot += act.amount;
            }
            else if constexpr (std::is_same_v<T, DrawCardAction>)
            {
                p.hand.push_back(DealOne());
                p.has_drawn = true;
            }
            else if constexpr (std::is_same_v<T, StayAction>)
            {
                p.has_drawn = true;
            }
            else if constexpr (std::is_same_v<T, FoldAction>)
            {
                p.folded = true;
            }
            else
            {
                static_assert(util::always_false_v<T>, "PokDeng action not handled in Mutate");
            }
        }, a);
    }

    auto PokDengGame::Advance() -> void
    {
        if (state_.phase == PokDengPhase::Betting)
        {
            bool const waiting = std::ranges::any_of(state_.players, [](PokDengPlayer const& p)
            {
                return !p.is_dealer && !p.folded && !p.has_bet;
            });
            if (waiting) return;

            bool const anyone_in = std::ranges::any_of(state_.players, [](PokDengPlayer const& p)
            {
                return !p.is_dealer && !p.folded;
            });
            if (anyone_in) DealHands();
            else Reveal();
            return;
        }

        if (state_.phase == PokDengPhase::Playing)
        {
            std::optional<PlyrIdxT> const next = NextToAct(state_.current_idx);
            if (next) state_.current_idx = *next;
            else Reveal();
        }
    }

    auto PokDengGame::DealHands() -> void
    {
        state_.phase = PokDengPhase::Dealing;
        std::size_t const n = state_.players.size();
        // two passes, starting left of the dealer
        for (int pass = 0; pass < 2; ++pass)
        {
            for (std::size_t step = 1; step <= n; ++step)
            {
                PokDengPlayer& p = state_.players[(state_.dealer_idx + step) % n];
                if (!p.folded) p.hand.push_back(DealOne());
            }
        }

        bool const natural = std::ranges::any_of(state_.players, [](PokDengPlayer const& p)
        {
            return !p.folded && eval::ScorePointHand(p.hand).natural;
        });
        if (natural)
        {
            Reveal();
            return;
        }

        state_.phase = PokDengPhase::Playing;
        std::optional<PlyrIdxT> const first = NextToAct(state_.dealer_idx);
        CRM_ASSERT(first.has_value(), "No seat left to act after the deal");
        state_.current_idx = *first;
    }

    auto PokDengGame::Reveal() -> void
    {
        state_.phase = PokDengPhase::Revealing;
        for (PokDengPlayer& p : state_.players)
        {
            if (!p.folded) p.result = eval::ScorePointHand(p.hand);
        }

        PokDengPlayer& dealer = state_.players[state_.dealer_idx];
        CRM_ASSERT(dealer.result.has_value(), "Dealer has no hand at reveal");

        Chips dealer_net = 0;
        for (PokDengPlayer& p : state_.players)
        {
            if (p.is_dealer) continue;
            if (p.folded)
            {
                p.payout = -p.bet;
            }
            else
            {
                std::strong_ordering const cmp = eval::ComparePointHands(*p.result, *dealer.result);
                if (cmp > 0) p.payout = p.bet * p.result->multiplier;
                else if (cmp < 0) p.payout = -p.bet;
                else p.payout = 0;
            }
            dealer_net -= p.payout;
        }
        dealer.payout = dealer_net;
        state_.phase = PokDengPhase::Settling;
    }

    auto PokDengGame::NextToAct(PlyrIdxT const from) const -> std::optional<PlyrIdxT>
    {
        return util::NextSeatWhere(from, state_.players.size(), [this](PlyrIdxT const seat)
        {
            PokDengPlayer const& p = state_.players[seat];
            return !p.folded && !p.has_drawn;
        });
    }

    auto PokDengGame::DealOne() -> Card
    {
        std::optional<Card> const c = deck_.Deal();
        if (!c) CRM_THROW(error::Code::State, "PokDeng deck exhausted mid-round");
        return *c;
    }

    auto PokDengGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto PokDengGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
