//
// Created by Malik T on 27/08/2025.
//

#include "BlackjackGame.hpp"

#include <algorithm>
#include <type_traits>

#include "Util.hpp"
#include "../eval/BlackjackScore.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    namespace
    {
        inline constexpr uint8_t DealerStandsOn = 17;
        // two dealt cards and two hits for every seat and the dealer
        inline constexpr std::size_t CardsReservedPerSeat = 4;

        auto IsNaturalHand(BlackjackHand const& h) -> bool
        {
            return !h.from_split && eval::IsNatural(h.cards);
        }
    }

    BlackjackGame::BlackjackGame(BlackjackConfig const& config) :
        cfg_(config),
        deck_(cfg_.decks, cfg_.seed)
    {
        if (cfg_.min_players < 1 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("Blackjack seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        if (cfg_.max_hands < 1)
            CRM_THROW(error::Code::Rules, "Blackjack needs at least one hand per player");
        if (cfg_.reshuffle_below >= deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("Reshuffle threshold {} exceeds the {} card shoe",
                                                      cfg_.reshuffle_below, deck_.Size()));
        if (std::size_t const floor = (cfg_.max_players + std::size_t{1}) * CardsReservedPerSeat;
            cfg_.reshuffle_below < floor)
            CRM_THROW(error::Code::Rules, fmt::format("Reshuffle threshold {} cannot cover {} seats, needs {}",
                                                      cfg_.reshuffle_below, cfg_.max_players, floor));
        if (cfg_.min_bet <= 0 || cfg_.min_bet > cfg_.max_bet)
            CRM_THROW(error::Code::Rules, fmt::format("Blackjack bet limits [{},{}] are invalid",
                                                      cfg_.min_bet, cfg_.max_bet));
        state_.min_bet = cfg_.min_bet;
        state_.max_bet = cfg_.max_bet;
    }

    auto BlackjackGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase != BlackjackPhase::Waiting && state_.phase != BlackjackPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(BlackjackPlayer{.id = info.id, .display_name = info.display_name});
        return {};
    }

    auto BlackjackGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase != BlackjackPhase::Waiting && state_.phase != BlackjackPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(id));
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, id);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(id));

        state_.players.erase(state_.players.begin() + *seat);
        return {};
    }

    auto BlackjackGame::StartRound() -> CheckResult
    {
        if (state_.phase != BlackjackPhase::Waiting && state_.phase != BlackjackPhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        if (state_.players.size() < cfg_.min_players)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers)
                                   .with_attempted(static_cast<uint8_t>(state_.players.size())));

        if (deck_.Remaining() < cfg_.reshuffle_below) deck_.Reset();
        for (BlackjackPlayer& p : state_.players)
        {
            p.hands.clear();
            p.bet = 0;
            p.payout = 0;
            p.has_bet = false;
            p.decided = false;
            p.current_hand = 0;
        }
        state_.dealer_hand.clear();
        state_.hole_revealed = false;
        state_.current_idx = 0;
        state_.house_payout = 0;
        ++state_.round;
        state_.phase = BlackjackPhase::Betting;
        return {};
    }

    auto BlackjackGame::EndRound() -> CheckResult
    {
        if (state_.phase != BlackjackPhase::Settling)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        state_.phase = BlackjackPhase::Finished;
        return {};
    }

    auto BlackjackGame::PlaceBet(PlayerId const& id, Chips const amount) -> CheckResult
    {
        return Apply(id, PlaceBetAction{amount});
    }

    auto BlackjackGame::Hit(PlayerId const& id, uint8_t const hand) -> CheckResult
    {
        return Apply(id, HitAction{hand});
    }

    auto BlackjackGame::Stand(PlayerId const& id, uint8_t const hand) -> CheckResult
    {
        return Apply(id, StandAction{hand});
    }

    auto BlackjackGame::Double(PlayerId const& id, uint8_t const hand) -> CheckResult
    {
        return Apply(id, DoubleAction{hand});
    }

    auto BlackjackGame::Split(PlayerId const& id, uint8_t const hand) -> CheckResult
    {
        return Apply(id, SplitAction{hand});
    }

    auto BlackjackGame::Surrender(PlayerId const& id) -> CheckResult
    {
        return Apply(id, SurrenderAction{});
    }

    auto BlackjackGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto BlackjackGame::CheckHand(PlyrIdxT const seat, uint8_t const hand) const -> CheckResult
    {
        BlackjackPlayer const& p = state_.players[seat];
        if (hand >= p.hands.size())
            return std::unexpected(Viol(RVC::Cards_IndexOutOfRange).with_actor(p.id).with_hand(hand));
        if (hand != p.current_hand)
            return std::unexpected(Viol(RVC::Hand_NotCurrent).with_actor(p.id).with_hand(hand));
        if (p.hands[hand].finished)
            return std::unexpected(Viol(RVC::Hand_Finished).with_actor(p.id).with_hand(hand));
        return {};
    }

    auto BlackjackGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));

        BlackjackPlayer const& p = state_.players[*seat];
        BlackjackPhase const phase = state_.phase;

        // every action except betting is a decision on the player's own turn
        if (!std::holds_alternative<PlaceBetAction>(a))
        {
            if (phase != BlackjackPhase::PlayerTurn)
                return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
            if (*seat != state_.current_idx)
                return std::unexpected(Viol(RVC::NotPlayersTurn)
                                       .with_actor(actor)
                                       .with_expected(state_.players[state_.current_idx].id));
        }

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                if (phase != BlackjackPhase::Betting)
                    return std::unexpected(Viol(RVC::WrongPhase).with_phase(phase).with_actor(actor));
                if (p.has_bet)
                    return std::unexpected(Viol(RVC::Bet_AlreadyPlaced).with_actor(actor).with_amount(p.bet));
                if (act.amount < state_.min_bet || act.amount > state_.max_bet)
                    return std::unexpected(Viol(RVC::Bet_OutOfRange)
                                           .with_actor(actor)
                                           .with_amount(act.amount)
                                           .with_range(state_.min_bet, state_.max_bet));
                return {};
            }
            else if constexpr (std::is_same_v<T, HitAction> || std::is_same_v<T, StandAction>)
            {
                return CheckHand(*seat, act.hand);
            }
            else if constexpr (std::is_same_v<T, DoubleAction>)
            {
                if (CheckResult v = CheckHand(*seat, act.hand); !v) return v;
                if (p.hands[act.hand].cards.size() != 2)
                    return std::unexpected(Viol(RVC::Double_NeedsTwoCards).with_actor(actor).with_hand(act.hand));
                return {};
            }
            else if constexpr (std::is_same_v<T, SplitAction>)
            {
                if (CheckResult v = CheckHand(*seat, act.hand); !v) return v;
                CardVec const& cards = p.hands[act.hand].cards;
                if (cards.size() != 2 || cards[0].rank() != cards[1].rank())
                    return std::unexpected(Viol(RVC::Split_NotAPair).with_actor(actor).with_hand(act.hand));
                if (p.hands.size() >= cfg_.max_hands)
                    return std::unexpected(Viol(RVC::Split_HandLimit)
                                           .with_actor(actor)
                                           .with_attempted(static_cast<uint8_t>(p.hands.size() + 1)));
                return {};
            }
            else if constexpr (std::is_same_v<T, SurrenderAction>)
            {
                if (p.decided || p.hands.size() != 1 || p.hands.front().cards.size() != 2)
                    return std::unexpected(Viol(RVC::Surrender_NotFirstDecision).with_actor(actor));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "Blackjack action not handled in Validate");
            }
        }, a);
    }

    auto BlackjackGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        BlackjackPlayer& p = state_.players[seat];
        // hand finishes on bust or on reaching 21
        auto const settle_total = [](BlackjackHand& h)
        {
            if (eval::ScoreBlackjack(h.cards).total >= eval::BlackjackTarget) h.finished = true;
        };

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlaceBetAction>)
            {
                p.bet = act.amount;
                p.has_bet = true;
            }
            else if constexpr (std::is_same_v<T, HitAction>)
            {
                BlackjackHand& h = p.hands[act.hand];
                h.cards.push_back(DealOne());
                settle_total(h);
            }
            else if constexpr (std::is_same_v<T, StandAction>)
            {
                p.hands[act.hand].finished = true;
            }
            else if constexpr (std::is_same_v<T, DoubleAction>)
            {
                BlackjackHand& h = p.hands[act.hand];
                h.bet *= 2;
                h.doubled = true;
                h.cards.push_back(DealOne());
                h.finished = true;
            }
            else if constexpr (std::is_same_v<T, SplitAction>)
            {
                BlackjackHand& h = p.hands[act.hand];
                BlackjackHand second{.cards = {h.cards.back()}, .bet = h.bet, .from_split = true};
                h.cards.pop_back();
                h.from_split = true;
                h.cards.push_back(DealOne());
                second.cards.push_back(DealOne());
                settle_total(h);
                settle_total(second);
                // h is invalidated by the insert
                p.hands.insert(p.hands.begin() + act.hand + 1, std::move(second));
            }
            else if constexpr (std::is_same_v<T, SurrenderAction>)
            {
                BlackjackHand& h = p.hands.front();
                h.surrendered = true;
                h.finished = true;
            }
            else
            {
                static_assert(util::always_false_v<T>, "Blackjack action not handled in Mutate");
            }
        }, a);

        if (state_.phase == BlackjackPhase::PlayerTurn) p.decided = true;
    }

    auto BlackjackGame::Advance() -> void
    {
        if (state_.phase == BlackjackPhase::Betting)
        {
            bool const waiting = std::ranges::any_of(state_.players, [](BlackjackPlayer const& p)
            {
                return !p.has_bet;
            });
            if (!waiting) DealInitial();
            return;
        }

        if (state_.phase != BlackjackPhase::PlayerTurn) return;

        BlackjackPlayer& cur = state_.players[state_.current_idx];
        if (std::optional<uint8_t> const h = NextUnfinishedHand(cur))
        {
            cur.current_hand = *h;
            return;
        }

        std::optional<PlyrIdxT> const next = util::NextSeatWhere(
            state_.current_idx, state_.players.size(),
            [this](PlyrIdxT const seat) { return NextUnfinishedHand(state_.players[seat]).has_value(); });
        if (next)
        {
            state_.current_idx = *next;
            state_.players[*next].current_hand = *NextUnfinishedHand(state_.players[*next]);
            return;
        }
        PlayDealer();
    }

    auto BlackjackGame::DealInitial() -> void
    {
        state_.phase = BlackjackPhase::Dealing;
        for (BlackjackPlayer& p : state_.players)
        {
            p.hands = {BlackjackHand{.bet = p.bet}};
        }
        for (int pass = 0; pass < 2; ++pass)
        {
            for (BlackjackPlayer& p : state_.players) p.hands.front().cards.push_back(DealOne());
            state_.dealer_hand.push_back(DealOne());
        }
        for (BlackjackPlayer& p : state_.players)
        {
            if (IsNaturalHand(p.hands.front())) p.hands.front().finished = true;
        }

        state_.phase = BlackjackPhase::PlayerTurn;
        std::optional<PlyrIdxT> const first = util::NextSeatWhere(
            static_cast<PlyrIdxT>(state_.players.size() - 1), state_.players.size(),
            [this](PlyrIdxT const seat) { return !state_.players[seat].hands.front().finished; });
        if (first) state_.current_idx = *first;
        else PlayDealer();
    }

    auto BlackjackGame::PlayDealer() -> void
    {
        state_.phase = BlackjackPhase::DealerTurn;
        state_.hole_revealed = true;

        bool const anyone_live = std::ranges::any_of(state_.players, [](BlackjackPlayer const& p)
        {
            return std::ranges::any_of(p.hands, [](BlackjackHand const& h)
            {
                return !h.surrendered && !eval::IsBust(h.cards);
            });
        });
        if (anyone_live)
        {
            // stands on every 17, soft included
            while (eval::ScoreBlackjack(state_.dealer_hand).total < DealerStandsOn)
                state_.dealer_hand.push_back(DealOne());
        }
        Settle();
    }

    auto BlackjackGame::SettleHand(BlackjackHand& h, bool const dealer_natural, bool const dealer_bust,
                                   uint8_t const dealer_total) const -> void
    {
        uint8_t const total = eval::ScoreBlackjack(h.cards).total;
        if (h.surrendered) h.payout = -(h.bet / 2);
        else if (total > eval::BlackjackTarget) h.payout = -h.bet;
        else if (IsNaturalHand(h)) h.payout = dealer_natural ? 0 : h.bet * 3 / 2;
        else if (dealer_natural) h.payout = -h.bet;
        else if (dealer_bust || total > dealer_total) h.payout = h.bet;
        else if (total == dealer_total) h.payout = 0;
        else h.payout = -h.bet;
    }

    auto BlackjackGame::Settle() -> void
    {
        bool const dealer_natural = eval::IsNatural(state_.dealer_hand);
        bool const dealer_bust = eval::IsBust(state_.dealer_hand);
        uint8_t const dealer_total = eval::ScoreBlackjack(state_.dealer_hand).total;

        Chips house = 0;
        for (BlackjackPlayer& p : state_.players)
        {
            p.payout = 0;
            for (BlackjackHand& h : p.hands)
            {
                SettleHand(h, dealer_natural, dealer_bust, dealer_total);
                p.payout += h.payout;
            }
            house -= p.payout;
        }
        state_.house_payout = house;
        state_.phase = BlackjackPhase::Settling;
    }

    auto BlackjackGame::NextUnfinishedHand(BlackjackPlayer const& p) const -> std::optional<uint8_t>
    {
        for (std::size_t i = 0; i < p.hands.size(); ++i)
        {
            if (!p.hands[i].finished) return static_cast<uint8_t>(i);
        }
        return std::nullopt;
    }

    auto BlackjackGame::DealOne() -> Card
    {
        if (deck_.Empty()) RecycleOffTable();
        std::optional<Card> const c = deck_.Deal();
        if (!c) CRM_THROW(error::Code::State, "Blackjack shoe exhausted mid-round");
        return *c;
    }

    // Cards from earlier rounds go back into the shoe; cards in play stay dealt.
    auto BlackjackGame::RecycleOffTable() -> void
    {
        CardVec spent = deck_.Serialize().dealt;
        CardVec in_play = state_.dealer_hand;
        for (BlackjackPlayer const& p : state_.players)
        {
            for (BlackjackHand const& h : p.hands) in_play.insert(in_play.end(), h.cards.begin(), h.cards.end());
        }
        bool const removed = util::RemoveCards(spent, in_play);
        CRM_ASSERT(removed, "A card in play was never dealt from the shoe");
        deck_.Recycle(spent);
    }

    auto BlackjackGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto BlackjackGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
