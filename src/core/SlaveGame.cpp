//
// Created by Malik T on 29/08/2025.
//

#include "SlaveGame.hpp"

#include <algorithm>
#include <type_traits>

#include "Util.hpp"

namespace cardroom::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    namespace
    {
        inline constexpr Card ThreeOfClubs{Suit::Clubs, Rank::Three};
    }

    SlaveGame::SlaveGame(SlaveConfig const& config) :
        cfg_(config),
        deck_(1, cfg_.seed)
    {
        if (cfg_.min_players < 2 || cfg_.min_players > cfg_.max_players)
            CRM_THROW(error::Code::Rules, fmt::format("Slave seats {}..{} are invalid",
                                                      cfg_.min_players, cfg_.max_players));
        if (cfg_.max_players > deck_.Size())
            CRM_THROW(error::Code::Rules, fmt::format("Slave cannot seat {} players", cfg_.max_players));
    }

    auto SlaveGame::AddPlayer(PlayerInfo const& info) -> CheckResult
    {
        if (state_.phase == SlavePhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(info.id));
        if (FindSeat(state_.players, info.id))
            return std::unexpected(Viol(RVC::Roster_DuplicatePlayer).with_actor(info.id));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(Viol(RVC::Roster_TableFull).with_actor(info.id));

        state_.players.push_back(SlavePlayer{.id = info.id, .display_name = info.display_name});
        return {};
    }

    auto SlaveGame::RemovePlayer(PlayerId const& id) -> CheckResult
    {
        if (state_.phase == SlavePhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(id));
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, id);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(id));

        state_.players.erase(state_.players.begin() + *seat);
        return {};
    }

    auto SlaveGame::StartRound() -> CheckResult
    {
        if (state_.phase == SlavePhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        if (state_.players.size() < cfg_.min_players)
            return std::unexpected(Viol(RVC::Roster_NotEnoughPlayers)
                                   .with_attempted(static_cast<uint8_t>(state_.players.size())));

        deck_.Reset();
        for (SlavePlayer& p : state_.players)
        {
            p.hand.clear();
            p.passed = false;
            p.out = false;
            p.finish_pos.reset();
            p.title = SlaveTitle::None;
        }

        std::size_t const n = state_.players.size();
        for (std::size_t i = 0; !deck_.Empty(); ++i)
        {
            std::optional<Card> const c = deck_.Deal();
            state_.players[i % n].hand.push_back(*c);
        }
        for (SlavePlayer& p : state_.players) eval::SortSlaveHand(p.hand);

        state_.table.reset();
        state_.last_played_idx.reset();
        state_.pile.clear();
        state_.finish_order.clear();
        state_.current_idx = OpeningSeat();
        ++state_.round;
        state_.phase = SlavePhase::Playing;
        return {};
    }

    auto SlaveGame::EndRound() -> CheckResult
    {
        if (state_.phase != SlavePhase::Finished)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase));
        state_.phase = SlavePhase::Waiting;
        return {};
    }

    auto SlaveGame::Play(PlayerId const& id, std::span<Card const> cards) -> CheckResult
    {
        return Apply(id, PlayCardsAction{CardVec(cards.begin(), cards.end())});
    }

    auto SlaveGame::Pass(PlayerId const& id) -> CheckResult
    {
        return Apply(id, PassAction{});
    }

    auto SlaveGame::Apply(PlayerId const& actor, Action const& a) -> CheckResult
    {
        if (CheckResult v = Validate(actor, a); !v) return v;
        Mutate(*FindSeat(state_.players, actor), a);
        Advance();
        return {};
    }

    auto SlaveGame::Validate(PlayerId const& actor, Action const& a) const -> CheckResult
    {
        std::optional<PlyrIdxT> const seat = FindSeat(state_.players, actor);
        if (!seat)
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));
        if (state_.phase != SlavePhase::Playing)
            return std::unexpected(Viol(RVC::WrongPhase).with_phase(state_.phase).with_actor(actor));

        SlavePlayer const& p = state_.players[*seat];
        if (p.out)
            return std::unexpected(Viol(RVC::Turn_PlayerOut).with_actor(actor));
        if (*seat != state_.current_idx)
            return std::unexpected(Viol(RVC::NotPlayersTurn)
                                   .with_actor(actor)
                                   .with_expected(state_.players[state_.current_idx].id));

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PassAction>)
            {
                if (!state_.table)
                    return std::unexpected(Viol(RVC::Pass_TableEmpty).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, PlayCardsAction>)
            {
                if (act.cards.empty())
                    return std::unexpected(Viol(RVC::Cards_Empty).with_actor(actor));
                if (util::ContainsDup(act.cards))
                    return std::unexpected(Viol(RVC::Cards_Duplicate)
                                           .with_actor(actor)
                                           .with_attempted(static_cast<uint8_t>(act.cards.size())));
                for (Card const& c : act.cards)
                {
                    if (std::ranges::find(p.hand, c) == p.hand.end())
                        return std::unexpected(Viol(RVC::Cards_NotInHand).with_actor(actor).with_card(c));
                }
                std::optional<eval::SlavePlay> const play = eval::MakePlay(act.cards, cfg_.rules);
                if (!play)
                    return std::unexpected(Viol(RVC::Play_InvalidCombination)
                                           .with_actor(actor)
                                           .with_attempted(static_cast<uint8_t>(act.cards.size())));
                if (state_.table && !eval::Beats(*play, *state_.table, cfg_.rules))
                    return std::unexpected(Viol(RVC::Play_DoesNotBeat).with_actor(actor));
                return {};
            }
            else
            {
                static_assert(util::always_false_v<T>, "Slave action not handled in Validate");
            }
        }, a);
    }

    auto SlaveGame::Mutate(PlyrIdxT const seat, Action const& a) -> void
    {
        SlavePlayer& p = state_.players[seat];
        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PassAction>)
            {
                p.passed = true;
            }
            else if constexpr (std::is_same_v<T, PlayCardsAction>)
            {
                std::optional<eval::SlavePlay> play = eval::MakePlay(act.cards, cfg_.rules);
                CRM_ASSERT(play.has_value(), "Validated play no longer classifies");
                bool const removed = util::RemoveCards(p.hand, act.cards);
                CRM_ASSERT(removed, "Validated cards missing from hand");

                state_.pile.insert(state_.pile.end(), act.cards.begin(), act.cards.end());
                state_.table = std::move(play);
                state_.last_played_idx = seat;
                // a new play reopens the trick for everyone who passed
                for (SlavePlayer& other : state_.players) other.passed = false;

                if (p.hand.empty())
                {
                    p.out = true;
                    p.finish_pos = static_cast<uint8_t>(state_.finish_order.size());
                    state_.finish_order.push_back(p.id);
                }
            }
            else
            {
                static_assert(util::always_false_v<T>, "Slave action not handled in Mutate");
            }
        }, a);
    }

    auto SlaveGame::Advance() -> void
    {
        auto const active = std::ranges::count_if(state_.players, [](SlavePlayer const& p) { return !p.out; });
        if (active <= 1)
        {
            FinishGame();
            return;
        }

        PlyrIdxT const leader = *state_.last_played_idx;
        bool const trick_over = std::ranges::all_of(state_.players, [&](SlavePlayer const& p)
        {
            return p.out || p.passed || p.id == state_.players[leader].id;
        });
        if (trick_over)
        {
            ClearTrick();
            return;
        }
        state_.current_idx = *NextActive(state_.current_idx);
    }

    auto SlaveGame::ClearTrick() -> void
    {
        PlyrIdxT const leader = *state_.last_played_idx;
        state_.table.reset();
        for (SlavePlayer& p : state_.players) p.passed = false;
        // a leader who went out hands the lead to the next player still holding cards
        state_.current_idx = state_.players[leader].out ? *NextActive(leader) : leader;
    }

    auto SlaveGame::FinishGame() -> void
    {
        for (SlavePlayer& p : state_.players)
        {
            if (p.out) continue;
            p.out = true;
            p.finish_pos = static_cast<uint8_t>(state_.finish_order.size());
            state_.finish_order.push_back(p.id);
        }

        std::size_t const n = state_.players.size();
        for (SlavePlayer& p : state_.players)
            p.title = TitleFor(*p.finish_pos, n);

        state_.previous_slave = state_.finish_order.back();
        state_.table.reset();
        state_.phase = SlavePhase::Finished;
    }

    auto SlaveGame::OpeningSeat() const -> PlyrIdxT
    {
        if (cfg_.rules.start == eval::StartPolicy::PreviousSlave && state_.previous_slave)
        {
            if (std::optional<PlyrIdxT> const seat = FindSeat(state_.players, *state_.previous_slave))
                return *seat;
        }
        for (std::size_t i = 0; i < state_.players.size(); ++i)
        {
            if (std::ranges::find(state_.players[i].hand, ThreeOfClubs) != state_.players[i].hand.end())
                return static_cast<PlyrIdxT>(i);
        }
        CRM_THROW(error::Code::State, "Nobody holds the three of clubs after a full deal");
    }

    auto SlaveGame::NextActive(PlyrIdxT const from) const -> std::optional<PlyrIdxT>
    {
        return util::NextSeatWhere(from, state_.players.size(), [this](PlyrIdxT const seat)
        {
            return !state_.players[seat].out;
        });
    }

    auto SlaveGame::Serialize() const -> Snapshot
    {
        return Snapshot{.state = state_, .deck = deck_.Serialize()};
    }

    auto SlaveGame::Restore(Snapshot snap) -> void
    {
        deck_.Restore(std::move(snap.deck));
        state_ = std::move(snap.state);
    }
}
