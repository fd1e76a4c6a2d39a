//
// Created by Malik T on 25/08/2025.
//

#ifndef CARDROOM_HOLDEMGAME_HPP
#define CARDROOM_HOLDEMGAME_HPP

#include "Deck.hpp"
#include "Exception.hpp"
#include "HoldemState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // No-limit community-card poker with blinds and side pots.
    class HoldemGame
    {
    public:
        using Action = HoldemAction;
        using State = HoldemState;
        using Snapshot = GameSnapshot<HoldemState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::Holdem;

        HoldemGame() = delete;
        explicit HoldemGame(HoldemConfig const& config);

        // New players sit down with the configured starting stack.
        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        // Posts blinds and deals hole cards. Needs two players with chips.
        auto StartRound() -> CheckResult;
        // Settling -> Finished, moves the button.
        auto EndRound() -> CheckResult;

        auto Fold(PlayerId const& id) -> CheckResult;
        auto Check(PlayerId const& id) -> CheckResult;
        auto Call(PlayerId const& id) -> CheckResult;
        // `by` is the raise on top of the amount to call.
        auto Raise(PlayerId const& id, Chips by) -> CheckResult;
        auto AllIn(PlayerId const& id) -> CheckResult;

        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> HoldemConfig const& { return cfg_; }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto Commit(HoldemPlayer& p, Chips amount) -> void;
        auto RaiseTo(PlyrIdxT seat, Chips target) -> void;
        auto EndStreet() -> void;
        auto AwardUncontested() -> void;
        auto Showdown() -> void;
        auto BuildPots() const -> std::vector<HoldemPot>;

        auto NeedsAction(HoldemPlayer const& p) const noexcept -> bool;
        auto ActionReopened(HoldemPlayer const& p, Chips to_call) const noexcept -> bool;
        auto NextToAct(PlyrIdxT from) const -> std::optional<PlyrIdxT>;
        auto NextWithChips(PlyrIdxT from) const -> std::optional<PlyrIdxT>;
        auto DealOne() -> Card;

    private:
        HoldemConfig cfg_;
        Deck deck_;
        State state_;
    };
}

#endif //CARDROOM_HOLDEMGAME_HPP
