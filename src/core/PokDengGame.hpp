//
// Created by Malik T on 21/08/2025.
//

#ifndef CARDROOM_POKDENGGAME_HPP
#define CARDROOM_POKDENGGAME_HPP

#include "Deck.hpp"
#include "Exception.hpp"
#include "PokDengState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // Point-comparison game. Every non-dealer plays against the dealer seat.
    class PokDengGame
    {
    public:
        using Action = PokDengAction;
        using State = PokDengState;
        using Snapshot = GameSnapshot<PokDengState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::PokDeng;

        PokDengGame() = delete;
        explicit PokDengGame(PokDengConfig const& config);

        // Roster, only while waiting or between rounds. The first player seated deals first.
        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        auto StartRound() -> CheckResult;
        // Settling -> Finished, passes the deal to the next seat.
        auto EndRound() -> CheckResult;

        auto PlaceBet(PlayerId const& id, Chips amount) -> CheckResult;
        auto Draw(PlayerId const& id) -> CheckResult;
        auto Stay(PlayerId const& id) -> CheckResult;
        auto Fold(PlayerId const& id) -> CheckResult;

        // Validate, mutate, advance. Rule violations never throw.
        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> PokDengConfig const& { return cfg_; }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto DealHands() -> void;
        auto Reveal() -> void;
        auto NextToAct(PlyrIdxT from) const -> std::optional<PlyrIdxT>;
        auto DealOne() -> Card;

    private:
        PokDengConfig cfg_;
        Deck deck_;
        State state_;
    };
}

#endif //CARDROOM_POKDENGGAME_HPP
