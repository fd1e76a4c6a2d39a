//
// Created by Malik T on 22/08/2025.
//

#ifndef CARDROOM_KANGGAME_HPP
#define CARDROOM_KANGGAME_HPP

#include <span>

#include "Deck.hpp"
#include "Exception.hpp"
#include "KangState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // Five-card draw against the dealer seat, one discard round.
    class KangGame
    {
    public:
        using Action = KangAction;
        using State = KangState;
        using Snapshot = GameSnapshot<KangState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::Kang;

        KangGame() = delete;
        explicit KangGame(KangConfig const& config);

        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        auto StartRound() -> CheckResult;
        auto EndRound() -> CheckResult;

        auto PlaceBet(PlayerId const& id, Chips amount) -> CheckResult;
        // Replaces the cards at the given hand positions.
        auto Discard(PlayerId const& id, std::span<uint8_t const> indices) -> CheckResult;
        auto KeepAll(PlayerId const& id) -> CheckResult;
        auto Fold(PlayerId const& id) -> CheckResult;

        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> KangConfig const& { return cfg_; }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto DealHands() -> void;
        auto Showdown() -> void;
        auto NextToAct(PlyrIdxT from) const -> std::optional<PlyrIdxT>;
        auto DealOne() -> Card;

    private:
        KangConfig cfg_;
        Deck deck_;
        State state_;
    };
}

#endif //CARDROOM_KANGGAME_HPP
