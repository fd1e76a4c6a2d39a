//
// Created by Malik T on 29/08/2025.
//

#ifndef CARDROOM_SLAVEGAME_HPP
#define CARDROOM_SLAVEGAME_HPP

#include <span>

#include "Deck.hpp"
#include "Exception.hpp"
#include "SlaveState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // Shedding game. Both table variants are presets of the same ruleset.
    class SlaveGame
    {
    public:
        using Action = SlaveAction;
        using State = SlaveState;
        using Snapshot = GameSnapshot<SlaveState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::Slave;

        SlaveGame() = delete;
        explicit SlaveGame(SlaveConfig const& config);

        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        // Deals the whole deck and picks the opening player.
        auto StartRound() -> CheckResult;
        // Finished -> Waiting once titles are handed out.
        auto EndRound() -> CheckResult;

        auto Play(PlayerId const& id, std::span<Card const> cards) -> CheckResult;
        auto Pass(PlayerId const& id) -> CheckResult;

        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> SlaveConfig const& { return cfg_; }
        [[nodiscard]] auto Rules() const noexcept -> eval::SlaveRuleset const& { return cfg_.rules; }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto OpeningSeat() const -> PlyrIdxT;
        auto ClearTrick() -> void;
        auto FinishGame() -> void;
        auto NextActive(PlyrIdxT from) const -> std::optional<PlyrIdxT>;

    private:
        SlaveConfig cfg_;
        Deck deck_;
        State state_;
    };
}

#endif //CARDROOM_SLAVEGAME_HPP
