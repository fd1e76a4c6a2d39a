//
// Created by Malik T on 27/08/2025.
//

#ifndef CARDROOM_BLACKJACKGAME_HPP
#define CARDROOM_BLACKJACKGAME_HPP

#include "Deck.hpp"
#include "Exception.hpp"
#include "BlackjackState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // Players against the house from a multi-deck shoe. The house is not a roster seat.
    class BlackjackGame
    {
    public:
        using Action = BlackjackAction;
        using State = BlackjackState;
        using Snapshot = GameSnapshot<BlackjackState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::Blackjack;

        BlackjackGame() = delete;
        explicit BlackjackGame(BlackjackConfig const& config);

        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        // Reshuffles the shoe first when it has run low.
        auto StartRound() -> CheckResult;
        auto EndRound() -> CheckResult;

        auto PlaceBet(PlayerId const& id, Chips amount) -> CheckResult;
        auto Hit(PlayerId const& id, uint8_t hand) -> CheckResult;
        auto Stand(PlayerId const& id, uint8_t hand) -> CheckResult;
        auto Double(PlayerId const& id, uint8_t hand) -> CheckResult;
        auto Split(PlayerId const& id, uint8_t hand) -> CheckResult;
        auto Surrender(PlayerId const& id) -> CheckResult;

        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> BlackjackConfig const& { return cfg_; }
        [[nodiscard]] auto ShoeRemaining() const noexcept -> std::size_t { return deck_.Remaining(); }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto CheckHand(PlyrIdxT seat, uint8_t hand) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto DealInitial() -> void;
        auto PlayDealer() -> void;
        auto Settle() -> void;
        auto SettleHand(BlackjackHand& h, bool dealer_natural, bool dealer_bust, uint8_t dealer_total) const -> void;
        auto NextUnfinishedHand(BlackjackPlayer const& p) const -> std::optional<uint8_t>;
        auto DealOne() -> Card;
        auto RecycleOffTable() -> void;

    private:
        BlackjackConfig cfg_;
        Deck deck_;
        State state_;
    };
}

#endif //CARDROOM_BLACKJACKGAME_HPP
