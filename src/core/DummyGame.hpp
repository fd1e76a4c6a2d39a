//
// Created by Malik T on 01/09/2025.
//

#ifndef CARDROOM_DUMMYGAME_HPP
#define CARDROOM_DUMMYGAME_HPP

#include <span>

#include "Deck.hpp"
#include "Exception.hpp"
#include "DummyState.hpp"
#include "State.hpp"

namespace cardroom::core
{
    // Draw, meld, discard. The undealt deck is the stock.
    class DummyGame
    {
    public:
        using Action = DummyAction;
        using State = DummyState;
        using Snapshot = GameSnapshot<DummyState>;
        using CheckResult = error::ValidateResult;
        static constexpr GameKind Kind = GameKind::Dummy;

        DummyGame() = delete;
        explicit DummyGame(DummyConfig const& config);

        auto AddPlayer(PlayerInfo const& info) -> CheckResult;
        auto RemovePlayer(PlayerId const& id) -> CheckResult;

        auto StartRound() -> CheckResult;
        // Finished -> Waiting, the next seat starts the following game.
        auto EndRound() -> CheckResult;

        auto DrawStock(PlayerId const& id) -> CheckResult;
        auto DrawDiscard(PlayerId const& id) -> CheckResult;
        auto Meld(PlayerId const& id, std::span<Card const> cards) -> CheckResult;
        auto LayOff(PlayerId const& id, Card const& card, uint32_t meld_id) -> CheckResult;
        auto Discard(PlayerId const& id, Card const& card) -> CheckResult;
        auto Knock(PlayerId const& id) -> CheckResult;

        auto Apply(PlayerId const& actor, Action const& a) -> CheckResult;

        [[nodiscard]] auto GetState() const noexcept -> State const& { return state_; }
        auto SetState(State s) -> void { state_ = std::move(s); }
        [[nodiscard]] auto Serialize() const -> Snapshot;
        auto Restore(Snapshot snap) -> void;

        [[nodiscard]] auto Config() const noexcept -> DummyConfig const& { return cfg_; }
        [[nodiscard]] auto StockSize() const noexcept -> std::size_t { return deck_.Remaining(); }

    private:
        auto Validate(PlayerId const& actor, Action const& a) const -> CheckResult;
        auto Mutate(PlyrIdxT seat, Action const& a) -> void;
        auto Advance() -> void;

        auto RefillStock() -> void;
        auto ScoreKnock(PlyrIdxT knocker) -> void;
        auto FinishOut(PlyrIdxT winner) -> void;
        auto FindMeld(uint32_t id) const -> std::optional<std::size_t>;
        auto DealOne() -> Card;

    private:
        DummyConfig cfg_;
        Deck deck_;
        State state_;
    };

    // Suit, then rank.
    auto SortDummyHand(CardVec& hand) -> void;
}

#endif //CARDROOM_DUMMYGAME_HPP
