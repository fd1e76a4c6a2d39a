//
// Created by Malik T on 14/08/2025.
//

#ifndef CARDROOM_EXCEPTION_HPP
#define CARDROOM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"

namespace cardroom::core::error
{
    enum class Code : unsigned
    {
        Rules, // engine misconfiguration or misuse (not a user invalid move)
        State, // state invariant broken (e.g. deck exhausted mid-deal)
        Network, // transport failure
        Assertion // internal assertion failed
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CRM_THROW(code_enum, msg) ::cardroom::core::error::fail((code_enum), (msg))
#define CRM_ASSERT(cond, msg) do { if(!(cond)) ::cardroom::core::error::fail(::cardroom::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase,
        NotPlayersTurn,
        UnknownPlayer,

        // Roster
        Roster_DuplicatePlayer,
        Roster_TableFull,
        Roster_NotEnoughPlayers,

        // Bets against a dealer
        Bet_DealerCannotBet,
        Bet_OutOfRange,
        Bet_AlreadyPlaced,

        // Per-turn decisions
        Turn_DealerCannotFold,
        Turn_AlreadyActed,
        Turn_PlayerFolded,
        Turn_PlayerOut,

        // Card selection
        Cards_Empty,
        Cards_NotInHand,
        Cards_Duplicate,
        Cards_IndexOutOfRange,
        Cards_TooMany,

        // Hold'em wagering
        Wager_CannotCheck,
        Wager_NothingToCall,
        Wager_RaiseBelowMinimum,
        Wager_ExceedsStack,
        Wager_NoChips,

        // Blackjack hands
        Hand_NotCurrent,
        Hand_Finished,
        Double_NeedsTwoCards,
        Split_NotAPair,
        Split_HandLimit,
        Surrender_NotFirstDecision,

        // Trick play
        Play_InvalidCombination,
        Play_DoesNotBeat,
        Pass_TableEmpty,

        // Melds
        Draw_AlreadyDrawn,
        Draw_Required,
        Draw_StockEmpty,
        Draw_DiscardEmpty,
        Meld_Invalid,
        Meld_NotFound,
        LayOff_DoesNotFit,
        Knock_DeadwoodTooHigh,

        // Replication
        Session_ActorMismatch,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<std::string_view> phase{}; // always a static phase name
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> expected_actor{};

        // Amounts useful in error messages
        std::optional<Chips> amount{};
        std::optional<Chips> lower{};
        std::optional<Chips> upper{};
        std::optional<std::uint8_t> attempted_count{}; // e.g., number of cards/indices
        std::optional<std::uint8_t> hand_index{};

        // Card-related details
        std::optional<Card> card{};

        // Quick helpers to build enriched violations (fluent style).
        // Every phase enum provides ToString(phase) in its own namespace.
        template <typename PhaseT>
        auto with_phase(PhaseT p) -> RuleViolation&
        {
            phase = ToString(p);
            return *this;
        }

        auto with_actor(PlayerId const& id) -> RuleViolation&
        {
            actor = id;
            return *this;
        }

        auto with_expected(PlayerId const& id) -> RuleViolation&
        {
            expected_actor = id;
            return *this;
        }

        auto with_amount(Chips v) -> RuleViolation&
        {
            amount = v;
            return *this;
        }

        auto with_range(Chips lo, Chips hi) -> RuleViolation&
        {
            lower = lo;
            upper = hi;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_hand(std::uint8_t v) -> RuleViolation&
        {
            hand_index = v;
            return *this;
        }

        auto with_card(Card const& c) -> RuleViolation&
        {
            card = c;
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{.code = code};
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::WrongPhase: return "Wrong phase for this action";
        case E::NotPlayersTurn: return "Not this player's turn";
        case E::UnknownPlayer: return "Player not seated at this table";

        // Roster
        case E::Roster_DuplicatePlayer: return "Roster: player already seated";
        case E::Roster_TableFull: return "Roster: table is full";
        case E::Roster_NotEnoughPlayers: return "Roster: not enough players to start";

        // Bets
        case E::Bet_DealerCannotBet: return "Bet: dealer does not bet";
        case E::Bet_OutOfRange: return "Bet: amount outside table limits";
        case E::Bet_AlreadyPlaced: return "Bet: already placed this round";

        // Turn
        case E::Turn_DealerCannotFold: return "Turn: dealer cannot fold";
        case E::Turn_AlreadyActed: return "Turn: player already acted";
        case E::Turn_PlayerFolded: return "Turn: player has folded";
        case E::Turn_PlayerOut: return "Turn: player is out of the round";

        // Cards
        case E::Cards_Empty: return "Cards: empty selection";
        case E::Cards_NotInHand: return "Cards: card not in player's hand";
        case E::Cards_Duplicate: return "Cards: duplicate cards in action";
        case E::Cards_IndexOutOfRange: return "Cards: hand index out of range";
        case E::Cards_TooMany: return "Cards: too many cards selected";

        // Wagering
        case E::Wager_CannotCheck: return "Wager: cannot check facing a bet";
        case E::Wager_NothingToCall: return "Wager: nothing to call";
        case E::Wager_RaiseBelowMinimum: return "Wager: raise below minimum";
        case E::Wager_ExceedsStack: return "Wager: amount exceeds stack";
        case E::Wager_NoChips: return "Wager: player has no chips";

        // Blackjack
        case E::Hand_NotCurrent: return "Hand: not the hand in play";
        case E::Hand_Finished: return "Hand: already finished";
        case E::Double_NeedsTwoCards: return "Double: only on a two-card hand";
        case E::Split_NotAPair: return "Split: hand is not a pair";
        case E::Split_HandLimit: return "Split: hand limit reached";
        case E::Surrender_NotFirstDecision: return "Surrender: only as first decision";

        // Trick play
        case E::Play_InvalidCombination: return "Play: not a valid combination";
        case E::Play_DoesNotBeat: return "Play: does not beat the table";
        case E::Pass_TableEmpty: return "Pass: cannot pass on an empty table";

        // Melds
        case E::Draw_AlreadyDrawn: return "Draw: already drew this turn";
        case E::Draw_Required: return "Draw: must draw first";
        case E::Draw_StockEmpty: return "Draw: stock and discard exhausted";
        case E::Draw_DiscardEmpty: return "Draw: discard pile is empty";
        case E::Meld_Invalid: return "Meld: cards do not form a set or run";
        case E::Meld_NotFound: return "Meld: no such meld on the table";
        case E::LayOff_DoesNotFit: return "Lay off: card does not extend meld";
        case E::Knock_DeadwoodTooHigh: return "Knock: deadwood above threshold";

        case E::Session_ActorMismatch: return "Session: actor is not the sending peer";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    auto describe(RuleViolation const& v) -> std::string;

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //CARDROOM_EXCEPTION_HPP
