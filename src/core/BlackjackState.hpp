//
// Created by Malik T on 27/08/2025.
//

#ifndef CARDROOM_BLACKJACKSTATE_HPP
#define CARDROOM_BLACKJACKSTATE_HPP

#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"

namespace cardroom::core
{
    enum class BlackjackPhase : uint8_t
    {
        Waiting = 0,
        Betting,
        Dealing,
        PlayerTurn,
        DealerTurn,
        Settling,
        Finished
    };

    inline auto ToString(BlackjackPhase p) -> std::string_view
    {
        switch (p)
        {
        case BlackjackPhase::Waiting: return "waiting";
        case BlackjackPhase::Betting: return "betting";
        case BlackjackPhase::Dealing: return "dealing";
        case BlackjackPhase::PlayerTurn: return "player_turn";
        case BlackjackPhase::DealerTurn: return "dealer_turn";
        case BlackjackPhase::Settling: return "settling";
        case BlackjackPhase::Finished: return "finished";
        }
        return "unknown";
    }

    struct BlackjackConfig
    {
        uint8_t decks{6};
        Chips min_bet{10};
        Chips max_bet{500};
        std::size_t reshuffle_below{78};
        uint8_t min_players{1};
        uint8_t max_players{7};
        uint8_t max_hands{4}; // per player, after splits
        uint64_t seed{std::random_device{}()};
    };

    struct BlackjackHand
    {
        CardVec cards;
        Chips bet{};
        Chips payout{};
        bool finished{false};
        bool doubled{false};
        bool from_split{false};
        bool surrendered{false};
    };

    struct BlackjackPlayer
    {
        PlayerId id;
        std::string display_name;
        std::vector<BlackjackHand> hands;
        Chips bet{}; // opening bet
        Chips payout{}; // sum over hands
        bool has_bet{false};
        bool decided{false}; // made a decision on the opening hand
        uint8_t current_hand{0};
    };

    struct BlackjackState
    {
        BlackjackPhase phase{BlackjackPhase::Waiting};
        std::vector<BlackjackPlayer> players;
        CardVec dealer_hand; // second card is the hole card
        bool hole_revealed{false};
        PlyrIdxT current_idx{0};
        Chips min_bet{};
        Chips max_bet{};
        Chips house_payout{};
        uint32_t round{0};
    };

    using BlackjackAction = std::variant<PlaceBetAction, HitAction, StandAction, DoubleAction,
                                         SplitAction, SurrenderAction>;
} // namespace cardroom::core

#endif //CARDROOM_BLACKJACKSTATE_HPP
