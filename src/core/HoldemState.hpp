//
// Created by Malik T on 25/08/2025.
//

#ifndef CARDROOM_HOLDEMSTATE_HPP
#define CARDROOM_HOLDEMSTATE_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"
#include "../eval/PokerEvaluator.hpp"

namespace cardroom::core
{
    enum class HoldemPhase : uint8_t
    {
        Waiting = 0,
        Preflop,
        Flop,
        Turn,
        River,
        Showdown,
        Settling,
        Finished
    };

    inline auto ToString(HoldemPhase p) -> std::string_view
    {
        switch (p)
        {
        case HoldemPhase::Waiting: return "waiting";
        case HoldemPhase::Preflop: return "preflop";
        case HoldemPhase::Flop: return "flop";
        case HoldemPhase::Turn: return "turn";
        case HoldemPhase::River: return "river";
        case HoldemPhase::Showdown: return "showdown";
        case HoldemPhase::Settling: return "settling";
        case HoldemPhase::Finished: return "finished";
        }
        return "unknown";
    }

    struct HoldemConfig
    {
        Chips small_blind{5};
        Chips big_blind{10};
        Chips starting_chips{1000};
        uint8_t min_players{2};
        uint8_t max_players{9};
        uint64_t seed{std::random_device{}()};
    };

    struct HoldemPlayer
    {
        PlayerId id;
        std::string display_name;
        CardVec hole;
        Chips chips{};
        Chips bet{}; // committed on the current street
        Chips contributed{}; // committed over the whole hand
        Chips won{};
        Chips payout{}; // won - contributed, once settled
        bool folded{false};
        bool all_in{false};
        bool has_acted{false};
        bool sitting_out{false}; // no chips when the hand started
        std::optional<eval::PokerHand> result{};
    };

    // One main or side pot. Seats index HoldemState::players.
    struct HoldemPot
    {
        Chips amount{};
        std::vector<PlyrIdxT> eligible;
        std::vector<PlyrIdxT> winners;
    };

    struct HoldemState
    {
        HoldemPhase phase{HoldemPhase::Waiting};
        std::vector<HoldemPlayer> players;
        CardVec community;
        std::vector<HoldemPot> pots; // filled at settlement
        PlyrIdxT button_idx{0};
        PlyrIdxT sb_idx{0};
        PlyrIdxT bb_idx{0};
        PlyrIdxT current_idx{0};
        Chips current_bet{};
        Chips min_raise{};
        Chips pot{};
        Chips small_blind{};
        Chips big_blind{};
        uint32_t round{0};
    };

    using HoldemAction = std::variant<FoldAction, CheckAction, CallAction, RaiseAction, AllInAction>;
} // namespace cardroom::core

#endif //CARDROOM_HOLDEMSTATE_HPP
