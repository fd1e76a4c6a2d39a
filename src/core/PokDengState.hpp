//
// Created by Malik T on 21/08/2025.
//

#ifndef CARDROOM_POKDENGSTATE_HPP
#define CARDROOM_POKDENGSTATE_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"
#include "../eval/PointScorer.hpp"

namespace cardroom::core
{
    enum class PokDengPhase : uint8_t
    {
        Waiting = 0,
        Betting,
        Dealing,
        Playing,
        Revealing,
        Settling,
        Finished
    };

    inline auto ToString(PokDengPhase p) -> std::string_view
    {
        switch (p)
        {
        case PokDengPhase::Waiting: return "waiting";
        case PokDengPhase::Betting: return "betting";
        case PokDengPhase::Dealing: return "dealing";
        case PokDengPhase::Playing: return "playing";
        case PokDengPhase::Revealing: return "revealing";
        case PokDengPhase::Settling: return "settling";
        case PokDengPhase::Finished: return "finished";
        }
        return "unknown";
    }

    struct PokDengConfig
    {
        Chips min_bet{10};
        Chips max_bet{100};
        uint8_t min_players{2};
        uint8_t max_players{9};
        uint64_t seed{std::random_device{}()};
    };

    struct PokDengPlayer
    {
        PlayerId id;
        std::string display_name;
        CardVec hand;
        Chips bet{};
        Chips payout{};
        bool is_dealer{false};
        bool folded{false};
        bool has_bet{false};
        bool has_drawn{false}; // drew or stayed this round
        std::optional<eval::PointHand> result{};
    };

    struct PokDengState
    {
        PokDengPhase phase{PokDengPhase::Waiting};
        std::vector<PokDengPlayer> players;
        PlyrIdxT dealer_idx{0};
        PlyrIdxT current_idx{0};
        Chips pot{};
        Chips min_bet{};
        Chips max_bet{};
        uint32_t round{0};
    };

    using PokDengAction = std::variant<PlaceBetAction, DrawCardAction, StayAction, FoldAction>;
} // namespace cardroom::core

#endif //CARDROOM_POKDENGSTATE_HPP
