//
// Created by Malik T on 22/08/2025.
//

#ifndef CARDROOM_KANGSTATE_HPP
#define CARDROOM_KANGSTATE_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"
#include "../eval/DrawHandEvaluator.hpp"

namespace cardroom::core
{
    enum class KangPhase : uint8_t
    {
        Waiting = 0,
        Betting,
        Dealing,
        Discarding,
        Showdown,
        Settling,
        Finished
    };

    inline auto ToString(KangPhase p) -> std::string_view
    {
        switch (p)
        {
        case KangPhase::Waiting: return "waiting";
        case KangPhase::Betting: return "betting";
        case KangPhase::Dealing: return "dealing";
        case KangPhase::Discarding: return "discarding";
        case KangPhase::Showdown: return "showdown";
        case KangPhase::Settling: return "settling";
        case KangPhase::Finished: return "finished";
        }
        return "unknown";
    }

    struct KangConfig
    {
        Chips min_bet{10};
        Chips max_bet{100};
        uint8_t hand_size{5};
        uint8_t max_discard{4};
        uint8_t min_players{2};
        uint8_t max_players{5};
        uint64_t seed{std::random_device{}()};
    };

    struct KangPlayer
    {
        PlayerId id;
        std::string display_name;
        CardVec hand;
        Chips bet{};
        Chips payout{};
        bool is_dealer{false};
        bool folded{false};
        bool has_bet{false};
        bool has_acted{false}; // discarded or kept this round
        uint8_t discarded{0};
        std::optional<eval::DrawHand> result{};
    };

    struct KangState
    {
        KangPhase phase{KangPhase::Waiting};
        std::vector<KangPlayer> players;
        CardVec muck; // discarded cards, face down
        PlyrIdxT dealer_idx{0};
        PlyrIdxT current_idx{0};
        Chips pot{};
        Chips min_bet{};
        Chips max_bet{};
        uint32_t round{0};
    };

    using KangAction = std::variant<PlaceBetAction, DiscardAction, KeepAllAction, FoldAction>;
} // namespace cardroom::core

#endif //CARDROOM_KANGSTATE_HPP
