//
// Created by Malik T on 01/09/2025.
//

#ifndef CARDROOM_DUMMYSTATE_HPP
#define CARDROOM_DUMMYSTATE_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"
#include "../eval/MeldRules.hpp"

namespace cardroom::core
{
    enum class DummyPhase : uint8_t
    {
        Waiting = 0,
        Playing,
        Finished
    };

    inline auto ToString(DummyPhase p) -> std::string_view
    {
        switch (p)
        {
        case DummyPhase::Waiting: return "waiting";
        case DummyPhase::Playing: return "playing";
        case DummyPhase::Finished: return "finished";
        }
        return "unknown";
    }

    struct DummyConfig
    {
        uint8_t min_players{2};
        uint8_t max_players{4};
        uint8_t heads_up_hand{10}; // two players
        uint8_t table_hand{7}; // three or more
        unsigned knock_threshold{10};
        int undercut_penalty{10};
        uint64_t seed{std::random_device{}()};
    };

    // Melds live on the table; anyone may lay off onto any meld.
    struct DummyMeld
    {
        uint32_t id{};
        eval::MeldType type{eval::MeldType::Set};
        CardVec cards;
        PlayerId owner;
    };

    struct DummyPlayer
    {
        PlayerId id;
        std::string display_name;
        CardVec hand;
        unsigned deadwood{};
        int score{}; // lower is better, set when the game ends
        bool is_knocker{false};
    };

    struct DummyState
    {
        DummyPhase phase{DummyPhase::Waiting};
        std::vector<DummyPlayer> players;
        CardVec discard; // top is back()
        std::vector<DummyMeld> melds;
        PlyrIdxT current_idx{0};
        PlyrIdxT starter_idx{0};
        bool has_drawn{false}; // current player drew this turn
        uint32_t next_meld_id{1};
        std::optional<PlayerId> winner{};
        std::optional<PlayerId> knocker{};
        bool undercut{false};
        bool went_out{false}; // won by emptying the hand
        uint32_t round{0};
    };

    using DummyAction = std::variant<DrawStockAction, DrawDiscardAction, MeldAction, LayOffAction,
                                     DiscardCardAction, KnockAction>;
} // namespace cardroom::core

#endif //CARDROOM_DUMMYSTATE_HPP
