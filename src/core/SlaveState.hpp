//
// Created by Malik T on 29/08/2025.
//

#ifndef CARDROOM_SLAVESTATE_HPP
#define CARDROOM_SLAVESTATE_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Types.hpp"
#include "../eval/ComboFinder.hpp"

namespace cardroom::core
{
    enum class SlavePhase : uint8_t
    {
        Waiting = 0,
        Playing,
        Finished
    };

    inline auto ToString(SlavePhase p) -> std::string_view
    {
        switch (p)
        {
        case SlavePhase::Waiting: return "waiting";
        case SlavePhase::Playing: return "playing";
        case SlavePhase::Finished: return "finished";
        }
        return "unknown";
    }

    enum class SlaveTitle : uint8_t
    {
        None = 0,
        President,
        VicePresident,
        Citizen,
        ViceSlave,
        Slave
    };

    inline auto ToString(SlaveTitle t) -> std::string_view
    {
        switch (t)
        {
        case SlaveTitle::None: return "none";
        case SlaveTitle::President: return "president";
        case SlaveTitle::VicePresident: return "vice_president";
        case SlaveTitle::Citizen: return "citizen";
        case SlaveTitle::ViceSlave: return "vice_slave";
        case SlaveTitle::Slave: return "slave";
        }
        return "unknown";
    }

    // Title for a finishing position out of `count` players.
    inline auto TitleFor(std::size_t position, std::size_t count) -> SlaveTitle
    {
        if (position == 0) return SlaveTitle::President;
        if (position + 1 == count) return SlaveTitle::Slave;
        if (count >= 4 && position == 1) return SlaveTitle::VicePresident;
        if (count >= 4 && position + 2 == count) return SlaveTitle::ViceSlave;
        return SlaveTitle::Citizen;
    }

    struct SlaveConfig
    {
        uint8_t min_players{2};
        uint8_t max_players{4};
        eval::SlaveRuleset rules{eval::SlaveRuleset::Classic()};
        uint64_t seed{std::random_device{}()};
    };

    struct SlavePlayer
    {
        PlayerId id;
        std::string display_name;
        CardVec hand;
        bool passed{false}; // since the last play on the table
        bool out{false}; // emptied the hand
        std::optional<uint8_t> finish_pos{};
        SlaveTitle title{SlaveTitle::None};
    };

    struct SlaveState
    {
        SlavePhase phase{SlavePhase::Waiting};
        std::vector<SlavePlayer> players;
        std::optional<eval::SlavePlay> table{}; // play to beat, empty after a trick clears
        std::optional<PlyrIdxT> last_played_idx{};
        CardVec pile; // every card played this game
        std::vector<PlayerId> finish_order;
        std::optional<PlayerId> previous_slave{};
        PlyrIdxT current_idx{0};
        uint32_t round{0};
    };

    using SlaveAction = std::variant<PassAction, PlayCardsAction>;
} // namespace cardroom::core

#endif //CARDROOM_SLAVESTATE_HPP
