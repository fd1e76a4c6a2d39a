//
// Created by Malik T on 05/09/2025.
//

#ifndef CARDROOM_COMBOFINDER_HPP
#define CARDROOM_COMBOFINDER_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../core/Types.hpp"

namespace cardroom::core::eval
{
    enum class SlavePlayType : uint8_t
    {
        Single = 0,
        Pair,
        Triple,
        Quadruple, // bomb
        Run
    };

    enum class StartPolicy : uint8_t
    {
        PreviousSlave, // 3 of clubs opens game one, the last game's slave opens later ones
        ThreeOfClubs // 3 of clubs opens every game
    };

    // Named presets of the Slave rule set. Selected once when the engine is built.
    struct SlaveRuleset
    {
        bool suit_tiebreak{true};
        bool triple_beats_single{true};
        // false: a bomb only beats singles and pairs; true: it beats every non-bomb play
        bool bomb_beats_any{false};
        StartPolicy start{StartPolicy::PreviousSlave};

        static auto Classic() -> SlaveRuleset
        {
            return SlaveRuleset{};
        }

        static auto House() -> SlaveRuleset
        {
            return SlaveRuleset{.suit_tiebreak = false,
                                .triple_beats_single = false,
                                .bomb_beats_any = true,
                                .start = StartPolicy::ThreeOfClubs};
        }
    };

    auto operator==(SlaveRuleset const& a, SlaveRuleset const& b) -> bool;

    struct SlavePlay
    {
        CardVec cards;
        SlavePlayType type{SlavePlayType::Single};
        uint16_t value{}; // highest card value in the play
    };

    // 3 -> 1 ... K -> 11, A -> 12, 2 -> 13. Used for grouping and runs.
    auto SlaveRankValue(Rank r) noexcept -> uint8_t;
    // Comparison key: rank value * 10 + suit (1..4) with suit tie-break, rank value alone without.
    auto SlaveCardValue(Card const& c, bool suit_tiebreak) noexcept -> uint16_t;
    auto ToString(SlavePlayType t) -> std::string_view;

    // Ascending by composite value.
    auto SortSlaveHand(CardVec& hand) -> void;

    auto ClassifyPlay(std::span<Card const> cards) -> std::optional<SlavePlayType>;
    auto MakePlay(std::span<Card const> cards, SlaveRuleset const& rules) -> std::optional<SlavePlay>;
    auto Beats(SlavePlay const& candidate, SlavePlay const& current, SlaveRuleset const& rules) -> bool;

    // Every size-k subset of each same-rank group.
    auto FindGroups(std::span<Card const> hand, std::size_t k) -> std::vector<CardVec>;
    // Every sub-run (length >= min_len) of each maximal consecutive-rank run, 2s excluded.
    auto FindRuns(std::span<Card const> hand, std::size_t min_len) -> std::vector<CardVec>;
    auto FindAllPlays(std::span<Card const> hand) -> std::vector<CardVec>;
    auto FindPlayable(std::span<Card const> hand,
                      std::optional<SlavePlay> const& current,
                      SlaveRuleset const& rules) -> std::vector<SlavePlay>;
}

#endif //CARDROOM_COMBOFINDER_HPP
