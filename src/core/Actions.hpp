//
// Created by Malik T on 14/08/2025.
//

#ifndef CARDROOM_ACTIONS_HPP
#define CARDROOM_ACTIONS_HPP

#include <cstdint>
#include <variant>

#include "Types.hpp"

// Player intents. Each game closes its own std::variant over the subset it accepts.
namespace cardroom::core
{
    // Wagers
    struct PlaceBetAction { Chips amount{}; };
    struct FoldAction     {};

    // PokDeng
    struct DrawCardAction {};
    struct StayAction     {};

    // Kang: hand indices of the cards to replace
    struct DiscardAction  { std::vector<uint8_t> indices; };
    struct KeepAllAction  {};

    // Hold'em; RaiseAction::amount is the raise on top of the call
    struct CheckAction    {};
    struct CallAction     {};
    struct RaiseAction    { Chips amount{}; };
    struct AllInAction    {};

    // Blackjack, per hand
    struct HitAction       { uint8_t hand{}; };
    struct StandAction     { uint8_t hand{}; };
    struct DoubleAction    { uint8_t hand{}; };
    struct SplitAction     { uint8_t hand{}; };
    struct SurrenderAction {};

    // Slave
    struct PlayCardsAction { CardVec cards; };
    struct PassAction      {};

    // Dummy
    struct DrawStockAction   {};
    struct DrawDiscardAction {};
    struct DiscardCardAction { Card card; };
    struct MeldAction        { CardVec cards; };
    struct LayOffAction      { Card card; uint32_t meld_id{}; };
    struct KnockAction       {};
} // namespace cardroom::core

#endif //CARDROOM_ACTIONS_HPP
