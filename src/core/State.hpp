//
// Created by Malik T on 14/08/2025.
//

#ifndef CARDROOM_STATE_HPP
#define CARDROOM_STATE_HPP

#include "Deck.hpp"
#include <optional>
#include <vector>

#include "Types.hpp"

namespace cardroom::core
{
    // Unit of replication: the whole engine state plus the deck it travels with.
    template <typename StateT>
    struct GameSnapshot
    {
        StateT state{};
        DeckSnapshot deck{};
    };

    // Seat lookup shared by every engine state (players vector of structs with an `id`).
    template <typename PlayerT>
    auto FindSeat(std::vector<PlayerT> const& players, PlayerId const& id) -> std::optional<PlyrIdxT>
    {
        for (std::size_t i = 0; i < players.size(); ++i)
        {
            if (players[i].id == id) return static_cast<PlyrIdxT>(i);
        }
        return std::nullopt;
    }
} // namespace cardroom::core

#endif //CARDROOM_STATE_HPP
