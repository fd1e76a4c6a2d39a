//
// Created by Malik T on 16/09/2025.
//

#ifndef CARDROOM_ROSTER_HPP
#define CARDROOM_ROSTER_HPP

#include <vector>

#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace cardroom::core::net
{
    // Handed over by session management once, before the first round.
    struct Roster
    {
        PlayerId host_id;
        std::vector<PlayerInfo> players;
    };

    // Seats every roster entry in order. Throws RulesError on the first seat the engine refuses.
    template <typename Game>
    auto SeatRoster(Game& game, Roster const& roster) -> void
    {
        for (PlayerInfo const& p : roster.players)
        {
            error::ValidateResult const seated = game.AddPlayer(p);
            if (!seated)
                CRM_THROW(error::Code::Rules, fmt::format("Cannot seat {}: {}", p.id, error::describe(seated.error())));
        }
    }
} // namespace cardroom::core::net

#endif //CARDROOM_ROSTER_HPP
