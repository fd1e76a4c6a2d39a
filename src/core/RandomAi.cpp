//
// Created by Malik T on 21/09/2025.
//

#include "RandomAi.hpp"

#include <vector>

#include "Exception.hpp"

namespace cardroom::core
{
    RandomSlaveAi::RandomSlaveAi(uint64_t rng_seed):
        rng_(rng_seed) {}

    auto RandomSlaveAi::Choose(SlaveState const& s, PlyrIdxT const seat, eval::SlaveRuleset const& rules) -> SlaveAction
    {
        CRM_ASSERT(seat < s.players.size(), "Seat out of range");
        SlavePlayer const& me = s.players[seat];

        std::vector<eval::SlavePlay> const options = eval::FindPlayable(me.hand, s.table, rules);

        // Leading on an empty table: any play will do, passing is not allowed.
        if (!s.table)
        {
            CRM_ASSERT(!options.empty(), "Leader without a playable combination");
            return PlayCardsAction{options[pick(options)].cards};
        }

        // one extra slot stands for passing
        std::size_t const choice = std::uniform_int_distribution<std::size_t>{0, options.size()}(rng_);
        if (choice == options.size()) return PassAction{};
        return PlayCardsAction{options[choice].cards};
    }
}
