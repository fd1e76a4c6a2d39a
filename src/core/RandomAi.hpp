//
// Created by Malik T on 21/09/2025.
//

#ifndef CARDROOM_RANDOMAI_HPP
#define CARDROOM_RANDOMAI_HPP

#include <cstdint>
#include <random>

#include "SlaveState.hpp"
#include "Types.hpp"

namespace cardroom::core
{
    // Picks uniformly among the legal Slave moves of a seat (passing counts as one when allowed).
    class RandomSlaveAi
    {
    public:
        explicit RandomSlaveAi(uint64_t rng_seed);

        auto Choose(SlaveState const& s, PlyrIdxT seat, eval::SlaveRuleset const& rules) -> SlaveAction;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //CARDROOM_RANDOMAI_HPP
