//
// Created by Malik T on 14/08/2025.
//

#include "Exception.hpp"

#include "Util.hpp"

namespace cardroom::core::error
{
    auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.phase) s += fmt::format(" | phase={}", *v.phase);
        if (v.actor) s += fmt::format(" | actor={}", *v.actor);
        if (v.expected_actor) s += fmt::format(" | turn={}", *v.expected_actor);
        if (v.amount) s += fmt::format(" | amount={}", *v.amount);
        if (v.lower && v.upper) s += fmt::format(" | range=[{},{}]", *v.lower, *v.upper);
        if (v.attempted_count) s += fmt::format(" | attempted={}", *v.attempted_count);
        if (v.hand_index) s += fmt::format(" | hand={}", *v.hand_index);
        if (v.card) s += fmt::format(" | card={}", util::ToString(*v.card));
        return s;
    }
}
