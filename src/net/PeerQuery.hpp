//
// Created by Malik T on 18/09/2025.
//

#ifndef CARDROOM_PEERQUERY_HPP
#define CARDROOM_PEERQUERY_HPP

#include <optional>
#include <string>
#include <string_view>

#include "../core/Types.hpp"

namespace cardroom::core::net
{
    // Decodes %XX escapes and '+'. Empty optional on a malformed escape.
    auto PercentDecode(std::string_view s) -> std::optional<std::string>;

    // Reads the peer identity from a connection resource such as "/?peer=alice&name=Alice%20B".
    // The display name falls back to the id.
    auto ParsePeerQuery(std::string_view resource) -> std::optional<PlayerInfo>;
} // namespace cardroom::core::net

#endif //CARDROOM_PEERQUERY_HPP
