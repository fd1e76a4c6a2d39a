//
// Created by Malik T on 16/09/2025.
//

#ifndef CARDROOM_CHANNEL_HPP
#define CARDROOM_CHANNEL_HPP

#include <cstddef>
#include <functional>
#include <span>

#include "../core/Types.hpp"

namespace cardroom::core::net
{
    // Reliable, ordered frame delivery between peer identifiers.
    // Peer identifiers are the player ids of the roster.
    class Channel
    {
    public:
        using ReceiveHandler = std::function<void(PlayerId const& from, std::span<std::byte const> bytes)>;
        using ConnectionHandler = std::function<void(PlayerId const& peer, bool connected)>;

        virtual ~Channel() = default;

        [[nodiscard]] virtual auto LocalId() const -> PlayerId const& = 0;

        virtual auto SendTo(PlayerId const& peer, std::span<std::byte const> bytes) -> void = 0;
        // Every connected peer except the local one.
        virtual auto Broadcast(std::span<std::byte const> bytes) -> void = 0;

        virtual auto OnReceive(ReceiveHandler handler) -> void = 0;
        virtual auto OnConnection(ConnectionHandler handler) -> void = 0;
    };
} // namespace cardroom::core::net

#endif //CARDROOM_CHANNEL_HPP
