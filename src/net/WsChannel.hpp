//
// Created by Malik T on 18/09/2025.
//

#ifndef CARDROOM_WSCHANNEL_HPP
#define CARDROOM_WSCHANNEL_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "Channel.hpp"

namespace cardroom::core::net
{
    // Host end of a star topology over WebSocket (no TLS). Peers connect with
    // ws://host:port/?peer=<id>&name=<display> and exchange binary frames only.
    // Handlers fire on the event-loop thread; other threads go through Post().
    class WsHostChannel final : public Channel
    {
    public:
        using WsServer = websocketpp::server<websocketpp::config::asio>;
        using Hdl = websocketpp::connection_hdl;

        WsHostChannel(PlayerId local_id, std::uint16_t port);
        ~WsHostChannel() override;

        WsHostChannel(WsHostChannel const&) = delete;
        auto operator=(WsHostChannel const&) -> WsHostChannel& = delete;

        [[nodiscard]] auto LocalId() const -> PlayerId const& override { return local_id_; }
        auto SendTo(PlayerId const& peer, std::span<std::byte const> bytes) -> void override;
        auto Broadcast(std::span<std::byte const> bytes) -> void override;
        auto OnReceive(ReceiveHandler handler) -> void override { on_receive_ = std::move(handler); }
        auto OnConnection(ConnectionHandler handler) -> void override { on_connection_ = std::move(handler); }

        // Blocks running the event loop until Stop().
        auto Run() -> void;
        auto Stop() -> void;
        auto Post(std::function<void()> task) -> void;

        [[nodiscard]] auto PeerCount() const noexcept -> std::size_t { return peers_.size(); }

    private:
        auto HandleOpen(Hdl hdl) -> void;
        auto HandleClose(Hdl hdl) -> void;
        auto HandleMessage(Hdl hdl, WsServer::message_ptr msg) -> void;
        auto Send(Hdl hdl, PlayerId const& peer, std::span<std::byte const> bytes) -> void;

    private:
        PlayerId local_id_;
        std::uint16_t port_;
        WsServer server_;
        std::map<Hdl, PlayerId, std::owner_less<Hdl>> hdl_to_peer_;
        std::map<PlayerId, Hdl> peers_;
        ReceiveHandler on_receive_;
        ConnectionHandler on_connection_;
    };
} // namespace cardroom::core::net

#endif //CARDROOM_WSCHANNEL_HPP
