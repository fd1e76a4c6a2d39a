//
// Created by Malik T on 18/09/2025.
//

#include "WsChannel.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "PeerQuery.hpp"
#include "../core/Exception.hpp"

namespace cardroom::core::net
{
    WsHostChannel::WsHostChannel(PlayerId local_id, std::uint16_t const port) :
        local_id_(std::move(local_id)),
        port_(port)
    {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.clear_error_channels(websocketpp::log::elevel::all);
        server_.init_asio();
        server_.set_reuse_addr(true);

        server_.set_open_handler([this](Hdl hdl) { HandleOpen(std::move(hdl)); });
        server_.set_close_handler([this](Hdl hdl) { HandleClose(std::move(hdl)); });
        server_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            HandleMessage(std::move(hdl), std::move(msg));
        });
    }

    WsHostChannel::~WsHostChannel()
    {
        if (!server_.stopped()) server_.stop();
    }

    auto WsHostChannel::Run() -> void
    {
        websocketpp::lib::error_code ec;
        server_.listen(port_, ec);
        if (ec) CRM_THROW(error::Code::Network, fmt::format("Cannot listen on port {}: {}", port_, ec.message()));
        server_.start_accept(ec);
        if (ec) CRM_THROW(error::Code::Network, fmt::format("Cannot accept on port {}: {}", port_, ec.message()));

        spdlog::info("[ws] listening on port {}", port_);
        server_.run();
    }

    auto WsHostChannel::Stop() -> void
    {
        Post([this]()
        {
            websocketpp::lib::error_code ec;
            server_.stop_listening(ec);
            for (auto const& [peer, hdl] : peers_)
            {
                server_.close(hdl, websocketpp::close::status::going_away, "Session over", ec);
                if (ec) spdlog::debug("[ws] close {}: {}", peer, ec.message());
            }
            server_.stop();
        });
    }

    auto WsHostChannel::Post(std::function<void()> task) -> void
    {
        server_.get_io_service().post(std::move(task));
    }

    auto WsHostChannel::SendTo(PlayerId const& peer, std::span<std::byte const> bytes) -> void
    {
        auto const it = peers_.find(peer);
        if (it == peers_.end())
        {
            spdlog::warn("[ws] no connection for peer {}", peer);
            return;
        }
        Send(it->second, peer, bytes);
    }

    auto WsHostChannel::Broadcast(std::span<std::byte const> bytes) -> void
    {
        for (auto const& [peer, hdl] : peers_) Send(hdl, peer, bytes);
    }

    auto WsHostChannel::Send(Hdl hdl, PlayerId const& peer, std::span<std::byte const> bytes) -> void
    {
        websocketpp::lib::error_code ec;
        server_.send(std::move(hdl), bytes.data(), bytes.size(), websocketpp::frame::opcode::binary, ec);
        if (ec) spdlog::warn("[ws] send to {} failed: {}", peer, ec.message());
    }

    auto WsHostChannel::HandleOpen(Hdl hdl) -> void
    {
        WsServer::connection_ptr const con = server_.get_con_from_hdl(hdl);
        std::optional<PlayerInfo> const info = ParsePeerQuery(con->get_resource());

        websocketpp::lib::error_code ec;
        if (!info)
        {
            spdlog::warn("[ws] connection without peer id ({}) refused", con->get_resource());
            server_.close(hdl, websocketpp::close::status::policy_violation, "peer id required", ec);
            return;
        }
        if (info->id == local_id_ || peers_.contains(info->id))
        {
            spdlog::warn("[ws] peer id {} already in use", info->id);
            server_.close(hdl, websocketpp::close::status::policy_violation, "peer id in use", ec);
            return;
        }

        hdl_to_peer_[hdl] = info->id;
        peers_.emplace(info->id, hdl);
        spdlog::info("[ws] {} ({}) connected, {} peer(s)", info->id, info->display_name, peers_.size());
        if (on_connection_) on_connection_(info->id, true);
    }

    auto WsHostChannel::HandleClose(Hdl hdl) -> void
    {
        auto const it = hdl_to_peer_.find(hdl);
        if (it == hdl_to_peer_.end()) return;

        PlayerId const peer = it->second;
        hdl_to_peer_.erase(it);
        peers_.erase(peer);
        if (on_connection_) on_connection_(peer, false);
    }

    auto WsHostChannel::HandleMessage(Hdl hdl, WsServer::message_ptr msg) -> void
    {
        auto const it = hdl_to_peer_.find(hdl);
        if (it == hdl_to_peer_.end()) return;

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            spdlog::warn("[ws] ignoring non-binary frame from {}", it->second);
            return;
        }

        std::string const& payload = msg->get_payload();
        if (on_receive_)
            on_receive_(it->second, std::span{reinterpret_cast<std::byte const*>(payload.data()), payload.size()});
    }
} // namespace cardroom::core::net
