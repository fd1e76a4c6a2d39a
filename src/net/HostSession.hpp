//
// Created by Malik T on 16/09/2025.
//

#ifndef CARDROOM_HOSTSESSION_HPP
#define CARDROOM_HOSTSESSION_HPP

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "Channel.hpp"
#include "codec.hpp"

namespace cardroom::core::net
{
    // Authoritative side of a session. Every accepted state change is followed by a
    // full snapshot broadcast; rejected remote actions earn the sender a Violation.
    template <typename Game>
    class HostSession
    {
    public:
        using Action = typename Game::Action;
        using CheckResult = error::ValidateResult;
        using ConnectionHandler = Channel::ConnectionHandler;

        HostSession(Game& game, Channel& channel, std::string session_id) :
            game_(game),
            channel_(channel),
            session_id_(std::move(session_id)) {}

        HostSession(HostSession const&) = delete;
        auto operator=(HostSession const&) -> HostSession& = delete;

        auto Start() -> void
        {
            channel_.OnReceive([this](PlayerId const& from, std::span<std::byte const> bytes)
            {
                HandleFrame(from, bytes);
            });
            channel_.OnConnection([this](PlayerId const& peer, bool connected)
            {
                spdlog::info("[{}] peer {} {}", session_id_, peer, connected ? "connected" : "disconnected");
                if (on_connection_) on_connection_(peer, connected);
            });
            spdlog::info("[{}] hosting {} as {}", session_id_, ToString(Game::Kind), channel_.LocalId());
        }

        // Session management hook for joins and drops.
        auto OnConnection(ConnectionHandler handler) -> void { on_connection_ = std::move(handler); }

        // The host's own player.
        auto Submit(PlayerId const& actor, Action const& a) -> CheckResult
        {
            CheckResult res = game_.Apply(actor, a);
            if (res) Broadcast();
            return res;
        }

        // Host-only controls such as StartRound, EndRound or AddPlayer: fn(Game&) -> CheckResult.
        template <typename Fn>
        auto Control(Fn&& fn) -> CheckResult
        {
            CheckResult res = std::forward<Fn>(fn)(game_);
            if (res) Broadcast();
            else spdlog::warn("[{}] control rejected: {}", session_id_, error::describe(res.error()));
            return res;
        }

        auto Broadcast() -> void
        {
            flatbuffers::DetachedBuffer const buf = BuildSnapshot<Game>(session_id_, game_.Serialize(), NextMsgId());
            channel_.Broadcast(AsBytes(buf));
            ++snapshots_sent_;
        }

        [[nodiscard]] auto SessionId() const noexcept -> std::string const& { return session_id_; }
        [[nodiscard]] auto SnapshotsSent() const noexcept -> std::uint64_t { return snapshots_sent_; }
        [[nodiscard]] auto GetGame() const noexcept -> Game const& { return game_; }

    private:
        auto NextMsgId() -> std::uint64_t { return next_msg_id_++; }

        auto HandleFrame(PlayerId const& from, std::span<std::byte const> bytes) -> void
        {
            std::expected<fb::Envelope const*, ParseError> env = OpenEnvelope(bytes);
            if (!env)
            {
                spdlog::warn("[{}] dropped frame from {}: {}", session_id_, from, env.error().message);
                return;
            }
            fb::ActionMsg const* am = (*env)->message_as_ActionMsg();
            if (!am)
            {
                spdlog::warn("[{}] dropped {} from {}: hosts only accept actions",
                             session_id_, fb::EnumNameMessage((*env)->message_type()), from);
                return;
            }
            if (Str(am->session_id()) != session_id_)
            {
                spdlog::warn("[{}] dropped action from {} for session '{}'", session_id_, from,
                             Str(am->session_id()));
                return;
            }

            std::expected<ActionFrame<Game>, ParseError> frame = DecodeAction<Game>(*am);
            if (!frame)
            {
                spdlog::warn("[{}] dropped action from {}: {}", session_id_, from, frame.error().message);
                return;
            }
            spdlog::debug("[{}] action #{} from {}", session_id_, frame->msg_id, from);

            // anti-spoof: a peer may only act for itself
            if (frame->actor != from)
            {
                error::RuleViolation v = error::Viol(error::RuleViolationCode::Session_ActorMismatch);
                v.with_actor(frame->actor).with_expected(from);
                Reject(from, v);
                return;
            }

            CheckResult const res = game_.Apply(frame->actor, frame->action);
            if (res) Broadcast();
            else Reject(from, res.error());
        }

        auto Reject(PlayerId const& peer, error::RuleViolation const& v) -> void
        {
            spdlog::warn("[{}] rejected action from {}: {}", session_id_, peer, error::describe(v));
            flatbuffers::DetachedBuffer const buf = BuildViolation(session_id_, v, NextMsgId());
            channel_.SendTo(peer, AsBytes(buf));
        }

    private:
        Game& game_;
        Channel& channel_;
        std::string session_id_;
        std::uint64_t next_msg_id_{1};
        std::uint64_t snapshots_sent_{0};
        ConnectionHandler on_connection_;
    };
} // namespace cardroom::core::net

#endif //CARDROOM_HOSTSESSION_HPP
