//
// Created by Malik T on 17/09/2025.
//

#ifndef CARDROOM_MIRRORSESSION_HPP
#define CARDROOM_MIRRORSESSION_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "Channel.hpp"
#include "codec.hpp"

namespace cardroom::core::net
{
    // Replica side of a session. The local engine is only ever overwritten by host snapshots.
    template <typename Game>
    class MirrorSession
    {
    public:
        using Action = typename Game::Action;

        MirrorSession(Game& game, Channel& channel, PlayerId host_id, std::string session_id) :
            game_(game),
            channel_(channel),
            host_id_(std::move(host_id)),
            session_id_(std::move(session_id)) {}

        MirrorSession(MirrorSession const&) = delete;
        auto operator=(MirrorSession const&) -> MirrorSession& = delete;

        auto Start() -> void
        {
            channel_.OnReceive([this](PlayerId const& from, std::span<std::byte const> bytes)
            {
                HandleFrame(from, bytes);
            });
        }

        // Fire and forget. The outcome arrives as a snapshot or a violation.
        auto Submit(PlayerId const& actor, Action const& a) -> void
        {
            if (left_) return;
            flatbuffers::DetachedBuffer const buf = BuildAction<Game>(session_id_, actor, a, next_msg_id_++);
            channel_.SendTo(host_id_, AsBytes(buf));
        }

        // Snapshots arriving after this are ignored.
        auto Leave() -> void { left_ = true; }

        [[nodiscard]] auto HasLeft() const noexcept -> bool { return left_; }
        [[nodiscard]] auto SnapshotsApplied() const noexcept -> std::uint64_t { return applied_; }
        [[nodiscard]] auto LastViolation() const noexcept -> std::optional<ViolationFrame> const& { return last_violation_; }
        [[nodiscard]] auto GetGame() const noexcept -> Game const& { return game_; }

    private:
        auto HandleFrame(PlayerId const& from, std::span<std::byte const> bytes) -> void
        {
            if (left_) return;
            if (from != host_id_)
            {
                spdlog::warn("[{}] ignored frame from non-host peer {}", session_id_, from);
                return;
            }

            std::expected<fb::Envelope const*, ParseError> env = OpenEnvelope(bytes);
            if (!env)
            {
                spdlog::warn("[{}] dropped frame from host: {}", session_id_, env.error().message);
                return;
            }

            switch ((*env)->message_type())
            {
            case fb::Message::SnapshotMsg:
                ApplySnapshot(*(*env)->message_as_SnapshotMsg());
                return;
            case fb::Message::Violation:
            {
                ViolationFrame v = DecodeViolation(*(*env)->message_as_Violation());
                if (v.session_id != session_id_) return;
                spdlog::warn("[{}] host rejected action of {}: {}", session_id_, v.actor, v.text);
                last_violation_ = std::move(v);
                return;
            }
            default:
                spdlog::warn("[{}] dropped {} from host", session_id_,
                             fb::EnumNameMessage((*env)->message_type()));
                return;
            }
        }

        auto ApplySnapshot(fb::SnapshotMsg const& msg) -> void
        {
            if (Str(msg.session_id()) != session_id_)
            {
                spdlog::debug("[{}] ignored snapshot for session '{}'", session_id_, Str(msg.session_id()));
                return;
            }
            std::expected<SnapshotFrame<Game>, ParseError> frame = DecodeSnapshot<Game>(msg);
            if (!frame)
            {
                spdlog::warn("[{}] dropped snapshot: {}", session_id_, frame.error().message);
                return;
            }
            try
            {
                game_.Restore(std::move(frame->snapshot));
            }
            catch (error::StateError const& e)
            {
                // deck contents that do not fit this engine's shoe
                spdlog::warn("[{}] dropped snapshot: {}", session_id_, e.what());
                return;
            }
            ++applied_;
            spdlog::debug("[{}] snapshot #{} applied", session_id_, frame->msg_id);
        }

    private:
        Game& game_;
        Channel& channel_;
        PlayerId host_id_;
        std::string session_id_;
        std::uint64_t next_msg_id_{1};
        std::uint64_t applied_{0};
        bool left_{false};
        std::optional<ViolationFrame> last_violation_{};
    };
} // namespace cardroom::core::net

#endif //CARDROOM_MIRRORSESSION_HPP
