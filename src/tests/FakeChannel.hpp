#ifndef CARDROOM_FAKECHANNEL_HPP
#define CARDROOM_FAKECHANNEL_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../net/Channel.hpp"

namespace cardroom::test
{
    using core::PlayerId;

    class FakeChannel;

    // In-memory switchboard. Frames queue up until Pump() delivers them in order.
    class FakeHub
    {
    public:
        struct Frame
        {
            PlayerId from;
            PlayerId to;
            std::vector<std::byte> bytes;
        };

        auto Attach(FakeChannel& ch) -> void;

        auto Enqueue(PlayerId const& from, PlayerId const& to, std::span<std::byte const> bytes) -> void
        {
            if (!channels_.contains(to)) return;
            queue_.push_back(Frame{from, to, {bytes.begin(), bytes.end()}});
            ++sent_to_[to];
        }

        // Returns the number of frames delivered.
        auto Pump() -> std::size_t;

        [[nodiscard]] auto SentTo(PlayerId const& id) const -> std::size_t
        {
            auto const it = sent_to_.find(id);
            return it == sent_to_.end() ? 0 : it->second;
        }

        [[nodiscard]] auto Peers() const -> std::vector<PlayerId>
        {
            std::vector<PlayerId> out;
            for (auto const& [id, ch] : channels_) out.push_back(id);
            return out;
        }

    private:
        std::map<PlayerId, FakeChannel*> channels_;
        std::map<PlayerId, std::size_t> sent_to_;
        std::deque<Frame> queue_;
    };

    class FakeChannel final : public core::net::Channel
    {
    public:
        FakeChannel(FakeHub& hub, PlayerId id) : hub_(hub), id_(std::move(id)) { hub_.Attach(*this); }

        [[nodiscard]] auto LocalId() const -> PlayerId const& override { return id_; }

        auto SendTo(PlayerId const& peer, std::span<std::byte const> bytes) -> void override
        {
            hub_.Enqueue(id_, peer, bytes);
        }

        auto Broadcast(std::span<std::byte const> bytes) -> void override
        {
            for (PlayerId const& peer : hub_.Peers())
            {
                if (peer != id_) hub_.Enqueue(id_, peer, bytes);
            }
        }

        auto OnReceive(ReceiveHandler handler) -> void override { on_receive_ = std::move(handler); }
        auto OnConnection(ConnectionHandler handler) -> void override { on_connection_ = std::move(handler); }

        auto Deliver(PlayerId const& from, std::span<std::byte const> bytes) -> void
        {
            if (on_receive_) on_receive_(from, bytes);
        }

        auto SignalConnection(PlayerId const& peer, bool connected) -> void
        {
            if (on_connection_) on_connection_(peer, connected);
        }

    private:
        FakeHub& hub_;
        PlayerId id_;
        ReceiveHandler on_receive_;
        ConnectionHandler on_connection_;
    };

    inline auto FakeHub::Attach(FakeChannel& ch) -> void
    {
        channels_[ch.LocalId()] = &ch;
    }

    inline auto FakeHub::Pump() -> std::size_t
    {
        std::size_t delivered = 0;
        while (!queue_.empty())
        {
            Frame f = std::move(queue_.front());
            queue_.pop_front();
            channels_.at(f.to)->Deliver(f.from, f.bytes);
            ++delivered;
        }
        return delivered;
    }
}

#endif //CARDROOM_FAKECHANNEL_HPP
