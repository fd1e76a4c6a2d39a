//
// Created by Malik T on 19/09/2025.
//
// Authoritative host over WebSocket (no TLS). Waits for N peers, seats them in
// connection order, then runs the requested number of rounds. Peers drive the
// game with ActionMsg frames and receive a SnapshotMsg after every change.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/BlackjackGame.hpp"
#include "core/DummyGame.hpp"
#include "core/Exception.hpp"
#include "core/HoldemGame.hpp"
#include "core/KangGame.hpp"
#include "core/PokDengGame.hpp"
#include "core/SlaveGame.hpp"
#include "net/HostSession.hpp"
#include "net/Roster.hpp"
#include "net/WsChannel.hpp"

namespace
{
    namespace crm = cardroom::core;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        crm::GameKind game{crm::GameKind::PokDeng};
        std::uint8_t players{2};
        std::uint64_t seed{12345ULL};
        std::string session{"table-1"};
        std::string host_id{"host"};
        std::uint32_t rounds{1};
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    auto ParseGame(std::string const& s) -> std::optional<crm::GameKind>
    {
        for (crm::GameKind const k : {crm::GameKind::PokDeng, crm::GameKind::Kang, crm::GameKind::Holdem,
                                      crm::GameKind::Blackjack, crm::GameKind::Slave, crm::GameKind::Dummy})
        {
            if (crm::ToString(k) == s) return k;
        }
        return std::nullopt;
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            auto next = [&]() -> std::optional<std::string>
            {
                if (i + 1 < argc) return std::string{argv[++i]};
                spdlog::warn("Missing value for {}", key);
                return std::nullopt;
            };

            if (key == "--port")
            {
                if (auto v = next()) c.port = static_cast<std::uint16_t>(std::strtoul(v->c_str(), nullptr, 10));
            }
            else if (key == "--players")
            {
                if (auto v = next()) c.players = static_cast<std::uint8_t>(std::strtoul(v->c_str(), nullptr, 10));
            }
            else if (key == "--seed")
            {
                if (auto v = next()) c.seed = std::strtoull(v->c_str(), nullptr, 10);
            }
            else if (key == "--rounds")
            {
                if (auto v = next()) c.rounds = static_cast<std::uint32_t>(std::strtoul(v->c_str(), nullptr, 10));
            }
            else if (key == "--session")
            {
                if (auto v = next()) c.session = *v;
            }
            else if (key == "--host-id")
            {
                if (auto v = next()) c.host_id = *v;
            }
            else if (key == "--game")
            {
                if (auto v = next())
                {
                    std::optional<crm::GameKind> const k = ParseGame(*v);
                    if (k) c.game = *k;
                    else spdlog::warn("Unknown game '{}', keeping {}", *v, crm::ToString(c.game));
                }
            }
            else if (key == "--log-level")
            {
                if (auto v = next()) c.log_level = spdlog::level::from_str(*v);
            }
            else
            {
                spdlog::warn("Ignoring unknown option {}", key);
            }
        }
        if (c.players < 1) c.players = 1;
        if (c.rounds < 1) c.rounds = 1;
        return c;
    }

    // Per-game config built from the command line.
    template <typename Game>
    struct Setup;

    template <>
    struct Setup<crm::PokDengGame>
    {
        static auto Config(ServerConfig const& c) -> crm::PokDengConfig
        {
            return crm::PokDengConfig{.seed = c.seed};
        }
    };

    template <>
    struct Setup<crm::KangGame>
    {
        static auto Config(ServerConfig const& c) -> crm::KangConfig { return crm::KangConfig{.seed = c.seed}; }
    };

    template <>
    struct Setup<crm::HoldemGame>
    {
        static auto Config(ServerConfig const& c) -> crm::HoldemConfig { return crm::HoldemConfig{.seed = c.seed}; }
    };

    template <>
    struct Setup<crm::BlackjackGame>
    {
        static auto Config(ServerConfig const& c) -> crm::BlackjackConfig
        {
            return crm::BlackjackConfig{.seed = c.seed};
        }
    };

    template <>
    struct Setup<crm::SlaveGame>
    {
        static auto Config(ServerConfig const& c) -> crm::SlaveConfig { return crm::SlaveConfig{.seed = c.seed}; }
    };

    template <>
    struct Setup<crm::DummyGame>
    {
        static auto Config(ServerConfig const& c) -> crm::DummyConfig { return crm::DummyConfig{.seed = c.seed}; }
    };

    // A round is over once the engine only waits for the host to close it.
    auto RoundOver(crm::PokDengState const& s) -> bool { return s.phase == crm::PokDengPhase::Settling; }
    auto RoundOver(crm::KangState const& s) -> bool { return s.phase == crm::KangPhase::Settling; }
    auto RoundOver(crm::HoldemState const& s) -> bool { return s.phase == crm::HoldemPhase::Settling; }
    auto RoundOver(crm::BlackjackState const& s) -> bool { return s.phase == crm::BlackjackPhase::Settling; }
    auto RoundOver(crm::SlaveState const& s) -> bool { return s.phase == crm::SlavePhase::Finished; }
    auto RoundOver(crm::DummyState const& s) -> bool { return s.phase == crm::DummyPhase::Finished; }

    template <typename Game>
    auto RunTable(ServerConfig const& cfg) -> int
    {
        Game game(Setup<Game>::Config(cfg));
        crm::net::WsHostChannel channel(cfg.host_id, cfg.port);
        crm::net::HostSession<Game> session(game, channel, cfg.session);

        std::mutex mx;
        std::condition_variable cv;
        crm::net::Roster roster{.host_id = cfg.host_id, .players = {}};
        bool seated{false};
        bool net_failed{false};
        std::atomic<bool> done{false};

        session.OnConnection([&](crm::PlayerId const& peer, bool connected)
        {
            std::lock_guard<std::mutex> lock(mx);
            if (connected && !seated)
            {
                roster.players.push_back(crm::PlayerInfo{.id = peer, .display_name = peer});
            }
            else if (!connected && !seated)
            {
                std::erase_if(roster.players, [&](crm::PlayerInfo const& p) { return p.id == peer; });
            }
            else if (!connected)
            {
                // Mid-game drops are left to the remaining players; the table keeps its seat.
                spdlog::warn("{} left during play", peer);
            }
            cv.notify_all();
        });
        session.Start();

        std::thread net_thr([&]()
        {
            try
            {
                channel.Run();
            }
            catch (crm::error::NetworkError const& e)
            {
                spdlog::critical("{}\n{}", e.what(), e.to_str());
                std::lock_guard<std::mutex> lock(mx);
                net_failed = true;
                done = true;
                cv.notify_all();
            }
        });

        {
            std::unique_lock<std::mutex> lk(mx);
            cv.wait(lk, [&]() { return net_failed || roster.players.size() >= cfg.players; });
            seated = true;
        }
        if (net_failed)
        {
            net_thr.join();
            return 3;
        }
        spdlog::info("All {} player(s) connected. Starting {}", static_cast<int>(cfg.players),
                     crm::ToString(Game::Kind));

        std::uint32_t rounds_played{0};
        channel.Post([&]()
        {
            try
            {
                crm::net::SeatRoster(game, roster);
            }
            catch (crm::error::RulesError const& e)
            {
                spdlog::critical("{}", e.what());
                done = true;
                return;
            }
            crm::error::ValidateResult const started = session.Control([](Game& g) { return g.StartRound(); });
            if (!started) done = true;
        });

        // Round bookkeeping runs on the event loop so it is ordered with inbound actions.
        while (!done)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            channel.Post([&]()
            {
                if (done || !RoundOver(game.GetState())) return;

                crm::error::ValidateResult const ended = session.Control([](Game& g) { return g.EndRound(); });
                if (!ended)
                {
                    done = true;
                    return;
                }
                ++rounds_played;
                spdlog::info("Round {} of {} finished", rounds_played, cfg.rounds);
                if (rounds_played >= cfg.rounds)
                {
                    done = true;
                    return;
                }
                crm::error::ValidateResult const next = session.Control([](Game& g) { return g.StartRound(); });
                if (!next) done = true;
            });
        }

        // Let the last snapshot drain before closing.
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        channel.Stop();
        if (net_thr.joinable()) net_thr.join();

        spdlog::info("Session {} closed after {} round(s), {} snapshot(s) sent", cfg.session, rounds_played,
                     session.SnapshotsSent());
        return 0;
    }
} // anon

int main(int argc, char** argv)
{
    ServerConfig const cfg = ParseArgs(argc, argv);
    spdlog::set_level(cfg.log_level);
    spdlog::info("[Server] {} on port {} | session {} | waiting for {} player(s) | seed={}",
                 crm::ToString(cfg.game), cfg.port, cfg.session, static_cast<int>(cfg.players), cfg.seed);

    try
    {
        switch (cfg.game)
        {
        case crm::GameKind::PokDeng: return RunTable<crm::PokDengGame>(cfg);
        case crm::GameKind::Kang: return RunTable<crm::KangGame>(cfg);
        case crm::GameKind::Holdem: return RunTable<crm::HoldemGame>(cfg);
        case crm::GameKind::Blackjack: return RunTable<crm::BlackjackGame>(cfg);
        case crm::GameKind::Slave: return RunTable<crm::SlaveGame>(cfg);
        case crm::GameKind::Dummy: return RunTable<crm::DummyGame>(cfg);
        }
    }
    catch (crm::error::RulesError const& e)
    {
        spdlog::critical("{}\n{}", e.what(), e.to_str());
        return 2;
    }
    return 1;
}
