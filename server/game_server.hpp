// server/game_server.hpp
// Owns the world, players and network stack; start/stop lifecycle
#ifndef SERVER_GAME_SERVER_HPP
#define SERVER_GAME_SERVER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

#include "broadcaster.hpp"
#include "chunk_storage.hpp"
#include "hub.hpp"
#include "listener.hpp"
#include "persistence.hpp"
#include "player_registry.hpp"
#include "server_config.hpp"
#include "world.hpp"

class GameServer {
public:
    explicit GameServer(const ServerConfig& config);
    ~GameServer();

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    // Reloads stored chunks, binds the listener and starts the worker threads.
    // Throws boost::system::system_error if the port cannot be bound.
    void start();
    // Closes the listener and every session, then runs the final flush
    void stop();

    bool isRunning() const { return running_; }
    unsigned short port() const;

    const ServerConfig& config() const { return config_; }
    World& world() { return world_; }
    PlayerRegistry& players() { return players_; }
    Hub& hub() { return hub_; }
    PersistenceEngine& persistence() { return persistence_; }

private:
    ServerConfig config_;
    net::io_context ioc_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;

    ChunkStorage storage_;
    World world_;
    PlayerRegistry players_;
    Broadcaster broadcaster_;
    Hub hub_;
    PersistenceEngine persistence_;
    std::shared_ptr<Listener> listener_;

    std::vector<std::thread> threads_;
    std::mutex lifecycleMutex_;
    bool running_ = false;
};

#endif // SERVER_GAME_SERVER_HPP
