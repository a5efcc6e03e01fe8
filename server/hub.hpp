// server/hub.hpp
// Session registry and record dispatcher for joined players
#ifndef SERVER_HUB_HPP
#define SERVER_HUB_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../shared/config.hpp"
#include "../shared/protocol.hpp"
#include "../shared/types.hpp"
#include "broadcaster.hpp"
#include "player_registry.hpp"
#include "server_config.hpp"
#include "world.hpp"

class ClientSession;

class Hub {
public:
    Hub(World& world, PlayerRegistry& players, Broadcaster& broadcaster, const ServerConfig& config);

    // False once closeAll() has run
    bool addClient(const std::shared_ptr<ClientSession>& client);
    // Runs once per session when it starts closing
    void removeClient(const std::shared_ptr<ClientSession>& client);

    // First record of a connection. Throws ProtocolError if it is not V, A or N.
    void handleHandshake(const std::shared_ptr<ClientSession>& client, const ClientMessage& message);
    void handleMessage(const std::shared_ptr<ClientSession>& client, const ClientMessage& message);

    void closeAll();
    std::size_t clientCount() const;

    // Spawn point management
    void calculateSpawnPoint();
    Transform getSpawnPoint() const { return spawnPoint; }

    static bool isValidUsername(const std::string& username);

private:
    World& world;
    PlayerRegistry& players;
    Broadcaster& broadcaster;
    const ServerConfig& config;

    // Serializes join and leave so an id is reused only after its D notice went out
    std::mutex membershipMutex;

    mutable std::mutex clientsMutex;
    std::unordered_map<uint64_t, std::weak_ptr<ClientSession>> clients;
    bool accepting = true;

    Transform spawnPoint{SPAWN_X, 0.0f, SPAWN_Z, 0.0f, 0.0f};

    void join(const std::shared_ptr<ClientSession>& client, const std::string& requestedName);
    void handleChunkRequest(const std::shared_ptr<ClientSession>& client, const ClientMsg::ChunkRequest& request);
    void handleEdit(const std::shared_ptr<ClientSession>& client, const ClientMsg::BlockEdit& edit);
    void handlePosition(const std::shared_ptr<ClientSession>& client, const ClientMsg::Position& position);
    void handleChat(const std::shared_ptr<ClientSession>& client, const std::string& text);
    void handleCommand(const std::shared_ptr<ClientSession>& client, const Player& player, const std::string& command);
    void handleRename(const std::shared_ptr<ClientSession>& client, const std::string& name);
    void teleport(const std::shared_ptr<ClientSession>& client, int playerId, const Transform& target);

    bool isNameTaken(const std::string& name, int exceptId) const;
    void broadcastSystemMessage(const std::string& message);
    void sendSystemMessage(const std::shared_ptr<ClientSession>& client, const std::string& message);
};

#endif // SERVER_HUB_HPP
