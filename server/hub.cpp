// server/hub.cpp
#include "hub.hpp"
#include "logger.hpp"
#include "session.hpp"
#include "../shared/codec.hpp"
#include "../shared/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <sstream>
#include <vector>

Hub::Hub(World& world, PlayerRegistry& players, Broadcaster& broadcaster, const ServerConfig& config)
    : world(world), players(players), broadcaster(broadcaster), config(config) {}

bool Hub::addClient(const std::shared_ptr<ClientSession>& client) {
    std::lock_guard<std::mutex> lock(clientsMutex);
    if (!accepting) return false;
    clients[client->connectionId()] = client;
    // Client becomes a player after a successful handshake
    Logger::hub("New client connected (awaiting handshake)");
    return true;
}

void Hub::calculateSpawnPoint() {
    int x = static_cast<int>(SPAWN_X);
    int z = static_cast<int>(SPAWN_Z);
    int top = world.highestBlock(x, z);

    spawnPoint = Transform{SPAWN_X, 0.0f, SPAWN_Z, 0.0f, 0.0f};
    spawnPoint.y = static_cast<float>(std::max(top, world.minY())) + SPAWN_HEADROOM;
    Logger::hub("Spawn point at (" + Codec::formatNumber(spawnPoint.x) + ", " + Codec::formatNumber(spawnPoint.y) +
                ", " + Codec::formatNumber(spawnPoint.z) + ")");
}

void Hub::removeClient(const std::shared_ptr<ClientSession>& client) {
    uint64_t connId = client->connectionId();
    {
        std::lock_guard<std::mutex> lock(clientsMutex);
        clients.erase(connId);
    }
    broadcaster.unsubscribe(connId);

    int id = client->playerId();
    if (id == 0) {
        Logger::hub("Connection " + std::to_string(connId) + " left before joining");
        return;
    }

    try {
        players.markGone(id);
    } catch (const StaleReferenceError& e) {
        Logger::debug(e.what());
        return;
    }

    std::lock_guard<std::mutex> lock(membershipMutex);
    try {
        Player player = players.unregisterPlayer(id);
        broadcaster.publish(Codec::encode(ServerMsg::Disconnect{id}) +
                            Codec::encode(ServerMsg::Talk{player.name + " left the game"}),
                            connId, Delivery::EXCEPT_ORIGIN);
        Logger::hub("Removed " + player.name + " (id " + std::to_string(id) + ")");
    } catch (const StaleReferenceError& e) {
        Logger::debug(e.what());
    }
}

void Hub::handleHandshake(const std::shared_ptr<ClientSession>& client, const ClientMessage& message) {
    if (const auto* version = std::get_if<ClientMsg::Version>(&message)) {
        if (version->version != PROTOCOL_VERSION) {
            Logger::error("Protocol mismatch: client=" + std::to_string(version->version) +
                          ", server=" + std::to_string(PROTOCOL_VERSION) + " - rejecting");
            client->fail("Client protocol " + std::to_string(version->version) +
                         " incompatible with server protocol " + std::to_string(PROTOCOL_VERSION));
            return;
        }
        join(client, "");
    } else if (const auto* auth = std::get_if<ClientMsg::Authenticate>(&message)) {
        join(client, auth->username);
    } else if (const auto* nick = std::get_if<ClientMsg::Nick>(&message)) {
        join(client, nick->name);
    } else {
        std::string record = Codec::encode(message);
        if (!record.empty() && record.back() == '\n') record.pop_back();
        throw ProtocolError("expected V, A or N before anything else", record);
    }
}

void Hub::join(const std::shared_ptr<ClientSession>& client, const std::string& requestedName) {
    std::lock_guard<std::mutex> lock(membershipMutex);

    std::string rejection;
    std::string name = requestedName;
    if (!name.empty() && !isValidUsername(name)) {
        rejection = "Name '" + name + "' must be 1-" + std::to_string(MAX_USERNAME_LENGTH) + " letters or digits";
        name.clear();
    } else if (!name.empty() && isNameTaken(name, 0)) {
        rejection = "Name '" + name + "' is already in use";
        name.clear();
    }

    Transform spawn = spawnPoint;
    int id = players.registerPlayer(client->connectionId(), name, spawn);
    name = players.find(id)->name;
    client->activate(id);

    double now = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();

    std::string greeting = Codec::encode(ServerMsg::You{id, spawn.x, spawn.y, spawn.z, spawn.rx, spawn.ry});
    greeting += Codec::encode(ServerMsg::Time{std::floor(now), config.dayLength});
    if (!config.motd.empty()) {
        greeting += Codec::encode(ServerMsg::Talk{config.motd});
    }
    if (!rejection.empty()) {
        greeting += Codec::encode(ServerMsg::Talk{rejection + ", you are " + name});
    }
    for (const Player& other : players.list()) {
        if (other.id == id || !other.live) continue;
        const Transform& t = other.transform;
        greeting += Codec::encode(ServerMsg::Nick{other.id, other.name});
        greeting += Codec::encode(ServerMsg::Position{other.id, t.x, t.y, t.z, t.rx, t.ry});
    }
    client->send(greeting);

    broadcaster.subscribe(client);
    broadcaster.publish(Codec::encode(ServerMsg::Nick{id, name}) +
                        Codec::encode(ServerMsg::Position{id, spawn.x, spawn.y, spawn.z, spawn.rx, spawn.ry}) +
                        Codec::encode(ServerMsg::Talk{name + " joined the game"}),
                        client->connectionId(), Delivery::EXCEPT_ORIGIN);

    Logger::hub(name + " joined (id " + std::to_string(id) + ", " + client->remoteAddress() + ")");
}

void Hub::handleMessage(const std::shared_ptr<ClientSession>& client, const ClientMessage& message) {
    if (const auto* request = std::get_if<ClientMsg::ChunkRequest>(&message)) {
        handleChunkRequest(client, *request);
    } else if (const auto* edit = std::get_if<ClientMsg::BlockEdit>(&message)) {
        handleEdit(client, *edit);
    } else if (const auto* position = std::get_if<ClientMsg::Position>(&message)) {
        handlePosition(client, *position);
    } else if (const auto* talk = std::get_if<ClientMsg::Talk>(&message)) {
        handleChat(client, talk->text);
    } else if (const auto* nick = std::get_if<ClientMsg::Nick>(&message)) {
        handleRename(client, nick->name);
    } else if (const auto* auth = std::get_if<ClientMsg::Authenticate>(&message)) {
        handleRename(client, auth->username);
    } else if (std::holds_alternative<ClientMsg::Disconnect>(message)) {
        Logger::session("Connection " + std::to_string(client->connectionId()) + " requested disconnect");
        client->close();
    } else if (std::holds_alternative<ClientMsg::Version>(message)) {
        Logger::debug("Ignoring repeated version record");
    } else if (const auto* unknown = std::get_if<ClientMsg::Unknown>(&message)) {
        Logger::debug("Ignoring record with opcode " + unknown->opcode);
    }
}

void Hub::handleChunkRequest(const std::shared_ptr<ClientSession>& client, const ClientMsg::ChunkRequest& request) {
    ChunkSnapshot snap;
    try {
        snap = world.snapshotChunk(request.p, request.q);
    } catch (const OutOfRangeError& e) {
        Logger::debug("Rejected chunk request from connection " + std::to_string(client->connectionId()) + ": " +
                      e.what());
        sendSystemMessage(client, std::string("Chunk request rejected: ") + e.what());
        return;
    }
    std::vector<BlockRecord> blocks = snap.since(request.key);

    std::string response;
    response.reserve(blocks.size() * 24 + 32);
    for (const BlockRecord& b : blocks) {
        response += Codec::encode(ServerMsg::Block{request.p, request.q, b.x, b.y, b.z, b.w});
    }
    response += Codec::encode(ServerMsg::Key{request.p, request.q, snap.revision});
    response += Codec::encode(ServerMsg::Redraw{request.p, request.q});
    client->send(response);

    Logger::debug("Sent chunk (" + std::to_string(request.p) + "," + std::to_string(request.q) + ") key " +
                  std::to_string(request.key) + " -> " + std::to_string(blocks.size()) + " blocks, revision " +
                  std::to_string(snap.revision));
}

void Hub::handleEdit(const std::shared_ptr<ClientSession>& client, const ClientMsg::BlockEdit& edit) {
    ChunkCoord owner = chunkOf(edit.x, edit.z);
    if (edit.p && edit.q && (*edit.p != owner.p || *edit.q != owner.q)) {
        Logger::debug("Edit names chunk (" + std::to_string(*edit.p) + "," + std::to_string(*edit.q) +
                      "), block belongs to (" + std::to_string(owner.p) + "," + std::to_string(owner.q) + ")");
    }

    uint64_t origin = client->connectionId();
    try {
        // Broadcast from inside the chunk lock so every client sees edits in the order they were applied
        world.setBlock(edit.x, edit.y, edit.z, edit.w, [&](const BlockChange& change) {
            broadcaster.publish(Codec::encode(ServerMsg::Block{change.coord.p, change.coord.q,
                                                               change.x, change.y, change.z, change.w}),
                                origin, Delivery::ALL);
        });
    } catch (const OutOfRangeError& e) {
        Logger::debug("Rejected edit from connection " + std::to_string(origin) + ": " + e.what());
        sendSystemMessage(client, std::string("Edit rejected: ") + e.what());
    }
}

void Hub::handlePosition(const std::shared_ptr<ClientSession>& client, const ClientMsg::Position& position) {
    int id = client->playerId();
    Transform t{position.x, position.y, position.z, position.rx, position.ry};
    try {
        players.updateTransform(id, t);
        broadcaster.publish(Codec::encode(ServerMsg::Position{id, t.x, t.y, t.z, t.rx, t.ry}),
                            client->connectionId(), Delivery::EXCEPT_ORIGIN);
    } catch (const StaleReferenceError& e) {
        Logger::debug(e.what());
    }
}

void Hub::handleChat(const std::shared_ptr<ClientSession>& client, const std::string& text) {
    std::optional<Player> player = players.find(client->playerId());
    if (!player) {
        Logger::error("Cannot send chat message from unregistered player");
        return;
    }

    if (!text.empty() && text[0] == '/') {
        handleCommand(client, *player, text);
        return;
    }

    Logger::chat(player->name, text);
    broadcastSystemMessage(player->name + "> " + text);
}

void Hub::handleCommand(const std::shared_ptr<ClientSession>& client, const Player& player, const std::string& command) {
    std::istringstream in(command);
    std::string cmd;
    in >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) { return std::tolower(c); });

    std::vector<std::string> args;
    for (std::string arg; in >> arg;) args.push_back(arg);

    Logger::chat(player.name, command);

    if (cmd == "/help") {
        sendSystemMessage(client, "Commands: /help, /list, /goto <name>, /spawn, /pq <p> <q>, /nick <name>");
    } else if (cmd == "/list") {
        std::string names;
        for (const std::string& name : players.list().names()) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        sendSystemMessage(client, "Players: " + names);
    } else if (cmd == "/goto" && !args.empty()) {
        std::optional<Player> target = players.findByName(args[0]);
        if (!target) {
            sendSystemMessage(client, "Player '" + args[0] + "' not found");
            return;
        }
        teleport(client, player.id, target->transform);
        sendSystemMessage(client, "Teleported to " + target->name);
    } else if (cmd == "/spawn") {
        teleport(client, player.id, spawnPoint);
        sendSystemMessage(client, "Teleported to spawn");
    } else if (cmd == "/pq" && args.size() == 2) {
        int p = 0, q = 0;
        try {
            p = Codec::parseInt(args[0], command);
            q = Codec::parseInt(args[1], command);
        } catch (const ProtocolError&) {
            sendSystemMessage(client, "Usage: /pq <p> <q>");
            return;
        }
        if (!World::chunkInRange(p, q)) {
            sendSystemMessage(client,
                              "Chunk (" + std::to_string(p) + ", " + std::to_string(q) + ") is outside the world");
            return;
        }
        int x = p * CHUNK_SIZE + CHUNK_SIZE / 2;
        int z = q * CHUNK_SIZE + CHUNK_SIZE / 2;
        int top = world.highestBlock(x, z);
        Transform target{static_cast<float>(x), static_cast<float>(std::max(top, world.minY())) + SPAWN_HEADROOM,
                         static_cast<float>(z), player.transform.rx, player.transform.ry};
        teleport(client, player.id, target);
        sendSystemMessage(client, "Teleported to chunk (" + std::to_string(p) + ", " + std::to_string(q) + ")");
    } else if (cmd == "/nick" && !args.empty()) {
        handleRename(client, args[0]);
    } else {
        sendSystemMessage(client, "Unknown command: " + cmd);
    }
}

void Hub::teleport(const std::shared_ptr<ClientSession>& client, int playerId, const Transform& target) {
    try {
        players.updateTransform(playerId, target);
    } catch (const StaleReferenceError& e) {
        Logger::debug(e.what());
        return;
    }
    std::string record = Codec::encode(ServerMsg::Position{playerId, target.x, target.y, target.z, target.rx, target.ry});
    client->send(record);
    broadcaster.publish(record, client->connectionId(), Delivery::EXCEPT_ORIGIN);
}

void Hub::handleRename(const std::shared_ptr<ClientSession>& client, const std::string& name) {
    int id = client->playerId();
    if (!isValidUsername(name)) {
        sendSystemMessage(client, "Name '" + name + "' must be 1-" + std::to_string(MAX_USERNAME_LENGTH) +
                                  " letters or digits");
        return;
    }

    std::lock_guard<std::mutex> lock(membershipMutex);
    if (isNameTaken(name, id)) {
        sendSystemMessage(client, "Name '" + name + "' is already in use");
        return;
    }

    try {
        std::optional<Player> before = players.find(id);
        if (!before) throw StaleReferenceError(id);
        if (before->name == name) return;

        players.rename(id, name);
        broadcaster.publish(Codec::encode(ServerMsg::Nick{id, name}) +
                            Codec::encode(ServerMsg::Talk{before->name + " is now known as " + name}),
                            client->connectionId(), Delivery::ALL);
        Logger::hub(before->name + " -> " + name);
    } catch (const StaleReferenceError& e) {
        Logger::debug(e.what());
    }
}

bool Hub::isNameTaken(const std::string& name, int exceptId) const {
    std::optional<Player> holder = players.findByName(name);
    return holder && holder->id != exceptId;
}

void Hub::broadcastSystemMessage(const std::string& message) {
    broadcaster.publish(Codec::encode(ServerMsg::Talk{message}));
}

void Hub::sendSystemMessage(const std::shared_ptr<ClientSession>& client, const std::string& message) {
    client->send(Codec::encode(ServerMsg::Talk{message}));
}

void Hub::closeAll() {
    std::vector<std::shared_ptr<ClientSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(clientsMutex);
        accepting = false;
        for (const auto& [id, weak] : clients) {
            if (auto session = weak.lock()) sessions.push_back(std::move(session));
        }
    }
    Logger::hub("Closing " + std::to_string(sessions.size()) + " connection(s)");
    for (const auto& session : sessions) {
        session->close();
    }
}

std::size_t Hub::clientCount() const {
    std::lock_guard<std::mutex> lock(clientsMutex);
    return clients.size();
}

bool Hub::isValidUsername(const std::string& username) {
    // Check length
    if (username.empty() || username.length() > MAX_USERNAME_LENGTH) {
        return false;
    }

    // Check characters (only alphanumeric)
    for (char c : username) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}
