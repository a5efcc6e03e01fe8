// server/player_registry.cpp
#include "player_registry.hpp"
#include "../shared/errors.hpp"

PlayerRegistry::PlayerRegistry() = default;

int PlayerRegistry::registerPlayer(uint64_t connectionId, const std::string& name, const Transform& transform) {
    std::lock_guard<std::mutex> lock(mutex);

    int id = 1;
    while (players.count(id)) ++id;

    players.emplace(id, Player{id, connectionId, name.empty() ? "guest" + std::to_string(id) : name, transform, true});
    snapshot.reset();
    return id;
}

template<class Fn>
Player PlayerRegistry::mutate(int id, Fn&& change) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = players.find(id);
    if (it == players.end()) {
        throw StaleReferenceError(id);
    }

    change(it->second);
    snapshot.reset();
    return it->second;
}

Player PlayerRegistry::updateTransform(int id, const Transform& transform) {
    return mutate(id, [&](Player& p) { p.transform = transform; });
}

Player PlayerRegistry::rename(int id, const std::string& name) {
    return mutate(id, [&](Player& p) { p.name = name; });
}

Player PlayerRegistry::markGone(int id) {
    return mutate(id, [](Player& p) { p.live = false; });
}

Player PlayerRegistry::unregisterPlayer(int id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = players.find(id);
    if (it == players.end()) {
        throw StaleReferenceError(id);
    }

    Player removed = std::move(it->second);
    players.erase(it);
    snapshot.reset();
    return removed;
}

std::optional<Player> PlayerRegistry::find(int id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = players.find(id);
    if (it == players.end()) return std::nullopt;
    return it->second;
}

std::optional<Player> PlayerRegistry::findByName(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [id, p] : players) {
        if (p.live && p.name == name) return p;
    }
    return std::nullopt;
}

PlayerList PlayerRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!snapshot) {
        snapshot = std::make_shared<const PlayerList::Table>(players);
    }
    return PlayerList(snapshot);
}

std::size_t PlayerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return players.size();
}
