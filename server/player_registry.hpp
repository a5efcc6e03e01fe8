// server/player_registry.hpp
// Live player table keyed by player id
#ifndef SERVER_PLAYER_REGISTRY_HPP
#define SERVER_PLAYER_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../shared/types.hpp"

struct Player {
    int id = 0;
    uint64_t connectionId = 0;
    std::string name;
    Transform transform;
    // Cleared once the owning session starts closing
    bool live = true;
};

// Point-in-time view of the registry. Later mutations never show through.
class PlayerList {
public:
    using Table = std::map<int, Player>;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Player;
        using difference_type = std::ptrdiff_t;
        using pointer = const Player*;
        using reference = const Player&;

        explicit const_iterator(Table::const_iterator it) : it_(it) {}
        reference operator*() const { return it_->second; }
        pointer operator->() const { return &it_->second; }
        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++it_; return tmp; }
        bool operator==(const const_iterator& o) const { return it_ == o.it_; }
        bool operator!=(const const_iterator& o) const { return it_ != o.it_; }

    private:
        Table::const_iterator it_;
    };

    PlayerList() : table_(std::make_shared<const Table>()) {}
    explicit PlayerList(std::shared_ptr<const Table> table) : table_(std::move(table)) {}

    const_iterator begin() const { return const_iterator(table_->begin()); }
    const_iterator end() const { return const_iterator(table_->end()); }
    std::size_t size() const { return table_->size(); }
    bool empty() const { return table_->empty(); }

    const Player* find(int id) const {
        auto it = table_->find(id);
        return it == table_->end() ? nullptr : &it->second;
    }

    // Names of live players only
    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(table_->size());
        for (const auto& [id, player] : *table_) {
            if (player.live) result.push_back(player.name);
        }
        return result;
    }

private:
    std::shared_ptr<const Table> table_;
};

class PlayerRegistry {
public:
    PlayerRegistry();

    // Assigns the lowest free id, starting at 1. An empty name becomes guest<id>.
    int registerPlayer(uint64_t connectionId, const std::string& name, const Transform& transform);

    // Each of these throws StaleReferenceError when `id` is not registered
    Player updateTransform(int id, const Transform& transform);
    Player rename(int id, const std::string& name);
    Player markGone(int id);
    Player unregisterPlayer(int id);

    std::optional<Player> find(int id) const;
    // Skips players that are no longer live
    std::optional<Player> findByName(const std::string& name) const;

    // Built on the first call after a change and shared until the next one
    PlayerList list() const;
    std::size_t size() const;

private:
    template<class Fn>
    Player mutate(int id, Fn&& change);

    mutable std::mutex mutex;
    PlayerList::Table players;
    mutable std::shared_ptr<const PlayerList::Table> snapshot;
};

#endif // SERVER_PLAYER_REGISTRY_HPP
