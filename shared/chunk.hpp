// shared/chunk.hpp
// Voxel storage for a single chunk column
#ifndef SHARED_CHUNK_HPP
#define SHARED_CHUNK_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "types.hpp"
#include "config.hpp"

// One stored block in a snapshot
struct BlockRecord {
    int x, y, z;
    int w;
    uint64_t revision;  // Chunk revision of the last edit, 0 for generated terrain

    bool operator==(const BlockRecord& o) const {
        return x == o.x && y == o.y && z == o.z && w == o.w && revision == o.revision;
    }
};

// Immutable copy of a chunk's contents, sorted by (x, y, z)
struct ChunkSnapshot {
    ChunkCoord coord{0, 0};
    uint64_t revision = 0;
    std::vector<BlockRecord> blocks;

    bool operator==(const ChunkSnapshot& o) const {
        return coord == o.coord && revision == o.revision && blocks == o.blocks;
    }
    bool operator!=(const ChunkSnapshot& o) const { return !(*this == o); }

    // Blocks a client holding revision `key` has not seen yet. Key 0 means everything.
    std::vector<BlockRecord> since(uint64_t key) const {
        if (key == 0) return blocks;
        std::vector<BlockRecord> result;
        for (const auto& b : blocks) {
            if (b.revision > key) result.push_back(b);
        }
        return result;
    }

    int materialAt(int x, int y, int z) const {
        for (const auto& b : blocks) {
            if (b.x == x && b.y == y && b.z == z) return b.w;
        }
        return MATERIAL_AIR;
    }
};

class Chunk {
public:
    explicit Chunk(ChunkCoord c) : coord_(c) {}

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    ChunkCoord coord() const { return coord_; }

    bool contains(int x, int z) const {
        return chunked(x) == coord_.p && chunked(z) == coord_.q;
    }

    int get(int x, int y, int z) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blocks_.find(BlockPos{x, y, z});
        return it == blocks_.end() ? MATERIAL_AIR : it->second.w;
    }

    // Apply an edit, returning the new chunk revision. Caller checks bounds.
    uint64_t set(int x, int y, int z, int w, bool* becameDirty = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        return setLocked(x, y, z, w, becameDirty);
    }

    // Same as set(), but runs `applied` with the new revision before the lock is released
    template<class Fn>
    uint64_t setAnd(int x, int y, int z, int w, bool* becameDirty, Fn&& applied) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t rev = setLocked(x, y, z, w, becameDirty);
        applied(rev);
        return rev;
    }

    // Write generated terrain: revision 0, chunk stays clean
    void fill(int x, int y, int z, int w) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocks_[BlockPos{x, y, z}] = Entry{w, 0};
    }

    int highestAt(int x, int z) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int best = -1;
        for (const auto& [pos, entry] : blocks_) {
            if (pos.x == x && pos.z == z && entry.w != MATERIAL_AIR && pos.y > best) {
                best = pos.y;
            }
        }
        return best;
    }

    ChunkSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ChunkSnapshot snap;
        snap.coord = coord_;
        snap.revision = revision_;
        snap.blocks.reserve(blocks_.size());
        for (const auto& [pos, entry] : blocks_) {
            snap.blocks.push_back(BlockRecord{pos.x, pos.y, pos.z, entry.w, entry.revision});
        }
        return snap;
    }

    // Replace contents with a stored record (startup reload)
    void restore(const ChunkSnapshot& snap) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocks_.clear();
        for (const auto& b : snap.blocks) {
            blocks_[BlockPos{b.x, b.y, b.z}] = Entry{b.w, b.revision};
        }
        revision_ = snap.revision;
        isDirty_ = false;
    }

    uint64_t revision() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return revision_;
    }

    bool isDirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return isDirty_;
    }

    // Clears the dirty flag if nothing changed since `flushedRevision` was captured
    bool markClean(uint64_t flushedRevision) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revision_ != flushedRevision) return false;
        isDirty_ = false;
        return true;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blocks_.size();
    }

private:
    struct Entry {
        int w;
        uint64_t revision;
    };

    uint64_t setLocked(int x, int y, int z, int w, bool* becameDirty) {
        ++revision_;
        blocks_[BlockPos{x, y, z}] = Entry{w, revision_};
        if (becameDirty) *becameDirty = !isDirty_;
        isDirty_ = true;
        return revision_;
    }

    ChunkCoord coord_;
    mutable std::mutex mutex_;
    std::map<BlockPos, Entry> blocks_;
    uint64_t revision_ = 0;
    bool isDirty_ = false;
};

#endif // SHARED_CHUNK_HPP
