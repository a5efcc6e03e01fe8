// shared/serialization.hpp
// Binary chunk record format used by the persistence layer
#ifndef SHARED_SERIALIZATION_HPP
#define SHARED_SERIALIZATION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "chunk.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace Serialization {

// Record layout (little endian):
//   "VXCH" u16 format, i32 p, i32 q, u64 revision, u32 count,
//   count * (i32 x, i32 y, i32 z, i32 w, u64 revision), u32 fnv1a(all preceding bytes)
constexpr char RECORD_MAGIC[4] = {'V', 'X', 'C', 'H'};
constexpr uint16_t RECORD_FORMAT = 1;
constexpr std::size_t RECORD_HEADER_SIZE = 4 + 2 + 4 + 4 + 8 + 4;
constexpr std::size_t RECORD_ENTRY_SIZE = 4 * 4 + 8;

inline uint32_t fnv1a(const uint8_t* data, std::size_t size) {
    uint32_t hash = 2166136261u;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= 16777619u;
    }
    return hash;
}

inline void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(v & 0xFF);
    out.push_back((v >> 8) & 0xFF);
}

inline void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((v >> (8 * i)) & 0xFF);
}

inline void putU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back((v >> (8 * i)) & 0xFF);
}

inline void putI32(std::vector<uint8_t>& out, int32_t v) {
    putU32(out, static_cast<uint32_t>(v));
}

// Bounds-checked little endian reader
class Reader {
public:
    Reader(const std::vector<uint8_t>& data, const std::string& source)
        : data_(data), source_(source) {}

    uint16_t u16() { return static_cast<uint16_t>(take(2)); }
    uint32_t u32() { return static_cast<uint32_t>(take(4)); }
    uint64_t u64() { return take(8); }
    int32_t i32() { return static_cast<int32_t>(u32()); }

private:
    uint64_t take(std::size_t n) {
        if (pos_ + n > data_.size()) {
            throw StorageError("truncated chunk record " + source_);
        }
        uint64_t v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += n;
        return v;
    }

    const std::vector<uint8_t>& data_;
    const std::string& source_;
    std::size_t pos_ = 0;
};

inline std::vector<uint8_t> encodeChunk(const ChunkSnapshot& snap) {
    std::vector<uint8_t> out;
    out.reserve(RECORD_HEADER_SIZE + snap.blocks.size() * RECORD_ENTRY_SIZE + 4);

    out.insert(out.end(), RECORD_MAGIC, RECORD_MAGIC + 4);
    putU16(out, RECORD_FORMAT);
    putI32(out, snap.coord.p);
    putI32(out, snap.coord.q);
    putU64(out, snap.revision);
    putU32(out, static_cast<uint32_t>(snap.blocks.size()));
    for (const auto& b : snap.blocks) {
        putI32(out, b.x);
        putI32(out, b.y);
        putI32(out, b.z);
        putI32(out, b.w);
        putU64(out, b.revision);
    }
    putU32(out, fnv1a(out.data(), out.size()));
    return out;
}

// Throws StorageError on any structural problem; never returns a partial snapshot
inline ChunkSnapshot decodeChunk(const std::vector<uint8_t>& data, const std::string& source) {
    if (data.size() < RECORD_HEADER_SIZE + 4) {
        throw StorageError("truncated chunk record " + source);
    }
    for (int i = 0; i < 4; ++i) {
        if (data[i] != static_cast<uint8_t>(RECORD_MAGIC[i])) {
            throw StorageError("bad magic in chunk record " + source);
        }
    }

    std::size_t bodySize = data.size() - 4;
    uint32_t stored = static_cast<uint32_t>(data[bodySize]) |
                      (static_cast<uint32_t>(data[bodySize + 1]) << 8) |
                      (static_cast<uint32_t>(data[bodySize + 2]) << 16) |
                      (static_cast<uint32_t>(data[bodySize + 3]) << 24);
    if (stored != fnv1a(data.data(), bodySize)) {
        throw StorageError("checksum mismatch in chunk record " + source);
    }

    Reader in(data, source);
    in.u32(); // magic
    uint16_t format = in.u16();
    if (format != RECORD_FORMAT) {
        throw StorageError("unsupported chunk record format " + std::to_string(format) + " in " + source);
    }

    ChunkSnapshot snap;
    snap.coord.p = in.i32();
    snap.coord.q = in.i32();
    snap.revision = in.u64();
    uint32_t count = in.u32();
    if (RECORD_HEADER_SIZE + static_cast<std::size_t>(count) * RECORD_ENTRY_SIZE + 4 != data.size()) {
        throw StorageError("entry count does not match size of chunk record " + source);
    }

    snap.blocks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        BlockRecord b{};
        b.x = in.i32();
        b.y = in.i32();
        b.z = in.i32();
        b.w = in.i32();
        b.revision = in.u64();
        if (chunked(b.x) != snap.coord.p || chunked(b.z) != snap.coord.q) {
            throw StorageError("block outside its chunk in record " + source);
        }
        if (b.w < MATERIAL_AIR || b.w > MAX_MATERIAL_ID || b.revision > snap.revision) {
            throw StorageError("invalid block entry in record " + source);
        }
        snap.blocks.push_back(b);
    }
    return snap;
}

} // namespace Serialization

#endif // SHARED_SERIALIZATION_HPP
