// server/chunk_storage.cpp
#include "chunk_storage.hpp"
#include "logger.hpp"
#include "../shared/errors.hpp"
#include "../shared/serialization.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

ChunkStorage::ChunkStorage(fs::path dir) : dir_(std::move(dir)) {}

fs::path ChunkStorage::pathFor(ChunkCoord coord) const {
    // Build file path: world_save/chunk_P_Q.dat
    std::ostringstream filename;
    filename << "chunk_" << coord.p << "_" << coord.q << ".dat";
    return dir_ / filename.str();
}

std::optional<ChunkCoord> ChunkStorage::parseFilename(const std::string& filename) {
    // Parse filename: chunk_P_Q.dat
    const std::string prefix = "chunk_";
    const std::string suffix = ".dat";
    if (filename.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

    std::string body = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    int p = 0, q = 0;
    char trailing = 0;
    if (std::sscanf(body.c_str(), "%d_%d%c", &p, &q, &trailing) != 2) {
        return std::nullopt;
    }
    return ChunkCoord{p, q};
}

std::optional<ChunkSnapshot> ChunkStorage::load(ChunkCoord coord) const {
    fs::path path = pathFor(coord);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw StorageError("cannot stat " + path.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StorageError("failed to open " + path.string() + " for reading");
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageError("read error on " + path.string());
    }

    ChunkSnapshot snap = Serialization::decodeChunk(data, path.string());
    if (snap.coord != coord) {
        throw StorageError("record " + path.string() + " holds chunk (" + std::to_string(snap.coord.p) +
                           "," + std::to_string(snap.coord.q) + ")");
    }
    return snap;
}

void ChunkStorage::save(const ChunkSnapshot& snap) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw StorageError("cannot create " + dir_.string() + ": " + ec.message());
    }

    fs::path target = pathFor(snap.coord);
    fs::path temp = target;
    temp += ".tmp";

    std::vector<uint8_t> bytes = Serialization::encodeChunk(snap);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StorageError("failed to open " + temp.string() + " for writing");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(temp, ec);
            throw StorageError("write error on " + temp.string());
        }
    }

    try {
        syncPath(temp);
    } catch (const StorageError&) {
        fs::remove(temp, ec);
        throw;
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StorageError("cannot replace " + target.string() + ": " + ec.message());
    }

    // Make the rename itself durable
    syncPath(dir_);
}

void ChunkStorage::syncPath(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw StorageError("cannot open " + path.string() + " for sync: " + std::strerror(errno));
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw StorageError("fsync failed on " + path.string() + ": " + std::strerror(err));
    }
    ::close(fd);
}

std::vector<ChunkCoord> ChunkStorage::list() const {
    std::vector<ChunkCoord> coords;
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return coords;

    fs::directory_iterator it(dir_, ec);
    if (ec) {
        throw StorageError("cannot list " + dir_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        auto coord = parseFilename(entry.path().filename().string());
        if (coord) {
            coords.push_back(*coord);
        } else if (entry.path().extension() == ".tmp") {
            Logger::storage("Ignoring leftover temporary file " + entry.path().string());
        }
    }
    return coords;
}
