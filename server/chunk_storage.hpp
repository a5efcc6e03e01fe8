// server/chunk_storage.hpp
// One durable file per chunk, replaced atomically on save
#ifndef SERVER_CHUNK_STORAGE_HPP
#define SERVER_CHUNK_STORAGE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../shared/chunk.hpp"
#include "../shared/types.hpp"

class ChunkStorage {
public:
    explicit ChunkStorage(std::filesystem::path dir);

    // Stored record for `coord`, or nullopt if none exists. Throws StorageError.
    std::optional<ChunkSnapshot> load(ChunkCoord coord) const;

    // Writes and fsyncs a temporary file, renames it over the record, then
    // fsyncs the directory. Throws StorageError.
    void save(const ChunkSnapshot& snap);

    // Coordinates of every record in the directory
    std::vector<ChunkCoord> list() const;

    std::filesystem::path pathFor(ChunkCoord coord) const;
    const std::filesystem::path& directory() const { return dir_; }

    static std::optional<ChunkCoord> parseFilename(const std::string& filename);

    // fsync a file or directory. Throws StorageError.
    static void syncPath(const std::filesystem::path& path);

private:
    std::filesystem::path dir_;
};

#endif // SERVER_CHUNK_STORAGE_HPP
