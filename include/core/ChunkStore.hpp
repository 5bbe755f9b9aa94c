#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "core/UploadIndex.hpp"

namespace chunkstitch {
namespace core {

/**
 * Temporary on-disk storage for raw chunk payloads.
 *
 * Every save writes a new file named after (identity, index) plus a random
 * suffix. A stored file is never reopened for writing, so a resend or a
 * conflicting writer cannot change bytes another request already recorded.
 */
class ChunkStore {
public:
    explicit ChunkStore(const std::string& basePath);

    /**
     * Stream a chunk payload into a fresh file.
     * On failure only that file is removed.
     * @throws StorageError if the directory or file cannot be written
     * @return location of the stored chunk
     */
    ChunkLocation save(const std::string& identity, size_t index, std::istream& payload);
    ChunkLocation save(const std::string& identity, size_t index, const std::vector<uint8_t>& payload);

    /**
     * Open a stored chunk for reading.
     * @throws NotFoundError if the location no longer exists
     */
    std::unique_ptr<std::istream> open(const ChunkLocation& location) const;

    // Best-effort delete. Failures are logged, never thrown.
    void remove(const ChunkLocation& location) const;

    // Unused location for one version of chunk `index`
    ChunkLocation newLocation(const std::string& identity, size_t index) const;

    const std::filesystem::path& basePath() const { return basePath_; }

    // Escapes every byte outside [A-Za-z0-9._-] as %XX
    static std::string escapeIdentity(const std::string& identity);

private:
    std::filesystem::path basePath_;

    void ensureStorageDirectory() const;
};

} // namespace core
} // namespace chunkstitch
