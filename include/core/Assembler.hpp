#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/ChunkStore.hpp"
#include "core/UploadIndex.hpp"

namespace chunkstitch {
namespace core {

struct ArtifactMetadata {
    std::string originalName;  // identity the chunks were uploaded under
    std::string storedName;    // generated file name inside the uploads directory
    uint64_t fileSize = 0;
    std::string mimeType;
    std::string path;          // full path of the final artifact
};

/**
 * Stitches the chunks of a complete upload into one file.
 */
class Assembler {
public:
    Assembler(const std::string& uploadsPath, const ChunkStore& chunks);

    /**
     * Concatenate slots 0..n-1 into a new artifact and check its size.
     * On any failure the partially written artifact is deleted.
     * @throws MissingChunkError for an empty slot
     * @throws IntegrityError if the byte count differs from expectedSize
     * @throws StorageError, NotFoundError on I/O failure
     */
    ArtifactMetadata assemble(const std::string& identity,
                              const ChunkSlots& slots,
                              uint64_t expectedSize) const;

    const std::filesystem::path& uploadsPath() const { return uploadsPath_; }

    // Random UUID plus the original's extension when it is a plain one
    static std::string generateStoredName(const std::string& originalName);

private:
    std::filesystem::path uploadsPath_;
    const ChunkStore& chunks_;

    uint64_t copyChunks(const std::string& identity, const ChunkSlots& slots, std::ostream& out) const;
};

} // namespace core
} // namespace chunkstitch
