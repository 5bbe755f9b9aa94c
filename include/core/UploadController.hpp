#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "core/Assembler.hpp"
#include "core/ChunkStore.hpp"
#include "core/UploadIndex.hpp"

namespace chunkstitch {
namespace core {

// What the caller claims about one chunk
struct ChunkDeclaration {
    std::string identity;
    size_t chunkIndex = 0;
    size_t totalChunks = 0;
    uint64_t expectedSize = 0;
};

struct UploadOutcome {
    enum class Kind {
        ChunkAccepted,
        UploadComplete
    };

    Kind kind = Kind::ChunkAccepted;
    std::string identity;
    size_t chunkIndex = 0;
    size_t totalChunks = 0;
    size_t receivedChunks = 0;
    std::optional<ArtifactMetadata> artifact;  // set for UploadComplete

    bool complete() const { return kind == Kind::UploadComplete; }
};

/**
 * Drives one upload from its first chunk to the stitched artifact.
 *
 * Safe to call from many threads at once, for the same or different uploads.
 * Any failure leaves the recorded progress as it was, so a failed chunk can
 * be resent. A failed assembly keeps the entry until cleanup(); resending any
 * chunk of the set retries the assembly.
 */
class UploadController {
public:
    explicit UploadController(const Config& config);

    UploadController(const UploadController&) = delete;
    UploadController& operator=(const UploadController&) = delete;

    UploadOutcome submitChunk(const ChunkDeclaration& declaration, std::istream& payload);
    UploadOutcome submitChunk(const ChunkDeclaration& declaration, const std::vector<uint8_t>& payload);

    UploadStatus status(const std::string& identity) const;

    // Abandon an upload: delete its chunks and forget it
    void cleanup(const std::string& identity);

    const Config& config() const { return config_; }

private:
    const Config config_;
    UploadIndex index_;
    ChunkStore chunks_;
    Assembler assembler_;

    void validate(const ChunkDeclaration& declaration) const;

    template <typename Payload>
    UploadOutcome process(const ChunkDeclaration& declaration, Payload& payload);

    UploadOutcome finish(const ChunkDeclaration& declaration);
};

} // namespace core
} // namespace chunkstitch
