#include "core/UploadController.hpp"
#include "core/Errors.hpp"

#include <iostream>

namespace chunkstitch {
namespace core {

namespace {

// Bounds the slot vector a single declaration can allocate
constexpr size_t kMaxTotalChunks = 1u << 20;

}

UploadController::UploadController(const Config& config)
    : config_(config),
      chunks_(config.tempDir),
      assembler_(config.uploadsDir, chunks_) {}

void UploadController::validate(const ChunkDeclaration& declaration) const {
    if (declaration.identity.empty()) {
        throw ValidationError("fileName is required");
    }
    if (declaration.totalChunks > kMaxTotalChunks) {
        throw ValidationError("totalChunks exceeds " + std::to_string(kMaxTotalChunks));
    }
    // Rejected before any payload bytes are written
    index_.checkDeclaration(declaration.identity, declaration.chunkIndex,
                            declaration.totalChunks, declaration.expectedSize);
}

template <typename Payload>
UploadOutcome UploadController::process(const ChunkDeclaration& declaration, Payload& payload) {
    validate(declaration);

    ChunkLocation location = chunks_.save(declaration.identity, declaration.chunkIndex, payload);

    InsertResult inserted;
    try {
        inserted = index_.insert(declaration.identity, declaration.chunkIndex, location,
                                 declaration.totalChunks, declaration.expectedSize);
    } catch (...) {
        // A conflicting first chunk of the same upload won the race
        chunks_.remove(location);
        throw;
    }

    if (!inserted.recorded) {
        // The set is being stitched or already was; its files stay as they are
        chunks_.remove(location);
    } else if (inserted.superseded && *inserted.superseded != location) {
        chunks_.remove(*inserted.superseded);
    }

    if (inserted.claimed) {
        return finish(declaration);
    }

    UploadOutcome outcome;
    outcome.kind = UploadOutcome::Kind::ChunkAccepted;
    outcome.identity = declaration.identity;
    outcome.chunkIndex = declaration.chunkIndex;
    outcome.totalChunks = declaration.totalChunks;
    outcome.receivedChunks = index_.receivedCount(declaration.identity);
    return outcome;
}

UploadOutcome UploadController::finish(const ChunkDeclaration& declaration) {
    const std::string& identity = declaration.identity;

    std::optional<UploadSnapshot> snapshot = index_.snapshot(identity);
    if (!snapshot) {
        throw NotFoundError("upload '" + identity + "' was cleaned up before stitching");
    }
    const size_t totalChunks = snapshot->slots.size();

    ArtifactMetadata artifact;
    try {
        artifact = assembler_.assemble(identity, snapshot->slots, snapshot->expectedSize);
    } catch (const std::exception& e) {
        std::cerr << "Stitching '" << identity << "' failed: " << e.what() << std::endl;
        index_.releaseAssembly(identity);
        throw;
    }

    // Without autoCleanup the claim stays held, so resent chunks never stitch twice
    if (config_.autoCleanup) {
        cleanup(identity);
    }

    UploadOutcome outcome;
    outcome.kind = UploadOutcome::Kind::UploadComplete;
    outcome.identity = identity;
    outcome.chunkIndex = declaration.chunkIndex;
    outcome.totalChunks = totalChunks;
    outcome.receivedChunks = totalChunks;
    outcome.artifact = std::move(artifact);
    return outcome;
}

UploadOutcome UploadController::submitChunk(const ChunkDeclaration& declaration, std::istream& payload) {
    return process(declaration, payload);
}

UploadOutcome UploadController::submitChunk(const ChunkDeclaration& declaration,
                                            const std::vector<uint8_t>& payload) {
    return process(declaration, payload);
}

UploadStatus UploadController::status(const std::string& identity) const {
    return index_.status(identity);
}

void UploadController::cleanup(const std::string& identity) {
    for (const auto& slot : index_.locations(identity)) {
        if (slot) {
            chunks_.remove(*slot);
        }
    }
    index_.remove(identity);
    std::cout << "Cleaned up chunks of '" << identity << "'" << std::endl;
}

} // namespace core
} // namespace chunkstitch
