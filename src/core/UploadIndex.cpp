#include "core/UploadIndex.hpp"
#include "core/Errors.hpp"

#include <mutex>

namespace chunkstitch {
namespace core {

void UploadIndex::validate(const std::string& identity,
                           const Entry& entry,
                           size_t index,
                           size_t totalChunks,
                           uint64_t expectedSize) {
    if (totalChunks != entry.slots.size()) {
        throw ValidationError("totalChunks mismatch for " + identity + ": upload declared " +
                              std::to_string(entry.slots.size()) + ", chunk declared " +
                              std::to_string(totalChunks));
    }
    if (index >= entry.slots.size()) {
        throw ValidationError("chunkIndex " + std::to_string(index) + " out of range for " +
                              identity + " (" + std::to_string(entry.slots.size()) + " chunks)");
    }
    if (expectedSize != entry.expectedSize) {
        throw ValidationError("fileSize mismatch for " + identity + ": upload declared " +
                              std::to_string(entry.expectedSize) + ", chunk declared " +
                              std::to_string(expectedSize));
    }
}

InsertResult UploadIndex::insert(const std::string& identity,
                                 size_t index,
                                 const ChunkLocation& location,
                                 size_t totalChunks,
                                 uint64_t expectedSize) {
    if (totalChunks == 0) {
        throw ValidationError("totalChunks must be positive");
    }
    if (index >= totalChunks) {
        throw ValidationError("chunkIndex " + std::to_string(index) + " out of range (" +
                              std::to_string(totalChunks) + " chunks)");
    }

    std::unique_lock lock(mutex_);

    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        Entry entry;
        entry.slots.resize(totalChunks);
        entry.expectedSize = expectedSize;
        it = entries_.emplace(identity, std::move(entry)).first;
    } else {
        validate(identity, it->second, index, totalChunks, expectedSize);
    }

    Entry& entry = it->second;
    InsertResult result;
    if (entry.assembling) {
        return result;
    }

    auto& slot = entry.slots[index];
    if (slot) {
        result.superseded = std::move(*slot);
    } else {
        ++entry.filled;
    }
    slot = location;
    result.recorded = true;

    if (entry.filled == entry.slots.size()) {
        entry.assembling = true;
        result.claimed = true;
    }
    return result;
}

void UploadIndex::checkDeclaration(const std::string& identity,
                                   size_t index,
                                   size_t totalChunks,
                                   uint64_t expectedSize) const {
    if (totalChunks == 0) {
        throw ValidationError("totalChunks must be positive");
    }
    if (index >= totalChunks) {
        throw ValidationError("chunkIndex " + std::to_string(index) + " out of range (" +
                              std::to_string(totalChunks) + " chunks)");
    }

    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it != entries_.end()) {
        validate(identity, it->second, index, totalChunks, expectedSize);
    }
}

void UploadIndex::releaseAssembly(const std::string& identity) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it != entries_.end()) {
        it->second.assembling = false;
    }
}

bool UploadIndex::isComplete(const std::string& identity) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return false;
    }
    return it->second.filled == it->second.slots.size();
}

ChunkSlots UploadIndex::locations(const std::string& identity) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return {};
    }
    return it->second.slots;
}

std::optional<UploadSnapshot> UploadIndex::snapshot(const std::string& identity) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return UploadSnapshot{it->second.slots, it->second.expectedSize};
}

size_t UploadIndex::receivedCount(const std::string& identity) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    return it == entries_.end() ? 0 : it->second.filled;
}

UploadStatus UploadIndex::status(const std::string& identity) const {
    UploadStatus result;

    std::shared_lock lock(mutex_);
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return result;
    }

    const Entry& entry = it->second;
    result.exists = true;
    result.receivedChunks = entry.filled;
    result.totalChunks = entry.slots.size();
    result.complete = entry.filled == entry.slots.size();
    result.expectedSize = entry.expectedSize;
    return result;
}

void UploadIndex::remove(const std::string& identity) {
    std::unique_lock lock(mutex_);
    entries_.erase(identity);
}

size_t UploadIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace core
} // namespace chunkstitch
