#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkstitch {
namespace core {

// Opaque handle to a persisted chunk (a file path inside the chunk directory)
using ChunkLocation = std::string;

// One slot per chunk index, empty until that chunk arrives
using ChunkSlots = std::vector<std::optional<ChunkLocation>>;

struct UploadStatus {
    bool exists = false;
    bool complete = false;
    size_t receivedChunks = 0;
    size_t totalChunks = 0;
    uint64_t expectedSize = 0;
};

// Outcome of recording one chunk
struct InsertResult {
    bool recorded = false;                     // false while an assembly holds the claim
    bool claimed = false;                      // this caller must assemble
    std::optional<ChunkLocation> superseded;   // earlier file of a resent chunk
};

// Slots and declared size read under one lock
struct UploadSnapshot {
    ChunkSlots slots;
    uint64_t expectedSize = 0;
};

/**
 * Registry of in-progress uploads keyed by upload identity.
 *
 * The slot count and expected size are fixed by the first chunk of an upload.
 * Later chunks must repeat the same declaration. Identity uniqueness is the
 * caller's contract: two transfers sharing a name share an entry.
 *
 * Thread-safe. Reads share the lock, writes hold it exclusively, and nothing
 * here touches the file system.
 */
class UploadIndex {
public:
    UploadIndex() = default;
    UploadIndex(const UploadIndex&) = delete;
    UploadIndex& operator=(const UploadIndex&) = delete;

    /**
     * Record a chunk location, creating the entry on first sight.
     * A repeated index replaces the slot and hands back the old location.
     * While an assembly holds the claim nothing is replaced and the result
     * is not recorded.
     * @throws ValidationError if index is out of range or the declaration
     *         disagrees with the one the entry was created with
     * @return claimed is set when this insert filled the last empty slot;
     *         exactly one caller sees it per claim
     */
    InsertResult insert(const std::string& identity,
                size_t index,
                const ChunkLocation& location,
                size_t totalChunks,
                uint64_t expectedSize);

    // Throws ValidationError when insert() would reject this declaration
    void checkDeclaration(const std::string& identity,
                          size_t index,
                          size_t totalChunks,
                          uint64_t expectedSize) const;

    // Drop the assembly claim so a later insert may claim again
    void releaseAssembly(const std::string& identity);

    bool isComplete(const std::string& identity) const;

    // Snapshot copy; empty for an unknown identity
    ChunkSlots locations(const std::string& identity) const;

    std::optional<UploadSnapshot> snapshot(const std::string& identity) const;

    size_t receivedCount(const std::string& identity) const;

    UploadStatus status(const std::string& identity) const;

    // No-op for an unknown identity
    void remove(const std::string& identity);

    size_t size() const;

private:
    struct Entry {
        ChunkSlots slots;
        size_t filled = 0;
        uint64_t expectedSize = 0;
        bool assembling = false;
    };

    static void validate(const std::string& identity,
                         const Entry& entry,
                         size_t index,
                         size_t totalChunks,
                         uint64_t expectedSize);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace core
} // namespace chunkstitch
