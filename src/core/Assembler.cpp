#include "core/Assembler.hpp"
#include "core/Errors.hpp"
#include "core/MimeTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace chunkstitch {
namespace core {

namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

void removeArtifact(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << "Failed to remove partial artifact " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

Assembler::Assembler(const std::string& uploadsPath, const ChunkStore& chunks)
    : uploadsPath_(std::filesystem::absolute(uploadsPath)), chunks_(chunks) {}

std::string Assembler::generateStoredName(const std::string& originalName) {
    // random_generator is not thread-safe, one per thread
    thread_local boost::uuids::random_generator generator;
    std::string name = boost::uuids::to_string(generator());

    std::string ext = MimeTypes::getExtension(originalName);
    bool plain = ext.size() > 1 &&
                 std::all_of(ext.begin() + 1, ext.end(),
                             [](unsigned char c) { return std::isalnum(c); });
    if (plain) {
        name += ext;
    }
    return name;
}

uint64_t Assembler::copyChunks(const std::string& identity, const ChunkSlots& slots, std::ostream& out) const {
    char buffer[kCopyBufferSize];
    uint64_t totalWritten = 0;

    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
            throw MissingChunkError(i, identity);
        }

        auto in = chunks_.open(*slots[i]);
        while (*in) {
            in->read(buffer, sizeof(buffer));
            std::streamsize got = in->gcount();
            if (got <= 0) break;
            if (!out.write(buffer, got)) {
                throw StorageError("error copying chunk " + std::to_string(i) + ": write failed");
            }
            totalWritten += static_cast<uint64_t>(got);
        }
        if (in->bad()) {
            throw StorageError("error copying chunk " + std::to_string(i) + ": read failed");
        }
    }
    return totalWritten;
}

ArtifactMetadata Assembler::assemble(const std::string& identity,
                                     const ChunkSlots& slots,
                                     uint64_t expectedSize) const {
    std::error_code ec;
    std::filesystem::create_directories(uploadsPath_, ec);
    if (ec) {
        throw StorageError("error creating uploads directory " + uploadsPath_.string() + ": " + ec.message());
    }

    ArtifactMetadata metadata;
    metadata.originalName = identity;
    metadata.storedName = generateStoredName(identity);
    std::filesystem::path finalPath = uploadsPath_ / metadata.storedName;

    std::ofstream finalFile(finalPath, std::ios::binary | std::ios::trunc);
    if (!finalFile) {
        throw StorageError("error creating final file " + finalPath.string() + " (" + std::strerror(errno) + ")");
    }

    uint64_t totalWritten = 0;
    try {
        totalWritten = copyChunks(identity, slots, finalFile);
        finalFile.flush();
        if (!finalFile) {
            throw StorageError("error flushing final file " + finalPath.string());
        }
    } catch (...) {
        finalFile.close();
        removeArtifact(finalPath);
        throw;
    }
    finalFile.close();

    if (totalWritten != expectedSize) {
        removeArtifact(finalPath);
        throw IntegrityError(expectedSize, totalWritten);
    }

    metadata.fileSize = totalWritten;
    metadata.mimeType = MimeTypes::fromFileName(identity);
    metadata.path = finalPath.string();

    std::cout << "Stitched '" << identity << "' from " << slots.size() << " chunks into "
              << metadata.path << " (" << totalWritten << " bytes)" << std::endl;
    return metadata;
}

} // namespace core
} // namespace chunkstitch
