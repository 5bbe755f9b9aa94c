#include "core/ChunkStore.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace chunkstitch {
namespace core {

namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

}

ChunkStore::ChunkStore(const std::string& basePath)
    : basePath_(std::filesystem::absolute(basePath)) {}

std::string ChunkStore::escapeIdentity(const std::string& identity) {
    static const char* hex = "0123456789ABCDEF";

    std::string escaped;
    escaped.reserve(identity.size());
    for (char c : identity) {
        unsigned char b = static_cast<unsigned char>(c);
        if (std::isalnum(b) || c == '.' || c == '_' || c == '-') {
            escaped.push_back(c);
        } else {
            escaped.push_back('%');
            escaped.push_back(hex[b >> 4]);
            escaped.push_back(hex[b & 0x0F]);
        }
    }
    return escaped;
}

ChunkLocation ChunkStore::newLocation(const std::string& identity, size_t index) const {
    thread_local boost::uuids::random_generator generator;
    std::string filename = escapeIdentity(identity) + "_chunk_" + std::to_string(index) + "." +
                           boost::uuids::to_string(generator());
    return (basePath_ / filename).string();
}

void ChunkStore::ensureStorageDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(basePath_, ec);
    if (ec) {
        throw StorageError("error creating temp directory " + basePath_.string() + ": " + ec.message());
    }
}

ChunkLocation ChunkStore::save(const std::string& identity, size_t index, std::istream& payload) {
    ensureStorageDirectory();

    ChunkLocation location = newLocation(identity, index);

    std::ofstream outFile(location, std::ios::binary);
    if (!outFile) {
        throw StorageError("error creating chunk file " + location + " (" + std::strerror(errno) + ")");
    }

    char buffer[kCopyBufferSize];
    uint64_t written = 0;
    while (payload) {
        payload.read(buffer, sizeof(buffer));
        std::streamsize got = payload.gcount();
        if (got <= 0) break;
        if (!outFile.write(buffer, got)) {
            break;
        }
        written += static_cast<uint64_t>(got);
    }

    bool readFailed = payload.bad();
    outFile.flush();
    bool writeFailed = !outFile;
    outFile.close();

    if (readFailed || writeFailed) {
        std::error_code ec;
        std::filesystem::remove(location, ec);
        throw StorageError(std::string("error saving chunk ") + std::to_string(index) + " of " + identity +
                           (readFailed ? ": payload read failed" : ": write failed"));
    }

    std::cout << "Saved chunk " << index << " of '" << identity << "' (" << written << " bytes)" << std::endl;
    return location;
}

ChunkLocation ChunkStore::save(const std::string& identity, size_t index, const std::vector<uint8_t>& payload) {
    const char* begin = payload.empty() ? "" : reinterpret_cast<const char*>(payload.data());
    boost::iostreams::stream<boost::iostreams::array_source> in(begin, payload.size());
    return save(identity, index, in);
}

std::unique_ptr<std::istream> ChunkStore::open(const ChunkLocation& location) const {
    std::error_code ec;
    if (!std::filesystem::exists(location, ec)) {
        throw NotFoundError("chunk not found: " + location);
    }

    auto inFile = std::make_unique<std::ifstream>(location, std::ios::binary);
    if (!inFile->is_open()) {
        throw StorageError("error opening chunk " + location + " (" + std::strerror(errno) + ")");
    }
    return inFile;
}

void ChunkStore::remove(const ChunkLocation& location) const {
    std::error_code ec;
    std::filesystem::remove(location, ec);
    if (ec) {
        std::cerr << "Failed to remove chunk " << location << ": " << ec.message() << std::endl;
    }
}

} // namespace core
} // namespace chunkstitch
