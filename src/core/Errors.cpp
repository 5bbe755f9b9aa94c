#include "core/Errors.hpp"

namespace chunkstitch {
namespace core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::MissingChunk: return "missing_chunk";
        default: return "unknown";
    }
}

IntegrityError::IntegrityError(uint64_t expected, uint64_t actual)
    : UploadError(ErrorKind::Integrity,
                  "file size mismatch: expected " + std::to_string(expected) +
                  ", got " + std::to_string(actual)),
      expected_(expected), actual_(actual) {}

MissingChunkError::MissingChunkError(size_t index, const std::string& identity)
    : UploadError(ErrorKind::MissingChunk,
                  "missing chunk " + std::to_string(index) + " for file " + identity),
      index_(index) {}

} // namespace core
} // namespace chunkstitch
