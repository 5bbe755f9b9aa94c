#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunkstitch {
namespace core {

enum class ErrorKind {
    Validation,   // missing or malformed declaration
    Storage,      // directory/file creation, read or write failure
    NotFound,     // a chunk location vanished
    Integrity,    // assembled size differs from the declared size
    MissingChunk  // an empty slot reached the assembler
};

const char* to_string(ErrorKind kind);

/**
 * Base of every error raised by the reassembly engine.
 * The HTTP layer picks the response status from kind().
 */
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public UploadError {
public:
    explicit ValidationError(const std::string& message)
        : UploadError(ErrorKind::Validation, message) {}
};

class StorageError : public UploadError {
public:
    explicit StorageError(const std::string& message)
        : UploadError(ErrorKind::Storage, message) {}
};

class NotFoundError : public UploadError {
public:
    explicit NotFoundError(const std::string& message)
        : UploadError(ErrorKind::NotFound, message) {}
};

class IntegrityError : public UploadError {
public:
    IntegrityError(uint64_t expected, uint64_t actual);

    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

private:
    uint64_t expected_;
    uint64_t actual_;
};

class MissingChunkError : public UploadError {
public:
    MissingChunkError(size_t index, const std::string& identity);

    size_t index() const { return index_; }

private:
    size_t index_;
};

} // namespace core
} // namespace chunkstitch
