#pragma once

#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/UploadController.hpp"
#include "http/Request.hpp"

namespace chunkstitch {
namespace server {

// Everything the uploader needs from one inbound chunk request
struct ChunkRequest {
    core::ChunkDeclaration declaration;
    nlohmann::json additionalParams = nlohmann::json::object();
    std::vector<uint8_t> payload;
};

/**
 * Pulls the chunk declaration and payload out of a hosting framework's
 * request. One implementation per framework.
 */
class ChunkRequestExtractor {
public:
    virtual ~ChunkRequestExtractor() = default;

    // @throws core::ValidationError for missing or malformed fields
    virtual ChunkRequest extract(const http::Request& request) const = 0;
};

/**
 * Extractor for the built-in listener's multipart/form-data requests:
 * fields fileName, chunkIndex, totalChunks, fileSize, optional
 * additionalParams (JSON text) and the file part "chunk".
 */
class MultipartChunkExtractor : public ChunkRequestExtractor {
public:
    ChunkRequest extract(const http::Request& request) const override;

    // Malformed or non-object JSON yields an empty object
    static nlohmann::json parseAdditionalParams(const std::string& text);

private:
    static std::string field(const http::Request& request, const std::string& name);
    static uint64_t parseUnsigned(const std::string& raw, const std::string& fieldName);
};

} // namespace server
} // namespace chunkstitch
