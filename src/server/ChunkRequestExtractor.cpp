#include "server/ChunkRequestExtractor.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <limits>

namespace chunkstitch {
namespace server {

std::string MultipartChunkExtractor::field(const http::Request& request, const std::string& name) {
    const http::MultipartPart* part = request.getPart(name);
    if (!part) {
        return "";
    }
    return part->dataAsString();
}

uint64_t MultipartChunkExtractor::parseUnsigned(const std::string& raw, const std::string& fieldName) {
    size_t start = 0;
    size_t end = raw.size();
    while (start < end && std::isspace(static_cast<unsigned char>(raw[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
    const std::string text = raw.substr(start, end - start);

    if (text.empty() || text.size() > 20) {
        throw core::ValidationError("invalid " + fieldName);
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw core::ValidationError("invalid " + fieldName);
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw core::ValidationError("invalid " + fieldName);
        }
        value = value * 10 + digit;
    }
    return value;
}

nlohmann::json MultipartChunkExtractor::parseAdditionalParams(const std::string& text) {
    if (text.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

ChunkRequest MultipartChunkExtractor::extract(const http::Request& request) const {
    ChunkRequest result;
    core::ChunkDeclaration& declaration = result.declaration;

    declaration.identity = field(request, "fileName");
    if (declaration.identity.empty()) {
        throw core::ValidationError("fileName is required");
    }

    declaration.chunkIndex = static_cast<size_t>(parseUnsigned(field(request, "chunkIndex"), "chunkIndex"));
    declaration.totalChunks = static_cast<size_t>(parseUnsigned(field(request, "totalChunks"), "totalChunks"));
    if (declaration.totalChunks == 0) {
        throw core::ValidationError("invalid totalChunks");
    }
    declaration.expectedSize = parseUnsigned(field(request, "fileSize"), "fileSize");

    result.additionalParams = parseAdditionalParams(field(request, "additionalParams"));

    const http::MultipartPart* chunk = request.getPart("chunk");
    if (!chunk) {
        throw core::ValidationError("chunk file part is required");
    }
    result.payload = chunk->data;
    return result;
}

} // namespace server
} // namespace chunkstitch
