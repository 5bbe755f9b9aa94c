#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace chunkstitch {
namespace http {

/**
 * Represents a single part of a multipart/form-data request
 */
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // original filename (empty if not a file)
    std::string content_type;   // MIME type of the content
    std::vector<uint8_t> data;  // binary content

    bool isFile() const { return !filename.empty(); }
    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
};

class MultipartError : public std::runtime_error {
public:
    explicit MultipartError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Parser for multipart/form-data HTTP requests
 */
class MultipartParser {
public:
    /**
     * Parse multipart body into structured parts
     * @param body Raw HTTP body
     * @param boundary Multipart boundary string (without --)
     * @throws MultipartError if the body has no opening boundary or a part
     *         is missing its header terminator
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    /**
     * Extract boundary from Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

    /**
     * Media type of a Content-Type header value, lower-cased, parameters dropped
     */
    static std::string extractMediaType(const std::string& content_type);

private:
    static void trim(std::string& s);
    static void toLower(std::string& s);
    static std::string unquote(const std::string& s);

    // Calls fn(key, value) for every key=value token after the first ';'-separated field
    template <typename Fn>
    static void forEachParameter(const std::string& value, Fn fn);

    static void parseHeaders(const std::string& body, size_t begin, size_t end, MultipartPart& part);
};

} // namespace http
} // namespace chunkstitch
