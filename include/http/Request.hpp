#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "http/MultipartParser.hpp"
#include "const/rest_enums.hpp"

namespace chunkstitch {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    std::unordered_map<std::string, std::string> headers;  // Header names are lower-case
    std::string mediaType;                                 // Content-Type without parameters
    std::vector<MultipartPart> parts;                      // Multipart parts
    std::string rawBody;                                   // Raw body for non-multipart requests

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }

    bool hasQuery(const std::string& key) const {
        return query.find(key) != query.end();
    }

    std::string getHeader(const std::string& name, const std::string& defaultValue = "") const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : defaultValue;
    }

    // First part with the given form field name, nullptr if absent
    const MultipartPart* getPart(const std::string& name) const {
        for (const auto& part : parts) {
            if (part.name == name) return &part;
        }
        return nullptr;
    }

    bool isMultipart() const { return mediaType == "multipart/form-data"; }

    // Split "a=1&b=x%20y" into decoded key/value pairs
    static std::unordered_map<std::string, std::string> parseQuery(const std::string& queryString);

    static std::string urlDecode(const std::string& value);
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;

    static Response ok(const std::string& body) {
        return {200, "application/json", body};
    }

    static Response json(int status, const nlohmann::json& body) {
        return {status, "application/json", body.dump()};
    }

    static Response noContent() {
        return {204, "application/json", ""};
    }

    static Response badRequest(const std::string& message) {
        return errorResponse(400, message);
    }

    static Response notFound(const std::string& message = "Not found") {
        return errorResponse(404, message);
    }

    static Response methodNotAllowed() {
        return errorResponse(405, "Method not allowed");
    }

    static Response lengthRequired() {
        return errorResponse(411, "Content-Length required");
    }

    static Response payloadTooLarge(size_t limit) {
        return errorResponse(413, "Request body exceeds " + std::to_string(limit) + " bytes");
    }

    static Response headerTooLarge(size_t limit) {
        return errorResponse(431, "Request header exceeds " + std::to_string(limit) + " bytes");
    }

    static Response unsupportedMediaType(const std::string& expected) {
        return errorResponse(415, "Expected " + expected);
    }

    static Response error(const std::string& message) {
        return errorResponse(500, message);
    }

    static Response errorResponse(int status, const std::string& message) {
        return json(status, {{"status", "error"}, {"message", message}});
    }

    static const char* statusText(int status);
};

} // namespace http
} // namespace chunkstitch
