#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#define CHUNKSTITCH_TEMP_DIR "./temp_chunks"
#define CHUNKSTITCH_UPLOADS_DIR "./uploads"
#define CHUNKSTITCH_MAX_MEMORY (32u << 20)
#define CHUNKSTITCH_AUTO_CLEANUP true
#define CHUNKSTITCH_PORT 8080
#define CHUNKSTITCH_CORS_ORIGIN "*"
#define CHUNKSTITCH_CONFIG_ENV "CHUNKSTITCH_CONFIG"

namespace chunkstitch {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Settings fixed for the lifetime of the uploader and its listener.
 */
struct Config {
    std::string tempDir = CHUNKSTITCH_TEMP_DIR;        // chunk files
    std::string uploadsDir = CHUNKSTITCH_UPLOADS_DIR;  // stitched artifacts
    size_t maxMemory = CHUNKSTITCH_MAX_MEMORY;         // largest request body buffered
    bool autoCleanup = CHUNKSTITCH_AUTO_CLEANUP;       // purge chunks after stitching
    uint16_t port = CHUNKSTITCH_PORT;
    size_t workerThreads = 0;                          // 0 = hardware concurrency
    std::string corsOrigin = CHUNKSTITCH_CORS_ORIGIN;

    static Config defaults() { return Config{}; }

    // Keys missing from j keep their defaults
    static Config fromJson(const nlohmann::json& j);

    static Config fromJsonFile(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace chunkstitch
