#include "config.hpp"

#include <fstream>

namespace chunkstitch {

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

Config Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    Config config;
    readField(j, "tempDir", config.tempDir);
    readField(j, "uploadsDir", config.uploadsDir);
    readField(j, "maxMemory", config.maxMemory);
    readField(j, "autoCleanup", config.autoCleanup);
    readField(j, "port", config.port);
    readField(j, "workerThreads", config.workerThreads);
    readField(j, "corsOrigin", config.corsOrigin);

    if (config.tempDir.empty()) {
        throw ConfigError("tempDir must not be empty");
    }
    if (config.uploadsDir.empty()) {
        throw ConfigError("uploadsDir must not be empty");
    }
    if (config.maxMemory == 0) {
        throw ConfigError("maxMemory must be positive");
    }
    return config;
}

Config Config::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config file " + path + " is not valid JSON: " + e.what());
    }
    return fromJson(j);
}

nlohmann::json Config::toJson() const {
    return {
        {"tempDir", tempDir},
        {"uploadsDir", uploadsDir},
        {"maxMemory", maxMemory},
        {"autoCleanup", autoCleanup},
        {"port", port},
        {"workerThreads", workerThreads},
        {"corsOrigin", corsOrigin},
    };
}

} // namespace chunkstitch
