#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>
#include <memory>

#include "config.hpp"
#include "core/UploadController.hpp"
#include "server/wserver.hpp"
#include "server/endpoint.hpp"
#include "server/UploadHandler.hpp"
#include "const/rest_enums.hpp"

using namespace chunkstitch;

namespace {

std::shared_ptr<server::wServer> g_server;

void signal_handler(int signum) {
    if ((signum == SIGINT || signum == SIGTERM) && g_server) {
        g_server->stop();
    }
}

Config load_config(int argc, char** argv) {
    std::string path;
    if (argc > 1) {
        path = argv[1];
    } else if (const char* env = std::getenv(CHUNKSTITCH_CONFIG_ENV)) {
        path = env;
    }

    if (path.empty()) {
        return Config::defaults();
    }
    std::cout << "Loading configuration from " << path << std::endl;
    return Config::fromJsonFile(path);
}

} // namespace

int main(int argc, char** argv)
{
    Config config;
    try {
        config = load_config(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Configuration: " << config.toJson().dump() << std::endl;

    core::UploadController controller(config);
    server::UploadHandler uploadHandler(controller);

    g_server = std::make_shared<server::wServer>(config);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    g_server->add_endpoint(server::endpoint(
        [&uploadHandler](const http::Request& request) { return uploadHandler.handleUpload(request); },
        http::HttpRequest::POST,
        "/upload"));

    g_server->add_endpoint(server::endpoint(
        [&uploadHandler](const http::Request& request) { return uploadHandler.handleStatus(request); },
        http::HttpRequest::GET,
        "/status"));

    g_server->add_endpoint(server::endpoint(
        [&uploadHandler](const http::Request& request) { return uploadHandler.handleCleanup(request); },
        http::HttpRequest::DELETE,
        "/cleanup"));

    try {
        g_server->run(config.port);
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    g_server.reset();
    std::cout << "Server stopped" << std::endl;
    return 0;
}
