#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>
#include "config.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace chunkstitch {
namespace server {

/**
 * Minimal HTTP/1.1 listener. Accepts on the calling thread and serves each
 * connection (one request, then close) on a worker pool.
 */
class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::thread_pool workers_;
  std::unordered_map<std::string, endpoint> handlers_;
  size_t max_body_;
  std::string cors_origin_;
  std::atomic<bool> running_{false};

  void write_response(boost::asio::ip::tcp::socket& socket, const http::Response& response) const;

public:
    // Request line plus headers; longer heads are answered with 431
    static constexpr size_t max_header_bytes = 16 * 1024;

    explicit wServer(const Config& config);
    ~wServer();

    void add_endpoint(const endpoint& ep);

    // Routing only: 404 for unknown paths, 405 for wrong methods, CORS preflight
    http::Response dispatch(const http::Request& request) const;

    // Reads one request from an accepted socket and writes the response
    void handle_connection(boost::asio::ip::tcp::socket& socket);

    // Blocks until stop() is called
    void run(uint16_t port);
    void stop();

    std::string cors_headers() const;
};

} // namespace server
} // namespace chunkstitch
