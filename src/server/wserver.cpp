#include "server/wserver.hpp"
#include "http/MultipartParser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace chunkstitch {
namespace server {

namespace {

void trim(std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    s = s.substr(a, b - a);
}

void tolower_inplace(std::string& s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

size_t worker_count(const Config& config) {
    if (config.workerThreads > 0) return config.workerThreads;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

wServer::wServer(const Config& config)
    : acceptor_(io_context_),
      workers_(worker_count(config)),
      max_body_(config.maxMemory),
      cors_origin_(config.corsOrigin) {}

wServer::~wServer()
{
    stop();
    workers_.join();
}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

std::string wServer::cors_headers() const
{
    return "Access-Control-Allow-Origin: " + cors_origin_ + "\r\n"
           "Access-Control-Allow-Methods: POST, GET, DELETE, OPTIONS\r\n"
           "Access-Control-Allow-Headers: Content-Type\r\n";
}

http::Response wServer::dispatch(const http::Request& request) const
{
    if (request.method == http::HttpRequest::OPTIONS) {
        return {200, "text/plain", ""};
    }

    auto it = handlers_.find(request.path);
    if (it == handlers_.end()) {
        return http::Response::notFound();
    }
    if (it->second.get_rest_type() != request.method) {
        return http::Response::methodNotAllowed();
    }

    try {
        return it->second.get_handler()(request);
    } catch (const std::exception& e) {
        std::cerr << "Handler for " << request.path << " failed: " << e.what() << std::endl;
        return http::Response::error(e.what());
    }
}

void wServer::write_response(tcp::socket& socket, const http::Response& response) const
{
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << http::Response::statusText(response.status) << "\r\n";
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Content-Type: " << response.contentType << "\r\n";
    out << cors_headers();
    out << "Connection: close\r\n\r\n";
    out << response.body;

    asio::write(socket, asio::buffer(out.str()));
}

void wServer::handle_connection(tcp::socket& socket)
{
    asio::streambuf buf(max_header_bytes);
    boost::system::error_code ec;
    asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec == asio::error::not_found) {
        write_response(socket, http::Response::headerTooLarge(max_header_bytes));
        return;
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }
    std::istream request_stream(&buf);

    std::string method, target, version;
    request_stream >> method >> target >> version;

    std::string dummy;
    std::getline(request_stream, dummy);

    http::Request request;
    auto qm = target.find('?');
    request.path = target.substr(0, qm);
    if (qm != std::string::npos) {
        request.query = http::Request::parseQuery(target.substr(qm + 1));
    }

    try {
        request.method = http::from_string(method);
    } catch (const std::invalid_argument&) {
        write_response(socket, http::Response::methodNotAllowed());
        return;
    }

    std::string header_line;
    while (std::getline(request_stream, header_line))
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        trim(name); trim(value);
        tolower_inplace(name);
        request.headers[name] = value;
    }

    std::string content_type = request.getHeader("content-type");
    request.mediaType = http::MultipartParser::extractMediaType(content_type);

    size_t content_length = 0;
    std::string length_header = request.getHeader("content-length");
    if (!length_header.empty()) {
        try {
            content_length = static_cast<size_t>(std::stoull(length_header));
        } catch (const std::exception&) {
            write_response(socket, http::Response::badRequest("Invalid Content-Length"));
            return;
        }
    } else if (request.method == http::HttpRequest::POST || request.method == http::HttpRequest::PUT) {
        write_response(socket, http::Response::lengthRequired());
        return;
    }

    if (content_length > max_body_) {
        write_response(socket, http::Response::payloadTooLarge(max_body_));
        return;
    }

    std::string body(std::istreambuf_iterator<char>(request_stream), {});
    if (body.size() < content_length) {
        std::string rest;
        rest.resize(content_length - body.size());
        asio::read(socket, asio::buffer(&rest[0], rest.size()));
        body += rest;
    } else if (body.size() > content_length) {
        body.resize(content_length);
    }

    if (request.isMultipart()) {
        try {
            request.parts = http::MultipartParser::parse(body, http::MultipartParser::extractBoundary(content_type));
        } catch (const http::MultipartError& e) {
            write_response(socket, http::Response::badRequest(e.what()));
            return;
        }
    } else {
        request.rawBody = std::move(body);
    }

    http::Response response = dispatch(request);
    std::cout << method << " " << request.path << " -> " << response.status << std::endl;
    write_response(socket, response);
}

void wServer::run(uint16_t port)
{
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    running_ = true;
    std::cout << "Server listening on port " << port << std::endl;

    while (running_)
    {
        auto socket = std::make_shared<tcp::socket>(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(*socket, ec);
        if (ec) {
            if (!running_) break;
            std::cerr << "Accept failed: " << ec.message() << std::endl;
            continue;
        }

        asio::post(workers_, [this, socket]() {
            try {
                handle_connection(*socket);
            } catch (const std::exception& e) {
                std::cerr << "Connection error: " << e.what() << std::endl;
            }
            boost::system::error_code ignored;
            socket->shutdown(tcp::socket::shutdown_both, ignored);
            socket->close(ignored);
        });
    }
}

void wServer::stop()
{
    if (!running_.exchange(false)) return;
    boost::system::error_code ec;
    acceptor_.close(ec);
}

} // namespace server
} // namespace chunkstitch
