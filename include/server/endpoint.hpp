#pragma once 

#include <string>
#include <functional>
#include "const/rest_enums.hpp"
#include "http/Request.hpp"

namespace chunkstitch {
namespace server {

using Handler = std::function<http::Response(const http::Request&)>;

class endpoint
{
    Handler handler;
    http::HttpRequest rest_type;
    std::string path;

public:
    endpoint(Handler handler, 
             http::HttpRequest rest_type, 
             const std::string& path)
        : handler(std::move(handler)), rest_type(rest_type), path(path) {}

    const std::string& get_path() const { return path; }
    const Handler& get_handler() const { return handler; }
    http::HttpRequest get_rest_type() const { return rest_type; }
};

} // namespace server
} // namespace chunkstitch
