#include "http/Request.hpp"

namespace chunkstitch {
namespace http {

std::string Request::urlDecode(const std::string& value) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                decoded.push_back(c);
                continue;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }
    return decoded;
}

std::unordered_map<std::string, std::string> Request::parseQuery(const std::string& queryString) {
    std::unordered_map<std::string, std::string> result;

    size_t pos = 0;
    while (pos <= queryString.size()) {
        size_t amp = queryString.find('&', pos);
        std::string pair = queryString.substr(pos, (amp == std::string::npos ? queryString.size() : amp) - pos);
        pos = (amp == std::string::npos) ? queryString.size() + 1 : amp + 1;

        if (pair.empty()) continue;

        auto eq = pair.find('=');
        std::string key = urlDecode(pair.substr(0, eq));
        std::string value = (eq == std::string::npos) ? "" : urlDecode(pair.substr(eq + 1));
        result.emplace(std::move(key), std::move(value));
    }
    return result;
}

const char* Response::statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

} // namespace http
} // namespace chunkstitch
