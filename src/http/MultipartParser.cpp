#include "http/MultipartParser.hpp"
#include <cctype>

namespace chunkstitch {
namespace http {

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string MultipartParser::unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

template <typename Fn>
void MultipartParser::forEachParameter(const std::string& value, Fn fn) {
    size_t pos = value.find(';');
    while (pos != std::string::npos && pos < value.size()) {
        size_t next = value.find(';', pos + 1);
        std::string token = value.substr(pos + 1, (next == std::string::npos ? value.size() : next) - pos - 1);
        pos = next;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);
        fn(key, unquote(val));
    }
}

std::string MultipartParser::extractBoundary(const std::string& content_type) {
    std::string boundary;
    forEachParameter(content_type, [&boundary](const std::string& key, const std::string& val) {
        if (key == "boundary" && boundary.empty()) boundary = val;
    });
    return boundary;
}

std::string MultipartParser::extractMediaType(const std::string& content_type) {
    std::string media_type = content_type.substr(0, content_type.find(';'));
    trim(media_type);
    toLower(media_type);
    return media_type;
}

void MultipartParser::parseHeaders(const std::string& body, size_t begin, size_t end, MultipartPart& part) {
    size_t hpos = begin;
    while (hpos < end) {
        size_t eol = body.find("\r\n", hpos);
        if (eol == std::string::npos || eol > end) eol = end;

        std::string hline = body.substr(hpos, eol - hpos);
        hpos = eol + 2;

        auto colon = hline.find(':');
        if (colon == std::string::npos) continue;

        std::string hname = hline.substr(0, colon);
        std::string hvalue = hline.substr(colon + 1);
        trim(hname);
        trim(hvalue);
        toLower(hname);

        if (hname == "content-disposition") {
            forEachParameter(hvalue, [&part](const std::string& key, const std::string& val) {
                if (key == "name") part.name = val;
                else if (key == "filename") part.filename = val;
            });
        } else if (hname == "content-type") {
            part.content_type = hvalue;
        }
    }
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                   const std::string& boundary) {
    if (boundary.empty()) {
        throw MultipartError("multipart boundary is missing");
    }

    const std::string dash = "--" + boundary;
    const std::string delimiter = "\r\n" + dash;

    // The opening boundary may be preceded by a preamble
    size_t bline;
    if (body.compare(0, dash.size(), dash) == 0) {
        bline = 0;
    } else {
        size_t m = body.find(delimiter);
        if (m == std::string::npos) {
            throw MultipartError("multipart body has no opening boundary");
        }
        bline = m + 2;
    }

    std::vector<MultipartPart> parts;
    while (true) {
        const size_t after = bline + dash.size();
        if (body.compare(after, 2, "--") == 0) break;  // closing boundary

        size_t line_end = body.find("\r\n", after);
        if (line_end == std::string::npos) break;

        size_t headers_end = body.find("\r\n\r\n", line_end);
        if (headers_end == std::string::npos) {
            throw MultipartError("multipart part " + std::to_string(parts.size()) + " has no header terminator");
        }

        MultipartPart part;
        if (headers_end > line_end) {
            parseHeaders(body, line_end + 2, headers_end, part);
        }

        size_t content_start = headers_end + 4;
        size_t next_marker = body.find(delimiter, content_start);
        size_t content_end = (next_marker == std::string::npos) ? body.size() : next_marker;

        part.data.assign(body.begin() + static_cast<std::ptrdiff_t>(content_start),
                         body.begin() + static_cast<std::ptrdiff_t>(content_end));
        parts.push_back(std::move(part));

        if (next_marker == std::string::npos) break;
        bline = next_marker + 2;
    }

    return parts;
}

} // namespace http
} // namespace chunkstitch
