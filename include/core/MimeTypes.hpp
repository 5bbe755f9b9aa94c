#pragma once

#include <string>

namespace chunkstitch {
namespace core {

class MimeTypes {
public:
    static constexpr const char* kDefault = "application/octet-stream";

    // Content type inferred from the file name's extension, kDefault if unknown
    static std::string fromFileName(const std::string& fileName);

    // Get file extension (lowercase, with the dot); empty if there is none
    static std::string getExtension(const std::string& fileName);
};

} // namespace core
} // namespace chunkstitch
