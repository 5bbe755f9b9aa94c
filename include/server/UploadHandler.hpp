#pragma once

#include <exception>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "core/UploadController.hpp"
#include "http/Request.hpp"
#include "server/ChunkRequestExtractor.hpp"

namespace chunkstitch {
namespace server {

class UploadHandler {
public:
    explicit UploadHandler(core::UploadController& controller);
    UploadHandler(core::UploadController& controller, std::unique_ptr<ChunkRequestExtractor> extractor);

    // POST /upload
    http::Response handleUpload(const http::Request& request);

    // GET /status?fileName=
    http::Response handleStatus(const http::Request& request) const;

    // DELETE /cleanup?fileName=
    http::Response handleCleanup(const http::Request& request);

    // Client errors for validation/integrity failures, server errors otherwise
    static http::Response errorResponse(const std::exception& e);

    static nlohmann::json toJson(const core::ArtifactMetadata& metadata);

private:
    core::UploadController& controller_;
    std::unique_ptr<ChunkRequestExtractor> extractor_;

    static std::string requireFileName(const http::Request& request);
};

} // namespace server
} // namespace chunkstitch
