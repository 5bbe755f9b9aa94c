#include "server/UploadHandler.hpp"
#include "core/Errors.hpp"

#include <iostream>

namespace chunkstitch {
namespace server {

UploadHandler::UploadHandler(core::UploadController& controller)
    : UploadHandler(controller, std::make_unique<MultipartChunkExtractor>()) {}

UploadHandler::UploadHandler(core::UploadController& controller, std::unique_ptr<ChunkRequestExtractor> extractor)
    : controller_(controller), extractor_(std::move(extractor)) {}

nlohmann::json UploadHandler::toJson(const core::ArtifactMetadata& metadata) {
    return {
        {"storedName", metadata.storedName},
        {"originalName", metadata.originalName},
        {"fileSize", metadata.fileSize},
        {"mimeType", metadata.mimeType},
        {"path", metadata.path},
    };
}

http::Response UploadHandler::errorResponse(const std::exception& e) {
    auto uploadError = dynamic_cast<const core::UploadError*>(&e);
    if (!uploadError) {
        return http::Response::error(e.what());
    }

    switch (uploadError->kind()) {
        case core::ErrorKind::Validation:
        case core::ErrorKind::Integrity:
            return http::Response::badRequest(e.what());
        default:
            return http::Response::error(e.what());
    }
}

std::string UploadHandler::requireFileName(const http::Request& request) {
    std::string fileName = request.getQuery("fileName");
    if (fileName.empty()) {
        throw core::ValidationError("fileName parameter is required");
    }
    return fileName;
}

http::Response UploadHandler::handleUpload(const http::Request& request) {
    if (!request.isMultipart()) {
        return http::Response::unsupportedMediaType("multipart/form-data");
    }

    try {
        ChunkRequest chunk = extractor_->extract(request);
        const core::ChunkDeclaration& declaration = chunk.declaration;

        core::UploadOutcome outcome = controller_.submitChunk(declaration, chunk.payload);

        nlohmann::json response;
        response["fileName"] = outcome.identity;
        if (outcome.complete()) {
            response["status"] = "complete";
            response["message"] = "File uploaded and stitched successfully";
            response["metadata"] = toJson(*outcome.artifact);
        } else {
            response["status"] = "chunk_received";
            response["chunkIndex"] = outcome.chunkIndex;
            response["totalChunks"] = outcome.totalChunks;
            response["receivedChunks"] = outcome.receivedChunks;
        }
        response["additionalParams"] = chunk.additionalParams;
        return http::Response::json(200, response);

    } catch (const std::exception& e) {
        std::cerr << "Upload request failed: " << e.what() << std::endl;
        return errorResponse(e);
    }
}

http::Response UploadHandler::handleStatus(const http::Request& request) const {
    try {
        std::string fileName = requireFileName(request);
        core::UploadStatus status = controller_.status(fileName);

        return http::Response::json(200, {
            {"fileName", fileName},
            {"isComplete", status.complete},
            {"receivedChunks", status.receivedChunks},
            {"totalChunks", status.totalChunks},
        });
    } catch (const std::exception& e) {
        return errorResponse(e);
    }
}

http::Response UploadHandler::handleCleanup(const http::Request& request) {
    try {
        std::string fileName = requireFileName(request);
        controller_.cleanup(fileName);

        return http::Response::json(200, {
            {"status", "cleaned"},
            {"fileName", fileName},
        });
    } catch (const std::exception& e) {
        return errorResponse(e);
    }
}

} // namespace server
} // namespace chunkstitch
