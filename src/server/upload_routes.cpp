#include "upload_routes.h"
#include "multipart.h"
#include "protocol.h"

namespace chunkpost {

namespace {

std::string bearerToken(const HttpRequest& request) {
    std::string authorization = request.header("authorization");
    const std::string scheme = "Bearer ";
    if (authorization.size() <= scheme.size() || authorization.compare(0, scheme.size(), scheme) != 0) {
        return "";
    }
    return Utils::trim(authorization.substr(scheme.size()));
}

} // namespace

UploadRoutes::UploadRoutes(SessionCoordinator& coordinator, StoragePublisher& publisher, const UploadMetrics& metrics)
    : coordinator_(coordinator), publisher_(publisher), metrics_(metrics) {
}

HttpResponse UploadRoutes::handle(const HttpRequest& request) {
    const std::string& path = request.path;

    if (request.method == "POST") {
        if (path == "/upload-chunk-start") return handleStart(request);
        if (path == "/upload-chunk") return handleChunk(request);
        if (path == "/upload-chunk-complete") return handleComplete(request);
        if (path == "/upload") return handleSingleShot(request);
        if (path == "/api/mobile/user/avatar") return handleAvatar(request);
    } else if (request.method == "GET" || request.method == "HEAD") {
        if (path == "/health") {
            Json::Value root(Json::objectValue);
            root["ok"] = true;
            return HttpResponse::json(200, root);
        }
        if (path == "/api/stats") return handleStats();

        std::string prefix = coordinator_.options().public_url_prefix;
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        if (path.size() > prefix.size() + 1 && path.compare(0, prefix.size(), prefix) == 0 &&
            path[prefix.size()] == '/') {
            HttpResponse response = handleArtifact(path.substr(prefix.size() + 1));
            if (request.method == "HEAD") {
                response.body.clear();
            }
            return response;
        }
    } else {
        return HttpResponse::json(405, errorToJson(Status(ErrorCode::kBadRequest, "Method not allowed")));
    }

    return errorResponse(Status(ErrorCode::kNotFound, "Not found"));
}

HttpResponse UploadRoutes::handleStart(const HttpRequest& request) {
    Json::Value root;
    StartUploadRequest start;
    Status status = parseJsonBody(request.body, root);
    if (status.ok()) {
        status = parseStartUploadRequest(root, start);
    }

    StartUploadResponse response;
    if (status.ok()) {
        status = coordinator_.startUpload(start, response);
    }
    if (!status.ok()) {
        return errorResponse(status);
    }
    return HttpResponse::json(200, toJson(response));
}

HttpResponse UploadRoutes::handleChunk(const HttpRequest& request) {
    Json::Value root;
    ChunkRequest chunk;
    Status status = parseJsonBody(request.body, root);
    if (status.ok()) {
        status = parseChunkRequest(root, chunk);
    }

    ChunkResponse response;
    if (status.ok()) {
        status = coordinator_.receiveChunk(chunk, response);
    }
    if (!status.ok()) {
        return errorResponse(status);
    }
    return HttpResponse::json(200, toJson(response));
}

HttpResponse UploadRoutes::handleComplete(const HttpRequest& request) {
    Json::Value root;
    CompleteRequest complete;
    Status status = parseJsonBody(request.body, root);
    if (status.ok()) {
        status = parseCompleteRequest(root, complete);
    }

    CompleteResponse response;
    if (status.ok()) {
        status = coordinator_.completeUpload(complete, response);
    }
    if (!status.ok()) {
        return errorResponse(status, response.missing);
    }
    return HttpResponse::json(200, toJson(response));
}

HttpResponse UploadRoutes::handleSingleShot(const HttpRequest& request) {
    MultipartForm form;
    Status status = MultipartParser::parse(request.header("content-type"), request.body, form);
    if (!status.ok()) {
        return errorResponse(status);
    }

    const MultipartFile* photo = form.file("photo");
    if (!photo) {
        return errorResponse(Status(ErrorCode::kBadRequest, "No file uploaded"));
    }

    SingleShotUpload upload;
    upload.client_id = form.field("clientId");
    upload.timestamp = form.field("timestamp");
    upload.signature_base64 = form.field("signatureBase64");
    upload.original_name = photo->filename;
    upload.bytes = photo->data;
    upload.file_sha256 = form.field("fileSha256");
    upload.purpose = form.field("purpose");
    upload.uploader_id = form.field("uploaderId");

    CompleteResponse response;
    status = coordinator_.uploadWhole(upload, response);
    if (!status.ok()) {
        return errorResponse(status);
    }
    return HttpResponse::json(200, toJson(response));
}

HttpResponse UploadRoutes::handleAvatar(const HttpRequest& request) {
    AvatarUpload upload;
    upload.bearer_token = bearerToken(request);
    if (upload.bearer_token.empty()) {
        return errorResponse(Status(ErrorCode::kUnauthorized, "Missing token"));
    }

    MultipartForm form;
    Status status = MultipartParser::parse(request.header("content-type"), request.body, form);
    if (!status.ok()) {
        return errorResponse(status);
    }

    const MultipartFile* avatar = form.file("avatar");
    upload.user_id = form.field("userId");
    if (avatar) {
        upload.original_name = avatar->filename.empty() ? "avatar.jpg" : avatar->filename;
        upload.bytes = avatar->data;
    }

    AvatarResult result;
    status = coordinator_.uploadAvatar(upload, result);
    if (!status.ok()) {
        return errorResponse(status);
    }

    Json::Value root(Json::objectValue);
    root["ok"] = true;
    root["avatar_path"] = result.avatar_path;
    root["url"] = result.url;
    return HttpResponse::json(200, root);
}

HttpResponse UploadRoutes::handleArtifact(const std::string& relative_path) {
    std::string absolute_path;
    Status status = publisher_.resolve(relative_path, absolute_path);
    if (!status.ok()) {
        return errorResponse(Status(ErrorCode::kNotFound, "Not found"));
    }

    std::string data;
    if (!Utils::readFile(absolute_path, data)) {
        Utils::logError("Failed to read artifact " + absolute_path);
        return errorResponse(Status(ErrorCode::kStorageError, "Failed to read file"));
    }

    size_t dot = relative_path.rfind('.');
    std::string extension = dot == std::string::npos ? "" : relative_path.substr(dot);
    return HttpResponse::bytes(StoragePublisher::mimeForExtension(extension), std::move(data));
}

HttpResponse UploadRoutes::handleStats() {
    return HttpResponse::bytes("application/json", metrics_.toJSON());
}

HttpResponse UploadRoutes::errorResponse(const Status& status, const std::vector<int64_t>& missing) {
    return HttpResponse::json(httpStatusFor(status.code()), errorToJson(status, missing));
}

} // namespace chunkpost
