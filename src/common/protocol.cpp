#include "protocol.h"
#include "utils.h"
#include <cmath>
#include <memory>

namespace chunkpost {

namespace {

const char* const kMissingFields = "Missing required fields";

// Integral JSON numbers as decimal text, unsigned ones past INT64_MAX included
bool integralText(const Json::Value& value, std::string& out) {
    if (value.isInt64()) {
        out = std::to_string(value.asInt64());
        return true;
    }
    if (value.isUInt64()) {
        out = std::to_string(value.asUInt64());
        return true;
    }
    return false;
}

// Non-empty string member; numbers are accepted and rendered as integers
bool readText(const Json::Value& root, const char* key, std::string& out) {
    if (!root.isMember(key)) {
        return false;
    }
    const Json::Value& value = root[key];
    if (value.isString()) {
        out = value.asString();
    } else if (!integralText(value, out)) {
        return false;
    }
    return !out.empty();
}

bool readOptionalText(const Json::Value& root, const char* key, std::string& out) {
    if (!root.isMember(key) || root[key].isNull()) {
        out.clear();
        return true;
    }
    const Json::Value& value = root[key];
    if (value.isString()) {
        out = value.asString();
        return true;
    }
    return integralText(value, out);
}

enum class IntResult { kMissing, kInvalid, kOk };

// Integer member given either as a JSON number or a decimal string
IntResult readInteger(const Json::Value& root, const char* key, int64_t& out) {
    if (!root.isMember(key) || root[key].isNull()) {
        return IntResult::kMissing;
    }
    const Json::Value& value = root[key];
    if (value.isInt64()) {
        out = value.asInt64();
        return IntResult::kOk;
    }
    if (value.isUInt64()) {
        return IntResult::kInvalid;
    }
    if (value.isDouble()) {
        // [-2^63, 2^63) is exactly the range that converts without overflow
        double d = value.asDouble();
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return IntResult::kInvalid;
        }
        int64_t whole = static_cast<int64_t>(d);
        if (d != static_cast<double>(whole)) {
            return IntResult::kInvalid;
        }
        out = whole;
        return IntResult::kOk;
    }
    if (value.isString()) {
        std::string text = Utils::trim(value.asString());
        if (text.empty()) {
            return IntResult::kMissing;
        }
        size_t start = (text[0] == '-') ? 1 : 0;
        if (start == text.size() || text.size() > 18) {
            return IntResult::kInvalid;
        }
        for (size_t i = start; i < text.size(); ++i) {
            if (text[i] < '0' || text[i] > '9') {
                return IntResult::kInvalid;
            }
        }
        out = std::stoll(text);
        return IntResult::kOk;
    }
    return IntResult::kInvalid;
}

bool readOk(const Json::Value& root) {
    return root.isObject() && root.isMember("ok") && root["ok"].isBool() && root["ok"].asBool();
}

Status malformedResponse(const std::string& what) {
    return Status(ErrorCode::kTransportError, "Malformed " + what + " response");
}

} // namespace

std::string purposeName(Purpose purpose) {
    switch (purpose) {
        case Purpose::kChat: return "chat";
        case Purpose::kAvatar: return "avatar";
        case Purpose::kShared: return "shared";
    }
    return "shared";
}

Purpose parsePurpose(const std::string& value) {
    std::string lowered = Utils::toLower(Utils::trim(value));
    if (lowered == "chat") {
        return Purpose::kChat;
    }
    // Avatars are only published through the dedicated endpoint
    return Purpose::kShared;
}

Status parseJsonBody(const std::string& body, Json::Value& root) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        return Status(ErrorCode::kBadRequest, "Invalid JSON body: " + errors);
    }
    if (!root.isObject()) {
        return Status(ErrorCode::kBadRequest, "JSON body must be an object");
    }
    return Status::OK();
}

std::string writeJson(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

Status parseStartUploadRequest(const Json::Value& root, StartUploadRequest& out) {
    StartUploadRequest request;
    if (!readText(root, "clientId", request.client_id) ||
        !readText(root, "timestamp", request.timestamp) ||
        !readText(root, "signatureBase64", request.signature_base64) ||
        !readText(root, "originalName", request.original_name) ||
        !readText(root, "fileSha256", request.file_sha256)) {
        return Status(ErrorCode::kBadRequest, kMissingFields);
    }

    IntResult chunks = readInteger(root, "totalChunks", request.total_chunks);
    if (chunks == IntResult::kMissing) {
        return Status(ErrorCode::kBadRequest, kMissingFields);
    }
    if (chunks == IntResult::kInvalid) {
        return Status(ErrorCode::kBadRequest, "Invalid totalChunks");
    }

    request.file_sha256 = Utils::toLower(request.file_sha256);
    if (!Utils::isSha256Hex(request.file_sha256)) {
        return Status(ErrorCode::kBadRequest, "Invalid fileSha256");
    }

    if (!readOptionalText(root, "purpose", request.purpose) ||
        !readOptionalText(root, "uploaderId", request.uploader_id)) {
        return Status(ErrorCode::kBadRequest, "Invalid purpose or uploaderId");
    }

    IntResult size = readInteger(root, "fileSize", request.file_size);
    if (size == IntResult::kInvalid) {
        return Status(ErrorCode::kBadRequest, "Invalid fileSize");
    }
    if (size == IntResult::kMissing) {
        request.file_size = -1;
    }

    out = request;
    return Status::OK();
}

Status parseChunkRequest(const Json::Value& root, ChunkRequest& out) {
    ChunkRequest request;
    if (!readText(root, "uploadId", request.upload_id) ||
        !readText(root, "chunkSha256", request.chunk_sha256) ||
        !readText(root, "chunkDataBase64", request.chunk_data_base64)) {
        return Status(ErrorCode::kBadRequest, kMissingFields);
    }

    IntResult index = readInteger(root, "chunkIndex", request.chunk_index);
    if (index == IntResult::kMissing) {
        return Status(ErrorCode::kBadRequest, kMissingFields);
    }
    if (index == IntResult::kInvalid) {
        return Status(ErrorCode::kBadRequest, "Invalid chunkIndex");
    }

    request.chunk_sha256 = Utils::toLower(request.chunk_sha256);
    out = request;
    return Status::OK();
}

Status parseCompleteRequest(const Json::Value& root, CompleteRequest& out) {
    CompleteRequest request;
    if (!readText(root, "uploadId", request.upload_id)) {
        return Status(ErrorCode::kBadRequest, kMissingFields);
    }
    out = request;
    return Status::OK();
}

Json::Value toJson(const StartUploadRequest& request) {
    Json::Value root(Json::objectValue);
    root["clientId"] = request.client_id;
    root["timestamp"] = request.timestamp;
    root["signatureBase64"] = request.signature_base64;
    root["originalName"] = request.original_name;
    root["totalChunks"] = Json::Int64(request.total_chunks);
    root["fileSha256"] = request.file_sha256;
    if (!request.purpose.empty()) {
        root["purpose"] = request.purpose;
    }
    if (!request.uploader_id.empty()) {
        root["uploaderId"] = request.uploader_id;
    }
    if (request.file_size >= 0) {
        root["fileSize"] = Json::Int64(request.file_size);
    }
    return root;
}

Json::Value toJson(const ChunkRequest& request) {
    Json::Value root(Json::objectValue);
    root["uploadId"] = request.upload_id;
    root["chunkIndex"] = Json::Int64(request.chunk_index);
    root["chunkSha256"] = request.chunk_sha256;
    root["chunkDataBase64"] = request.chunk_data_base64;
    return root;
}

Json::Value toJson(const CompleteRequest& request) {
    Json::Value root(Json::objectValue);
    root["uploadId"] = request.upload_id;
    return root;
}

Json::Value toJson(const StartUploadResponse& response) {
    Json::Value root(Json::objectValue);
    root["ok"] = true;
    root["uploadId"] = response.upload_id;
    return root;
}

Json::Value toJson(const ChunkResponse& response) {
    Json::Value root(Json::objectValue);
    root["ok"] = true;
    root["receivedIndex"] = Json::Int64(response.received_index);
    return root;
}

Json::Value toJson(const StoredArtifact& artifact) {
    Json::Value file(Json::objectValue);
    file["relativePath"] = artifact.relative_path;
    file["mime"] = artifact.mime;
    file["size"] = Json::Int64(artifact.size);
    file["originalName"] = artifact.original_name;
    return file;
}

Json::Value toJson(const CompleteResponse& response) {
    Json::Value root(Json::objectValue);
    root["ok"] = true;
    root["status"] = "ok";
    root["verified"] = response.verified;
    root["file"] = toJson(response.file);
    if (!response.url.empty()) {
        root["url"] = response.url;
    }
    return root;
}

Status parseStartUploadResponse(const Json::Value& root, StartUploadResponse& out) {
    if (!readOk(root) || !root.isMember("uploadId") || !root["uploadId"].isString() ||
        root["uploadId"].asString().empty()) {
        return malformedResponse("start");
    }
    out.upload_id = root["uploadId"].asString();
    return Status::OK();
}

Status parseChunkResponse(const Json::Value& root, ChunkResponse& out) {
    if (!readOk(root)) {
        return malformedResponse("chunk");
    }
    if (root.isMember("receivedIndex") && root["receivedIndex"].isInt64()) {
        out.received_index = root["receivedIndex"].asInt64();
    }
    return Status::OK();
}

Status parseCompleteResponse(const Json::Value& root, CompleteResponse& out) {
    if (!root.isObject() || !root.isMember("status") || !root["status"].isString() ||
        root["status"].asString() != "ok") {
        return malformedResponse("complete");
    }
    if (!root.isMember("file") || !root["file"].isObject()) {
        return malformedResponse("complete");
    }

    const Json::Value& file = root["file"];
    CompleteResponse response;
    response.verified = root.isMember("verified") && root["verified"].isBool() && root["verified"].asBool();
    if (!file.isMember("relativePath") || !file["relativePath"].isString()) {
        return malformedResponse("complete");
    }
    response.file.relative_path = file["relativePath"].asString();
    if (file.isMember("mime") && file["mime"].isString()) {
        response.file.mime = file["mime"].asString();
    }
    if (file.isMember("size") && file["size"].isInt64()) {
        response.file.size = file["size"].asInt64();
    }
    if (file.isMember("originalName") && file["originalName"].isString()) {
        response.file.original_name = file["originalName"].asString();
    }
    if (root.isMember("url") && root["url"].isString()) {
        response.url = root["url"].asString();
    }
    if (response.file.relative_path.empty()) {
        return malformedResponse("complete");
    }
    out = response;
    return Status::OK();
}

Json::Value errorToJson(const Status& status, const std::vector<int64_t>& missing) {
    Json::Value root(Json::objectValue);
    root["ok"] = false;
    root["error"] = status.message();
    root["code"] = Status::errorCodeName(status.code());
    if (!missing.empty()) {
        Json::Value list(Json::arrayValue);
        for (int64_t index : missing) {
            list.append(Json::Int64(index));
        }
        root["missing"] = list;
    }
    return root;
}

Status statusFromErrorBody(int http_status, const std::string& body, std::vector<int64_t>* missing) {
    Json::Value root;
    Status parsed = parseJsonBody(body, root);
    if (!parsed.ok()) {
        return Status(ErrorCode::kTransportError,
                      "HTTP " + std::to_string(http_status) + " with unreadable body");
    }

    std::string message;
    if (root.isObject() && root.isMember("error") && root["error"].isString()) {
        message = root["error"].asString();
    }
    if (message.empty()) {
        message = "HTTP " + std::to_string(http_status);
    }

    ErrorCode code;
    if (root.isObject() && root.isMember("code") && root["code"].isString()) {
        code = Status::errorCodeFromName(root["code"].asString());
    } else {
        switch (http_status) {
            case 401: code = ErrorCode::kUnauthorized; break;
            case 404: code = ErrorCode::kNotFound; break;
            case 413: code = ErrorCode::kPayloadTooLarge; break;
            case 400: code = ErrorCode::kBadRequest; break;
            default: code = ErrorCode::kTransportError; break;
        }
    }

    if (missing && root.isObject() && root.isMember("missing") && root["missing"].isArray()) {
        missing->clear();
        for (const auto& index : root["missing"]) {
            if (index.isInt64()) {
                missing->push_back(index.asInt64());
            }
        }
    }
    return Status(code, message);
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return 200;
        case ErrorCode::kUnauthorized:
            return 401;
        case ErrorCode::kNotFound:
            return 404;
        case ErrorCode::kPayloadTooLarge:
            return 413;
        case ErrorCode::kStorageError:
        case ErrorCode::kConfigError:
            return 500;
        case ErrorCode::kTimeout:
            return 504;
        case ErrorCode::kTransportError:
            return 502;
        default:
            return 400;
    }
}

} // namespace chunkpost
