#pragma once

#include "status.h"
#include <json/json.h>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkpost {

// Tenant partition an artifact is published into
enum class Purpose {
    kShared,
    kChat,
    kAvatar,
};

std::string purposeName(Purpose purpose);
Purpose parsePurpose(const std::string& value);

// All digests on the wire are lowercase hex SHA-256 computed over the base64
// text of the payload (per chunk, or the concatenation of every chunk), never
// over the decoded bytes.

// POST /upload-chunk-start
struct StartUploadRequest {
    std::string client_id;
    std::string timestamp;
    std::string signature_base64;
    std::string original_name;
    int64_t total_chunks = 0;
    std::string file_sha256;
    std::string purpose;
    std::string uploader_id;
    int64_t file_size = -1;   // decoded size, -1 when not declared
};

struct StartUploadResponse {
    std::string upload_id;
};

// POST /upload-chunk
struct ChunkRequest {
    std::string upload_id;
    int64_t chunk_index = -1;
    std::string chunk_sha256;
    std::string chunk_data_base64;
};

struct ChunkResponse {
    int64_t received_index = -1;
};

// POST /upload-chunk-complete
struct CompleteRequest {
    std::string upload_id;
};

struct StoredArtifact {
    std::string relative_path;  // always '/' separated
    std::string mime;
    int64_t size = 0;
    std::string original_name;
};

struct CompleteResponse {
    bool verified = false;
    StoredArtifact file;
    std::string url;
    std::vector<int64_t> missing;  // filled on IncompleteUpload
};

// Body parsing / rendering
Status parseJsonBody(const std::string& body, Json::Value& root);
std::string writeJson(const Json::Value& root);

// Request validation at the boundary (server side)
Status parseStartUploadRequest(const Json::Value& root, StartUploadRequest& out);
Status parseChunkRequest(const Json::Value& root, ChunkRequest& out);
Status parseCompleteRequest(const Json::Value& root, CompleteRequest& out);

// Request rendering (client side)
Json::Value toJson(const StartUploadRequest& request);
Json::Value toJson(const ChunkRequest& request);
Json::Value toJson(const CompleteRequest& request);

// Response rendering (server side)
Json::Value toJson(const StartUploadResponse& response);
Json::Value toJson(const ChunkResponse& response);
Json::Value toJson(const CompleteResponse& response);
Json::Value toJson(const StoredArtifact& artifact);

// Response parsing (client side)
Status parseStartUploadResponse(const Json::Value& root, StartUploadResponse& out);
Status parseChunkResponse(const Json::Value& root, ChunkResponse& out);
Status parseCompleteResponse(const Json::Value& root, CompleteResponse& out);

// Error envelopes: {"ok": false, "error": ..., "code": ..., "missing": [...]}
Json::Value errorToJson(const Status& status, const std::vector<int64_t>& missing = {});
Status statusFromErrorBody(int http_status, const std::string& body, std::vector<int64_t>* missing);
int httpStatusFor(ErrorCode code);

} // namespace chunkpost
