#pragma once

#include "client_registry.h"
#include "metadata_store.h"
#include "protocol.h"
#include "status.h"
#include "storage_publisher.h"
#include "upload_session_table.h"
#include "utils.h"
#include <string>

namespace chunkpost {

struct CoordinatorOptions {
    int64_t max_upload_bytes = MAX_UPLOAD_BYTES;
    int max_total_chunks = MAX_TOTAL_CHUNKS;
    std::string public_url_prefix = "/uploads";
};

// Whole file delivered in one request (POST /upload)
struct SingleShotUpload {
    std::string client_id;
    std::string timestamp;
    std::string signature_base64;
    std::string original_name;
    std::string bytes;
    std::string file_sha256;   // optional, over the base64 text of bytes
    std::string purpose;
    std::string uploader_id;
};

// POST /api/mobile/user/avatar
struct AvatarUpload {
    std::string bearer_token;
    std::string user_id;
    std::string original_name;
    std::string bytes;
};

struct AvatarResult {
    std::string avatar_path;
    std::string url;
};

// Drives the upload session state machine:
//   start -> OPEN -> chunk* -> complete -> CLOSED_OK | CLOSED_FAIL
// Sessions idle past the TTL are evicted by the sweeper.
class SessionCoordinator {
public:
    SessionCoordinator(const ClientRegistry& registry,
                       UploadSessionTable& sessions,
                       StoragePublisher& publisher,
                       MetadataStore* metadata_store,
                       UploadMetrics& metrics,
                       CoordinatorOptions options = CoordinatorOptions());

    Status startUpload(const StartUploadRequest& request, StartUploadResponse& response);
    Status receiveChunk(const ChunkRequest& request, ChunkResponse& response);
    // On IncompleteUpload, response.missing lists the empty slots
    Status completeUpload(const CompleteRequest& request, CompleteResponse& response);

    Status uploadWhole(const SingleShotUpload& upload, CompleteResponse& response);
    Status uploadAvatar(const AvatarUpload& upload, AvatarResult& result);

    const CoordinatorOptions& options() const { return options_; }
    std::string publicUrl(const std::string& relative_path) const;

private:
    const ClientRegistry& registry_;
    UploadSessionTable& sessions_;
    StoragePublisher& publisher_;
    MetadataStore* metadata_store_;
    UploadMetrics& metrics_;
    CoordinatorOptions options_;

    Status publishAndRecord(const PublishContext& context, const std::string& bytes, StoredArtifact& artifact);
};

} // namespace chunkpost
