#pragma once

#include "upload_transport.h"
#include <atomic>
#include <string>

namespace chunkpost {

// JSON-over-HTTP transport built on libcurl. Safe to share between worker threads.
class HttpTransport : public UploadTransport {
public:
    explicit HttpTransport(std::string server_url);

    Status startUpload(const StartUploadRequest& request, StartUploadResponse& response, int timeout_ms) override;
    Status sendChunk(const ChunkRequest& request, ChunkResponse& response, int timeout_ms) override;
    Status completeUpload(const CompleteRequest& request, CompleteResponse& response, int timeout_ms) override;

    int64_t requestCount() const { return request_count_.load(); }

private:
    std::string server_url_;
    std::atomic<int64_t> request_count_;

    // POST a JSON body; on success root holds the parsed response
    Status postJson(const std::string& path, const Json::Value& body, int timeout_ms,
                    Json::Value& root, std::vector<int64_t>* missing);
};

} // namespace chunkpost
