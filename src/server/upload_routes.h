#pragma once

#include "http_message.h"
#include "session_coordinator.h"
#include "storage_publisher.h"
#include "utils.h"

namespace chunkpost {

// Maps HTTP endpoints onto the session coordinator
class UploadRoutes {
public:
    UploadRoutes(SessionCoordinator& coordinator, StoragePublisher& publisher, const UploadMetrics& metrics);

    HttpResponse handle(const HttpRequest& request);

private:
    SessionCoordinator& coordinator_;
    StoragePublisher& publisher_;
    const UploadMetrics& metrics_;

    HttpResponse handleStart(const HttpRequest& request);
    HttpResponse handleChunk(const HttpRequest& request);
    HttpResponse handleComplete(const HttpRequest& request);
    HttpResponse handleSingleShot(const HttpRequest& request);
    HttpResponse handleAvatar(const HttpRequest& request);
    HttpResponse handleArtifact(const std::string& relative_path);
    HttpResponse handleStats();

    static HttpResponse errorResponse(const Status& status, const std::vector<int64_t>& missing = {});
};

} // namespace chunkpost
