#pragma once

#include "protocol.h"
#include "status.h"

namespace chunkpost {

// Carries the three protocol calls to a server. Timeouts surface as kTimeout,
// connection failures as kTransportError, server rejections with their own code.
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual Status startUpload(const StartUploadRequest& request, StartUploadResponse& response,
                               int timeout_ms) = 0;

    virtual Status sendChunk(const ChunkRequest& request, ChunkResponse& response, int timeout_ms) = 0;

    // On kIncompleteUpload, response.missing lists what the server lacks
    virtual Status completeUpload(const CompleteRequest& request, CompleteResponse& response,
                                  int timeout_ms) = 0;
};

} // namespace chunkpost
