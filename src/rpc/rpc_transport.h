#pragma once

#include "upload.grpc.pb.h"
#include "upload.pb.h"
#include "upload_transport.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace chunkpost {

// UploadTransport over the gRPC UploadService. Per-call timeouts become deadlines.
class RpcTransport : public UploadTransport {
public:
    explicit RpcTransport(const std::string& target);
    explicit RpcTransport(std::shared_ptr<grpc::Channel> channel);

    Status startUpload(const StartUploadRequest& request, StartUploadResponse& response, int timeout_ms) override;
    Status sendChunk(const ChunkRequest& request, ChunkResponse& response, int timeout_ms) override;
    Status completeUpload(const CompleteRequest& request, CompleteResponse& response, int timeout_ms) override;

private:
    std::unique_ptr<rpc::UploadService::Stub> stub_;

    static void setDeadline(grpc::ClientContext& context, int timeout_ms);
};

} // namespace chunkpost
