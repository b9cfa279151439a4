#pragma once

#include "upload.grpc.pb.h"
#include "upload.pb.h"
#include "session_coordinator.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <memory>
#include <string>

namespace chunkpost {

// gRPC front end over the same coordinator the HTTP routes use
class UploadRpcService final : public rpc::UploadService::Service {
public:
    explicit UploadRpcService(SessionCoordinator& coordinator);

    grpc::Status StartUpload(grpc::ServerContext* context,
                             const rpc::StartUploadRequest* request,
                             rpc::StartUploadResponse* response) override;

    grpc::Status UploadChunk(grpc::ServerContext* context,
                             const rpc::UploadChunkRequest* request,
                             rpc::UploadChunkResponse* response) override;

    grpc::Status CompleteUpload(grpc::ServerContext* context,
                                const rpc::CompleteUploadRequest* request,
                                rpc::CompleteUploadResponse* response) override;

    int64_t requestCount() const { return total_requests_.load(); }

private:
    SessionCoordinator& coordinator_;
    std::atomic<int64_t> total_requests_;
};

// Owns the grpc::Server hosting UploadRpcService
class UploadRpcServer {
public:
    explicit UploadRpcServer(SessionCoordinator& coordinator);
    ~UploadRpcServer();

    bool start(const std::string& address, int port, int64_t max_message_bytes);
    void stop();

    int boundPort() const { return bound_port_; }

private:
    UploadRpcService service_;
    std::unique_ptr<grpc::Server> server_;
    int bound_port_;
};

} // namespace chunkpost
