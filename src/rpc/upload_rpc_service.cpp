#include "upload_rpc_service.h"
#include "rpc_status.h"
#include "utils.h"
#include <algorithm>

namespace chunkpost {

UploadRpcService::UploadRpcService(SessionCoordinator& coordinator)
    : coordinator_(coordinator), total_requests_(0) {
}

grpc::Status UploadRpcService::StartUpload(grpc::ServerContext* context,
                                           const rpc::StartUploadRequest* request,
                                           rpc::StartUploadResponse* response) {
    (void)context;
    total_requests_++;

    StartUploadRequest start;
    start.client_id = request->client_id();
    start.timestamp = request->timestamp();
    start.signature_base64 = request->signature_base64();
    start.original_name = request->original_name();
    start.total_chunks = request->total_chunks();
    start.file_sha256 = request->file_sha256();
    start.purpose = request->purpose();
    start.uploader_id = request->uploader_id();
    start.file_size = request->file_size() > 0 ? request->file_size() : -1;

    StartUploadResponse result;
    Status status = coordinator_.startUpload(start, result);
    if (!status.ok()) {
        return toGrpcStatus(status);
    }

    response->set_upload_id(result.upload_id);
    return grpc::Status::OK;
}

grpc::Status UploadRpcService::UploadChunk(grpc::ServerContext* context,
                                           const rpc::UploadChunkRequest* request,
                                           rpc::UploadChunkResponse* response) {
    (void)context;
    total_requests_++;

    ChunkRequest chunk;
    chunk.upload_id = request->upload_id();
    chunk.chunk_index = request->chunk_index();
    chunk.chunk_sha256 = request->chunk_sha256();
    chunk.chunk_data_base64 = request->chunk_data_base64();

    ChunkResponse result;
    Status status = coordinator_.receiveChunk(chunk, result);
    if (!status.ok()) {
        return toGrpcStatus(status);
    }

    response->set_received_index(result.received_index);
    return grpc::Status::OK;
}

grpc::Status UploadRpcService::CompleteUpload(grpc::ServerContext* context,
                                              const rpc::CompleteUploadRequest* request,
                                              rpc::CompleteUploadResponse* response) {
    total_requests_++;

    CompleteRequest complete;
    complete.upload_id = request->upload_id();

    CompleteResponse result;
    Status status = coordinator_.completeUpload(complete, result);
    if (!status.ok()) {
        if (!result.missing.empty()) {
            std::vector<std::string> indices;
            for (int64_t index : result.missing) {
                indices.push_back(std::to_string(index));
                response->add_missing(index);
            }
            context->AddTrailingMetadata(kMissingChunksMetadata, Utils::joinStrings(indices, ","));
        }
        return toGrpcStatus(status);
    }

    response->set_verified(result.verified);
    response->set_url(result.url);
    rpc::StoredArtifact* file = response->mutable_file();
    file->set_relative_path(result.file.relative_path);
    file->set_mime(result.file.mime);
    file->set_size(result.file.size);
    file->set_original_name(result.file.original_name);
    return grpc::Status::OK;
}

UploadRpcServer::UploadRpcServer(SessionCoordinator& coordinator)
    : service_(coordinator), bound_port_(0) {
}

UploadRpcServer::~UploadRpcServer() {
    stop();
}

bool UploadRpcServer::start(const std::string& address, int port, int64_t max_message_bytes) {
    std::string server_address = address + ":" + std::to_string(port);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials(), &bound_port_);
    builder.RegisterService(&service_);

    // Capped to what grpc accepts as an int
    int max_bytes = static_cast<int>(std::min<int64_t>(max_message_bytes, 256LL * 1024 * 1024));
    builder.SetMaxReceiveMessageSize(max_bytes);
    builder.SetMaxSendMessageSize(max_bytes);

    server_ = builder.BuildAndStart();
    if (!server_) {
        Utils::logError("Failed to start gRPC server on " + server_address);
        return false;
    }

    Utils::logInfo("gRPC UploadService started on " + address + ":" + std::to_string(bound_port_));
    return true;
}

void UploadRpcServer::stop() {
    if (server_) {
        server_->Shutdown();
        server_.reset();
        Utils::logInfo("gRPC UploadService stopped");
    }
}

} // namespace chunkpost
