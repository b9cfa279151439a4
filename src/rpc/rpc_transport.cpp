#include "rpc_transport.h"
#include "rpc_status.h"
#include "utils.h"
#include <chrono>

namespace chunkpost {

namespace {

std::shared_ptr<grpc::Channel> makeChannel(const std::string& target) {
    grpc::ChannelArguments args;
    args.SetMaxSendMessageSize(64 * 1024 * 1024);
    args.SetMaxReceiveMessageSize(64 * 1024 * 1024);
    return grpc::CreateCustomChannel(target, grpc::InsecureChannelCredentials(), args);
}

// "3,7,9" from the trailing metadata of an incomplete upload
void readMissingFromTrailers(const grpc::ClientContext& context, std::vector<int64_t>& missing) {
    const auto& trailers = context.GetServerTrailingMetadata();
    auto it = trailers.find(kMissingChunksMetadata);
    if (it == trailers.end()) {
        return;
    }
    std::string value(it->second.data(), it->second.size());
    for (const auto& token : Utils::splitString(value, ',')) {
        std::string trimmed = Utils::trim(token);
        if (trimmed.empty()) {
            continue;
        }
        try {
            missing.push_back(std::stoll(trimmed));
        } catch (const std::exception& e) {
            Utils::logWarning("Ignoring malformed missing index '" + trimmed + "': " + e.what());
        }
    }
}

} // namespace

RpcTransport::RpcTransport(const std::string& target)
    : RpcTransport(makeChannel(target)) {
}

RpcTransport::RpcTransport(std::shared_ptr<grpc::Channel> channel)
    : stub_(rpc::UploadService::NewStub(channel)) {
}

void RpcTransport::setDeadline(grpc::ClientContext& context, int timeout_ms) {
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms));
}

Status RpcTransport::startUpload(const StartUploadRequest& request, StartUploadResponse& response,
                                 int timeout_ms) {
    rpc::StartUploadRequest rpc_request;
    rpc_request.set_client_id(request.client_id);
    rpc_request.set_timestamp(request.timestamp);
    rpc_request.set_signature_base64(request.signature_base64);
    rpc_request.set_original_name(request.original_name);
    rpc_request.set_total_chunks(request.total_chunks);
    rpc_request.set_file_sha256(request.file_sha256);
    rpc_request.set_purpose(request.purpose);
    rpc_request.set_uploader_id(request.uploader_id);
    if (request.file_size >= 0) {
        rpc_request.set_file_size(request.file_size);
    }

    rpc::StartUploadResponse rpc_response;
    grpc::ClientContext context;
    setDeadline(context, timeout_ms);

    grpc::Status status = stub_->StartUpload(&context, rpc_request, &rpc_response);
    if (!status.ok()) {
        return fromGrpcStatus(status);
    }
    if (rpc_response.upload_id().empty()) {
        return Status(ErrorCode::kTransportError, "StartUpload returned no uploadId");
    }
    response.upload_id = rpc_response.upload_id();
    return Status::OK();
}

Status RpcTransport::sendChunk(const ChunkRequest& request, ChunkResponse& response, int timeout_ms) {
    rpc::UploadChunkRequest rpc_request;
    rpc_request.set_upload_id(request.upload_id);
    rpc_request.set_chunk_index(request.chunk_index);
    rpc_request.set_chunk_sha256(request.chunk_sha256);
    rpc_request.set_chunk_data_base64(request.chunk_data_base64);

    rpc::UploadChunkResponse rpc_response;
    grpc::ClientContext context;
    setDeadline(context, timeout_ms);

    grpc::Status status = stub_->UploadChunk(&context, rpc_request, &rpc_response);
    if (!status.ok()) {
        return fromGrpcStatus(status);
    }
    response.received_index = rpc_response.received_index();
    return Status::OK();
}

Status RpcTransport::completeUpload(const CompleteRequest& request, CompleteResponse& response,
                                    int timeout_ms) {
    rpc::CompleteUploadRequest rpc_request;
    rpc_request.set_upload_id(request.upload_id);

    rpc::CompleteUploadResponse rpc_response;
    grpc::ClientContext context;
    setDeadline(context, timeout_ms);

    grpc::Status status = stub_->CompleteUpload(&context, rpc_request, &rpc_response);
    if (!status.ok()) {
        Status result = fromGrpcStatus(status);
        if (result.code() == ErrorCode::kIncompleteUpload) {
            readMissingFromTrailers(context, response.missing);
        }
        return result;
    }

    response.verified = rpc_response.verified();
    response.url = rpc_response.url();
    response.file.relative_path = rpc_response.file().relative_path();
    response.file.mime = rpc_response.file().mime();
    response.file.size = rpc_response.file().size();
    response.file.original_name = rpc_response.file().original_name();
    return Status::OK();
}

} // namespace chunkpost
