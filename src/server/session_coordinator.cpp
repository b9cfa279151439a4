#include "session_coordinator.h"

namespace chunkpost {

namespace {

const char* const kUnknownUpload = "Unknown uploadId";

} // namespace

SessionCoordinator::SessionCoordinator(const ClientRegistry& registry,
                                       UploadSessionTable& sessions,
                                       StoragePublisher& publisher,
                                       MetadataStore* metadata_store,
                                       UploadMetrics& metrics,
                                       CoordinatorOptions options)
    : registry_(registry),
      sessions_(sessions),
      publisher_(publisher),
      metadata_store_(metadata_store),
      metrics_(metrics),
      options_(std::move(options)) {
}

std::string SessionCoordinator::publicUrl(const std::string& relative_path) const {
    std::string prefix = options_.public_url_prefix;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + "/" + relative_path;
}

Status SessionCoordinator::startUpload(const StartUploadRequest& request, StartUploadResponse& response) {
    if (request.client_id.empty() || request.timestamp.empty() || request.signature_base64.empty() ||
        request.original_name.empty() || request.file_sha256.empty()) {
        return Status(ErrorCode::kBadRequest, "Missing required fields");
    }
    if (request.total_chunks < 1 || request.total_chunks > options_.max_total_chunks) {
        return Status(ErrorCode::kBadRequest, "Invalid totalChunks");
    }

    std::string file_sha256 = Utils::toLower(request.file_sha256);
    if (!Utils::isSha256Hex(file_sha256)) {
        return Status(ErrorCode::kBadRequest, "Invalid fileSha256");
    }
    if (request.file_size > options_.max_upload_bytes) {
        return Status(ErrorCode::kPayloadTooLarge, "File too large");
    }

    if (!registry_.hasClient(request.client_id)) {
        return Status(ErrorCode::kUnauthorized, "Unknown client");
    }
    if (!registry_.verifyUploadSignature(request.client_id, request.timestamp,
                                         request.original_name, request.signature_base64)) {
        Utils::logWarning("Rejected upload start from " + request.client_id + ": invalid signature");
        return Status(ErrorCode::kUnauthorized, "Invalid signature");
    }

    auto session = std::make_shared<UploadSession>();
    session->upload_id = Utils::generateUploadId();
    session->client_id = request.client_id;
    session->original_name = request.original_name;
    session->total_chunks = request.total_chunks;
    session->file_sha256 = file_sha256;
    session->purpose = parsePurpose(request.purpose);
    session->uploader_id = request.uploader_id;
    session->chunk_slots.resize(static_cast<size_t>(request.total_chunks));
    session->slot_digests.resize(static_cast<size_t>(request.total_chunks));

    if (!sessions_.insert(session)) {
        return Status(ErrorCode::kStorageError, "Upload id collision");
    }

    metrics_.incrementSessionsStarted();
    Utils::logInfo("Upload " + session->upload_id + " opened: " + request.original_name + ", " +
                   std::to_string(request.total_chunks) + " chunk(s), client " + request.client_id);

    response.upload_id = session->upload_id;
    return Status::OK();
}

Status SessionCoordinator::receiveChunk(const ChunkRequest& request, ChunkResponse& response) {
    if (request.upload_id.empty() || request.chunk_sha256.empty() || request.chunk_data_base64.empty()) {
        return Status(ErrorCode::kBadRequest, "Missing required fields");
    }

    auto session = sessions_.find(request.upload_id);
    if (!session) {
        return Status(ErrorCode::kUnknownSession, kUnknownUpload);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed.load()) {
        return Status(ErrorCode::kUnknownSession, kUnknownUpload);
    }

    if (request.chunk_index < 0 || request.chunk_index >= session->total_chunks) {
        return Status(ErrorCode::kBadRequest, "Invalid chunkIndex");
    }

    std::string expected = Utils::toLower(request.chunk_sha256);
    std::string actual = Utils::calculateSHA256(request.chunk_data_base64);
    if (actual != expected) {
        metrics_.incrementChunkIntegrityFailures();
        Utils::logWarning("Upload " + session->upload_id + " chunk " + std::to_string(request.chunk_index) +
                          " checksum mismatch (expected: " + expected + ", actual: " + actual + ")");
        return Status(ErrorCode::kIntegrityError, "Chunk checksum mismatch");
    }

    size_t slot = static_cast<size_t>(request.chunk_index);
    if (session->slotFilled(request.chunk_index)) {
        if (session->slot_digests[slot] != actual) {
            Utils::logWarning("Upload " + session->upload_id + " chunk " + std::to_string(request.chunk_index) +
                              " re-sent with a different checksum");
            return Status(ErrorCode::kConflict, "Chunk already received with a different checksum");
        }
        metrics_.incrementDuplicateChunks();
        sessions_.touch(*session);
        Utils::logDebug("Upload " + session->upload_id + " duplicate chunk " + std::to_string(request.chunk_index));
        response.received_index = request.chunk_index;
        return Status::OK();
    }

    int64_t limit = static_cast<int64_t>(Utils::base64EncodedLength(static_cast<size_t>(options_.max_upload_bytes)));
    int64_t incoming = static_cast<int64_t>(request.chunk_data_base64.size());
    if (session->received_base64_bytes + incoming > limit) {
        return Status(ErrorCode::kPayloadTooLarge, "File too large");
    }

    session->chunk_slots[slot] = request.chunk_data_base64;
    session->slot_digests[slot] = actual;
    session->received_base64_bytes += incoming;
    sessions_.touch(*session);
    metrics_.incrementChunksAccepted();

    Utils::logDebug("Upload " + session->upload_id + " received chunk " + std::to_string(request.chunk_index) +
                    "/" + std::to_string(session->total_chunks));

    response.received_index = request.chunk_index;
    return Status::OK();
}

Status SessionCoordinator::completeUpload(const CompleteRequest& request, CompleteResponse& response) {
    if (request.upload_id.empty()) {
        return Status(ErrorCode::kBadRequest, "Missing required fields");
    }

    auto session = sessions_.find(request.upload_id);
    if (!session) {
        return Status(ErrorCode::kUnknownSession, kUnknownUpload);
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed.load()) {
        return Status(ErrorCode::kUnknownSession, kUnknownUpload);
    }

    std::vector<int64_t> missing = session->missingSlots();
    if (!missing.empty()) {
        Utils::logInfo("Upload " + session->upload_id + " completion refused: " +
                       std::to_string(missing.size()) + " chunk(s) missing");
        response.missing = missing;
        return Status(ErrorCode::kIncompleteUpload, "Missing chunks");
    }

    // From here on the session is terminal whatever the outcome
    sessions_.erase(session->upload_id);

    std::string digest = Utils::calculateSHA256(session->chunk_slots);
    if (digest != session->file_sha256) {
        metrics_.incrementFinalDigestFailures();
        Utils::logWarning("Upload " + session->upload_id + " final checksum mismatch (expected: " +
                          session->file_sha256 + ", actual: " + digest + ")");
        return Status(ErrorCode::kIntegrityError, "Final checksum mismatch");
    }

    std::string joined;
    joined.reserve(static_cast<size_t>(session->received_base64_bytes));
    for (auto& piece : session->chunk_slots) {
        joined += piece;
        std::string().swap(piece);
    }

    std::string bytes;
    if (!Utils::base64Decode(joined, bytes)) {
        Utils::logWarning("Upload " + session->upload_id + " payload is not valid base64");
        return Status(ErrorCode::kBadRequest, "Invalid base64 payload");
    }
    std::string().swap(joined);

    PublishContext context;
    context.purpose = session->purpose;
    context.owner_id = session->uploader_id;
    context.original_name = session->original_name;

    StoredArtifact artifact;
    Status published = publishAndRecord(context, bytes, artifact);
    if (!published.ok()) {
        Utils::logError("Upload " + session->upload_id + " failed to publish: " + published.toString());
        return published;
    }

    Utils::logInfo("Upload " + session->upload_id + " completed: " + artifact.relative_path);

    response.verified = true;
    response.file = artifact;
    response.url = publicUrl(artifact.relative_path);
    response.missing.clear();
    return Status::OK();
}

Status SessionCoordinator::uploadWhole(const SingleShotUpload& upload, CompleteResponse& response) {
    if (upload.client_id.empty() || upload.timestamp.empty() || upload.signature_base64.empty()) {
        return Status(ErrorCode::kBadRequest, "Missing auth fields");
    }
    if (upload.original_name.empty()) {
        return Status(ErrorCode::kBadRequest, "No file uploaded");
    }
    if (static_cast<int64_t>(upload.bytes.size()) > options_.max_upload_bytes) {
        return Status(ErrorCode::kPayloadTooLarge, "File too large");
    }

    if (!registry_.verifyUploadSignature(upload.client_id, upload.timestamp,
                                         upload.original_name, upload.signature_base64)) {
        Utils::logWarning("Rejected single-shot upload from " + upload.client_id + ": invalid signature");
        return Status(ErrorCode::kUnauthorized, "Invalid signature");
    }

    bool verified = false;
    if (!upload.file_sha256.empty()) {
        std::string actual = Utils::calculateSHA256(Utils::base64Encode(upload.bytes));
        if (actual != Utils::toLower(upload.file_sha256)) {
            metrics_.incrementFinalDigestFailures();
            Utils::logWarning("Single-shot upload " + upload.original_name + " checksum mismatch (expected: " +
                              upload.file_sha256 + ", actual: " + actual + ")");
            return Status(ErrorCode::kIntegrityError, "Final checksum mismatch");
        }
        verified = true;
    }

    PublishContext context;
    context.purpose = parsePurpose(upload.purpose);
    context.owner_id = upload.uploader_id;
    context.original_name = upload.original_name;

    StoredArtifact artifact;
    Status published = publishAndRecord(context, upload.bytes, artifact);
    if (!published.ok()) {
        return published;
    }

    Utils::logInfo("Single-shot upload from " + upload.client_id + " stored at " + artifact.relative_path);

    response.verified = verified;
    response.file = artifact;
    response.url = publicUrl(artifact.relative_path);
    return Status::OK();
}

Status SessionCoordinator::uploadAvatar(const AvatarUpload& upload, AvatarResult& result) {
    if (!metadata_store_) {
        return Status(ErrorCode::kConfigError, "Avatar uploads are not configured");
    }
    if (upload.bearer_token.empty()) {
        return Status(ErrorCode::kUnauthorized, "Missing token");
    }

    auto caller = metadata_store_->findUserByToken(upload.bearer_token);
    if (!caller) {
        return Status(ErrorCode::kUnauthorized, "Invalid token");
    }
    if (upload.user_id.empty() || upload.original_name.empty()) {
        return Status(ErrorCode::kBadRequest, "Missing avatar or userId");
    }
    if (caller->id != upload.user_id) {
        return Status(ErrorCode::kUnauthorized, "Token does not match user");
    }
    if (!metadata_store_->userExists(upload.user_id)) {
        return Status(ErrorCode::kNotFound, "User not found");
    }
    if (static_cast<int64_t>(upload.bytes.size()) > options_.max_upload_bytes) {
        return Status(ErrorCode::kPayloadTooLarge, "File too large");
    }

    PublishContext context;
    context.purpose = Purpose::kAvatar;
    context.owner_id = upload.user_id;
    context.original_name = upload.original_name;

    StoredArtifact artifact;
    Status published = publisher_.publish(context, upload.bytes, artifact);
    if (!published.ok()) {
        return published;
    }

    std::string previous_path;
    Status recorded = metadata_store_->setAvatar(upload.user_id, artifact.relative_path,
                                                 artifact.mime, artifact.size, previous_path);
    if (!recorded.ok()) {
        Status removed = publisher_.remove(artifact.relative_path);
        if (!removed.ok()) {
            Utils::logWarning("Could not remove unrecorded avatar " + artifact.relative_path + ": " +
                              removed.toString());
        }
        return recorded;
    }

    if (!previous_path.empty() && previous_path != artifact.relative_path) {
        Status removed = publisher_.remove(previous_path);
        if (!removed.ok()) {
            Utils::logWarning("Could not delete previous avatar " + previous_path + ": " + removed.toString());
        }
    }

    metrics_.incrementUploadsCompleted();
    metrics_.addBytesPublished(artifact.size);

    result.avatar_path = artifact.relative_path;
    result.url = publicUrl(artifact.relative_path);
    return Status::OK();
}

Status SessionCoordinator::publishAndRecord(const PublishContext& context,
                                            const std::string& bytes,
                                            StoredArtifact& artifact) {
    Status published = publisher_.publish(context, bytes, artifact);
    if (!published.ok()) {
        return published;
    }

    metrics_.incrementUploadsCompleted();
    metrics_.addBytesPublished(artifact.size);

    if (metadata_store_) {
        MediaRecord record;
        record.storage_path = artifact.relative_path;
        record.owner_user_id = context.owner_id;
        record.kind = purposeName(context.purpose);
        record.mime_type = artifact.mime;
        record.file_size = artifact.size;
        Status recorded = metadata_store_->recordMedia(record);
        if (!recorded.ok()) {
            // The artifact is already public; the media index is secondary
            Utils::logError("Failed to record media row for " + artifact.relative_path + ": " +
                            recorded.toString());
        }
    }
    return Status::OK();
}

} // namespace chunkpost
