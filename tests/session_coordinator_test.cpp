#include "server_fixture.h"

namespace chunkpost {
namespace test {

class SessionCoordinatorTest : public CoordinatorTestBase {};

TEST_F(SessionCoordinatorTest, SingleChunkHappyPath) {
    std::string bytes("Hi!\n");
    std::string base64 = Utils::base64Encode(bytes);
    ASSERT_EQ(base64, "SGkhCg==");

    std::string upload_id = startUpload("note", {base64});
    ASSERT_FALSE(upload_id.empty());
    EXPECT_EQ(sessions_->size(), 1u);

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, base64));

    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_TRUE(response.verified);
    EXPECT_EQ(response.file.size, 4);
    EXPECT_EQ(response.file.mime, "image/jpeg");
    EXPECT_EQ(response.file.original_name, "note");
    EXPECT_EQ(response.url, "/uploads/" + response.file.relative_path);
    EXPECT_EQ(readArtifact(response.file.relative_path), bytes);

    EXPECT_EQ(sessions_->size(), 0u);
    EXPECT_EQ(metrics_.getSessionsStarted(), 1);
    EXPECT_EQ(metrics_.getUploadsCompleted(), 1);
    EXPECT_EQ(metrics_.getBytesPublished(), 4);
}

TEST_F(SessionCoordinatorTest, OutOfOrderDelivery) {
    std::string bytes = generateRandomData(3000);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 3);
    ASSERT_EQ(chunks.size(), 3u);

    std::string upload_id = startUpload("photo.png", chunks);
    ASSERT_STATUS_OK(sendChunk(upload_id, 2, chunks[2]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));

    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_EQ(response.file.mime, "image/png");
    EXPECT_EQ(readArtifact(response.file.relative_path), bytes);
}

TEST_F(SessionCoordinatorTest, CorruptChunkCanBeResent) {
    std::string bytes = generateRandomData(900);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 3);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_CODE(sendChunk(upload_id, 1, chunks[1], Utils::calculateSHA256("something else")),
                       ErrorCode::kIntegrityError);
    EXPECT_EQ(metrics_.getChunkIntegrityFailures(), 1);

    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 2, chunks[2]));

    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_EQ(readArtifact(response.file.relative_path), bytes);
}

TEST_F(SessionCoordinatorTest, DuplicateChunkIsNoOp) {
    std::string bytes = generateRandomData(900);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 3);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_OK(sendChunk(upload_id, 2, chunks[2]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 2, chunks[2]));
    EXPECT_EQ(metrics_.getChunksAccepted(), 1);
    EXPECT_EQ(metrics_.getDuplicateChunks(), 1);

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));
    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_EQ(readArtifact(response.file.relative_path), bytes);
}

TEST_F(SessionCoordinatorTest, ConflictingRewriteKeepsFirstWrite) {
    std::string bytes = generateRandomData(600);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 2);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_CODE(sendChunk(upload_id, 0, chunks[1]), ErrorCode::kConflict);

    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));
    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_EQ(readArtifact(response.file.relative_path), bytes);
}

TEST_F(SessionCoordinatorTest, FinalDigestMismatchClosesSession) {
    std::string bytes = generateRandomData(600);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 2);

    StartUploadRequest start = signedStart("a.jpg", 2, Utils::calculateSHA256("tampered"));
    StartUploadResponse started;
    ASSERT_STATUS_OK(coordinator_->startUpload(start, started));

    ASSERT_STATUS_OK(sendChunk(started.upload_id, 0, chunks[0]));
    ASSERT_STATUS_OK(sendChunk(started.upload_id, 1, chunks[1]));

    CompleteResponse response;
    ASSERT_STATUS_CODE(complete(started.upload_id, response), ErrorCode::kIntegrityError);
    EXPECT_FALSE(response.verified);
    EXPECT_EQ(metrics_.getFinalDigestFailures(), 1);

    ASSERT_STATUS_CODE(complete(started.upload_id, response), ErrorCode::kUnknownSession);
    ASSERT_STATUS_CODE(sendChunk(started.upload_id, 0, chunks[0]), ErrorCode::kUnknownSession);
}

TEST_F(SessionCoordinatorTest, IncompleteUploadListsMissingAndKeepsSession) {
    std::string bytes = generateRandomData(1200);
    auto chunks = splitBase64(Utils::base64Encode(bytes), 4);
    ASSERT_EQ(chunks.size(), 4u);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 2, chunks[2]));

    CompleteResponse response;
    ASSERT_STATUS_CODE(complete(upload_id, response), ErrorCode::kIncompleteUpload);
    EXPECT_EQ(response.missing, (std::vector<int64_t>{0, 3}));

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_OK(sendChunk(upload_id, 3, chunks[3]));
    CompleteResponse done;
    ASSERT_STATUS_OK(complete(upload_id, done));
    EXPECT_TRUE(done.missing.empty());
}

TEST_F(SessionCoordinatorTest, CompletionIsOneShot) {
    std::string base64 = Utils::base64Encode("abc");
    std::string upload_id = startUpload("a.jpg", {base64});
    ASSERT_STATUS_OK(sendChunk(upload_id, 0, base64));

    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    ASSERT_STATUS_CODE(complete(upload_id, response), ErrorCode::kUnknownSession);
    ASSERT_STATUS_CODE(sendChunk(upload_id, 0, base64), ErrorCode::kUnknownSession);
}

TEST_F(SessionCoordinatorTest, EvictedSessionIsUnknown) {
    std::string base64 = Utils::base64Encode("abc");
    std::string upload_id = startUpload("a.jpg", {base64});

    clock_.advance(kTtlMs + 1);
    EXPECT_EQ(sessions_->sweepExpired(), 1u);

    ASSERT_STATUS_CODE(sendChunk(upload_id, 0, base64), ErrorCode::kUnknownSession);
    CompleteResponse response;
    ASSERT_STATUS_CODE(complete(upload_id, response), ErrorCode::kUnknownSession);
}

TEST_F(SessionCoordinatorTest, StartValidation) {
    StartUploadResponse response;
    std::string digest = Utils::calculateSHA256("x");

    StartUploadRequest empty_name = signedStart("", 1, digest);
    ASSERT_STATUS_CODE(coordinator_->startUpload(empty_name, response), ErrorCode::kBadRequest);

    ASSERT_STATUS_CODE(coordinator_->startUpload(signedStart("a.jpg", 0, digest), response),
                       ErrorCode::kBadRequest);
    ASSERT_STATUS_CODE(coordinator_->startUpload(signedStart("a.jpg", MAX_TOTAL_CHUNKS + 1, digest), response),
                       ErrorCode::kBadRequest);
    ASSERT_STATUS_CODE(coordinator_->startUpload(signedStart("a.jpg", 1, "not-a-digest"), response),
                       ErrorCode::kBadRequest);
    ASSERT_STATUS_OK(coordinator_->startUpload(signedStart("a.jpg", MAX_TOTAL_CHUNKS, digest), response));

    StartUploadRequest too_big = signedStart("a.jpg", 1, digest);
    too_big.file_size = MAX_UPLOAD_BYTES + 1;
    ASSERT_STATUS_CODE(coordinator_->startUpload(too_big, response), ErrorCode::kPayloadTooLarge);

    EXPECT_EQ(sessions_->size(), 1u);
}

TEST_F(SessionCoordinatorTest, StartRejectsBadSignatures) {
    StartUploadResponse response;
    std::string digest = Utils::calculateSHA256("x");

    StartUploadRequest renamed = signedStart("a.jpg", 1, digest);
    renamed.original_name = "b.jpg";
    ASSERT_STATUS_CODE(coordinator_->startUpload(renamed, response), ErrorCode::kUnauthorized);

    StartUploadRequest unknown = signedStart("a.jpg", 1, digest);
    unknown.client_id = "someone-else";
    ASSERT_STATUS_CODE(coordinator_->startUpload(unknown, response), ErrorCode::kUnauthorized);

    EXPECT_EQ(sessions_->size(), 0u);
}

TEST_F(SessionCoordinatorTest, ChunkIndexBounds) {
    std::string base64 = Utils::base64Encode("abcdef");
    auto chunks = splitBase64(base64, 2);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_CODE(sendChunk(upload_id, 2, chunks[0]), ErrorCode::kBadRequest);
    ASSERT_STATUS_CODE(sendChunk(upload_id, -1, chunks[0]), ErrorCode::kBadRequest);
    ASSERT_STATUS_CODE(sendChunk("no-such-upload", 0, chunks[0]), ErrorCode::kUnknownSession);
    ASSERT_STATUS_CODE(sendChunk(upload_id, 0, ""), ErrorCode::kBadRequest);
}

TEST_F(SessionCoordinatorTest, ChunkBytesAreCapped) {
    options_.max_upload_bytes = 6;
    coordinator_ = std::make_unique<SessionCoordinator>(registry_, *sessions_, *publisher_,
                                                        metadata_.get(), metrics_, options_);

    std::string base64 = Utils::base64Encode("0123456789");
    auto chunks = splitBase64(base64, 2);
    std::string upload_id = startUpload("a.jpg", chunks);

    ASSERT_STATUS_OK(sendChunk(upload_id, 0, chunks[0]));
    ASSERT_STATUS_CODE(sendChunk(upload_id, 1, chunks[1]), ErrorCode::kPayloadTooLarge);
}

TEST_F(SessionCoordinatorTest, ChatUploadsArePartitionedAndRecorded) {
    std::string base64 = Utils::base64Encode("chat image");
    std::string upload_id = startUpload("pic.webp", {base64}, "chat", "u2");
    ASSERT_STATUS_OK(sendChunk(upload_id, 0, base64));

    CompleteResponse response;
    ASSERT_STATUS_OK(complete(upload_id, response));
    EXPECT_EQ(response.file.relative_path.rfind("chat/u2/", 0), 0u);
    EXPECT_EQ(response.file.mime, "image/webp");

    auto media = metadata_->listMedia();
    ASSERT_EQ(media.size(), 1u);
    EXPECT_EQ(media[0].kind, "chat");
    EXPECT_EQ(media[0].owner_user_id, "u2");
    EXPECT_EQ(media[0].storage_path, response.file.relative_path);
}

TEST_F(SessionCoordinatorTest, SingleShotUpload) {
    SingleShotUpload upload;
    upload.client_id = kClientId;
    upload.timestamp = "1700000000000";
    upload.original_name = "whole.gif";
    upload.bytes = generateRandomData(256);
    ASSERT_STATUS_OK(signer_->sign(upload.timestamp, upload.original_name, upload.signature_base64));

    CompleteResponse unverified;
    ASSERT_STATUS_OK(coordinator_->uploadWhole(upload, unverified));
    EXPECT_FALSE(unverified.verified);
    EXPECT_EQ(unverified.file.mime, "image/gif");
    EXPECT_EQ(readArtifact(unverified.file.relative_path), upload.bytes);

    upload.file_sha256 = Utils::calculateSHA256(Utils::base64Encode(upload.bytes));
    CompleteResponse verified;
    ASSERT_STATUS_OK(coordinator_->uploadWhole(upload, verified));
    EXPECT_TRUE(verified.verified);

    upload.file_sha256 = Utils::calculateSHA256(upload.bytes);
    CompleteResponse rejected;
    ASSERT_STATUS_CODE(coordinator_->uploadWhole(upload, rejected), ErrorCode::kIntegrityError);
}

TEST_F(SessionCoordinatorTest, SingleShotRejectedBeforeTouchingDisk) {
    SingleShotUpload upload;
    upload.client_id = kClientId;
    upload.timestamp = "1700000000000";
    upload.original_name = "whole.jpg";
    upload.bytes = "data";
    upload.signature_base64 = Utils::base64Encode(std::string(64, 'x'));

    CompleteResponse response;
    ASSERT_STATUS_CODE(coordinator_->uploadWhole(upload, response), ErrorCode::kUnauthorized);

    upload.original_name.clear();
    ASSERT_STATUS_CODE(coordinator_->uploadWhole(upload, response), ErrorCode::kBadRequest);

    size_t entries = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(publisher_->rootDirectory())) {
        if (entry.is_regular_file()) entries++;
    }
    EXPECT_EQ(entries, 0u);
}

TEST_F(SessionCoordinatorTest, AvatarReplacesPreviousFile) {
    AvatarUpload upload;
    upload.bearer_token = "token-u1";
    upload.user_id = "u1";
    upload.original_name = "me.png";
    upload.bytes = "first";

    AvatarResult first;
    ASSERT_STATUS_OK(coordinator_->uploadAvatar(upload, first));
    EXPECT_EQ(first.avatar_path.rfind("avatars/u1/avatar-", 0), 0u);
    EXPECT_EQ(first.url, "/uploads/" + first.avatar_path);

    upload.bytes = "second";
    AvatarResult second;
    ASSERT_STATUS_OK(coordinator_->uploadAvatar(upload, second));
    EXPECT_NE(first.avatar_path, second.avatar_path);
    EXPECT_EQ(metadata_->getUser("u1")->avatar_path, second.avatar_path);

    std::string absolute;
    ASSERT_STATUS_CODE(publisher_->resolve(first.avatar_path, absolute), ErrorCode::kNotFound);
    EXPECT_EQ(readArtifact(second.avatar_path), "second");
}

TEST_F(SessionCoordinatorTest, AvatarAuthorization) {
    AvatarUpload upload;
    upload.user_id = "u1";
    upload.original_name = "me.png";
    upload.bytes = "x";
    AvatarResult result;

    ASSERT_STATUS_CODE(coordinator_->uploadAvatar(upload, result), ErrorCode::kUnauthorized);

    upload.bearer_token = "bogus";
    ASSERT_STATUS_CODE(coordinator_->uploadAvatar(upload, result), ErrorCode::kUnauthorized);

    upload.bearer_token = "token-u2";
    ASSERT_STATUS_CODE(coordinator_->uploadAvatar(upload, result), ErrorCode::kUnauthorized);

    upload.bearer_token = "token-u1";
    upload.original_name.clear();
    ASSERT_STATUS_CODE(coordinator_->uploadAvatar(upload, result), ErrorCode::kBadRequest);
}

TEST_F(SessionCoordinatorTest, PublicUrlTrimsTrailingSlash) {
    options_.public_url_prefix = "https://cdn.example.com/media/";
    SessionCoordinator coordinator(registry_, *sessions_, *publisher_, nullptr, metrics_, options_);
    EXPECT_EQ(coordinator.publicUrl("chat/u1/a.jpg"), "https://cdn.example.com/media/chat/u1/a.jpg");

    AvatarUpload upload;
    AvatarResult result;
    ASSERT_STATUS_CODE(coordinator.uploadAvatar(upload, result), ErrorCode::kConfigError);
}

} // namespace test
} // namespace chunkpost
