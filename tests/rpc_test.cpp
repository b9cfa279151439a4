#include "server_fixture.h"
#include "../src/client/uploader.h"
#include "../src/rpc/rpc_status.h"
#include "../src/rpc/rpc_transport.h"
#include "../src/rpc/upload_rpc_service.h"

namespace chunkpost {
namespace test {

class RpcTest : public CoordinatorTestBase {
protected:
    void SetUp() override {
        CoordinatorTestBase::SetUp();
        server_ = std::make_unique<UploadRpcServer>(*coordinator_);
        ASSERT_TRUE(server_->start("127.0.0.1", 0, 16 * 1024 * 1024));
        ASSERT_GT(server_->boundPort(), 0);
        transport_ = std::make_unique<RpcTransport>("127.0.0.1:" + std::to_string(server_->boundPort()));
    }

    void TearDown() override {
        transport_.reset();
        server_.reset();
        CoordinatorTestBase::TearDown();
    }

    std::unique_ptr<UploadRpcServer> server_;
    std::unique_ptr<RpcTransport> transport_;
};

TEST_F(RpcTest, UploaderOverGrpc) {
    NetworkState state;
    state.link = LinkClass::kEthernet;
    StaticNetworkProbe probe(state);
    Uploader uploader(*transport_, *signer_, probe, UploaderOptions(), [](int) {});

    std::string bytes = generateRandomData(900 * 1024);
    UploadPlan plan = ConcurrencyPlanner::plan(state, NetworkPreference::kAny);
    FileOutcome outcome = uploader.uploadBytes("rpc.png", bytes, plan);

    ASSERT_STATUS_OK(outcome.status);
    EXPECT_GT(outcome.total_chunks, 1);
    EXPECT_TRUE(outcome.response.verified);
    EXPECT_EQ(outcome.response.file.mime, "image/png");
    EXPECT_EQ(readArtifact(outcome.response.file.relative_path), bytes);
}

TEST_F(RpcTest, ErrorsKeepTheirCodes) {
    ChunkRequest chunk;
    chunk.upload_id = "missing";
    chunk.chunk_index = 0;
    chunk.chunk_data_base64 = "QUJD";
    chunk.chunk_sha256 = Utils::calculateSHA256(chunk.chunk_data_base64);
    ChunkResponse chunk_response;
    Status status = transport_->sendChunk(chunk, chunk_response, 5000);
    EXPECT_EQ(status.code(), ErrorCode::kUnknownSession);
    EXPECT_EQ(status.message(), "Unknown uploadId");

    auto chunks = splitBase64(Utils::base64Encode(generateRandomData(600)), 3);
    std::string upload_id = startUpload("a.jpg", chunks);
    ASSERT_STATUS_OK(sendChunk(upload_id, 1, chunks[1]));

    CompleteRequest complete;
    complete.upload_id = upload_id;
    CompleteResponse response;
    status = transport_->completeUpload(complete, response, 5000);
    EXPECT_EQ(status.code(), ErrorCode::kIncompleteUpload);
    EXPECT_EQ(response.missing, (std::vector<int64_t>{0, 2}));
}

TEST_F(RpcTest, UnreachableTargetIsRetryable) {
    int port = server_->boundPort();
    server_->stop();

    RpcTransport transport("127.0.0.1:" + std::to_string(port));
    CompleteRequest complete;
    complete.upload_id = "x";
    CompleteResponse response;
    Status status = transport.completeUpload(complete, response, 1000);
    EXPECT_TRUE(WorkerPool::isRetryable(status)) << status.toString();
}

TEST(RpcStatusTest, MapsTaxonomyBothWays) {
    grpc::Status unauthenticated = toGrpcStatus(Status(ErrorCode::kUnauthorized, "Invalid signature"));
    EXPECT_EQ(unauthenticated.error_code(), grpc::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(fromGrpcStatus(unauthenticated).code(), ErrorCode::kUnauthorized);

    grpc::Status conflict = toGrpcStatus(Status(ErrorCode::kConflict, "Chunk already received"));
    EXPECT_EQ(conflict.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(fromGrpcStatus(conflict).code(), ErrorCode::kConflict);

    EXPECT_EQ(toGrpcStatus(Status(ErrorCode::kPayloadTooLarge, "")).error_code(),
              grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(toGrpcStatus(Status(ErrorCode::kIncompleteUpload, "")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_TRUE(toGrpcStatus(Status::OK()).ok());

    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "slow")).code(), ErrorCode::kTimeout);
    EXPECT_EQ(fromGrpcStatus(grpc::Status(grpc::StatusCode::UNAVAILABLE, "down")).code(),
              ErrorCode::kTransportError);
}

} // namespace test
} // namespace chunkpost
