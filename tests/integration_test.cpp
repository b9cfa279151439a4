#include "test_framework.h"
#include "../src/common/crypto.h"
#include "../src/client/cli.h"
#include "../src/client/http_transport.h"
#include "../src/client/uploader.h"
#include "../src/server/upload_server.h"
#include <sstream>

namespace chunkpost {
namespace test {

class IntegrationTest : public ChunkpostTestBase {
protected:
    void SetUp() override {
        ChunkpostTestBase::SetUp();

        Ed25519KeyPair keys;
        ASSERT_TRUE(Crypto::generateKeyPair(keys));
        secret_key_base64_ = Utils::base64Encode(keys.secret_key);

        Json::Value registry;
        registry["clients"]["mobile-app"]["publicKeyBase64"] = Utils::base64Encode(keys.public_key);
        std::string clients_file = createTempFile(writeJson(registry), "clients.json");

        std::string error;
        ASSERT_TRUE(config_.set("listen_address", "127.0.0.1", error)) << error;
        ASSERT_TRUE(config_.set("clients_file", clients_file, error)) << error;
        ASSERT_TRUE(config_.set("metadata_file", test_dir_ + "/metadata.json", error)) << error;
        ASSERT_TRUE(config_.set("http_worker_threads", "4", error)) << error;
        config_.setUploadRoot(test_dir_ + "/uploads");
        config_.setHttpPort(0);
        config_.setGrpcPort(0);

        server_ = std::make_unique<UploadServer>(config_);
        ASSERT_STATUS_OK(server_->initialize());
        ASSERT_TRUE(server_->start());
        server_url_ = "http://127.0.0.1:" + std::to_string(server_->httpPort());
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            server_.reset();
        }
        ChunkpostTestBase::TearDown();
    }

    std::string storedBytes(const std::string& relative_path) {
        std::string data;
        EXPECT_TRUE(Utils::readFile(config_.getUploadRoot() + "/" + relative_path, data)) << relative_path;
        return data;
    }

    std::string clientConfigFile() {
        std::stringstream conf;
        conf << "server_url = " << server_url_ << "\n"
             << "client_id = mobile-app\n"
             << "secret_key_base64 = " << secret_key_base64_ << "\n"
             << "retry_delay_ms = 10\n";
        return createTempFile(conf.str(), "client.conf");
    }

    Config config_;
    std::string secret_key_base64_;
    std::unique_ptr<UploadServer> server_;
    std::string server_url_;
};

TEST_F(IntegrationTest, ChunkedUploadOverHttp) {
    HttpTransport transport(server_url_ + "/");
    Signer signer("mobile-app", secret_key_base64_);
    NetworkState state;
    state.link = LinkClass::kCellular;
    state.generation = CellularGeneration::k3G;
    StaticNetworkProbe probe(state);

    UploaderOptions options;
    Uploader uploader(transport, signer, probe, options, [](int) {});

    std::string bytes = generateRandomData(700 * 1024);
    std::string path = createTempFile(bytes, "holiday.heic");
    BatchReport report = uploader.uploadFiles({path});

    ASSERT_EQ(report.success_count, 1) << writeJson(report.toJson());
    const FileOutcome& outcome = report.files[0];
    EXPECT_GT(outcome.total_chunks, 1);
    EXPECT_TRUE(outcome.response.verified);
    // No converter configured: HEIC bytes are kept as they are
    EXPECT_EQ(outcome.response.file.mime, "image/heic");
    EXPECT_EQ(storedBytes(outcome.response.file.relative_path), bytes);
    EXPECT_EQ(transport.requestCount(), 2 + outcome.total_chunks);

    EXPECT_EQ(server_->metrics().getUploadsCompleted(), 1);
    EXPECT_EQ(server_->metrics().getChunksAccepted(), outcome.total_chunks);
    ASSERT_EQ(server_->metadataStore().listMedia().size(), 1u);
}

TEST_F(IntegrationTest, ServerErrorsMapToStatusCodes) {
    HttpTransport transport(server_url_);

    ChunkRequest chunk;
    chunk.upload_id = "missing";
    chunk.chunk_index = 0;
    chunk.chunk_data_base64 = "QUJD";
    chunk.chunk_sha256 = Utils::calculateSHA256(chunk.chunk_data_base64);
    ChunkResponse chunk_response;
    Status status = transport.sendChunk(chunk, chunk_response, 5000);
    EXPECT_EQ(status.code(), ErrorCode::kUnknownSession);
    EXPECT_EQ(status.message(), "Unknown uploadId");

    StartUploadRequest start;
    start.client_id = "mobile-app";
    start.timestamp = "1";
    start.original_name = "a.jpg";
    start.total_chunks = 2;
    start.file_sha256 = Utils::calculateSHA256("x");
    ASSERT_STATUS_OK(Signer("mobile-app", secret_key_base64_).sign(start.timestamp, start.original_name,
                                                                    start.signature_base64));
    StartUploadResponse started;
    ASSERT_STATUS_OK(transport.startUpload(start, started, 5000));

    CompleteRequest complete;
    complete.upload_id = started.upload_id;
    CompleteResponse completed;
    status = transport.completeUpload(complete, completed, 5000);
    EXPECT_EQ(status.code(), ErrorCode::kIncompleteUpload);
    EXPECT_EQ(completed.missing, (std::vector<int64_t>{0, 1}));

    start.original_name = "b.jpg";
    status = transport.startUpload(start, started, 5000);
    EXPECT_EQ(status.code(), ErrorCode::kUnauthorized);
}

TEST_F(IntegrationTest, UnreachableServerIsTransportError) {
    int port = server_->httpPort();
    server_->stop();

    HttpTransport transport("http://127.0.0.1:" + std::to_string(port));
    CompleteRequest complete;
    complete.upload_id = "x";
    CompleteResponse response;
    Status status = transport.completeUpload(complete, response, 2000);
    EXPECT_EQ(status.code(), ErrorCode::kTransportError);
    EXPECT_TRUE(WorkerPool::isRetryable(status));
}

TEST_F(IntegrationTest, SecondServerWithoutRegistryFails) {
    Config broken = config_;
    std::string error;
    ASSERT_TRUE(broken.set("clients_file", test_dir_ + "/nope.json", error));
    UploadServer server(broken);
    ASSERT_STATUS_CODE(server.initialize(), ErrorCode::kConfigError);
    EXPECT_FALSE(server.start());
}

TEST_F(IntegrationTest, CliUploadCommand) {
    std::string conf = clientConfigFile();
    std::string file = createTempFile("cli bytes", "cli.png");

    const char* argv[] = {"chunkpost_client", "--config", conf.c_str(), "--network", "wifi:90",
                          "--purpose", "chat", "--uploader-id", "u9", "upload", file.c_str()};
    CliOptions options;
    std::string error;
    ASSERT_TRUE(ClientCli::parseArguments(11, argv, options, error)) << error;
    EXPECT_EQ(options.command, "upload");
    EXPECT_EQ(options.config.getServerUrl(), server_url_);

    std::stringstream out;
    EXPECT_EQ(ClientCli::run(options, out), 0) << out.str();

    Json::Value report;
    ASSERT_STATUS_OK(parseJsonBody(out.str(), report));
    EXPECT_EQ(report["successCount"].asInt(), 1);
    std::string relative = report["files"][0]["file"]["relativePath"].asString();
    EXPECT_EQ(relative.rfind("chat/u9/", 0), 0u);
    EXPECT_EQ(storedBytes(relative), "cli bytes");
}

TEST_F(IntegrationTest, CliRefusesOffline) {
    std::string conf = clientConfigFile();
    std::string file = createTempFile("x", "x.jpg");
    const char* argv[] = {"chunkpost_client", "--config", conf.c_str(), "--network", "offline",
                          "upload", file.c_str()};
    CliOptions options;
    std::string error;
    ASSERT_TRUE(ClientCli::parseArguments(7, argv, options, error)) << error;

    std::stringstream out;
    EXPECT_EQ(ClientCli::run(options, out), 1);
    EXPECT_NE(out.str().find("Refused"), std::string::npos);
    EXPECT_EQ(server_->metrics().getSessionsStarted(), 0);
}

TEST(ClientCliTest, ParseArguments) {
    CliOptions options;
    std::string error;

    const char* plan[] = {"c", "--network-preference", "wifi", "--verbose", "plan", "1048576"};
    ASSERT_TRUE(ClientCli::parseArguments(6, plan, options, error)) << error;
    EXPECT_EQ(options.command, "plan");
    EXPECT_EQ(options.arguments, std::vector<std::string>{"1048576"});
    EXPECT_EQ(options.config.getNetworkPreference(), "wifi");
    EXPECT_TRUE(options.config.isDebugLog());

    const char* help[] = {"c", "--help"};
    CliOptions help_options;
    ASSERT_TRUE(ClientCli::parseArguments(2, help, help_options, error));
    EXPECT_TRUE(help_options.show_help);

    const char* missing_files[] = {"c", "upload"};
    CliOptions bad;
    EXPECT_FALSE(ClientCli::parseArguments(2, missing_files, bad, error));

    const char* unknown_flag[] = {"c", "--colour", "red", "probe"};
    CliOptions bad2;
    EXPECT_FALSE(ClientCli::parseArguments(4, unknown_flag, bad2, error));

    const char* bad_transport[] = {"c", "--transport", "carrier-pigeon", "probe"};
    CliOptions bad3;
    EXPECT_FALSE(ClientCli::parseArguments(4, bad_transport, bad3, error));

    const char* no_command[] = {"c", "--network", "wifi"};
    CliOptions bad4;
    EXPECT_FALSE(ClientCli::parseArguments(3, no_command, bad4, error));
    EXPECT_EQ(error, "Missing command");
}

TEST(ClientCliTest, PlanCommandOutput) {
    CliOptions options;
    std::string error;
    const char* argv[] = {"c", "--network", "wifi:75", "plan", "3145728"};
    ASSERT_TRUE(ClientCli::parseArguments(5, argv, options, error)) << error;

    std::stringstream out;
    EXPECT_EQ(ClientCli::run(options, out), 0);
    EXPECT_NE(out.str().find("plan: workers=4 baseChunkBytes=1048576"), std::string::npos) << out.str();
    EXPECT_NE(out.str().find("chunks: 3 x 1398104 base64 chars"), std::string::npos) << out.str();

    CliOptions offline;
    const char* refused[] = {"c", "--network", "offline", "plan"};
    ASSERT_TRUE(ClientCli::parseArguments(4, refused, offline, error));
    std::stringstream refusal;
    EXPECT_EQ(ClientCli::run(offline, refusal), 2);
    EXPECT_NE(refusal.str().find("refused (offline)"), std::string::npos);
}

TEST(ClientCliTest, TransportSelection) {
    Config config;
    std::unique_ptr<UploadTransport> transport;
    ASSERT_STATUS_OK(ClientCli::makeTransport(config, transport));
    EXPECT_NE(dynamic_cast<HttpTransport*>(transport.get()), nullptr);

    std::string error;
    ASSERT_TRUE(config.set("transport", "grpc", error));
#ifdef CHUNKPOST_WITH_GRPC
    EXPECT_STATUS_OK(ClientCli::makeTransport(config, transport));
#else
    EXPECT_EQ(ClientCli::makeTransport(config, transport).code(), ErrorCode::kConfigError);
#endif
}

} // namespace test
} // namespace chunkpost
