#include "upload_server.h"
#include "image_transcoder.h"
#ifdef CHUNKPOST_WITH_GRPC
#include "upload_rpc_service.h"
#endif

namespace chunkpost {

UploadServer::UploadServer(const Config& config)
    : config_(config), running_(false) {
}

UploadServer::~UploadServer() {
    stop();
}

Status UploadServer::initialize() {
    Status status = registry_.loadFromFile(config_.getClientsFile());
    if (!status.ok()) {
        return status;
    }

    metadata_store_ = std::make_unique<JsonMetadataStore>(config_.getMetadataFile());
    status = metadata_store_->load();
    if (!status.ok()) {
        return status;
    }

    std::shared_ptr<ImageTranscoder> transcoder;
    if (!config_.getTranscodeCommand().empty()) {
        transcoder = std::make_shared<CommandTranscoder>(config_.getTranscodeCommand());
        Utils::logInfo("HEIC/HEIF uploads will be converted with: " + config_.getTranscodeCommand());
    }

    publisher_ = std::make_unique<StoragePublisher>(config_.getUploadRoot(), transcoder);
    status = publisher_->initialize();
    if (!status.ok()) {
        return status;
    }

    sessions_ = std::make_unique<UploadSessionTable>(static_cast<int64_t>(config_.getSessionTtlSeconds()) * 1000);

    CoordinatorOptions options;
    options.max_upload_bytes = config_.getMaxUploadBytes();
    options.max_total_chunks = config_.getMaxTotalChunks();
    options.public_url_prefix = config_.getPublicUrlPrefix();
    coordinator_ = std::make_unique<SessionCoordinator>(registry_, *sessions_, *publisher_,
                                                        metadata_store_.get(), metrics_, options);
    routes_ = std::make_unique<UploadRoutes>(*coordinator_, *publisher_, metrics_);

    WebServerOptions web_options;
    web_options.listen_address = config_.getListenAddress();
    web_options.port = config_.getHttpPort();
    web_options.worker_threads = config_.getHttpWorkerThreads();
    web_options.socket_timeout_ms = config_.getSocketTimeoutMs();
    web_options.max_body_bytes = maxRequestBytes();
    UploadRoutes* routes = routes_.get();
    web_server_ = std::make_unique<WebServer>(web_options, [routes](const HttpRequest& request) {
        return routes->handle(request);
    });

    sweeper_ = std::make_unique<SessionSweeper>(
        *sessions_, std::chrono::seconds(config_.getSweepIntervalSeconds()), &metrics_);

#ifdef CHUNKPOST_WITH_GRPC
    if (config_.getGrpcPort() > 0) {
        rpc_server_ = std::make_unique<UploadRpcServer>(*coordinator_);
    }
#else
    if (config_.getGrpcPort() > 0) {
        Utils::logWarning("Built without gRPC support; the RPC front end is disabled");
    }
#endif

    Utils::logInfo("Upload server initialized (root " + publisher_->rootDirectory() + ")");
    return Status::OK();
}

bool UploadServer::start() {
    if (running_) {
        Utils::logWarning("Server is already running");
        return true;
    }
    if (!web_server_) {
        Utils::logError("Upload server started before initialize()");
        return false;
    }

    if (!web_server_->start()) {
        return false;
    }

#ifdef CHUNKPOST_WITH_GRPC
    if (rpc_server_) {
        if (!rpc_server_->start(config_.getListenAddress(), config_.getGrpcPort(), maxRequestBytes())) {
            web_server_->stop();
            return false;
        }
    }
#endif

    sweeper_->start();
    running_ = true;
    return true;
}

void UploadServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

#ifdef CHUNKPOST_WITH_GRPC
    if (rpc_server_) {
        rpc_server_->stop();
    }
#endif
    web_server_->stop();
    sweeper_->stop();

    Utils::logInfo("Upload server stopped. Stats: " + metrics_.toJSON());
}

int64_t UploadServer::maxRequestBytes() const {
    // Base64 of the largest file plus room for JSON or multipart framing
    return static_cast<int64_t>(Utils::base64EncodedLength(static_cast<size_t>(config_.getMaxUploadBytes()))) +
           64 * 1024;
}

int UploadServer::httpPort() const {
    return web_server_ ? web_server_->boundPort() : 0;
}

} // namespace chunkpost
