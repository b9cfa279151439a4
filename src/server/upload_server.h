#pragma once

#include "client_registry.h"
#include "metadata_store.h"
#include "session_coordinator.h"
#include "session_sweeper.h"
#include "storage_publisher.h"
#include "upload_routes.h"
#include "upload_session_table.h"
#include "utils.h"
#include "web_server.h"
#include <memory>

namespace chunkpost {

#ifdef CHUNKPOST_WITH_GRPC
class UploadRpcServer;
#endif

// Wires the upload pipeline together from a Config and runs its front ends
class UploadServer {
public:
    explicit UploadServer(const Config& config);
    ~UploadServer();

    // Load the client registry and metadata, prepare the storage tree
    Status initialize();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    int httpPort() const;
    UploadMetrics& metrics() { return metrics_; }
    SessionCoordinator& coordinator() { return *coordinator_; }
    ClientRegistry& registry() { return registry_; }
    JsonMetadataStore& metadataStore() { return *metadata_store_; }

private:
    const Config& config_;
    bool running_;

    UploadMetrics metrics_;
    ClientRegistry registry_;
    std::unique_ptr<UploadSessionTable> sessions_;
    std::unique_ptr<StoragePublisher> publisher_;
    std::unique_ptr<JsonMetadataStore> metadata_store_;
    std::unique_ptr<SessionCoordinator> coordinator_;
    std::unique_ptr<UploadRoutes> routes_;
    std::unique_ptr<WebServer> web_server_;
    std::unique_ptr<SessionSweeper> sweeper_;
#ifdef CHUNKPOST_WITH_GRPC
    std::unique_ptr<UploadRpcServer> rpc_server_;
#endif

    int64_t maxRequestBytes() const;
};

} // namespace chunkpost
