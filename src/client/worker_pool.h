#pragma once

#include "chunk_partitioner.h"
#include "status.h"
#include "upload_transport.h"
#include "utils.h"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace chunkpost {

// Per-chunk send budget: one attempt, then one retry after a cool-down
struct TransferPolicy {
    int chunk_timeout_ms = CHUNK_TIMEOUT_MS;
    int retry_delay_ms = RETRY_DELAY_MS;

    static TransferPolicy fromConfig(const Config& config);
};

// Outcome of one chunk, reported by a worker on the result channel
struct ChunkResult {
    int64_t index = -1;    // -1 marks a worker that has exited
    Status status;
    int attempts = 0;
};

// Sends a session's chunks with a fixed number of cooperating workers.
// Workers claim indices from a shared counter, so delivery order is arbitrary.
class WorkerPool {
public:
    using Sleeper = std::function<void(int milliseconds)>;
    using ProgressCallback = std::function<void(int64_t chunks_done, int64_t chunks_total)>;

    WorkerPool(UploadTransport& transport, TransferPolicy policy, Sleeper sleeper = nullptr);

    // Returns the first permanent failure, with its chunk index in failed_index.
    // After a failure, workers finish their in-flight request and claim nothing new.
    Status run(const std::string& upload_id, const std::vector<ChunkDescriptor>& chunks, int workers,
               int64_t* failed_index = nullptr);

    void setProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    int64_t requestsSent() const { return requests_sent_.load(); }

    static bool isRetryable(const Status& status);

private:
    UploadTransport& transport_;
    TransferPolicy policy_;
    Sleeper sleeper_;
    ProgressCallback progress_callback_;
    std::atomic<int64_t> requests_sent_;

    ChunkResult sendWithRetry(const std::string& upload_id, const ChunkDescriptor& chunk,
                              const std::atomic<bool>& stopped);
};

} // namespace chunkpost
