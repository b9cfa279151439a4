#include "worker_pool.h"
#include "blocking_queue.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace chunkpost {

TransferPolicy TransferPolicy::fromConfig(const Config& config) {
    TransferPolicy policy;
    policy.chunk_timeout_ms = config.getChunkTimeoutMs();
    policy.retry_delay_ms = config.getRetryDelayMs();
    return policy;
}

WorkerPool::WorkerPool(UploadTransport& transport, TransferPolicy policy, Sleeper sleeper)
    : transport_(transport), policy_(policy), sleeper_(std::move(sleeper)), requests_sent_(0) {
    if (!sleeper_) {
        sleeper_ = [](int milliseconds) {
            std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
        };
    }
}

bool WorkerPool::isRetryable(const Status& status) {
    return status.code() == ErrorCode::kTimeout || status.code() == ErrorCode::kTransportError;
}

ChunkResult WorkerPool::sendWithRetry(const std::string& upload_id, const ChunkDescriptor& chunk,
                                      const std::atomic<bool>& stopped) {
    ChunkRequest request;
    request.upload_id = upload_id;
    request.chunk_index = chunk.index;
    request.chunk_sha256 = chunk.chunk_sha256;
    request.chunk_data_base64 = chunk.payload_base64;

    ChunkResult result;
    result.index = chunk.index;

    for (int attempt = 1; attempt <= 2; ++attempt) {
        ChunkResponse response;
        result.attempts = attempt;
        requests_sent_++;
        result.status = transport_.sendChunk(request, response, policy_.chunk_timeout_ms);

        if (result.status.ok()) {
            if (response.received_index != chunk.index) {
                result.status = Status(ErrorCode::kTransportError,
                                       "Server acknowledged chunk " + std::to_string(response.received_index) +
                                           " instead of " + std::to_string(chunk.index));
            }
            return result;
        }
        if (attempt == 2 || !isRetryable(result.status)) {
            return result;
        }

        Utils::logWarning("Chunk " + std::to_string(chunk.index) + " of " + upload_id + " failed (" +
                          result.status.toString() + "), retrying in " +
                          std::to_string(policy_.retry_delay_ms) + " ms");
        sleeper_(policy_.retry_delay_ms);
        if (stopped.load()) {
            return result;
        }
    }
    return result;
}

Status WorkerPool::run(const std::string& upload_id, const std::vector<ChunkDescriptor>& chunks, int workers,
                       int64_t* failed_index) {
    if (chunks.empty()) {
        return Status::OK();
    }
    int worker_count = std::max(1, std::min<int>(workers, static_cast<int>(chunks.size())));

    std::atomic<size_t> next_index(0);
    std::atomic<bool> stopped(false);
    BlockingQueue<ChunkResult> results;

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (int w = 0; w < worker_count; ++w) {
        threads.emplace_back([&]() {
            while (!stopped.load()) {
                size_t claimed = next_index.fetch_add(1);
                if (claimed >= chunks.size()) {
                    break;
                }
                ChunkResult result = sendWithRetry(upload_id, chunks[claimed], stopped);
                if (!result.status.ok()) {
                    stopped.store(true);
                }
                results.push(std::move(result));
            }
            ChunkResult done;
            results.push(done);
        });
    }

    Status first_failure;
    int64_t chunks_done = 0;
    int exited = 0;
    bool report_progress = true;
    ChunkResult result;
    while (exited < worker_count && results.waitPop(result)) {
        if (result.index < 0) {
            exited++;
            continue;
        }
        if (result.status.ok()) {
            chunks_done++;
            Utils::logDebug("Chunk " + std::to_string(result.index) + " of " + upload_id + " accepted after " +
                            std::to_string(result.attempts) + " attempt(s)");
            if (progress_callback_ && report_progress) {
                // Workers are still joinable here, so nothing may escape
                try {
                    progress_callback_(chunks_done, static_cast<int64_t>(chunks.size()));
                } catch (const std::exception& e) {
                    Utils::logWarning("Progress callback failed for " + upload_id + ": " + e.what());
                    report_progress = false;
                }
            }
        } else if (first_failure.ok()) {
            first_failure = result.status;
            stopped.store(true);
            if (failed_index) {
                *failed_index = result.index;
            }
            Utils::logError("Chunk " + std::to_string(result.index) + " of " + upload_id +
                            " failed permanently: " + result.status.toString());
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }
    return first_failure;
}

} // namespace chunkpost
