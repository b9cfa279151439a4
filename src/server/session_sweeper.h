#pragma once

#include "upload_session_table.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace chunkpost {

// Background task that evicts idle upload sessions once per interval.
class SessionSweeper {
public:
    SessionSweeper(UploadSessionTable& table, std::chrono::milliseconds interval, UploadMetrics* metrics = nullptr);
    ~SessionSweeper();

    void start();
    // Wakes the thread and joins it; returns once no pass is in progress
    void stop();
    bool isRunning() const { return running_.load(); }

    // One synchronous sweep pass
    size_t runOnce();

    int64_t passesCompleted() const { return passes_.load(); }

private:
    void sweepLoop();

    UploadSessionTable& table_;
    std::chrono::milliseconds interval_;
    UploadMetrics* metrics_;

    std::atomic<bool> running_;
    std::atomic<int64_t> passes_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread sweep_thread_;
};

} // namespace chunkpost
