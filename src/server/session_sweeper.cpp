#include "session_sweeper.h"

namespace chunkpost {

SessionSweeper::SessionSweeper(UploadSessionTable& table, std::chrono::milliseconds interval, UploadMetrics* metrics)
    : table_(table),
      interval_(interval),
      metrics_(metrics),
      running_(false),
      passes_(0) {
}

SessionSweeper::~SessionSweeper() {
    stop();
}

void SessionSweeper::start() {
    if (running_.exchange(true)) {
        Utils::logWarning("Session sweeper is already running");
        return;
    }
    sweep_thread_ = std::thread(&SessionSweeper::sweepLoop, this);
    Utils::logInfo("Session sweeper started (interval " + std::to_string(interval_.count()) + " ms)");
}

void SessionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false) && !sweep_thread_.joinable()) {
            return;
        }
    }
    wake_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    Utils::logInfo("Session sweeper stopped");
}

size_t SessionSweeper::runOnce() {
    size_t evicted = table_.sweepExpired();
    if (evicted > 0) {
        Utils::logInfo("Sweep evicted " + std::to_string(evicted) + " idle session(s)");
        if (metrics_) {
            metrics_->addSessionsEvicted(static_cast<int64_t>(evicted));
        }
    } else {
        Utils::logDebug("Sweep found no idle sessions");
    }
    passes_++;
    return evicted;
}

void SessionSweeper::sweepLoop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
        }

        if (!running_.load()) break;

        runOnce();
    }
}

} // namespace chunkpost
