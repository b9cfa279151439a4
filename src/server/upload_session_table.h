#pragma once

#include "protocol.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkpost {

// Server-side record of one in-progress chunked upload.
// Fields below mutex are guarded by it. last_updated and closed are read
// without the lock; closed only changes while the lock is held.
struct UploadSession {
    std::string upload_id;
    std::string client_id;
    std::string original_name;
    int64_t total_chunks = 0;
    std::string file_sha256;
    Purpose purpose = Purpose::kShared;
    std::string uploader_id;
    int64_t created_at = 0;

    std::mutex mutex;
    std::vector<std::string> chunk_slots;    // base64 text, empty = not received
    std::vector<std::string> slot_digests;
    int64_t received_base64_bytes = 0;

    std::atomic<int64_t> last_updated{0};
    std::atomic<bool> closed{false};

    bool slotFilled(int64_t index) const { return !slot_digests[static_cast<size_t>(index)].empty(); }
    std::vector<int64_t> missingSlots() const;
};

// Concurrency-safe map of active sessions keyed by uploadId.
// Per-session operations are serialized by UploadSession::mutex; the table
// mutex only guards membership.
class UploadSessionTable {
public:
    using Clock = std::function<int64_t()>;  // milliseconds

    // A null clock means wall-clock time
    explicit UploadSessionTable(int64_t ttl_ms, Clock clock = nullptr);

    // Stamp created_at/last_updated and insert. Fails if the id is taken.
    bool insert(const std::shared_ptr<UploadSession>& session);

    std::shared_ptr<UploadSession> find(const std::string& upload_id) const;

    // Remove and mark closed; later lookups miss
    bool erase(const std::string& upload_id);

    void touch(UploadSession& session) const;

    // Evict sessions idle for longer than the TTL; returns how many went.
    // Each session is closed under its own lock, so an in-flight chunk either
    // lands first and refreshes the session or sees it closed.
    size_t sweepExpired();

    size_t size() const;
    int64_t now() const { return clock_(); }
    int64_t ttlMs() const { return ttl_ms_; }

private:
    int64_t ttl_ms_;
    Clock clock_;
    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
};

} // namespace chunkpost
