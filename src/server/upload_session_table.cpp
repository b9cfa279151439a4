#include "upload_session_table.h"
#include "utils.h"

namespace chunkpost {

std::vector<int64_t> UploadSession::missingSlots() const {
    std::vector<int64_t> missing;
    for (size_t i = 0; i < slot_digests.size(); ++i) {
        if (slot_digests[i].empty()) {
            missing.push_back(static_cast<int64_t>(i));
        }
    }
    return missing;
}

UploadSessionTable::UploadSessionTable(int64_t ttl_ms, Clock clock)
    : ttl_ms_(ttl_ms), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Utils::getCurrentTimestamp(); };
    }
}

bool UploadSessionTable::insert(const std::shared_ptr<UploadSession>& session) {
    int64_t now = clock_();
    session->created_at = now;
    session->last_updated = now;
    session->closed = false;

    std::lock_guard<std::mutex> lock(table_mutex_);
    return sessions_.emplace(session->upload_id, session).second;
}

std::shared_ptr<UploadSession> UploadSessionTable::find(const std::string& upload_id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

bool UploadSessionTable::erase(const std::string& upload_id) {
    std::shared_ptr<UploadSession> removed;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            return false;
        }
        removed = it->second;
        sessions_.erase(it);
    }
    removed->closed = true;
    return true;
}

void UploadSessionTable::touch(UploadSession& session) const {
    session.last_updated = clock_();
}

size_t UploadSessionTable::sweepExpired() {
    std::vector<std::shared_ptr<UploadSession>> candidates;
    {
        int64_t now = clock_();
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& entry : sessions_) {
            if (now - entry.second->last_updated.load() > ttl_ms_) {
                candidates.push_back(entry.second);
            }
        }
    }

    // Lock order is session then table, matching completion. A chunk that
    // finished writing while we waited has touched the session and keeps it.
    size_t evicted = 0;
    for (const auto& session : candidates) {
        std::lock_guard<std::mutex> session_lock(session->mutex);
        if (session->closed.load() || clock_() - session->last_updated.load() <= ttl_ms_) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto it = sessions_.find(session->upload_id);
            if (it == sessions_.end() || it->second != session) {
                continue;
            }
            sessions_.erase(it);
        }
        session->closed = true;
        ++evicted;
        Utils::logInfo("Evicted idle upload session " + session->upload_id);
    }
    return evicted;
}

size_t UploadSessionTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return sessions_.size();
}

} // namespace chunkpost
