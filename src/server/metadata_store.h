#pragma once

#include "status.h"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkpost {

struct UserRecord {
    std::string id;
    std::string token;
    std::string avatar_path;
};

struct MediaRecord {
    std::string storage_path;
    std::string owner_user_id;
    std::string kind;          // avatar, chat or shared
    std::string mime_type;
    int64_t file_size = 0;
    int64_t created_at = 0;
};

struct MessageAttachment {
    std::string message_id;
    std::string sender_id;
    std::string attachment_path;
    std::string mime_type;
    int64_t size = 0;
    int64_t created_at = 0;
};

// Domain records the upload pipeline touches after publication
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual std::optional<UserRecord> findUserByToken(const std::string& token) const = 0;
    virtual bool userExists(const std::string& user_id) const = 0;

    // Replace the user's avatar; previous_path receives the old path (may be empty)
    virtual Status setAvatar(const std::string& user_id,
                             const std::string& relative_path,
                             const std::string& mime,
                             int64_t size,
                             std::string& previous_path) = 0;

    virtual Status attachToMessage(const std::string& message_id,
                                   const std::string& sender_id,
                                   const std::string& relative_path,
                                   const std::string& mime,
                                   int64_t size) = 0;

    virtual Status recordMedia(const MediaRecord& record) = 0;
};

// Metadata store persisted as a single JSON document, rewritten on every mutation
class JsonMetadataStore : public MetadataStore {
public:
    // An empty path keeps everything in memory
    explicit JsonMetadataStore(const std::string& metadata_file);

    // Load existing records; a missing file starts an empty store
    Status load();

    Status addUser(const UserRecord& user);

    std::optional<UserRecord> findUserByToken(const std::string& token) const override;
    bool userExists(const std::string& user_id) const override;
    std::optional<UserRecord> getUser(const std::string& user_id) const;

    Status setAvatar(const std::string& user_id,
                     const std::string& relative_path,
                     const std::string& mime,
                     int64_t size,
                     std::string& previous_path) override;

    Status attachToMessage(const std::string& message_id,
                           const std::string& sender_id,
                           const std::string& relative_path,
                           const std::string& mime,
                           int64_t size) override;

    Status recordMedia(const MediaRecord& record) override;

    std::vector<MediaRecord> listMedia() const;
    std::vector<MessageAttachment> listAttachments() const;

private:
    std::string metadata_file_;
    mutable std::mutex mutex_;

    std::unordered_map<std::string, UserRecord> users_;   // id -> user
    std::vector<MediaRecord> media_;
    std::vector<MessageAttachment> attachments_;

    // Callers hold mutex_
    Status saveLocked() const;
    std::string serializeLocked() const;
    bool deserialize(const std::string& data);
};

} // namespace chunkpost
