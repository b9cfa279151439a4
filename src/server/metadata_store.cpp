#include "metadata_store.h"
#include "protocol.h"
#include "utils.h"
#include <filesystem>

namespace chunkpost {

JsonMetadataStore::JsonMetadataStore(const std::string& metadata_file)
    : metadata_file_(metadata_file) {
}

Status JsonMetadataStore::load() {
    if (metadata_file_.empty()) {
        return Status::OK();
    }
    if (!Utils::fileExists(metadata_file_)) {
        Utils::logWarning("Metadata file not found, starting empty: " + metadata_file_);
        return Status::OK();
    }

    std::string data;
    if (!Utils::readFile(metadata_file_, data)) {
        Utils::logError("Failed to read metadata from file: " + metadata_file_);
        return Status(ErrorCode::kConfigError, "Cannot read metadata file " + metadata_file_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!deserialize(data)) {
        Utils::logError("Failed to deserialize metadata from file: " + metadata_file_);
        return Status(ErrorCode::kConfigError, "Malformed metadata file " + metadata_file_);
    }

    Utils::logInfo("Loaded metadata from file: " + metadata_file_ + " (" + std::to_string(users_.size()) +
                   " users, " + std::to_string(media_.size()) + " media)");
    return Status::OK();
}

Status JsonMetadataStore::addUser(const UserRecord& user) {
    if (user.id.empty()) {
        return Status(ErrorCode::kBadRequest, "User id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    users_[user.id] = user;
    return saveLocked();
}

std::optional<UserRecord> JsonMetadataStore::findUserByToken(const std::string& token) const {
    if (token.empty()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : users_) {
        if (pair.second.token == token) {
            return pair.second;
        }
    }
    return std::nullopt;
}

bool JsonMetadataStore::userExists(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.find(user_id) != users_.end();
}

std::optional<UserRecord> JsonMetadataStore::getUser(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status JsonMetadataStore::setAvatar(const std::string& user_id,
                                    const std::string& relative_path,
                                    const std::string& mime,
                                    int64_t size,
                                    std::string& previous_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return Status(ErrorCode::kNotFound, "User not found");
    }

    previous_path = it->second.avatar_path;
    it->second.avatar_path = relative_path;

    MediaRecord record;
    record.storage_path = relative_path;
    record.owner_user_id = user_id;
    record.kind = "avatar";
    record.mime_type = mime;
    record.file_size = size;
    record.created_at = Utils::getCurrentTimestamp();
    media_.push_back(record);

    Utils::logInfo("Avatar for user " + user_id + " set to " + relative_path);
    return saveLocked();
}

Status JsonMetadataStore::attachToMessage(const std::string& message_id,
                                          const std::string& sender_id,
                                          const std::string& relative_path,
                                          const std::string& mime,
                                          int64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.find(sender_id) == users_.end()) {
        return Status(ErrorCode::kNotFound, "Sender not found");
    }

    MessageAttachment attachment;
    attachment.message_id = message_id;
    attachment.sender_id = sender_id;
    attachment.attachment_path = relative_path;
    attachment.mime_type = mime;
    attachment.size = size;
    attachment.created_at = Utils::getCurrentTimestamp();
    attachments_.push_back(attachment);
    return saveLocked();
}

Status JsonMetadataStore::recordMedia(const MediaRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    MediaRecord stored = record;
    if (stored.created_at == 0) {
        stored.created_at = Utils::getCurrentTimestamp();
    }
    media_.push_back(stored);
    return saveLocked();
}

std::vector<MediaRecord> JsonMetadataStore::listMedia() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return media_;
}

std::vector<MessageAttachment> JsonMetadataStore::listAttachments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attachments_;
}

Status JsonMetadataStore::saveLocked() const {
    if (metadata_file_.empty()) {
        return Status::OK();
    }

    // Write a sibling file and swap it in so readers never see half a document
    std::string temp_file = metadata_file_ + ".tmp";
    if (!Utils::writeFile(temp_file, serializeLocked())) {
        Utils::logError("Failed to write metadata to file: " + temp_file);
        return Status(ErrorCode::kStorageError, "Failed to persist metadata");
    }

    std::error_code ec;
    std::filesystem::rename(temp_file, metadata_file_, ec);
    if (ec) {
        Utils::logError("Failed to replace metadata file " + metadata_file_ + ": " + ec.message());
        return Status(ErrorCode::kStorageError, "Failed to persist metadata");
    }

    Utils::logDebug("Saved metadata to file: " + metadata_file_);
    return Status::OK();
}

std::string JsonMetadataStore::serializeLocked() const {
    Json::Value root;

    Json::Value users_json(Json::arrayValue);
    for (const auto& pair : users_) {
        Json::Value user_json;
        user_json["id"] = pair.second.id;
        user_json["token"] = pair.second.token;
        user_json["avatar_path"] = pair.second.avatar_path;
        users_json.append(user_json);
    }
    root["users"] = users_json;

    Json::Value media_json(Json::arrayValue);
    for (const auto& media : media_) {
        Json::Value media_entry;
        media_entry["storage_path"] = media.storage_path;
        media_entry["owner_user_id"] = media.owner_user_id;
        media_entry["kind"] = media.kind;
        media_entry["mime_type"] = media.mime_type;
        media_entry["file_size"] = static_cast<Json::Int64>(media.file_size);
        media_entry["created_at"] = static_cast<Json::Int64>(media.created_at);
        media_json.append(media_entry);
    }
    root["media"] = media_json;

    Json::Value attachments_json(Json::arrayValue);
    for (const auto& attachment : attachments_) {
        Json::Value attachment_json;
        attachment_json["message_id"] = attachment.message_id;
        attachment_json["sender_id"] = attachment.sender_id;
        attachment_json["attachment_path"] = attachment.attachment_path;
        attachment_json["mime_type"] = attachment.mime_type;
        attachment_json["size"] = static_cast<Json::Int64>(attachment.size);
        attachment_json["created_at"] = static_cast<Json::Int64>(attachment.created_at);
        attachments_json.append(attachment_json);
    }
    root["attachments"] = attachments_json;

    Json::StreamWriterBuilder builder;
    return Json::writeString(builder, root);
}

bool JsonMetadataStore::deserialize(const std::string& data) {
    Json::Value root;
    if (!parseJsonBody(data, root).ok()) {
        return false;
    }

    if (!root["users"].isArray() && !root["users"].isNull()) {
        return false;
    }

    users_.clear();
    media_.clear();
    attachments_.clear();

    try {
        for (const auto& user_json : root["users"]) {
            if (!user_json.isObject()) continue;
            UserRecord user;
            user.id = user_json.get("id", "").asString();
            user.token = user_json.get("token", "").asString();
            user.avatar_path = user_json.get("avatar_path", "").asString();
            if (!user.id.empty()) {
                users_[user.id] = user;
            }
        }

        for (const auto& media_entry : root["media"]) {
            if (!media_entry.isObject()) continue;
            MediaRecord media;
            media.storage_path = media_entry.get("storage_path", "").asString();
            media.owner_user_id = media_entry.get("owner_user_id", "").asString();
            media.kind = media_entry.get("kind", "").asString();
            media.mime_type = media_entry.get("mime_type", "").asString();
            media.file_size = media_entry["file_size"].asInt64();
            media.created_at = media_entry["created_at"].asInt64();
            media_.push_back(media);
        }

        for (const auto& attachment_json : root["attachments"]) {
            if (!attachment_json.isObject()) continue;
            MessageAttachment attachment;
            attachment.message_id = attachment_json.get("message_id", "").asString();
            attachment.sender_id = attachment_json.get("sender_id", "").asString();
            attachment.attachment_path = attachment_json.get("attachment_path", "").asString();
            attachment.mime_type = attachment_json.get("mime_type", "").asString();
            attachment.size = attachment_json["size"].asInt64();
            attachment.created_at = attachment_json["created_at"].asInt64();
            attachments_.push_back(attachment);
        }
    } catch (const std::exception& e) {
        Utils::logError("Exception during metadata deserialization: " + std::string(e.what()));
        users_.clear();
        media_.clear();
        attachments_.clear();
        return false;
    }

    return true;
}

} // namespace chunkpost
