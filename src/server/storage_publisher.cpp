#include "storage_publisher.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace chunkpost {

namespace fs = std::filesystem;

namespace {

const char* const kStagingName = ".staging";

bool isHeif(const std::string& mime) {
    return mime == "image/heic" || mime == "image/heif";
}

} // namespace

StoragePublisher::StoragePublisher(const std::string& root_directory, std::shared_ptr<ImageTranscoder> transcoder)
    : transcoder_(std::move(transcoder)) {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(root_directory, ec), ec);
    if (ec) {
        root = fs::path(root_directory).lexically_normal();
    }
    if (root.has_relative_path() && root.filename().empty()) {
        root = root.parent_path();
    }
    root_directory_ = root.string();
    staging_directory_ = (root / kStagingName).string();
}

Status StoragePublisher::initialize() {
    if (!Utils::createDirectories(root_directory_) || !Utils::createDirectories(staging_directory_)) {
        Utils::logError("Failed to create storage directory: " + root_directory_);
        return Status(ErrorCode::kStorageError, "Cannot create storage directory");
    }
    Utils::logInfo("StoragePublisher initialized at: " + root_directory_);
    return Status::OK();
}

std::string StoragePublisher::safeSegment(const std::string& id) {
    std::string safe;
    for (char c : id) {
        unsigned char uc = static_cast<unsigned char>(c);
        safe += (std::isalnum(uc) || c == '_' || c == '-') ? c : '_';
    }
    if (safe.empty()) {
        return "unknown";
    }
    return safe;
}

std::string StoragePublisher::extensionFor(const std::string& original_name) {
    std::string ext = fs::path(original_name).extension().string();
    std::string cleaned;
    for (char c : Utils::toLower(ext)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    if (cleaned.empty() || cleaned.size() > 10) {
        return ".jpg";
    }
    return "." + cleaned;
}

std::string StoragePublisher::mimeForExtension(const std::string& extension) {
    std::string ext = Utils::toLower(extension);
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".gif") return "image/gif";
    if (ext == ".webp") return "image/webp";
    if (ext == ".heic") return "image/heic";
    if (ext == ".heif") return "image/heif";
    return "application/octet-stream";
}

std::string StoragePublisher::partitionDirectory(const PublishContext& context) const {
    switch (context.purpose) {
        case Purpose::kAvatar:
            return "avatars/" + safeSegment(context.owner_id);
        case Purpose::kChat:
            return "chat/" + safeSegment(context.owner_id);
        case Purpose::kShared:
            break;
    }
    return "";
}

bool StoragePublisher::isInsideRoot(const std::string& path) const {
    std::error_code ec;
    fs::path candidate = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        return false;
    }

    fs::path root(root_directory_);
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *candidate_it != *root_it) {
            return false;
        }
    }
    // The root itself is not a valid destination
    return candidate_it != candidate.end();
}

Status StoragePublisher::publish(const PublishContext& context, const std::string& bytes, StoredArtifact& artifact) {
    std::string extension = extensionFor(context.original_name);
    std::string mime = mimeForExtension(extension);
    std::string file_id = Utils::generateUuid();

    fs::path staged = fs::path(staging_directory_) / (file_id + extension);
    if (!Utils::writeFile(staged.string(), bytes)) {
        Utils::logError("Failed to write staged upload: " + staged.string());
        Utils::deleteFile(staged.string());
        return Status(ErrorCode::kStorageError, "Failed to store file");
    }

    if (isHeif(mime) && transcoder_) {
        fs::path converted = fs::path(staging_directory_) / (file_id + ".jpg");
        if (transcoder_->transcodeToJpeg(staged.string(), converted.string())) {
            Utils::deleteFile(staged.string());
            staged = converted;
            extension = ".jpg";
            mime = "image/jpeg";
        } else {
            // Keep the original bytes
            Utils::deleteFile(converted.string());
            Utils::logWarning("HEIC conversion failed for " + context.original_name + ", keeping original");
        }
    }

    std::string prefix = context.purpose == Purpose::kAvatar ? "avatar-" : "";
    fs::path relative = fs::path(partitionDirectory(context)) / (prefix + file_id + extension);
    fs::path destination = fs::path(root_directory_) / relative;

    if (!isInsideRoot(destination.string())) {
        Utils::logError("Refusing to publish outside storage root: " + destination.string());
        Utils::deleteFile(staged.string());
        return Status(ErrorCode::kPathEscape, "Invalid destination path");
    }

    if (!Utils::createDirectories(destination.parent_path().string())) {
        Utils::logError("Failed to create directory: " + destination.parent_path().string());
        Utils::deleteFile(staged.string());
        return Status(ErrorCode::kStorageError, "Failed to store file");
    }

    std::error_code ec;
    fs::rename(staged, destination, ec);
    if (ec) {
        Utils::logError("Failed to move " + staged.string() + " into place: " + ec.message());
        Utils::deleteFile(staged.string());
        return Status(ErrorCode::kStorageError, "Failed to store file");
    }

    int64_t size = Utils::getFileSize(destination.string());
    if (size < 0) {
        return Status(ErrorCode::kStorageError, "Stored file is unreadable");
    }

    artifact.relative_path = relative.generic_string();
    artifact.mime = mime;
    artifact.size = size;
    artifact.original_name = context.original_name;

    Utils::logInfo("Published " + artifact.relative_path + " (" + std::to_string(size) + " bytes, " + mime + ")");
    return Status::OK();
}

Status StoragePublisher::resolve(const std::string& relative_path, std::string& absolute_path) const {
    if (relative_path.empty() || relative_path[0] == '/') {
        return Status(ErrorCode::kNotFound, "Not found");
    }
    for (const auto& segment : Utils::splitString(relative_path, '/')) {
        // Hidden entries (the staging area, "..") are never served
        if (segment.empty() || segment[0] == '.') {
            return Status(ErrorCode::kNotFound, "Not found");
        }
    }

    fs::path candidate = fs::path(root_directory_) / fs::path(relative_path);
    if (!isInsideRoot(candidate.string())) {
        return Status(ErrorCode::kPathEscape, "Invalid path");
    }

    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        return Status(ErrorCode::kNotFound, "Not found");
    }
    absolute_path = candidate.string();
    return Status::OK();
}

Status StoragePublisher::remove(const std::string& relative_path) {
    std::string absolute_path;
    Status status = resolve(relative_path, absolute_path);
    if (!status.ok()) {
        return status;
    }
    if (!Utils::deleteFile(absolute_path)) {
        return Status(ErrorCode::kStorageError, "Failed to delete " + relative_path);
    }
    Utils::logInfo("Deleted artifact " + relative_path);
    return Status::OK();
}

} // namespace chunkpost
