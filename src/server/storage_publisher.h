#pragma once

#include "image_transcoder.h"
#include "protocol.h"
#include "status.h"
#include <memory>
#include <string>

namespace chunkpost {

// Where and for whom an artifact is published
struct PublishContext {
    Purpose purpose = Purpose::kShared;
    std::string owner_id;        // userId for avatars, uploaderId for chat
    std::string original_name;
};

// Writes verified upload bytes into the tenant-partitioned storage tree:
//   avatars/<userId>/avatar-<uuid>.<ext>
//   chat/<uploaderId>/<uuid>.<ext>
//   <uuid>.<ext>
// Files are staged under <root>/.staging and renamed into place.
class StoragePublisher {
public:
    StoragePublisher(const std::string& root_directory, std::shared_ptr<ImageTranscoder> transcoder = nullptr);

    // Create the root and staging directories
    Status initialize();

    Status publish(const PublishContext& context, const std::string& bytes, StoredArtifact& artifact);

    // Delete a previously published artifact
    Status remove(const std::string& relative_path);

    // Map a public relative path to an existing file under the root
    Status resolve(const std::string& relative_path, std::string& absolute_path) const;

    const std::string& rootDirectory() const { return root_directory_; }

    // Helpers
    static std::string safeSegment(const std::string& id);
    static std::string extensionFor(const std::string& original_name);
    static std::string mimeForExtension(const std::string& extension);

private:
    std::string root_directory_;
    std::string staging_directory_;
    std::shared_ptr<ImageTranscoder> transcoder_;

    bool isInsideRoot(const std::string& path) const;
    std::string partitionDirectory(const PublishContext& context) const;
};

} // namespace chunkpost
