#pragma once

#include "concurrency_planner.h"
#include "network_probe.h"
#include "signer.h"
#include "upload_transport.h"
#include "worker_pool.h"
#include <functional>
#include <string>
#include <vector>

namespace chunkpost {

struct UploaderOptions {
    int start_timeout_ms = START_TIMEOUT_MS;
    int complete_timeout_ms = COMPLETE_TIMEOUT_MS;
    TransferPolicy transfer;
    std::string purpose;
    std::string uploader_id;
    NetworkPreference preference = NetworkPreference::kAny;

    static Status fromConfig(const Config& config, UploaderOptions& options);
};

// A file as it will be uploaded; the preprocessor may rewrite both fields
struct PreparedFile {
    std::string name;
    std::string bytes;
};

using Preprocessor = std::function<Status(PreparedFile& file)>;

struct FileOutcome {
    std::string path;
    std::string original_name;
    Status status;
    std::string upload_id;
    int64_t total_chunks = 0;
    int64_t failed_chunk = -1;
    CompleteResponse response;
};

struct BatchReport {
    std::vector<FileOutcome> files;
    int success_count = 0;
    int failure_count = 0;
    UploadPlan plan;

    Json::Value toJson() const;
};

// Drives probe -> plan -> partition -> sign -> start -> chunks -> complete for a batch of files
class Uploader {
public:
    Uploader(UploadTransport& transport, const Signer& signer, NetworkProbe& probe, UploaderOptions options,
             WorkerPool::Sleeper sleeper = nullptr);

    BatchReport uploadFiles(const std::vector<std::string>& paths);

    // Upload one in-memory file under an already accepted plan
    FileOutcome uploadBytes(const std::string& original_name, const std::string& bytes, const UploadPlan& plan);

    void setPreprocessor(Preprocessor preprocessor) { preprocessor_ = std::move(preprocessor); }
    void setProgressCallback(WorkerPool::ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Requests issued so far, across every call
    int64_t requestsSent() const { return requests_sent_; }

private:
    UploadTransport& transport_;
    const Signer& signer_;
    NetworkProbe& probe_;
    UploaderOptions options_;
    WorkerPool::Sleeper sleeper_;
    Preprocessor preprocessor_;
    WorkerPool::ProgressCallback progress_callback_;
    int64_t requests_sent_;

    Status transfer(const PreparedFile& file, const UploadPlan& plan, FileOutcome& outcome);
};

} // namespace chunkpost
