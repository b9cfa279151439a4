#include "uploader.h"
#include "chunk_partitioner.h"
#include <filesystem>

namespace chunkpost {

Status UploaderOptions::fromConfig(const Config& config, UploaderOptions& options) {
    if (!parseNetworkPreference(config.getNetworkPreference(), options.preference)) {
        return Status(ErrorCode::kConfigError, "Invalid network_preference: " + config.getNetworkPreference());
    }
    options.start_timeout_ms = config.getStartTimeoutMs();
    options.complete_timeout_ms = config.getCompleteTimeoutMs();
    options.transfer = TransferPolicy::fromConfig(config);
    options.purpose = config.getPurpose();
    options.uploader_id = config.getUploaderId();
    return Status::OK();
}

Json::Value BatchReport::toJson() const {
    Json::Value root;
    root["successCount"] = success_count;
    root["failureCount"] = failure_count;
    Json::Value files_json(Json::arrayValue);
    for (const auto& file : files) {
        Json::Value entry;
        entry["path"] = file.path;
        entry["ok"] = file.status.ok();
        if (file.status.ok()) {
            entry["verified"] = file.response.verified;
            entry["file"] = chunkpost::toJson(file.response.file);
            if (!file.response.url.empty()) {
                entry["url"] = file.response.url;
            }
        } else {
            entry["error"] = file.status.message();
            entry["code"] = Status::errorCodeName(file.status.code());
        }
        files_json.append(entry);
    }
    root["files"] = files_json;
    return root;
}

Uploader::Uploader(UploadTransport& transport, const Signer& signer, NetworkProbe& probe, UploaderOptions options,
                   WorkerPool::Sleeper sleeper)
    : transport_(transport), signer_(signer), probe_(probe), options_(std::move(options)),
      sleeper_(std::move(sleeper)), requests_sent_(0) {
}

BatchReport Uploader::uploadFiles(const std::vector<std::string>& paths) {
    BatchReport report;

    NetworkState state = probe_.probe();
    report.plan = ConcurrencyPlanner::plan(state, options_.preference);
    Utils::logInfo("Network " + state.toString() + " -> " + report.plan.toString());

    for (const auto& path : paths) {
        FileOutcome outcome;
        outcome.path = path;
        outcome.original_name = std::filesystem::path(path).filename().string();

        if (!report.plan.ok) {
            outcome.status = Status(ErrorCode::kRefused, report.plan.reason);
        } else {
            std::string bytes;
            if (!Utils::readFile(path, bytes)) {
                outcome.status = Status(ErrorCode::kBadRequest, "Cannot read file: " + path);
            } else {
                FileOutcome uploaded = uploadBytes(outcome.original_name, bytes, report.plan);
                uploaded.path = path;
                outcome = std::move(uploaded);
            }
        }

        if (outcome.status.ok()) {
            report.success_count++;
            Utils::logInfo("Uploaded " + path + " as " + outcome.response.file.relative_path);
        } else {
            report.failure_count++;
            Utils::logError("Upload of " + path + " failed: " + outcome.status.toString());
        }
        report.files.push_back(std::move(outcome));
    }
    return report;
}

FileOutcome Uploader::uploadBytes(const std::string& original_name, const std::string& bytes,
                                  const UploadPlan& plan) {
    FileOutcome outcome;
    outcome.original_name = original_name;

    if (!plan.ok) {
        outcome.status = Status(ErrorCode::kRefused, plan.reason);
        return outcome;
    }

    PreparedFile file{original_name, bytes};
    if (preprocessor_) {
        Status status = preprocessor_(file);
        if (!status.ok()) {
            outcome.status = status;
            return outcome;
        }
        outcome.original_name = file.name;
    }

    if (file.name.empty()) {
        outcome.status = Status(ErrorCode::kBadRequest, "File has no name");
    } else if (file.bytes.empty()) {
        outcome.status = Status(ErrorCode::kBadRequest, "File is empty");
    } else if (static_cast<int64_t>(file.bytes.size()) > MAX_UPLOAD_BYTES) {
        outcome.status = Status(ErrorCode::kPayloadTooLarge, "File too large");
    } else {
        outcome.status = transfer(file, plan, outcome);
    }
    return outcome;
}

Status Uploader::transfer(const PreparedFile& file, const UploadPlan& plan, FileOutcome& outcome) {
    std::string payload = Utils::base64Encode(file.bytes);
    std::string file_sha256 = Utils::calculateSHA256(payload);
    std::vector<ChunkDescriptor> chunks = ChunkPartitioner::partition(payload, plan.base_chunk_bytes);
    outcome.total_chunks = static_cast<int64_t>(chunks.size());

    StartUploadRequest start;
    start.client_id = signer_.clientId();
    start.timestamp = std::to_string(Utils::getCurrentTimestamp());
    start.original_name = file.name;
    start.total_chunks = outcome.total_chunks;
    start.file_sha256 = file_sha256;
    start.purpose = options_.purpose;
    start.uploader_id = options_.uploader_id;
    start.file_size = static_cast<int64_t>(file.bytes.size());

    Status status = signer_.sign(start.timestamp, start.original_name, start.signature_base64);
    if (!status.ok()) {
        return status;
    }

    StartUploadResponse started;
    requests_sent_++;
    status = transport_.startUpload(start, started, options_.start_timeout_ms);
    if (!status.ok()) {
        return status;
    }
    outcome.upload_id = started.upload_id;
    Utils::logInfo("Session " + started.upload_id + " opened for " + file.name + " (" +
                   std::to_string(chunks.size()) + " chunks, " + std::to_string(plan.workers) + " workers)");

    WorkerPool pool(transport_, options_.transfer, sleeper_);
    if (progress_callback_) {
        pool.setProgressCallback(progress_callback_);
    }
    status = pool.run(started.upload_id, chunks, plan.workers, &outcome.failed_chunk);
    requests_sent_ += pool.requestsSent();
    if (!status.ok()) {
        return status;
    }

    CompleteRequest complete;
    complete.upload_id = started.upload_id;
    requests_sent_++;
    status = transport_.completeUpload(complete, outcome.response, options_.complete_timeout_ms);
    if (!status.ok()) {
        if (!outcome.response.missing.empty()) {
            Utils::logError("Server reports " + std::to_string(outcome.response.missing.size()) +
                            " missing chunk(s) for " + started.upload_id);
        }
        return status;
    }
    if (!outcome.response.verified) {
        return Status(ErrorCode::kIntegrityError, "Server did not verify the upload");
    }
    return Status::OK();
}

} // namespace chunkpost
