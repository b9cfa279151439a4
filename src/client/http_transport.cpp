#include "http_transport.h"
#include "utils.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace chunkpost {

namespace {

std::once_flag g_curl_init;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpTransport::HttpTransport(std::string server_url)
    : server_url_(std::move(server_url)), request_count_(0) {
    while (!server_url_.empty() && server_url_.back() == '/') {
        server_url_.pop_back();
    }
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Status HttpTransport::startUpload(const StartUploadRequest& request, StartUploadResponse& response,
                                  int timeout_ms) {
    Json::Value root;
    Status status = postJson("/upload-chunk-start", toJson(request), timeout_ms, root, nullptr);
    if (!status.ok()) {
        return status;
    }
    return parseStartUploadResponse(root, response);
}

Status HttpTransport::sendChunk(const ChunkRequest& request, ChunkResponse& response, int timeout_ms) {
    Json::Value root;
    Status status = postJson("/upload-chunk", toJson(request), timeout_ms, root, nullptr);
    if (!status.ok()) {
        return status;
    }
    return parseChunkResponse(root, response);
}

Status HttpTransport::completeUpload(const CompleteRequest& request, CompleteResponse& response,
                                     int timeout_ms) {
    Json::Value root;
    Status status = postJson("/upload-chunk-complete", toJson(request), timeout_ms, root, &response.missing);
    if (!status.ok()) {
        return status;
    }
    return parseCompleteResponse(root, response);
}

Status HttpTransport::postJson(const std::string& path, const Json::Value& body, int timeout_ms,
                               Json::Value& root, std::vector<int64_t>* missing) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Status(ErrorCode::kTransportError, "Failed to initialize libcurl");
    }

    std::string url = server_url_ + path;
    std::string payload = writeJson(body);
    std::string response_body;

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);

    request_count_++;
    CURLcode result = curl_easy_perform(curl.get());
    if (result == CURLE_OPERATION_TIMEDOUT) {
        return Status(ErrorCode::kTimeout, "Request to " + path + " timed out after " +
                                               std::to_string(timeout_ms) + " ms");
    }
    if (result != CURLE_OK) {
        return Status(ErrorCode::kTransportError, std::string("Request to ") + path + " failed: " +
                                                      curl_easy_strerror(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code >= 300) {
        Status status = statusFromErrorBody(static_cast<int>(http_code), response_body, missing);
        Utils::logDebug("POST " + path + " -> HTTP " + std::to_string(http_code) + " " + status.toString());
        return status;
    }

    Status parsed = parseJsonBody(response_body, root);
    if (!parsed.ok()) {
        return Status(ErrorCode::kTransportError, "Unreadable response from " + path);
    }

    // Servers may answer 2xx with ok=false
    if (root.isMember("ok") && root["ok"].isBool() && !root["ok"].asBool()) {
        return statusFromErrorBody(400, response_body, missing);
    }
    return Status::OK();
}

} // namespace chunkpost
