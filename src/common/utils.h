#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace chunkpost {

// Protocol limits
constexpr int64_t MAX_UPLOAD_BYTES = 100LL * 1024 * 1024;   // 100MB decoded
constexpr int MAX_TOTAL_CHUNKS = 500;
constexpr size_t MIN_CHUNK_BYTES = 128 * 1024;              // 128KB
constexpr size_t MAX_CHUNK_BYTES = 1024 * 1024;             // 1MB
constexpr int MAX_WORKERS = 4;

// Timeouts
constexpr int START_TIMEOUT_MS = 15000;
constexpr int CHUNK_TIMEOUT_MS = 20000;
constexpr int RETRY_DELAY_MS = 60000;
constexpr int COMPLETE_TIMEOUT_MS = 30000;

// Session lifecycle
constexpr int SESSION_TTL_SECONDS = 60 * 60;
constexpr int SWEEP_INTERVAL_SECONDS = 15 * 60;

// Utility functions
class Utils {
public:
    // Identifiers
    static std::string generateUuid();
    static std::string generateUploadId();

    // Hash functions (lowercase hex)
    static std::string calculateSHA256(const std::vector<uint8_t>& data);
    static std::string calculateSHA256(const std::string& data);
    // Digest of the concatenation of all pieces, without joining them
    static std::string calculateSHA256(const std::vector<std::string>& pieces);
    static bool isSha256Hex(const std::string& digest);

    // Base64 (standard alphabet, padded, no line breaks)
    static std::string base64Encode(const std::string& data);
    static std::string base64Encode(const uint8_t* data, size_t size);
    static bool base64Decode(const std::string& encoded, std::string& out);
    static size_t base64EncodedLength(size_t raw_size);

    // File system utilities
    static bool fileExists(const std::string& path);
    static bool createDirectories(const std::string& path);
    static bool readFile(const std::string& path, std::string& out);
    static bool writeFile(const std::string& path, const std::string& data);
    static int64_t getFileSize(const std::string& path);
    static bool deleteFile(const std::string& path);

    // String utilities
    static std::vector<std::string> splitString(const std::string& str, char delimiter);
    static std::string joinStrings(const std::vector<std::string>& strings, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string toLower(std::string str);

    // Time utilities
    static int64_t getCurrentTimestamp();
    static std::string timestampToString(int64_t timestamp);

    // Logging
    static void setDebugLogging(bool enabled);
    static bool isDebugLogging();
    static void logInfo(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void logDebug(const std::string& message);

private:
    static void writeLog(const char* level, const std::string& message, bool to_stderr);

    static std::mutex log_mutex_;
    static std::atomic<bool> debug_logging_;
};

// Configuration management. Constructed by the entry point and passed down.
class Config {
public:
    Config() = default;

    // Load configuration from a key = value file
    bool loadFromFile(const std::string& configFile, std::string& error);
    // Apply a single key; used by the loader and by command-line overrides
    bool set(const std::string& key, const std::string& value, std::string& error);

    // Server
    const std::string& getListenAddress() const { return listen_address_; }
    int getHttpPort() const { return http_port_; }
    int getGrpcPort() const { return grpc_port_; }
    const std::string& getUploadRoot() const { return upload_root_; }
    const std::string& getClientsFile() const { return clients_file_; }
    const std::string& getMetadataFile() const { return metadata_file_; }
    int getSessionTtlSeconds() const { return session_ttl_seconds_; }
    int getSweepIntervalSeconds() const { return sweep_interval_seconds_; }
    int64_t getMaxUploadBytes() const { return max_upload_bytes_; }
    int getMaxTotalChunks() const { return max_total_chunks_; }
    int getHttpWorkerThreads() const { return http_worker_threads_; }
    int getSocketTimeoutMs() const { return socket_timeout_ms_; }
    const std::string& getTranscodeCommand() const { return transcode_command_; }
    const std::string& getPublicUrlPrefix() const { return public_url_prefix_; }
    bool isDebugLog() const { return debug_log_; }

    // Client
    const std::string& getServerUrl() const { return server_url_; }
    const std::string& getRpcTarget() const { return rpc_target_; }
    const std::string& getTransport() const { return transport_; }
    const std::string& getClientId() const { return client_id_; }
    const std::string& getSecretKeyBase64() const { return secret_key_base64_; }
    const std::string& getNetworkPreference() const { return network_preference_; }
    int getStartTimeoutMs() const { return start_timeout_ms_; }
    int getChunkTimeoutMs() const { return chunk_timeout_ms_; }
    int getRetryDelayMs() const { return retry_delay_ms_; }
    int getCompleteTimeoutMs() const { return complete_timeout_ms_; }
    const std::string& getPurpose() const { return purpose_; }
    const std::string& getUploaderId() const { return uploader_id_; }

    // Setters used by tests and command-line flags
    void setUploadRoot(const std::string& dir) { upload_root_ = dir; }
    void setHttpPort(int port) { http_port_ = port; }
    void setGrpcPort(int port) { grpc_port_ = port; }
    void setServerUrl(const std::string& url) { server_url_ = url; }
    void setDebugLog(bool enabled) { debug_log_ = enabled; }

private:
    std::string listen_address_ = "0.0.0.0";
    int http_port_ = 8080;
    int grpc_port_ = 50051;
    std::string upload_root_ = "./uploads";
    std::string clients_file_ = "./clients.json";
    std::string metadata_file_ = "./metadata.json";
    int session_ttl_seconds_ = SESSION_TTL_SECONDS;
    int sweep_interval_seconds_ = SWEEP_INTERVAL_SECONDS;
    int64_t max_upload_bytes_ = MAX_UPLOAD_BYTES;
    int max_total_chunks_ = MAX_TOTAL_CHUNKS;
    int http_worker_threads_ = 8;
    int socket_timeout_ms_ = 30000;
    std::string transcode_command_;
    std::string public_url_prefix_ = "/uploads";
    bool debug_log_ = false;

    std::string server_url_ = "http://localhost:8080";
    std::string rpc_target_ = "localhost:50051";
    std::string transport_ = "http";
    std::string client_id_;
    std::string secret_key_base64_;
    std::string network_preference_ = "any";
    int start_timeout_ms_ = START_TIMEOUT_MS;
    int chunk_timeout_ms_ = CHUNK_TIMEOUT_MS;
    int retry_delay_ms_ = RETRY_DELAY_MS;
    int complete_timeout_ms_ = COMPLETE_TIMEOUT_MS;
    std::string purpose_;
    std::string uploader_id_;
};

// Upload pipeline counters
class UploadMetrics {
public:
    void incrementSessionsStarted() { sessions_started_++; }
    void incrementChunksAccepted() { chunks_accepted_++; }
    void incrementDuplicateChunks() { duplicate_chunks_++; }
    void incrementChunkIntegrityFailures() { chunk_integrity_failures_++; }
    void incrementUploadsCompleted() { uploads_completed_++; }
    void incrementFinalDigestFailures() { final_digest_failures_++; }
    void addSessionsEvicted(int64_t count) { sessions_evicted_ += count; }
    void addBytesPublished(int64_t bytes) { bytes_published_ += bytes; }

    int64_t getSessionsStarted() const { return sessions_started_; }
    int64_t getChunksAccepted() const { return chunks_accepted_; }
    int64_t getDuplicateChunks() const { return duplicate_chunks_; }
    int64_t getChunkIntegrityFailures() const { return chunk_integrity_failures_; }
    int64_t getUploadsCompleted() const { return uploads_completed_; }
    int64_t getFinalDigestFailures() const { return final_digest_failures_; }
    int64_t getSessionsEvicted() const { return sessions_evicted_; }
    int64_t getBytesPublished() const { return bytes_published_; }

    // Export metrics as JSON
    std::string toJSON() const;

private:
    std::atomic<int64_t> sessions_started_{0};
    std::atomic<int64_t> chunks_accepted_{0};
    std::atomic<int64_t> duplicate_chunks_{0};
    std::atomic<int64_t> chunk_integrity_failures_{0};
    std::atomic<int64_t> uploads_completed_{0};
    std::atomic<int64_t> final_digest_failures_{0};
    std::atomic<int64_t> sessions_evicted_{0};
    std::atomic<int64_t> bytes_published_{0};
};

} // namespace chunkpost
