#include "utils.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chunkpost {

namespace fs = std::filesystem;

std::mutex Utils::log_mutex_;
#ifdef DEBUG
std::atomic<bool> Utils::debug_logging_{true};
#else
std::atomic<bool> Utils::debug_logging_{false};
#endif

namespace {

std::string toHex(const unsigned char* bytes, size_t size) {
    std::stringstream ss;
    for (size_t i = 0; i < size; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool isBase64Char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

std::string Utils::generateUuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating an identifier");
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::string hex = toHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string Utils::generateUploadId() {
    return generateUuid();
}

std::string Utils::calculateSHA256(const std::vector<uint8_t>& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(hash, hash_len);
}

std::string Utils::calculateSHA256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(hash, hash_len);
}

std::string Utils::calculateSHA256(const std::vector<std::string>& pieces) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    for (const std::string& piece : pieces) {
        if (!ok) break;
        ok = EVP_DigestUpdate(ctx, piece.data(), piece.size()) == 1;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(hash, hash_len);
}

bool Utils::isSha256Hex(const std::string& digest) {
    if (digest.size() != 64) return false;
    return std::all_of(digest.begin(), digest.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string Utils::base64Encode(const std::string& data) {
    return base64Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Utils::base64Encode(const uint8_t* data, size_t size) {
    std::string out(base64EncodedLength(size) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

bool Utils::base64Decode(const std::string& encoded, std::string& out) {
    out.clear();
    if (encoded.empty()) {
        return true;
    }
    if (encoded.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') padding++;
    if (encoded[encoded.size() - 2] == '=') padding++;

    // Padding only at the very end; every other character from the alphabet
    for (size_t i = 0; i < encoded.size() - padding; ++i) {
        if (!isBase64Char(encoded[i])) {
            return false;
        }
    }

    out.resize(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        out.clear();
        return false;
    }
    out.resize(static_cast<size_t>(written) - padding);
    return true;
}

size_t Utils::base64EncodedLength(size_t raw_size) {
    return (raw_size + 2) / 3 * 4;
}

bool Utils::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool Utils::createDirectories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool Utils::readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return false;
    }
    out = buffer.str();
    return true;
}

bool Utils::writeFile(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    return file.good();
}

int64_t Utils::getFileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return -1;
    }
    return static_cast<int64_t>(size);
}

bool Utils::deleteFile(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::vector<std::string> Utils::splitString(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string Utils::joinStrings(const std::vector<std::string>& strings, const std::string& delimiter) {
    if (strings.empty()) return "";

    std::string result = strings[0];
    for (size_t i = 1; i < strings.size(); ++i) {
        result += delimiter + strings[i];
    }
    return result;
}

std::string Utils::trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

std::string Utils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

int64_t Utils::getCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string Utils::timestampToString(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp / 1000);
    std::tm tm_buf{};
    gmtime_r(&time, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setw(3) << std::setfill('0') << (timestamp % 1000) << "Z";
    return ss.str();
}

void Utils::setDebugLogging(bool enabled) {
    debug_logging_.store(enabled);
}

bool Utils::isDebugLogging() {
    return debug_logging_.load();
}

void Utils::logInfo(const std::string& message) {
    writeLog("INFO", message, false);
}

void Utils::logWarning(const std::string& message) {
    writeLog("WARN", message, false);
}

void Utils::logError(const std::string& message) {
    writeLog("ERROR", message, true);
}

void Utils::logDebug(const std::string& message) {
    if (debug_logging_.load()) {
        writeLog("DEBUG", message, false);
    }
}

void Utils::writeLog(const char* level, const std::string& message, bool to_stderr) {
    std::string line = "[" + std::string(level) + "] " + timestampToString(getCurrentTimestamp()) + " " + message;

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (to_stderr) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

namespace {

bool parseInt(const std::string& key, const std::string& value, int64_t min_value, int64_t& out,
              std::string& error) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < min_value) {
            error = "Invalid value for " + key + ": " + value;
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        error = "Invalid number for " + key + ": " + value;
    } catch (const std::out_of_range&) {
        error = "Number out of range for " + key + ": " + value;
    }
    return false;
}

bool parseBool(const std::string& key, const std::string& value, bool& out, std::string& error) {
    std::string lower = Utils::toLower(value);
    if (lower == "true" || lower == "1" || lower == "on" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "off" || lower == "no") {
        out = false;
        return true;
    }
    error = "Invalid boolean for " + key + ": " + value;
    return false;
}

} // namespace

bool Config::loadFromFile(const std::string& configFile, std::string& error) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        error = "Could not open config file: " + configFile;
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = Utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            Utils::logWarning("Ignoring malformed config line " + std::to_string(line_number) +
                              " in " + configFile);
            continue;
        }

        std::string key = Utils::trim(line.substr(0, pos));
        std::string value = Utils::trim(line.substr(pos + 1));

        if (!set(key, value, error)) {
            error = configFile + ":" + std::to_string(line_number) + ": " + error;
            return false;
        }
    }

    return true;
}

bool Config::set(const std::string& key, const std::string& value, std::string& error) {
    int64_t number = 0;

    if (key == "listen_address") {
        listen_address_ = value;
    } else if (key == "http_port") {
        if (!parseInt(key, value, 0, number, error) || number > 65535) {
            if (error.empty()) error = "Port out of range: " + value;
            return false;
        }
        http_port_ = static_cast<int>(number);
    } else if (key == "grpc_port") {
        if (!parseInt(key, value, 0, number, error) || number > 65535) {
            if (error.empty()) error = "Port out of range: " + value;
            return false;
        }
        grpc_port_ = static_cast<int>(number);
    } else if (key == "upload_root") {
        upload_root_ = value;
    } else if (key == "clients_file") {
        clients_file_ = value;
    } else if (key == "metadata_file") {
        metadata_file_ = value;
    } else if (key == "session_ttl_seconds") {
        if (!parseInt(key, value, 1, number, error)) return false;
        session_ttl_seconds_ = static_cast<int>(number);
    } else if (key == "sweep_interval_seconds") {
        if (!parseInt(key, value, 1, number, error)) return false;
        sweep_interval_seconds_ = static_cast<int>(number);
    } else if (key == "max_upload_bytes") {
        if (!parseInt(key, value, 1, number, error)) return false;
        max_upload_bytes_ = number;
    } else if (key == "max_total_chunks") {
        if (!parseInt(key, value, 1, number, error)) return false;
        max_total_chunks_ = static_cast<int>(number);
    } else if (key == "http_worker_threads") {
        if (!parseInt(key, value, 1, number, error)) return false;
        http_worker_threads_ = static_cast<int>(number);
    } else if (key == "socket_timeout_ms") {
        if (!parseInt(key, value, 1, number, error)) return false;
        socket_timeout_ms_ = static_cast<int>(number);
    } else if (key == "transcode_command") {
        transcode_command_ = value;
    } else if (key == "public_url_prefix") {
        public_url_prefix_ = value;
    } else if (key == "debug_log") {
        if (!parseBool(key, value, debug_log_, error)) return false;
    } else if (key == "server_url") {
        server_url_ = value;
    } else if (key == "rpc_target") {
        rpc_target_ = value;
    } else if (key == "transport") {
        if (value != "http" && value != "grpc") {
            error = "Unknown transport: " + value;
            return false;
        }
        transport_ = value;
    } else if (key == "client_id") {
        client_id_ = value;
    } else if (key == "secret_key_base64") {
        secret_key_base64_ = value;
    } else if (key == "network_preference") {
        if (value != "any" && value != "wifi" && value != "cellular") {
            error = "Unknown network preference: " + value;
            return false;
        }
        network_preference_ = value;
    } else if (key == "start_timeout_ms") {
        if (!parseInt(key, value, 1, number, error)) return false;
        start_timeout_ms_ = static_cast<int>(number);
    } else if (key == "chunk_timeout_ms") {
        if (!parseInt(key, value, 1, number, error)) return false;
        chunk_timeout_ms_ = static_cast<int>(number);
    } else if (key == "retry_delay_ms") {
        if (!parseInt(key, value, 0, number, error)) return false;
        retry_delay_ms_ = static_cast<int>(number);
    } else if (key == "complete_timeout_ms") {
        if (!parseInt(key, value, 1, number, error)) return false;
        complete_timeout_ms_ = static_cast<int>(number);
    } else if (key == "purpose") {
        purpose_ = value;
    } else if (key == "uploader_id") {
        uploader_id_ = value;
    } else {
        Utils::logWarning("Unknown config key: " + key);
    }

    return true;
}

std::string UploadMetrics::toJSON() const {
    std::stringstream ss;
    ss << "{\n";
    ss << "  \"sessions_started\": " << sessions_started_ << ",\n";
    ss << "  \"chunks_accepted\": " << chunks_accepted_ << ",\n";
    ss << "  \"duplicate_chunks\": " << duplicate_chunks_ << ",\n";
    ss << "  \"chunk_integrity_failures\": " << chunk_integrity_failures_ << ",\n";
    ss << "  \"uploads_completed\": " << uploads_completed_ << ",\n";
    ss << "  \"final_digest_failures\": " << final_digest_failures_ << ",\n";
    ss << "  \"sessions_evicted\": " << sessions_evicted_ << ",\n";
    ss << "  \"bytes_published\": " << bytes_published_ << "\n";
    ss << "}";
    return ss.str();
}

} // namespace chunkpost
