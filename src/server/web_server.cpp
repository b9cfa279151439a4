#include "web_server.h"
#include "protocol.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace chunkpost {

namespace {

HttpResponse errorResponse(ErrorCode code, int status_code, const std::string& message) {
    return HttpResponse::json(status_code, errorToJson(Status(code, message)));
}

} // namespace

WebServer::WebServer(WebServerOptions options, Handler handler)
    : options_(std::move(options)),
      handler_(std::move(handler)),
      running_(false),
      server_socket_(-1),
      bound_port_(0) {
}

WebServer::~WebServer() {
    stop();
}

bool WebServer::start() {
    if (running_.load()) {
        Utils::logWarning("Web server is already running");
        return true;
    }

    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        Utils::logError("Failed to create socket for web server: " + std::string(std::strerror(errno)));
        return false;
    }

    // Allow socket reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (inet_pton(AF_INET, options_.listen_address.c_str(), &address.sin_addr) != 1) {
        Utils::logError("Invalid listen address: " + options_.listen_address);
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        Utils::logError("Failed to bind web server socket on port " + std::to_string(options_.port) + ": " +
                        std::strerror(errno));
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 64) < 0) {
        Utils::logError("Failed to listen on web server socket");
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    socklen_t address_len = sizeof(address);
    if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address), &address_len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    } else {
        bound_port_ = options_.port;
    }

    running_.store(true);
    int worker_count = std::max(1, options_.worker_threads);
    for (int i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&WebServer::workerLoop, this);
    }
    accept_thread_ = std::thread(&WebServer::acceptLoop, this);

    Utils::logInfo("HTTP server started on " + options_.listen_address + ":" + std::to_string(bound_port_) +
                   " with " + std::to_string(worker_count) + " worker(s)");
    return true;
}

void WebServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Unblock accept()
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (server_socket_ >= 0) {
        close(server_socket_);
        server_socket_ = -1;
    }

    pending_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    Utils::logInfo("HTTP server stopped");
}

void WebServer::acceptLoop() {
    while (running_.load()) {
        struct sockaddr_in client_address;
        socklen_t client_len = sizeof(client_address);

        int client_socket = accept(server_socket_, reinterpret_cast<struct sockaddr*>(&client_address), &client_len);
        if (client_socket < 0) {
            if (running_.load() && errno != EINTR) {
                Utils::logError("Failed to accept client connection: " + std::string(std::strerror(errno)));
            }
            continue;
        }

        struct timeval timeout;
        timeout.tv_sec = options_.socket_timeout_ms / 1000;
        timeout.tv_usec = (options_.socket_timeout_ms % 1000) * 1000;
        setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        pending_.push(client_socket);
    }
}

void WebServer::workerLoop() {
    int client_socket = -1;
    while (pending_.waitPop(client_socket)) {
        handleConnection(client_socket);
        close(client_socket);
    }
}

void WebServer::handleConnection(int client_socket) {
    HttpRequest request;
    HttpResponse rejection;
    if (!readRequest(client_socket, request, rejection)) {
        if (rejection.status_code != 0) {
            sendResponse(client_socket, rejection);
        }
        return;
    }

    Utils::logDebug("HTTP " + request.method + " " + request.path + " (" + std::to_string(request.body.size()) +
                    " bytes)");

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        Utils::logError("Unhandled error serving " + request.path + ": " + e.what());
        response = errorResponse(ErrorCode::kStorageError, 500, "Internal server error");
    }
    sendResponse(client_socket, response);
}

bool WebServer::readRequest(int client_socket, HttpRequest& request, HttpResponse& rejection) {
    rejection.status_code = 0;

    std::string buffer;
    size_t head_end = std::string::npos;
    char chunk[8192];

    while (head_end == std::string::npos) {
        ssize_t received = recv(client_socket, chunk, sizeof(chunk), 0);
        if (received <= 0) {
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                rejection = errorResponse(ErrorCode::kBadRequest, 408, "Request timeout");
            }
            return false;
        }
        buffer.append(chunk, static_cast<size_t>(received));
        head_end = buffer.find("\r\n\r\n");
        if (head_end == std::string::npos && buffer.size() > options_.max_header_bytes) {
            rejection = errorResponse(ErrorCode::kBadRequest, 431, "Request headers too large");
            return false;
        }
    }

    std::string error;
    if (!HttpParser::parseHead(buffer.substr(0, head_end), request, error)) {
        rejection = errorResponse(ErrorCode::kBadRequest, 400, error);
        return false;
    }

    if (!request.header("transfer-encoding").empty()) {
        rejection = errorResponse(ErrorCode::kBadRequest, 411, "Content-Length required");
        return false;
    }

    int64_t length = 0;
    if (!request.header("content-length").empty()) {
        length = request.contentLength();
        if (length < 0) {
            rejection = errorResponse(ErrorCode::kBadRequest, 400, "Invalid Content-Length");
            return false;
        }
    }
    if (options_.max_body_bytes > 0 && length > options_.max_body_bytes) {
        Utils::logWarning("Rejected " + request.path + ": body of " + std::to_string(length) + " bytes");
        rejection = errorResponse(ErrorCode::kPayloadTooLarge, 413, "File too large");
        return false;
    }

    request.body = buffer.substr(head_end + 4);
    request.body.reserve(static_cast<size_t>(length));
    while (static_cast<int64_t>(request.body.size()) < length) {
        ssize_t received = recv(client_socket, chunk, sizeof(chunk), 0);
        if (received <= 0) {
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                rejection = errorResponse(ErrorCode::kBadRequest, 408, "Request timeout");
            }
            return false;
        }
        request.body.append(chunk, static_cast<size_t>(received));
    }
    if (static_cast<int64_t>(request.body.size()) > length) {
        request.body.resize(static_cast<size_t>(length));
    }
    return true;
}

void WebServer::sendResponse(int client_socket, const HttpResponse& response) {
    std::string data = response.serialize();
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t written = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) continue;
            Utils::logError("Failed to send HTTP response: " + std::string(std::strerror(errno)));
            return;
        }
        sent += static_cast<size_t>(written);
    }
}

} // namespace chunkpost
