#pragma once

#include "blocking_queue.h"
#include "http_message.h"
#include "utils.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace chunkpost {

struct WebServerOptions {
    std::string listen_address = "0.0.0.0";
    int port = 8080;                        // 0 picks a free port
    int worker_threads = 8;
    int64_t max_body_bytes = 0;             // requests above this get 413
    int socket_timeout_ms = 30000;
    size_t max_header_bytes = 16 * 1024;
};

// Minimal HTTP/1.1 server: one accept thread feeding a fixed pool of workers.
// Each connection carries exactly one request (Connection: close).
class WebServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    WebServer(WebServerOptions options, Handler handler);
    ~WebServer();

    // Bind and start serving; false if the socket cannot be set up
    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }
    int boundPort() const { return bound_port_; }

private:
    WebServerOptions options_;
    Handler handler_;
    std::atomic<bool> running_;
    int server_socket_;
    int bound_port_;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    BlockingQueue<int> pending_;

    void acceptLoop();
    void workerLoop();

    // HTTP request handling
    void handleConnection(int client_socket);
    bool readRequest(int client_socket, HttpRequest& request, HttpResponse& rejection);
    void sendResponse(int client_socket, const HttpResponse& response);
};

} // namespace chunkpost
