#pragma once

#include <json/json.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace chunkpost {

struct HttpRequest {
    std::string method;
    std::string target;   // as received, including any query
    std::string path;     // target without query, percent-decoded
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers;   // lowercased names
    std::string body;

    std::string header(const std::string& name) const;
    int64_t contentLength() const;   // -1 when absent or malformed
};

struct HttpResponse {
    int status_code = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> extra_headers;

    std::string serialize() const;

    static HttpResponse json(int status_code, const Json::Value& root);
    static HttpResponse bytes(const std::string& content_type, std::string body);
};

class HttpParser {
public:
    // Parse the request line and headers (everything before the blank line)
    static bool parseHead(const std::string& head, HttpRequest& request, std::string& error);

    static std::string percentDecode(const std::string& text);
    static const char* statusText(int status_code);
};

} // namespace chunkpost
