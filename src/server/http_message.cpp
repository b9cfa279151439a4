#include "http_message.h"
#include "protocol.h"
#include "utils.h"
#include <sstream>

namespace chunkpost {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(Utils::toLower(name));
    if (it == headers.end()) {
        return "";
    }
    return it->second;
}

int64_t HttpRequest::contentLength() const {
    std::string value = header("content-length");
    if (value.empty() || value.size() > 18) {
        return -1;
    }
    int64_t length = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return -1;
        }
        length = length * 10 + (c - '0');
    }
    return length;
}

std::string HttpResponse::serialize() const {
    std::stringstream out;
    out << "HTTP/1.1 " << status_code << " " << HttpParser::statusText(status_code) << "\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Content-Length: " << body.size() << "\r\n";
    for (const auto& header : extra_headers) {
        out << header.first << ": " << header.second << "\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    out << body;
    return out.str();
}

HttpResponse HttpResponse::json(int status_code, const Json::Value& root) {
    HttpResponse response;
    response.status_code = status_code;
    response.content_type = "application/json";
    response.body = writeJson(root);
    return response;
}

HttpResponse HttpResponse::bytes(const std::string& content_type, std::string body) {
    HttpResponse response;
    response.content_type = content_type;
    response.body = std::move(body);
    return response;
}

bool HttpParser::parseHead(const std::string& head, HttpRequest& request, std::string& error) {
    std::istringstream stream(head);
    std::string request_line;
    if (!std::getline(stream, request_line)) {
        error = "Empty request";
        return false;
    }
    if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
    }

    std::istringstream line(request_line);
    line >> request.method >> request.target >> request.version;
    if (request.method.empty() || request.target.empty() || request.version.compare(0, 5, "HTTP/") != 0) {
        error = "Malformed request line";
        return false;
    }

    size_t query_pos = request.target.find('?');
    if (query_pos != std::string::npos) {
        request.path = percentDecode(request.target.substr(0, query_pos));
        request.query = request.target.substr(query_pos + 1);
    } else {
        request.path = percentDecode(request.target);
    }

    std::string header_line;
    while (std::getline(stream, header_line)) {
        if (!header_line.empty() && header_line.back() == '\r') {
            header_line.pop_back();
        }
        if (header_line.empty()) {
            break;
        }
        size_t colon = header_line.find(':');
        if (colon == std::string::npos) {
            error = "Malformed header line";
            return false;
        }
        std::string name = Utils::toLower(Utils::trim(header_line.substr(0, colon)));
        request.headers[name] = Utils::trim(header_line.substr(colon + 1));
    }
    return true;
}

std::string HttpParser::percentDecode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        decoded += text[i];
    }
    return decoded;
}

const char* HttpParser::statusText(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 504: return "Gateway Timeout";
    }
    return "Unknown";
}

} // namespace chunkpost
