#include "multipart.h"
#include "utils.h"

namespace chunkpost {

namespace {

// Value of name="..." inside a Content-Disposition header
std::string dispositionParam(const std::string& disposition, const std::string& name) {
    std::string lowered = Utils::toLower(disposition);
    std::string needle = name + "=";
    size_t pos = 0;
    while ((pos = lowered.find(needle, pos)) != std::string::npos) {
        // Must start a parameter, so "filename=" is not matched by "name="
        if (pos > 0 && lowered[pos - 1] != ';' && lowered[pos - 1] != ' ') {
            pos += needle.size();
            continue;
        }
        size_t start = pos + needle.size();
        if (start < disposition.size() && disposition[start] == '"') {
            size_t end = disposition.find('"', start + 1);
            if (end == std::string::npos) {
                return "";
            }
            return disposition.substr(start + 1, end - start - 1);
        }
        size_t end = disposition.find(';', start);
        return Utils::trim(disposition.substr(start, end == std::string::npos ? std::string::npos : end - start));
    }
    return "";
}

bool hasParam(const std::string& disposition, const std::string& name) {
    std::string lowered = Utils::toLower(disposition);
    size_t pos = lowered.find(name + "=");
    return pos != std::string::npos && (pos == 0 || lowered[pos - 1] == ';' || lowered[pos - 1] == ' ');
}

} // namespace

std::string MultipartForm::field(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? "" : it->second;
}

const MultipartFile* MultipartForm::file(const std::string& name) const {
    auto it = files.find(name);
    return it == files.end() ? nullptr : &it->second;
}

bool MultipartParser::extractBoundary(const std::string& content_type, std::string& boundary) {
    std::string lowered = Utils::toLower(content_type);
    if (lowered.compare(0, 19, "multipart/form-data") != 0) {
        return false;
    }
    size_t pos = lowered.find("boundary=");
    if (pos == std::string::npos) {
        return false;
    }
    std::string value = content_type.substr(pos + 9);
    size_t end = value.find(';');
    if (end != std::string::npos) {
        value = value.substr(0, end);
    }
    value = Utils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty() || value.size() > 70) {
        return false;
    }
    boundary = value;
    return true;
}

Status MultipartParser::parse(const std::string& content_type, const std::string& body, MultipartForm& form) {
    std::string boundary;
    if (!extractBoundary(content_type, boundary)) {
        return Status(ErrorCode::kBadRequest, "Expected multipart/form-data");
    }

    const std::string delimiter = "--" + boundary;
    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        return Status(ErrorCode::kBadRequest, "Malformed multipart body");
    }

    while (true) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            break;   // closing delimiter
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            return Status(ErrorCode::kBadRequest, "Malformed multipart body");
        }
        pos += 2;

        size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) {
            return Status(ErrorCode::kBadRequest, "Malformed multipart part headers");
        }

        std::string disposition;
        std::string part_type;
        for (const auto& raw : Utils::splitString(body.substr(pos, headers_end - pos), '\n')) {
            std::string line = Utils::trim(raw);
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = Utils::toLower(Utils::trim(line.substr(0, colon)));
            std::string value = Utils::trim(line.substr(colon + 1));
            if (name == "content-disposition") {
                disposition = value;
            } else if (name == "content-type") {
                part_type = value;
            }
        }

        size_t data_start = headers_end + 4;
        size_t next = body.find("\r\n" + delimiter, data_start);
        if (next == std::string::npos) {
            return Status(ErrorCode::kBadRequest, "Unterminated multipart part");
        }

        std::string field_name = dispositionParam(disposition, "name");
        if (field_name.empty()) {
            return Status(ErrorCode::kBadRequest, "Multipart part without a name");
        }

        std::string data = body.substr(data_start, next - data_start);
        if (hasParam(disposition, "filename")) {
            MultipartFile file;
            file.field_name = field_name;
            file.filename = dispositionParam(disposition, "filename");
            file.content_type = part_type.empty() ? "application/octet-stream" : part_type;
            file.data = std::move(data);
            form.files[field_name] = std::move(file);
        } else {
            form.fields[field_name] = std::move(data);
        }

        pos = next + 2;
    }

    return Status::OK();
}

} // namespace chunkpost
