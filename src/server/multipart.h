#pragma once

#include "status.h"
#include <map>
#include <string>

namespace chunkpost {

struct MultipartFile {
    std::string field_name;
    std::string filename;
    std::string content_type;
    std::string data;
};

struct MultipartForm {
    std::map<std::string, std::string> fields;
    std::map<std::string, MultipartFile> files;

    std::string field(const std::string& name) const;
    const MultipartFile* file(const std::string& name) const;
};

// multipart/form-data decoder for buffered request bodies
class MultipartParser {
public:
    static Status parse(const std::string& content_type, const std::string& body, MultipartForm& form);

    // Extract the boundary parameter of a Content-Type header
    static bool extractBoundary(const std::string& content_type, std::string& boundary);
};

} // namespace chunkpost
