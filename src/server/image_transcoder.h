#pragma once

#include <string>
#include <vector>

namespace chunkpost {

// Converts a stored image (HEIC/HEIF) into a JPEG file
class ImageTranscoder {
public:
    virtual ~ImageTranscoder() = default;

    virtual bool transcodeToJpeg(const std::string& input_path, const std::string& output_path) = 0;
};

// Runs an external converter, e.g. "heif-convert -q 90 {input} {output}".
// The template is split on whitespace; {input} and {output} are substituted
// per argument, so paths never pass through a shell.
class CommandTranscoder : public ImageTranscoder {
public:
    explicit CommandTranscoder(const std::string& command_template);

    bool transcodeToJpeg(const std::string& input_path, const std::string& output_path) override;

    const std::vector<std::string>& argumentTemplate() const { return arguments_; }

private:
    std::vector<std::string> arguments_;
};

} // namespace chunkpost
