#include "image_transcoder.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>

extern char** environ;

namespace chunkpost {

namespace {

std::string substitute(std::string argument, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = argument.find(placeholder, pos)) != std::string::npos) {
        argument.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return argument;
}

} // namespace

CommandTranscoder::CommandTranscoder(const std::string& command_template) {
    std::istringstream stream(command_template);
    std::string token;
    while (stream >> token) {
        arguments_.push_back(token);
    }
}

bool CommandTranscoder::transcodeToJpeg(const std::string& input_path, const std::string& output_path) {
    if (arguments_.empty()) {
        return false;
    }

    std::vector<std::string> argv_storage;
    for (const auto& argument : arguments_) {
        argv_storage.push_back(substitute(substitute(argument, "{input}", input_path), "{output}", output_path));
    }

    std::vector<char*> argv;
    for (auto& argument : argv_storage) {
        argv.push_back(&argument[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        Utils::logError("Failed to launch transcoder " + argv_storage[0] + ": " + std::strerror(rc));
        return false;
    }

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            Utils::logError("waitpid failed for transcoder: " + std::string(std::strerror(errno)));
            return false;
        }
    }

    if (!WIFEXITED(wait_status) || WEXITSTATUS(wait_status) != 0) {
        Utils::logWarning("Transcoder exited abnormally for " + input_path);
        return false;
    }

    if (Utils::getFileSize(output_path) <= 0) {
        Utils::logWarning("Transcoder produced no output for " + input_path);
        return false;
    }

    Utils::logDebug("Transcoded " + input_path + " -> " + output_path);
    return true;
}

} // namespace chunkpost
