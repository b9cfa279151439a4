#pragma once

#include "status.h"
#include "upload_transport.h"
#include "utils.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace chunkpost {

struct CliOptions {
    Config config;
    std::string network_spec;          // empty means probe the live interfaces
    std::string command;
    std::vector<std::string> arguments;
    bool show_help = false;
};

// chunkpost_client [flags] <upload|probe|plan> [args]
class ClientCli {
public:
    static bool parseArguments(int argc, const char* const* argv, CliOptions& options, std::string& error);
    static void printUsage(const char* program, std::ostream& out);

    // Returns the process exit code; results go to out, diagnostics to the log
    static int run(const CliOptions& options, std::ostream& out);

    static Status makeTransport(const Config& config, std::unique_ptr<UploadTransport>& transport);

private:
    static int runProbe(const CliOptions& options, std::ostream& out);
    static int runPlan(const CliOptions& options, std::ostream& out);
    static int runUpload(const CliOptions& options, std::ostream& out);
};

} // namespace chunkpost
