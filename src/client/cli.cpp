#include "cli.h"
#include "concurrency_planner.h"
#include "chunk_partitioner.h"
#include "http_transport.h"
#include "network_probe.h"
#include "signer.h"
#include "uploader.h"
#ifdef CHUNKPOST_WITH_GRPC
#include "rpc_transport.h"
#endif
#include <iostream>

namespace chunkpost {

namespace {

std::unique_ptr<NetworkProbe> makeProbe(const std::string& network_spec, Status& status) {
    if (network_spec.empty()) {
        return std::make_unique<LinuxNetworkProbe>();
    }
    NetworkState state;
    std::string error;
    if (!parseNetworkSpec(network_spec, state, error)) {
        status = Status(ErrorCode::kConfigError, error);
        return nullptr;
    }
    return std::make_unique<StaticNetworkProbe>(state);
}

} // namespace

bool ClientCli::parseArguments(int argc, const char* const* argv, CliOptions& options, std::string& error) {
    struct Flag {
        const char* name;
        const char* key;
    };
    static const Flag kConfigFlags[] = {
        {"--server", "server_url"},
        {"--transport", "transport"},
        {"--purpose", "purpose"},
        {"--uploader-id", "uploader_id"},
        {"--network-preference", "network_preference"},
    };

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return true;
        }
        if (arg == "--verbose") {
            options.config.setDebugLog(true);
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            break;
        }
        if (!has_value) {
            error = "Missing value for " + arg;
            return false;
        }
        if (arg == "--config") {
            if (!options.config.loadFromFile(argv[++i], error)) {
                return false;
            }
            continue;
        }
        if (arg == "--network") {
            options.network_spec = argv[++i];
            continue;
        }

        bool known = false;
        for (const auto& flag : kConfigFlags) {
            if (arg == flag.name) {
                if (!options.config.set(flag.key, argv[++i], error)) {
                    return false;
                }
                known = true;
                break;
            }
        }
        if (!known) {
            error = "Unknown option: " + arg;
            return false;
        }
    }

    if (i >= argc) {
        error = "Missing command";
        return false;
    }
    options.command = argv[i++];
    for (; i < argc; ++i) {
        options.arguments.push_back(argv[i]);
    }

    if (options.command != "upload" && options.command != "probe" && options.command != "plan") {
        error = "Unknown command: " + options.command;
        return false;
    }
    if (options.command == "upload" && options.arguments.empty()) {
        error = "upload needs at least one file";
        return false;
    }
    return true;
}

void ClientCli::printUsage(const char* program, std::ostream& out) {
    out << "Usage: " << program << " [options] <command> [args]\n"
        << "\nCommands:\n"
        << "  upload <file>...     Upload files and print per-file outcomes\n"
        << "  probe                Print the current network reading\n"
        << "  plan [file-size]     Print the concurrency plan (and chunk count)\n"
        << "\nOptions:\n"
        << "  --config FILE                      Client configuration file\n"
        << "  --server URL                       Server base URL\n"
        << "  --transport http|grpc              Wire transport\n"
        << "  --purpose chat|shared              Upload partition\n"
        << "  --uploader-id ID                   Uploader for chat uploads\n"
        << "  --network-preference any|wifi|cellular\n"
        << "  --network SPEC                     Fixed network reading, e.g. offline, wifi:75, cellular:4g:cheap\n"
        << "  --verbose                          Debug logging\n";
}

Status ClientCli::makeTransport(const Config& config, std::unique_ptr<UploadTransport>& transport) {
    std::string kind = Utils::toLower(config.getTransport());
    if (kind == "http") {
        transport = std::make_unique<HttpTransport>(config.getServerUrl());
        return Status::OK();
    }
    if (kind == "grpc") {
#ifdef CHUNKPOST_WITH_GRPC
        transport = std::make_unique<RpcTransport>(config.getRpcTarget());
        return Status::OK();
#else
        return Status(ErrorCode::kConfigError, "This build has no gRPC transport");
#endif
    }
    return Status(ErrorCode::kConfigError, "Unknown transport: " + config.getTransport());
}

int ClientCli::run(const CliOptions& options, std::ostream& out) {
    if (options.config.isDebugLog()) {
        Utils::setDebugLogging(true);
    }
    if (options.command == "probe") {
        return runProbe(options, out);
    }
    if (options.command == "plan") {
        return runPlan(options, out);
    }
    return runUpload(options, out);
}

int ClientCli::runProbe(const CliOptions& options, std::ostream& out) {
    Status status;
    auto probe = makeProbe(options.network_spec, status);
    if (!probe) {
        Utils::logError(status.toString());
        return 1;
    }
    out << probe->probe().toString() << std::endl;
    return 0;
}

int ClientCli::runPlan(const CliOptions& options, std::ostream& out) {
    Status status;
    auto probe = makeProbe(options.network_spec, status);
    if (!probe) {
        Utils::logError(status.toString());
        return 1;
    }

    NetworkPreference preference;
    if (!parseNetworkPreference(options.config.getNetworkPreference(), preference)) {
        Utils::logError("Invalid network preference: " + options.config.getNetworkPreference());
        return 1;
    }

    NetworkState state = probe->probe();
    UploadPlan plan = ConcurrencyPlanner::plan(state, preference);
    out << "network: " << state.toString() << std::endl;
    out << "plan: " << plan.toString() << std::endl;

    if (plan.ok && !options.arguments.empty()) {
        int64_t file_size = 0;
        try {
            file_size = std::stoll(options.arguments[0]);
        } catch (const std::exception&) {
            Utils::logError("Invalid file size: " + options.arguments[0]);
            return 1;
        }
        if (file_size <= 0) {
            Utils::logError("Invalid file size: " + options.arguments[0]);
            return 1;
        }
        size_t encoded = Utils::base64EncodedLength(static_cast<size_t>(file_size));
        size_t chunk_length = ChunkPartitioner::effectiveChunkLength(encoded, plan.base_chunk_bytes);
        size_t chunks = (encoded + chunk_length - 1) / chunk_length;
        out << "chunks: " << chunks << " x " << chunk_length << " base64 chars" << std::endl;
    }
    return plan.ok ? 0 : 2;
}

int ClientCli::runUpload(const CliOptions& options, std::ostream& out) {
    Status status;
    auto probe = makeProbe(options.network_spec, status);
    if (!probe) {
        Utils::logError(status.toString());
        return 1;
    }

    UploaderOptions uploader_options;
    status = UploaderOptions::fromConfig(options.config, uploader_options);
    if (!status.ok()) {
        Utils::logError(status.toString());
        return 1;
    }

    std::unique_ptr<UploadTransport> transport;
    status = makeTransport(options.config, transport);
    if (!status.ok()) {
        Utils::logError(status.toString());
        return 1;
    }

    Signer signer = Signer::fromConfig(options.config);
    Uploader uploader(*transport, signer, *probe, uploader_options);
    uploader.setProgressCallback([](int64_t done, int64_t total) {
        Utils::logDebug("Progress: " + std::to_string(done) + "/" + std::to_string(total) + " chunks");
    });

    BatchReport report = uploader.uploadFiles(options.arguments);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, report.toJson()) << std::endl;
    return report.failure_count == 0 ? 0 : 1;
}

} // namespace chunkpost
