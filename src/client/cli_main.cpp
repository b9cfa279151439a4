#include "cli.h"
#include <iostream>

int main(int argc, char** argv) {
    try {
        chunkpost::CliOptions options;
        std::string error;
        if (!chunkpost::ClientCli::parseArguments(argc, argv, options, error)) {
            std::cerr << "Error: " << error << std::endl;
            chunkpost::ClientCli::printUsage(argv[0], std::cerr);
            return 1;
        }
        if (options.show_help) {
            chunkpost::ClientCli::printUsage(argv[0], std::cout);
            return 0;
        }
        return chunkpost::ClientCli::run(options, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
