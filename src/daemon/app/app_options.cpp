#include "daemon/app/app_options.h"

#include <iostream>

namespace speaker_remote {
namespace daemon_app {

void printHelp(const char* exeName) {
    std::cout << "speaker_remote - powers speakers on and off with the media receiver\n";
    std::cout << "Usage: " << exeName << " [options] CONFIG_FILE\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  CONFIG_FILE             the .json configuration file\n\n";
    std::cout << "Options:\n";
    std::cout << "  -v, --verbose           enable verbose logging (debug level)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << std::endl;
}

bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error) {
    showHelp = false;
    const char* exeName = argc > 0 ? argv[0] : "speaker_remote";

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            printHelp(exeName);
            showHelp = true;
            return false;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            error = "unknown option: " + arg;
            printHelp(exeName);
            return false;
        }
        if (!options.configPath.empty()) {
            error = "unexpected argument: " + arg;
            printHelp(exeName);
            return false;
        }
        options.configPath = arg;
    }

    if (options.configPath.empty()) {
        error = "the following arguments are required: CONFIG_FILE";
        printHelp(exeName);
        return false;
    }
    return true;
}

}  // namespace daemon_app
}  // namespace speaker_remote
