#pragma once

#include <string>

namespace speaker_remote {
namespace daemon_app {

struct AppOptions {
    std::string configPath;
    bool verbose = false;  // debug-level logging
};

// Parse CLI arguments. showHelp=true means help was printed and the caller should exit 0.
bool parseArgs(int argc, char** argv, AppOptions& options, bool& showHelp, std::string& error);

void printHelp(const char* exeName);

}  // namespace daemon_app
}  // namespace speaker_remote
