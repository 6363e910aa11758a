#include "daemon/app/app.h"
#include "daemon/app/app_options.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace speaker_remote::daemon_app;

    AppOptions options;
    bool showHelp = false;
    std::string optionError;
    if (!parseArgs(argc, argv, options, showHelp, optionError)) {
        if (!optionError.empty()) {
            std::cerr << "error: " << optionError << std::endl;
        }
        return showHelp ? 0 : 1;
    }

    try {
        App app(options);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
