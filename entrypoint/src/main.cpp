#include "Config.h"
#include "EntrypointApp.h"
#include "Log.h"

#include <iostream>
#include <stdexcept>
#include <string>

using bootgate::entrypoint::EntrypointApp;
using bootgate::entrypoint::EntrypointConfig;
using bootgate::entrypoint::Logger;

namespace {
constexpr int kExitUsage = 2;
}

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "bootgate-entrypoint";
    Logger logger;

    EntrypointConfig config;
    try {
        config = bootgate::entrypoint::parseEntrypointConfig(argc, argv);
    } catch (const std::invalid_argument& ex) {
        logger.error(ex.what());
        std::cerr << bootgate::entrypoint::usage(program);
        return kExitUsage;
    }

    if (config.showHelp) {
        std::cout << bootgate::entrypoint::usage(program);
        return 0;
    }
    if (config.printConfig) {
        std::cout << bootgate::entrypoint::configToJson(config).dump(2) << std::endl;
        return 0;
    }

    logger.setVerbose(config.verbose);

    try {
        EntrypointApp app(config, logger);
        return app.run();
    } catch (const std::exception& ex) {
        logger.error(ex.what());
        return 1;
    }
}
