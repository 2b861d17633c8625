/**
 * @file main.cpp
 * @brief Entry point for the code execution service
 *
 * Serves POST /execute, GET / and GET /health. Crow installs its own
 * SIGINT/SIGTERM handlers that stop the server, after which main returns.
 */

#include "main_server.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/exception.hpp"
#include "config/service_config.hpp"
#include "logging/logging.hpp"

int main(int argc, char* argv[]) {
    runway::config::ServiceConfig config;
    try {
        auto options = runway::config::parseCommandLine(argc, argv);
        if (options.showHelp) {
            std::cout << runway::config::usage(argv[0]);
            return EXIT_SUCCESS;
        }
        config = runway::config::loadServiceConfig(
            options, runway::config::processEnvironment());
    } catch (const runway::config::BadConfigException& e) {
        spdlog::error("Configuration error: {}", e.what());
        std::cerr << runway::config::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        runway::logging::initializeLogging(config.logging);
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize logging: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("==============================================");
    spdlog::info("  Code Execution Service                      ");
    spdlog::info("==============================================");
    spdlog::debug("Effective configuration: {}", config.serialize().dump());

    int status = EXIT_SUCCESS;
    try {
        runway::server::MainServer server(std::move(config));
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        status = EXIT_FAILURE;
    }

    runway::logging::shutdownLogging();
    return status;
}
