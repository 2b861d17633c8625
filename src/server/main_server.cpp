/*
 * main_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "main_server.hpp"

#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>

#include "controller/execution.hpp"
#include "controller/service.hpp"

namespace runway::server {

MainServer::MainServer(config::ServiceConfig config)
    : config_(std::move(config)),
      orchestrator_(std::make_shared<const exec::ExecutionOrchestrator>(
          config_.orchestratorOptions())) {
    spdlog::info("Initializing {} v{}", controller::kServiceName,
                 controller::kServiceVersion);
    // Crow's own logger only reports problems; requests go through spdlog.
    app_.loglevel(crow::LogLevel::Warning);
    initializeControllers();
}

void MainServer::initializeControllers() {
    controllers_.push_back(
        std::make_unique<controller::ExecutionController>(orchestrator_));
    controllers_.push_back(std::make_unique<controller::ServiceController>(
        orchestrator_->registry().languages()));

    for (auto& ctrl : controllers_) {
        ctrl->registerRoutes(app_);
    }
    spdlog::info("Registered {} controllers", controllers_.size());
}

void MainServer::start() {
    spdlog::info("Starting server on {}:{} with {} threads", config_.host,
                 config_.port, config_.threadCount);
    app_.bindaddr(config_.host)
        .port(static_cast<std::uint16_t>(config_.port))
        .concurrency(static_cast<std::uint16_t>(config_.threadCount))
        .run();
    spdlog::info("Server stopped");
}

}  // namespace runway::server
