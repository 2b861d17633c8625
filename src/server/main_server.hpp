/*
 * main_server.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_MAIN_SERVER_HPP
#define RUNWAY_SERVER_MAIN_SERVER_HPP

#include <memory>
#include <vector>

#include "app.hpp"
#include "config/service_config.hpp"
#include "controller/controller.hpp"
#include "exec/orchestrator.hpp"

namespace runway::server {

/**
 * @brief Main server application class
 *
 * Owns the Crow application, the execution orchestrator and the controllers
 * that expose it over HTTP.
 */
class MainServer {
public:
    explicit MainServer(config::ServiceConfig config);

    MainServer(const MainServer&) = delete;
    MainServer& operator=(const MainServer&) = delete;

    /**
     * @brief Bind and serve; blocks until SIGINT or SIGTERM
     */
    void start();

    [[nodiscard]] auto app() noexcept -> ServerApp& { return app_; }

    [[nodiscard]] auto orchestrator() const noexcept
        -> const exec::ExecutionOrchestrator& {
        return *orchestrator_;
    }

    [[nodiscard]] auto config() const noexcept -> const config::ServiceConfig& {
        return config_;
    }

private:
    void initializeControllers();

    config::ServiceConfig config_;
    ServerApp app_;
    std::shared_ptr<const exec::ExecutionOrchestrator> orchestrator_;
    std::vector<std::unique_ptr<controller::Controller>> controllers_;
};

}  // namespace runway::server

#endif  // RUNWAY_SERVER_MAIN_SERVER_HPP
