/*
 * service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_CONTROLLER_SERVICE_HPP
#define RUNWAY_SERVER_CONTROLLER_SERVICE_HPP

#include "../utils/response.hpp"
#include "controller.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace runway::server::controller {

inline constexpr const char* kServiceName = "execution-service";
inline constexpr const char* kServiceVersion = "0.1.0";

/**
 * @brief GET / and GET /health
 */
class ServiceController : public Controller {
public:
    explicit ServiceController(std::vector<std::string> languages)
        : languages_(std::move(languages)) {}

    void registerRoutes(ServerApp& app) override {
        CROW_ROUTE(app, "/").methods("GET"_method)([this]() {
            return utils::ResponseBuilder::json(root());
        });
        CROW_ROUTE(app, "/health").methods("GET"_method)([]() {
            return utils::ResponseBuilder::json(health());
        });
    }

    [[nodiscard]] auto root() const -> nlohmann::json {
        return {{"service", kServiceName},
                {"status", "running"},
                {"version", kServiceVersion},
                {"languages", languages_}};
    }

    [[nodiscard]] static auto health() -> nlohmann::json {
        return {{"status", "healthy"}, {"service", kServiceName}};
    }

private:
    std::vector<std::string> languages_;
};

}  // namespace runway::server::controller

#endif  // RUNWAY_SERVER_CONTROLLER_SERVICE_HPP
