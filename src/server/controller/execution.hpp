/*
 * execution.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_CONTROLLER_EXECUTION_HPP
#define RUNWAY_SERVER_CONTROLLER_EXECUTION_HPP

#include "../models/execution.hpp"
#include "../utils/response.hpp"
#include "controller.hpp"

#include <memory>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "exec/orchestrator.hpp"

namespace runway::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

/**
 * @brief POST /execute
 *
 * Processable requests always receive 200; failures travel in the body.
 */
class ExecutionController : public Controller {
public:
    explicit ExecutionController(
        std::shared_ptr<const exec::ExecutionOrchestrator> orchestrator)
        : orchestrator_(std::move(orchestrator)) {}

    void registerRoutes(ServerApp& app) override {
        CROW_ROUTE(app, "/execute")
            .methods("POST"_method)([this](const crow::request& req) {
                return execute(req);
            });
    }

    /**
     * @brief Handle one /execute body
     */
    auto execute(const crow::request& req) const -> crow::response {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("ExecutionController: rejected body: {}", e.what());
            return ResponseBuilder::invalidJson(e.what());
        }

        auto request = models::execution::parseRequest(body);
        if (!request) {
            const auto& err = request.error();
            spdlog::warn("ExecutionController: bad field '{}': {}", err.field,
                         err.constraint);
            if (err.kind == models::execution::FieldError::Kind::Missing) {
                return ResponseBuilder::missingField(err.field,
                                                     err.constraint);
            }
            return ResponseBuilder::invalidFieldValue(err.field,
                                                      err.constraint);
        }

        exec::ExecutionResponse response;
        try {
            response = orchestrator_->execute(*request);
        } catch (const std::exception& e) {
            spdlog::error(
                "ExecutionController: exception while executing {} code: {}",
                request->language, e.what());
            response.stderrText = fmt::format("Internal error: {}", e.what());
            response.exitCode = exec::kSyntheticExitCode;
        }
        return ResponseBuilder::json(models::execution::toJson(response));
    }

private:
    std::shared_ptr<const exec::ExecutionOrchestrator> orchestrator_;
};

}  // namespace runway::server::controller

#endif  // RUNWAY_SERVER_CONTROLLER_EXECUTION_HPP
