/*
 * execution.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_MODELS_EXECUTION_HPP
#define RUNWAY_SERVER_MODELS_EXECUTION_HPP

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "exec/types.hpp"

namespace runway::models::execution {

using json = nlohmann::json;

/**
 * @brief Why a request body could not be turned into an ExecutionRequest
 */
struct FieldError {
    enum class Kind { Missing, Invalid };

    Kind kind{Kind::Invalid};
    std::string field;       ///< Offending key
    std::string constraint;  ///< Human readable requirement
};

/**
 * @brief Map a POST /execute body onto an ExecutionRequest
 *
 * `code` and `language` must be strings. `timeout` is optional; when present
 * it must be a non-negative integer, and null counts as absent.
 */
[[nodiscard]] auto parseRequest(const json& body)
    -> std::expected<exec::ExecutionRequest, FieldError>;

/**
 * @brief Wire form of an ExecutionResponse
 */
[[nodiscard]] auto toJson(const exec::ExecutionResponse& response) -> json;

}  // namespace runway::models::execution

#endif  // RUNWAY_SERVER_MODELS_EXECUTION_HPP
