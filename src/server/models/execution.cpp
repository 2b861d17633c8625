/*
 * execution.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution.hpp"

#include <cmath>

namespace runway::models::execution {

namespace {

auto requireString(const json& body, const char* field)
    -> std::expected<std::string, FieldError> {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return std::unexpected(
            FieldError{FieldError::Kind::Missing, field, "string"});
    }
    if (!it->is_string()) {
        return std::unexpected(
            FieldError{FieldError::Kind::Invalid, field, "must be a string"});
    }
    return it->get<std::string>();
}

}  // namespace

auto parseRequest(const json& body)
    -> std::expected<exec::ExecutionRequest, FieldError> {
    if (!body.is_object()) {
        return std::unexpected(FieldError{FieldError::Kind::Invalid, "body",
                                          "must be a JSON object"});
    }

    exec::ExecutionRequest request;

    auto code = requireString(body, "code");
    if (!code) {
        return std::unexpected(code.error());
    }
    request.code = std::move(*code);

    auto language = requireString(body, "language");
    if (!language) {
        return std::unexpected(language.error());
    }
    request.language = std::move(*language);

    if (auto it = body.find("timeout"); it != body.end() && !it->is_null()) {
        if (it->is_number_unsigned()) {
            request.timeoutSeconds = it->get<std::uint64_t>();
        } else if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            request.timeoutSeconds =
                static_cast<std::uint64_t>(it->get<std::int64_t>());
        } else {
            return std::unexpected(FieldError{FieldError::Kind::Invalid,
                                              "timeout",
                                              "must be a non-negative integer"});
        }
    }

    return request;
}

auto toJson(const exec::ExecutionResponse& response) -> json {
    const double elapsed = std::isfinite(response.executionTimeMs) &&
                                   response.executionTimeMs >= 0.0
                               ? response.executionTimeMs
                               : 0.0;
    return {{"stdout", response.stdoutText},
            {"stderr", response.stderrText},
            {"exit_code", response.exitCode},
            {"execution_time", elapsed}};
}

}  // namespace runway::models::execution
