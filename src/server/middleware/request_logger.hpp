/*
 * request_logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
#define RUNWAY_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP

#include <crow.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace runway::server::middleware {

/**
 * @brief Request logging middleware
 *
 * Logs one line when a request arrives and one when it completes, with the
 * body sizes in both directions. Server errors are logged at warn.
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
        std::size_t request_bytes{0};
    };

    /// "POST /execute -> 200 in 12ms (48 bytes in, 97 bytes out)"
    static auto summarize(const crow::request& req, const crow::response& res,
                          std::size_t requestBytes,
                          std::chrono::milliseconds elapsed) -> std::string {
        return fmt::format("{} {} -> {} in {}ms ({} bytes in, {} bytes out)",
                           crow::method_name(req.method), req.url, res.code,
                           elapsed.count(), requestBytes, res.body.size());
    }

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        ctx.request_bytes = req.body.size();
        spdlog::info("Incoming request: {} {} ({} bytes)",
                     crow::method_name(req.method), req.url,
                     ctx.request_bytes);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        const auto level =
            res.code >= 500 ? spdlog::level::warn : spdlog::level::info;
        spdlog::log(level, "Request completed: {}",
                    summarize(req, res, ctx.request_bytes, elapsed));
    }
};

}  // namespace runway::server::middleware

#endif  // RUNWAY_SERVER_MIDDLEWARE_REQUEST_LOGGER_HPP
