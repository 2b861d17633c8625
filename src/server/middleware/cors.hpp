/*
 * cors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_MIDDLEWARE_CORS_HPP
#define RUNWAY_SERVER_MIDDLEWARE_CORS_HPP

#include <crow.h>

#include <string>

namespace runway::server::middleware {

/**
 * @brief CORS middleware allowing any origin, method and header
 *
 * Preflight requests are answered with 204 before routing.
 */
struct CORS {
    static constexpr const char* kAllowMethods =
        "GET, POST, PUT, PATCH, DELETE, OPTIONS, HEAD";
    static constexpr const char* kMaxAge = "3600";

    struct context {};

    void before_handle(crow::request& req, crow::response& res,
                       context& /*ctx*/) {
        if (req.method != crow::HTTPMethod::Options) {
            return;
        }
        res.code = 204;
        applyHeaders(req, res);
        res.end();
    }

    void after_handle(crow::request& req, crow::response& res,
                      context& /*ctx*/) {
        applyHeaders(req, res);
    }

    static void applyHeaders(const crow::request& req, crow::response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);

        // Echo the requested headers; "*" is not honored with credentials.
        const auto& requested =
            req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers",
                       requested.empty() ? std::string("*") : requested);
        res.set_header("Access-Control-Max-Age", kMaxAge);
    }
};

}  // namespace runway::server::middleware

#endif  // RUNWAY_SERVER_MIDDLEWARE_CORS_HPP
