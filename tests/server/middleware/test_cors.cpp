/*
 * test_cors.cpp - Tests for CORS and request logging middleware
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "server/middleware/cors.hpp"
#include "server/middleware/request_logger.hpp"

using namespace runway::server::middleware;

class CorsMiddlewareTest : public ::testing::Test {
protected:
    CORS cors;
    CORS::context ctx;
    crow::request req;
    crow::response res;
};

TEST_F(CorsMiddlewareTest, PreflightIsAnsweredWith204) {
    req.method = crow::HTTPMethod::Options;
    req.url = "/execute";
    req.add_header("Access-Control-Request-Headers", "content-type, x-trace");

    cors.before_handle(req, res, ctx);

    EXPECT_EQ(res.code, 204);
    EXPECT_TRUE(res.is_completed());
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Headers"),
              "content-type, x-trace");
    EXPECT_EQ(res.get_header_value("Access-Control-Max-Age"), "3600");
    EXPECT_NE(res.get_header_value("Access-Control-Allow-Methods").find("POST"),
              std::string::npos);
}

TEST_F(CorsMiddlewareTest, NonPreflightPassesThrough) {
    req.method = crow::HTTPMethod::Post;
    cors.before_handle(req, res, ctx);
    EXPECT_FALSE(res.is_completed());
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "");
}

TEST_F(CorsMiddlewareTest, AfterHandleAddsHeaders) {
    req.method = crow::HTTPMethod::Get;
    res.code = 200;
    cors.after_handle(req, res, ctx);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Headers"), "*");
    EXPECT_EQ(res.get_header_value("Access-Control-Max-Age"), "3600");
}

TEST(RequestLoggerTest, RecordsStartTime) {
    RequestLogger logger;
    RequestLogger::context ctx;
    crow::request req;
    crow::response res(200);
    req.url = "/health";

    const auto before = std::chrono::steady_clock::now();
    logger.before_handle(req, res, ctx);
    EXPECT_GE(ctx.start_time, before);
    EXPECT_EQ(ctx.request_bytes, 0u);
    logger.after_handle(req, res, ctx);
    EXPECT_EQ(res.code, 200);
}

TEST(RequestLoggerTest, CountsRequestBodyBytes) {
    RequestLogger logger;
    RequestLogger::context ctx;
    crow::request req;
    crow::response res;
    req.method = crow::HTTPMethod::Post;
    req.url = "/execute";
    req.body = R"({"code":"print(1)","language":"python"})";

    logger.before_handle(req, res, ctx);
    EXPECT_EQ(ctx.request_bytes, req.body.size());
}

TEST(RequestLoggerTest, SummaryCarriesStatusTimingAndSizes) {
    crow::request req;
    req.method = crow::HTTPMethod::Post;
    req.url = "/execute";
    crow::response res(500, "boom");

    EXPECT_EQ(RequestLogger::summarize(req, res, 48,
                                       std::chrono::milliseconds(12)),
              "POST /execute -> 500 in 12ms (48 bytes in, 4 bytes out)");
}
