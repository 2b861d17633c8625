/*
 * app.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_APP_HPP
#define RUNWAY_SERVER_APP_HPP

#include <crow.h>

#include "middleware/cors.hpp"
#include "middleware/request_logger.hpp"

namespace runway::server {

/**
 * @brief Central HTTP application type with middleware stack
 *
 * Middleware execution order (before_handle):
 *   1. CORS - Answer preflight OPTIONS requests
 *   2. RequestLogger - Log request timing
 *
 * Note: after_handle runs in reverse order
 */
using ServerApp = crow::App<middleware::CORS, middleware::RequestLogger>;

}  // namespace runway::server

#endif  // RUNWAY_SERVER_APP_HPP
