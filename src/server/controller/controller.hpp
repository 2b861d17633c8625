/*
 * controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNWAY_SERVER_CONTROLLER_CONTROLLER_HPP
#define RUNWAY_SERVER_CONTROLLER_CONTROLLER_HPP

#include "../app.hpp"

namespace runway::server::controller {

/**
 * @brief Base class for all HTTP controllers
 *
 * Controllers implement registerRoutes() to define their HTTP endpoints.
 */
class Controller {
public:
    virtual ~Controller() = default;

    /**
     * @brief Register HTTP routes with the Crow application
     * @param app The Crow application instance
     */
    virtual void registerRoutes(ServerApp& app) = 0;
};

}  // namespace runway::server::controller

#endif  // RUNWAY_SERVER_CONTROLLER_CONTROLLER_HPP
