/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Configuration Exception Types

**************************************************/

#ifndef RUNWAY_CONFIG_EXCEPTION_HPP
#define RUNWAY_CONFIG_EXCEPTION_HPP

#include <stdexcept>

namespace runway::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

}  // namespace runway::config

#endif  // RUNWAY_CONFIG_EXCEPTION_HPP
