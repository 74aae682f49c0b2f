/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Configuration Exception Types

**************************************************/

#ifndef STORMWATCH_CONFIG_EXCEPTION_HPP
#define STORMWATCH_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace stormwatch::config {

/**
 * @brief Base exception for configuration errors, also raised for a
 * settings file that cannot be parsed
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                       \
    throw stormwatch::config::BadConfigException(                             \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for invalid configuration values
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)                                   \
    throw stormwatch::config::InvalidConfigException(                         \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                        \
    throw stormwatch::config::ConfigIOException(                              \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace stormwatch::config

#endif  // STORMWATCH_CONFIG_EXCEPTION_HPP
