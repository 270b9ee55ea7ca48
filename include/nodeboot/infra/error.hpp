/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Fatal error taxonomy of the bootstrap pipeline.
 *
 * @details
 * Every stage reports failure by throwing `BootError`. Nothing below `main`
 * catches it: the entrypoint logs the error, runs the diagnostics reporter
 * and exits with `exit_code()`. No error in this taxonomy is retried.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace nodeboot::infra {

/**
 * @enum ErrorCode
 * @brief Classification of fatal conditions.
 */
enum class ErrorCode {
    ConfigurationConflict, ///< Mutually exclusive inputs were both supplied.
    InvalidConfiguration,  ///< The server rejected its configuration, or an input is malformed.
    InitializationFailed,  ///< Creating the system database failed.
    StartupFailed,         ///< The setup instance died before answering the readiness probe.
    ProvisioningFailed,    ///< A setup statement, init script or timezone load failed.
    ShutdownFailed,        ///< The setup instance did not stop cleanly.
    HandoffFailed          ///< `exec` of the final server command failed.
};

/// @brief Stable name of an error code, e.g. `"StartupFailed"`.
const char* to_string(ErrorCode code);

/**
 * @class BootError
 * @brief Exception carrying an `ErrorCode` and the process exit status to use.
 */
class BootError : public std::runtime_error {
  public:
    BootError(ErrorCode code, const std::string& message, int exit_code = 1)
        : std::runtime_error(message), code_(code), exit_code_(exit_code)
    {
    }

    ErrorCode code() const
    {
        return code_;
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    ErrorCode code_;
    int exit_code_;
};

} // namespace nodeboot::infra
