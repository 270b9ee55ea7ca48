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
 * @file secret_resolver.hpp
 * @brief Value-or-file resolution of configuration variables.
 *
 * @details
 * Orchestrators commonly mount secrets as files and point at them with a
 * `NAME_FILE` variable instead of placing the secret in `NAME` itself. The
 * resolver accepts either form, never both.
 */

#pragma once

#include "nodeboot/config/environment.hpp"

#include <string>

namespace nodeboot::config {

/**
 * @class SecretResolver
 * @brief Resolves `NAME` from its direct value, `NAME_FILE`, or a default.
 */
class SecretResolver {
  public:
    /// @brief Suffix of the file-indirection variable.
    static constexpr const char* kFileSuffix = "_FILE";

    explicit SecretResolver(Environment& env) : env_(env) {}

    /**
     * @brief Resolves one variable.
     *
     * Resolution order:
     * 1. `NAME` when non-empty.
     * 2. Contents of the file named by `NAME_FILE`, leading and trailing
     *    whitespace trimmed.
     * 3. `def`.
     *
     * `NAME_FILE` is removed from the environment afterwards so the path
     * never reaches child processes.
     *
     * @throws infra::BootError `ConfigurationConflict` when both `NAME` and
     * `NAME_FILE` are set; `InvalidConfiguration` when the file cannot be read.
     */
    std::string resolve(const std::string& name, const std::string& def = "");

  private:
    Environment& env_;
};

} // namespace nodeboot::config
