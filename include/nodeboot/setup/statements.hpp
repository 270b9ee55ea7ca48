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
 * @file statements.hpp
 * @brief SQL composed by the setup supervisor.
 *
 * @details
 * Pure functions, no I/O. Every statement is written to be safe to re-run:
 * a setup pass interrupted by a crash is repeated in full on the next start.
 */

#pragma once

#include "nodeboot/config/settings.hpp"

#include <string>
#include <vector>

namespace nodeboot::setup {

/**
 * @class Statements
 * @brief Static builders for provisioning statements.
 */
class Statements {
  public:
    /// @brief `CREATE DATABASE IF NOT EXISTS `name``.
    static std::string create_database(const std::string& name);

    /**
     * @brief Application account: create, grant on `database` (when set), flush.
     */
    static std::vector<std::string> create_user(const std::string& user,
                                                const std::string& password,
                                                const std::string& database);

    /**
     * @brief The root account batch.
     *
     * Composition, in order:
     * 1. `SET @@SESSION.SQL_LOG_BIN=0;` so none of it replicates as data.
     * 2. For a remote host pattern (non-empty, not `localhost`): create
     *    `root@host`, grant everything, and expire the password when a
     *    one-time password was requested.
     * 3. Unless the mode is `Empty`: grant and set the password of
     *    `root@localhost`.
     * 4. `FLUSH PRIVILEGES;`, always last.
     *
     * @param settings Source of host pattern, one-time flag and password mode.
     * @param password The effective password (generated, literal or empty).
     */
    static std::vector<std::string> root_setup(const config::Settings& settings,
                                               const std::string& password);

    /// @brief Joins statements into one newline-separated batch.
    static std::string batch(const std::vector<std::string>& statements);
};

} // namespace nodeboot::setup
