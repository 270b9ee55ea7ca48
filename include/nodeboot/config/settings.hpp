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
 * @file settings.hpp
 * @brief Immutable configuration of one entrypoint run.
 *
 * @details
 * `Settings` is built once at startup from a fixed schema of named options,
 * validated, and then passed by const reference to every component. No
 * component reads the environment on its own.
 *
 * The only way to change a value after load is `with_overrides()`, which is
 * how init scripts feed root-account changes into the final setup step. It
 * returns a new value and leaves the original untouched.
 */

#pragma once

#include "nodeboot/config/environment.hpp"
#include "nodeboot/infra/logger.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace nodeboot::config {

/**
 * @enum RootPasswordMode
 * @brief How the local root account password is determined.
 */
enum class RootPasswordMode {
    Literal, ///< A password supplied by the operator.
    Random,  ///< Generated at setup time, printed once, never stored.
    Empty    ///< Explicitly no password. Logged as a security warning.
};

const char* to_string(RootPasswordMode mode);

/**
 * @struct OptionSpec
 * @brief One entry of the configuration schema.
 */
struct OptionSpec {
    const char* name;       ///< Environment variable name.
    const char* fallback;   ///< Value used when the variable is unset or empty.
    bool file_indirection;  ///< Whether `NAME_FILE` is accepted.
};

/**
 * @struct Settings
 * @brief Resolved, validated configuration.
 */
struct Settings {
    /// @brief Product name used in progress messages.
    std::string product = "mysql-wsrep";

    // --- Application account -------------------------------------------------
    std::string user;
    std::string password;
    std::string database;

    // --- Root account --------------------------------------------------------
    RootPasswordMode root_password_mode = RootPasswordMode::Random;
    std::string root_password; ///< Only meaningful for `Literal`.
    std::string root_host = "%";
    bool onetime_password = false;

    // --- Provisioning --------------------------------------------------------
    bool load_tzinfo = true;
    std::string initdb_dir = "/codership-initdb.d";
    std::string zoneinfo_dir = "/usr/share/zoneinfo";

    // --- Cluster -------------------------------------------------------------
    /// @brief Comma-separated peer list; empty when bootstrapping or resuming.
    std::string wsrep_join;

    // --- Runtime -------------------------------------------------------------
    std::chrono::seconds shutdown_timeout{300};
    infra::LogLevel log_level = infra::LogLevel::INFO;
    bool image_debug = false;

    // --- External programs ---------------------------------------------------
    std::string server_binary = "mysqld";
    std::string client_binary = "mysql";
    std::string tzinfo_binary = "mysql_tzinfo_to_sql";
    std::string recover_binary = "wsrep_recover";
    std::string journal_binary = "journalctl";

    /// @brief The schema walked by `load()`.
    static const std::vector<OptionSpec>& schema();

    /**
     * @brief Builds settings from the environment.
     *
     * Every schema entry is resolved (through `SecretResolver` where file
     * indirection is allowed), then typed fields are derived and validated.
     *
     * @throws infra::BootError `ConfigurationConflict` for exclusive inputs set
     * together, `InvalidConfiguration` for malformed values.
     */
    static Settings load(Environment& env);

    /**
     * @brief Returns a copy with init-script overrides applied.
     *
     * Honored keys: `MYSQL_ROOT_PASSWORD`, `MYSQL_ROOT_HOST`,
     * `MYSQL_ONETIME_PASSWORD`. Every other key is logged and ignored.
     */
    Settings with_overrides(const std::map<std::string, std::string>& overrides) const;

    /// @brief Keys accepted by `with_overrides()`.
    static const std::vector<std::string>& overridable_keys();

    /**
     * @brief The resolved configuration as environment variables.
     *
     * Handed to init scripts so they see file-indirected secrets already
     * resolved, under their plain names.
     */
    std::map<std::string, std::string> to_environment() const;
};

} // namespace nodeboot::config
