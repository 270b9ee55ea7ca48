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
 * @file setup_supervisor.hpp
 * @brief One-shot provisioning against a private, socket-only server instance.
 *
 * @details
 * The supervisor owns the temporary server for the duration of `run()`:
 *
 * 1. Spawn with networking and replication disabled.
 * 2. Poll readiness once per second for as long as the child is alive.
 * 3. Provision: timezones, database, application user, init directory,
 *    root account.
 * 4. SIGTERM and wait, bounded by the configured shutdown timeout.
 *
 * If any step throws, the `ProcessHandle` destructor kills and reaps the
 * child before the error leaves `run()`.
 */

#pragma once

#include "nodeboot/config/settings.hpp"
#include "nodeboot/infra/clock.hpp"
#include "nodeboot/process/process_runner.hpp"
#include "nodeboot/setup/sql_client.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace nodeboot::setup {

/**
 * @class SetupSupervisor
 * @brief Drives the temporary server through provisioning and shutdown.
 */
class SetupSupervisor {
  public:
    /// @brief Readiness probe cadence.
    static constexpr infra::Clock::Duration kPollInterval{1000};

    /**
     * @param runner Process backend.
     * @param clock Time source for polling and the shutdown bound.
     * @param settings Resolved configuration; overrides from init scripts are
     * applied to a private copy.
     * @param out Stream receiving the one-time generated root password.
     */
    SetupSupervisor(process::ProcessRunner& runner, infra::Clock& clock,
                    const config::Settings& settings, std::ostream& out = std::cout)
        : runner_(runner), clock_(clock), settings_(settings), out_(out)
    {
    }

    /// @brief `argv` plus the flags that keep the temporary server private.
    static std::vector<std::string> setup_command(const std::vector<std::string>& argv,
                                                  const std::string& socket);

    /**
     * @brief Runs the whole setup pass.
     *
     * @param argv The validated server command (without cluster arguments).
     * @param data_dir The data directory, exported to init scripts.
     * @param socket Socket path the temporary server listens on.
     * @return the settings in effect after init-script overrides.
     * @throws infra::BootError `StartupFailed`, `ProvisioningFailed` or
     * `ShutdownFailed`.
     */
    config::Settings run(const std::vector<std::string>& argv, const std::string& data_dir,
                         const std::string& socket);

  private:
    process::ProcessRunner& runner_;
    infra::Clock& clock_;
    config::Settings settings_;
    std::ostream& out_;

    void await_ready(process::ProcessHandle& server, SqlClient& client);
    void provision(SqlClient& client, const std::string& data_dir);
    void secure_root(SqlClient& client);
    void stop(process::ProcessHandle& server);
};

} // namespace nodeboot::setup
