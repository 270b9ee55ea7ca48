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
 * @file sql_client.hpp
 * @brief Statement execution against the setup instance through the CLI client.
 *
 * @details
 * The entrypoint does not link a database driver. SQL is streamed into the
 * stock client over the setup instance's local socket as `root` without a
 * password, which is what `--initialize-insecure` leaves behind. One call is
 * one client session.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

#include <string>
#include <vector>

namespace nodeboot::setup {

/**
 * @class SqlClient
 * @brief Runs SQL text through the client binary over a Unix socket.
 */
class SqlClient {
  public:
    /// @brief Trivial introspection query used as the readiness probe.
    static constexpr const char* kProbeQuery = "SELECT @@wsrep_on;";

    SqlClient(process::ProcessRunner& runner, std::string client_binary, std::string socket)
        : runner_(runner), client_binary_(std::move(client_binary)), socket_(std::move(socket))
    {
    }

    /// @brief Client command line, optionally selecting `database`.
    std::vector<std::string> command(const std::string& database = "") const;

    /// @brief True when the server answered the probe query.
    bool ping();

    /**
     * @brief Executes `sql` in one client session.
     *
     * @param sql Statements, `;`-separated. Never logged.
     * @param database Default schema for the session; empty for none.
     * @param what Short description used in log and error messages.
     * @return the client's standard output.
     * @throws infra::BootError `ProvisioningFailed` with the client's stderr.
     */
    std::string execute(const std::string& sql, const std::string& database,
                        const std::string& what);

    const std::string& socket() const
    {
        return socket_;
    }

  private:
    process::ProcessRunner& runner_;
    std::string client_binary_;
    std::string socket_;
};

} // namespace nodeboot::setup
