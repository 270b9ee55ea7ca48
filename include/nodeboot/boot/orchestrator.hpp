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
 * @file orchestrator.hpp
 * @brief The startup pipeline, from raw arguments to handoff.
 *
 * @details
 * Sequence:
 * 1. Validate the server command.
 * 2. Resolve `datadir`, append `--log-error=<datadir>/mysqld.err`.
 * 3. Inspect the markers and classify.
 * 4. Join modes: hand off right away.
 * 5. Otherwise: initialize when needed, run the setup instance when the
 *    directory was just initialized or a new cluster is being bootstrapped,
 *    then hand off.
 *
 * The `DiagnosticsContext` passed in is filled as soon as the data directory
 * and error log are known, so a failure in any later step reports them.
 */

#pragma once

#include "nodeboot/boot/diagnostics.hpp"
#include "nodeboot/config/settings.hpp"
#include "nodeboot/infra/clock.hpp"
#include "nodeboot/process/process_runner.hpp"

#include <string>
#include <vector>

namespace nodeboot::boot {

/**
 * @class Orchestrator
 * @brief Runs the full bootstrap for one container start.
 */
class Orchestrator {
  public:
    Orchestrator(process::ProcessRunner& runner, infra::Clock& clock,
                 const config::Settings& settings, DiagnosticsContext& diagnostics)
        : runner_(runner), clock_(clock), settings_(settings), diagnostics_(diagnostics)
    {
    }

    /// @brief Prepends the server binary when `args` is empty or starts with an option.
    static std::vector<std::string> build_command(const std::vector<std::string>& args,
                                                  const std::string& server_binary);

    /**
     * @brief Runs the pipeline and execs the server.
     *
     * Returns only by throwing.
     *
     * @throws infra::BootError with the code of the failing stage.
     */
    [[noreturn]] void run(const std::vector<std::string>& args);

  private:
    process::ProcessRunner& runner_;
    infra::Clock& clock_;
    const config::Settings& settings_;
    DiagnosticsContext& diagnostics_;

    std::string resolve(const std::vector<std::string>& argv, const std::string& key);
};

} // namespace nodeboot::boot
