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
 * @file main.cpp
 * @brief Container entrypoint.
 *
 * @details
 * This file contains the `main` function, the single catch site of the
 * program:
 * 1. Load the settings from the process environment.
 * 2. Apply the log level.
 * 3. Run the pipeline, which ends in `execvp` of the server.
 *
 * Any error is logged at FATAL, followed by the diagnostics bundle on
 * stderr, and the process exits non-zero.
 */

#include "nodeboot/boot/diagnostics.hpp"
#include "nodeboot/boot/orchestrator.hpp"
#include "nodeboot/config/environment.hpp"
#include "nodeboot/config/settings.hpp"
#include "nodeboot/infra/clock.hpp"
#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/process/posix_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    nodeboot::process::PosixProcessRunner runner;
    nodeboot::infra::SystemClock clock;
    nodeboot::boot::DiagnosticsContext context;
    nodeboot::boot::DiagnosticsReporter diagnostics(runner, std::cerr);

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        nodeboot::config::ProcessEnvironment env;
        const auto settings = nodeboot::config::Settings::load(env);
        nodeboot::infra::Logger::set_level(settings.log_level);

        nodeboot::infra::Logger::log(nodeboot::infra::LogLevel::INFO,
                                     "System: Preparing " + settings.product + "...");

        nodeboot::boot::Orchestrator(runner, clock, settings, context).run(args);

    } catch (const nodeboot::infra::BootError& e) {
        nodeboot::infra::Logger::log(nodeboot::infra::LogLevel::FATAL,
                                     std::string("System: ") + nodeboot::infra::to_string(e.code()) +
                                         ": " + e.what());
        diagnostics.report(context);
        return e.exit_code();
    } catch (const std::exception& e) {
        nodeboot::infra::Logger::log(nodeboot::infra::LogLevel::FATAL,
                                     "System: Critical Failure: " + std::string(e.what()));
        diagnostics.report(context);
        return 1;
    }
    return 1;
}
