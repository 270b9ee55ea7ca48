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

#include "nodeboot/boot/orchestrator.hpp"

#include "nodeboot/boot/classifier.hpp"
#include "nodeboot/boot/config_validator.hpp"
#include "nodeboot/boot/handoff.hpp"
#include "nodeboot/boot/initializer.hpp"
#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/setup/setup_supervisor.hpp"

namespace nodeboot::boot {

std::vector<std::string> Orchestrator::build_command(const std::vector<std::string>& args,
                                                     const std::string& server_binary)
{
    if (args.empty() || args.front().empty() || args.front()[0] == '-') {
        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(server_binary);
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }
    return args;
}

std::string Orchestrator::resolve(const std::vector<std::string>& argv, const std::string& key)
{
    auto value = ConfigValidator(runner_).effective_value(argv, key);
    if (!value || value->empty()) {
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               "Server did not report a value for '" + key + "'");
    }
    return *value;
}

void Orchestrator::run(const std::vector<std::string>& args)
{
    std::vector<std::string> argv = build_command(args, settings_.server_binary);

    // 1. Validation
    infra::Logger::log(infra::LogLevel::INFO, "Boot: Validating configuration...");
    ConfigValidator(runner_).validate(argv);

    // 2. Data directory and persistent error log
    std::string data_dir = resolve(argv, "datadir");
    while (data_dir.size() > 1 && data_dir.back() == '/') {
        data_dir.pop_back();
    }
    diagnostics_.data_dir = data_dir;
    diagnostics_.error_log = data_dir + "/mysqld.err";
    argv.push_back("--log-error=" + diagnostics_.error_log);

    // 3. Classification
    BootPlan plan = Classifier(runner_).plan(NodeState::inspect(data_dir), settings_);

    std::vector<std::string> final_argv = argv;
    final_argv.insert(final_argv.end(), plan.cluster_args.begin(), plan.cluster_args.end());

    HandoffRunner handoff(runner_);
    if (plan.route == Route::Handoff) {
        handoff.hand_off(final_argv);
    }

    // 4. Local route: provisioning follows only the initialization of this start
    if (Initializer(runner_).ensure(data_dir, argv)) {
        std::string socket = resolve(argv, "socket");
        setup::SetupSupervisor(runner_, clock_, settings_).run(argv, data_dir, socket);
    }

    infra::Logger::log(infra::LogLevel::INFO, "Boot: " + settings_.product + " is starting!");
    handoff.hand_off(final_argv);
}

} // namespace nodeboot::boot
