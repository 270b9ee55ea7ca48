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

#include "nodeboot/setup/setup_supervisor.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/random.hpp"
#include "nodeboot/infra/string.hpp"
#include "nodeboot/setup/init_scripts.hpp"
#include "nodeboot/setup/statements.hpp"
#include "nodeboot/setup/timezone_loader.hpp"

#include <chrono>

namespace nodeboot::setup {

std::vector<std::string> SetupSupervisor::setup_command(const std::vector<std::string>& argv,
                                                        const std::string& socket)
{
    std::vector<std::string> cmd = argv;
    cmd.emplace_back("--skip-networking");
    cmd.push_back("--socket=" + socket);
    cmd.emplace_back("--wsrep-provider=none");
    return cmd;
}

config::Settings SetupSupervisor::run(const std::vector<std::string>& argv,
                                      const std::string& data_dir, const std::string& socket)
{
    infra::Logger::log(infra::LogLevel::INFO, "Setup: Initializing " + settings_.product + "...");

    process::Invocation inv;
    inv.argv = setup_command(argv, socket);
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Setup: starting " + infra::String::join_command(inv.argv));
    auto server = runner_.spawn(inv);

    SqlClient client(runner_, settings_.client_binary, socket);
    await_ready(*server, client);
    provision(client, data_dir);
    stop(*server);

    infra::Logger::log(infra::LogLevel::INFO,
                       "Setup: " + settings_.product + " init process done. Ready for start up.");
    return settings_;
}

void SetupSupervisor::await_ready(process::ProcessHandle& server, SqlClient& client)
{
    const std::string& product = settings_.product;
    bool ready = infra::poll_until(clock_, kPollInterval, [&]() {
        if (!server.alive()) {
            return infra::Probe::Abandon;
        }
        if (client.ping()) {
            return infra::Probe::Ready;
        }
        infra::Logger::log(infra::LogLevel::INFO, product + " initialization startup in progress...");
        return infra::Probe::Pending;
    });

    if (!ready) {
        throw infra::BootError(infra::ErrorCode::StartupFailed, product + " failed to start!");
    }
    infra::Logger::log(infra::LogLevel::INFO, "Setup: " + product + " accepts connections");
}

void SetupSupervisor::provision(SqlClient& client, const std::string& data_dir)
{
    if (settings_.load_tzinfo) {
        TimezoneLoader(runner_, client).load(settings_.tzinfo_binary, settings_.zoneinfo_dir);
    }

    if (!settings_.database.empty()) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Setup: Creating database " + settings_.database);
        client.execute(Statements::create_database(settings_.database), "", "create database");
    }

    if (!settings_.user.empty() && !settings_.password.empty()) {
        infra::Logger::log(infra::LogLevel::INFO, "Setup: Creating user " + settings_.user);
        client.execute(Statements::batch(Statements::create_user(
                           settings_.user, settings_.password, settings_.database)),
                       "", "create user");
    } else if (!settings_.user.empty() || !settings_.password.empty()) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Setup: MYSQL_USER and MYSQL_PASSWORD must both be set to create an "
                           "account, skipping");
    }

    settings_ = InitScriptRunner(runner_, client).run_all(settings_.initdb_dir, settings_, data_dir);

    secure_root(client);
}

void SetupSupervisor::secure_root(SqlClient& client)
{
    std::string password;
    switch (settings_.root_password_mode) {
    case config::RootPasswordMode::Literal:
        password = settings_.root_password;
        break;
    case config::RootPasswordMode::Random:
        password = infra::Random::password();
        out_ << "GENERATED ROOT PASSWORD: " << password << std::endl;
        break;
    case config::RootPasswordMode::Empty:
        infra::Logger::log(infra::LogLevel::WARN, "=-> Warning! Warning! Warning!");
        infra::Logger::log(infra::LogLevel::WARN,
                           "EMPTY password is specified for image, your container is insecure!!!");
        break;
    }

    client.execute(Statements::batch(Statements::root_setup(settings_, password)), "",
                   "root account setup");
}

void SetupSupervisor::stop(process::ProcessHandle& server)
{
    infra::Logger::log(infra::LogLevel::INFO, "Setup: Shutting down " + settings_.product);
    server.terminate();

    auto timeout = std::chrono::duration_cast<infra::Clock::Duration>(settings_.shutdown_timeout);
    auto status = server.wait_for(clock_, timeout);
    if (!status) {
        throw infra::BootError(infra::ErrorCode::ShutdownFailed,
                               settings_.product + " did not stop within " +
                                   std::to_string(settings_.shutdown_timeout.count()) + "s");
    }
    if (*status != 0) {
        throw infra::BootError(infra::ErrorCode::ShutdownFailed,
                               settings_.product + " shutdown failed (exit " +
                                   std::to_string(*status) + ")");
    }
}

} // namespace nodeboot::setup
