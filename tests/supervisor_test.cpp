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
 * @file supervisor_test.cpp
 * @brief Tests for the temporary setup instance lifecycle.
 *
 * @details
 * The spawned server is a `FakeHandle`; "mysql" invocations are answered by
 * a scripted client that fails the readiness probe a configurable number of
 * times before the server "comes up".
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "nodeboot/setup/setup_supervisor.hpp"
#include "nodeboot/setup/sql_client.hpp"

#include <sstream>
#include <string>

using nodeboot::setup::SetupSupervisor;
using nodeboot::setup::SqlClient;

namespace {

bool is_probe(const nodeboot::process::Invocation& inv)
{
    return inv.stdin_data == SqlClient::kProbeQuery;
}

/// @brief Client that answers the probe after `failures` refusals, accepts everything else.
void script_client(nodeboot::test::FakeRunner& runner, int failures)
{
    auto refused = std::make_shared<int>(0);
    runner.when(
        [](const nodeboot::process::Invocation& inv) {
            return inv.argv[0] == "mysql" && is_probe(inv);
        },
        [refused, failures](const nodeboot::process::Invocation&) {
            if ((*refused)++ < failures) {
                return nodeboot::test::exec_fail(1, "Can't connect to local MySQL server");
            }
            return nodeboot::test::exec_ok("1\n");
        });
    runner.on("mysql", nodeboot::test::exec_ok());
}

nodeboot::config::Settings quiet_settings()
{
    nodeboot::config::Settings s;
    s.load_tzinfo = false;
    s.initdb_dir = "";
    s.root_password_mode = nodeboot::config::RootPasswordMode::Literal;
    s.root_password = "pw";
    return s;
}

std::vector<std::string> sql_sent(const nodeboot::test::FakeRunner& runner)
{
    std::vector<std::string> sql;
    for (const auto& inv : runner.runs_of("mysql")) {
        if (!is_probe(inv)) {
            sql.push_back(inv.stdin_data);
        }
    }
    return sql;
}

} // namespace

void test_setup_command_private()
{
    auto cmd = SetupSupervisor::setup_command({"mysqld", "--user=mysql"}, "/run/s.sock");
    ASSERT_EQ(cmd.size(), static_cast<size_t>(5));
    ASSERT_EQ(cmd[2], std::string("--skip-networking"));
    ASSERT_EQ(cmd[3], std::string("--socket=/run/s.sock"));
    ASSERT_EQ(cmd[4], std::string("--wsrep-provider=none"));
}

/**
 * @brief Readiness after two refusals costs exactly two one-second polls,
 * then the provisioning steps run in order and the instance is stopped.
 */
void test_setup_full_pass()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 2);
    runner.on("mysql_tzinfo_to_sql", nodeboot::test::exec_ok("TZ SQL;"));

    nodeboot::test::ManualClock clock;
    auto settings = quiet_settings();
    settings.load_tzinfo = true;
    settings.database = "shop";
    settings.user = "app";
    settings.password = "apppw";

    SetupSupervisor(runner, clock, settings).run({"mysqld"}, "/data", "/run/s.sock");

    ASSERT_EQ(clock.sleeps(), 2);
    ASSERT_EQ(runner.spawned.size(), static_cast<size_t>(1));
    ASSERT_TRUE(runner.spawned[0]->terminated);
    ASSERT_FALSE(runner.spawned[0]->alive);

    auto sql = sql_sent(runner);
    ASSERT_EQ(sql.size(), static_cast<size_t>(4));
    ASSERT_EQ(sql[0], std::string("TZ SQL;"));
    ASSERT_EQ(sql[1], std::string("CREATE DATABASE IF NOT EXISTS `shop`;"));
    ASSERT_TRUE(sql[2].find("CREATE USER IF NOT EXISTS 'app'@'%'") != std::string::npos);
    ASSERT_TRUE(sql[3].find("ALTER USER 'root'@'localhost' IDENTIFIED BY 'pw';") !=
                std::string::npos);

    // The timezone batch targets the system schema.
    auto tz_runs = runner.runs_of("mysql");
    ASSERT_EQ(tz_runs[tz_runs.size() - 4].argv.back(), std::string("mysql"));
}

void test_setup_user_needs_both_fields()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 0);
    nodeboot::test::ManualClock clock;
    auto settings = quiet_settings();
    settings.user = "app";

    SetupSupervisor(runner, clock, settings).run({"mysqld"}, "/data", "/run/s.sock");
    auto sql = sql_sent(runner);
    ASSERT_EQ(sql.size(), static_cast<size_t>(1));
    ASSERT_TRUE(sql[0].find("'app'") == std::string::npos);
}

/**
 * @brief The generated password is printed once and used in the root batch.
 */
void test_setup_random_root_password()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 0);
    nodeboot::test::ManualClock clock;
    auto settings = quiet_settings();
    settings.root_password_mode = nodeboot::config::RootPasswordMode::Random;

    std::ostringstream out;
    SetupSupervisor(runner, clock, settings, out).run({"mysqld"}, "/data", "/run/s.sock");

    const std::string prefix = "GENERATED ROOT PASSWORD: ";
    std::string printed = out.str();
    ASSERT_EQ(printed.find(prefix), static_cast<size_t>(0));
    std::string password = printed.substr(prefix.size(), 32);
    ASSERT_EQ(password.size(), static_cast<size_t>(32));

    auto sql = sql_sent(runner);
    ASSERT_TRUE(sql.back().find("IDENTIFIED BY '" + password + "'") != std::string::npos);
}

void test_setup_child_dies()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 1000);
    nodeboot::test::ManualClock clock;
    clock.on_sleep = [&runner](int sleeps) {
        if (sleeps == 3) {
            runner.spawned[0]->alive = false;
        }
    };

    SetupSupervisor supervisor(runner, clock, quiet_settings());
    ASSERT_BOOT_ERROR(supervisor.run({"mysqld"}, "/data", "/run/s.sock"), StartupFailed);
    ASSERT_EQ(clock.sleeps(), 3);
    ASSERT_TRUE(sql_sent(runner).empty());
}

void test_setup_shutdown_timeout()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 0);
    runner.next_process.exits_on_terminate = false;
    nodeboot::test::ManualClock clock;
    auto settings = quiet_settings();
    settings.shutdown_timeout = std::chrono::seconds(5);

    SetupSupervisor supervisor(runner, clock, settings);
    ASSERT_BOOT_ERROR(supervisor.run({"mysqld"}, "/data", "/run/s.sock"), ShutdownFailed);
    ASSERT_TRUE(clock.slept() == std::chrono::seconds(5));
}

void test_setup_shutdown_nonzero_exit()
{
    nodeboot::test::FakeRunner runner;
    script_client(runner, 0);
    runner.next_process.exit_code = 1;
    nodeboot::test::ManualClock clock;

    SetupSupervisor supervisor(runner, clock, quiet_settings());
    ASSERT_BOOT_ERROR(supervisor.run({"mysqld"}, "/data", "/run/s.sock"), ShutdownFailed);
}

void test_setup_provisioning_failure()
{
    nodeboot::test::FakeRunner runner;
    runner.when([](const nodeboot::process::Invocation& inv) { return is_probe(inv); },
                [](const nodeboot::process::Invocation&) { return nodeboot::test::exec_ok(); });
    runner.on("mysql", nodeboot::test::exec_fail(1, "ERROR 1064 (42000)"));

    nodeboot::test::ManualClock clock;
    auto settings = quiet_settings();
    settings.database = "shop";
    SetupSupervisor supervisor(runner, clock, settings);
    ASSERT_BOOT_ERROR(supervisor.run({"mysqld"}, "/data", "/run/s.sock"), ProvisioningFailed);
    // No graceful stop on this path; the handle destructor kills the server.
    ASSERT_FALSE(runner.spawned[0]->terminated);
}
