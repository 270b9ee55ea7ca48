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
 * @file config_test.cpp
 * @brief Tests for secret resolution and the settings schema.
 *
 * @details
 * Everything runs against a `MapEnvironment`; the process environment is
 * never touched.
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "nodeboot/config/environment.hpp"
#include "nodeboot/config/secret_resolver.hpp"
#include "nodeboot/config/settings.hpp"

#include <fstream>
#include <map>
#include <string>

using nodeboot::config::MapEnvironment;
using nodeboot::config::RootPasswordMode;
using nodeboot::config::SecretResolver;
using nodeboot::config::Settings;

// ============================================================================
// SecretResolver
// ============================================================================

void test_secret_conflict()
{
    MapEnvironment env(std::map<std::string, std::string>{{"MYSQL_PASSWORD", "direct"}, {"MYSQL_PASSWORD_FILE", "/run/secrets/pw"}});
    SecretResolver resolver(env);
    ASSERT_BOOT_ERROR(resolver.resolve("MYSQL_PASSWORD"), ConfigurationConflict);
}

/**
 * @brief Only the file form is set: the trimmed file content wins and the
 * `_FILE` variable is gone afterwards.
 */
void test_secret_from_file()
{
    nodeboot::test::ScratchDir dir;
    const std::string secret = dir / "pw";
    {
        std::ofstream out(secret);
        out << "  s3cret\n\n";
    }

    MapEnvironment env(std::map<std::string, std::string>{{"MYSQL_PASSWORD_FILE", secret}});
    SecretResolver resolver(env);
    ASSERT_EQ(resolver.resolve("MYSQL_PASSWORD"), std::string("s3cret"));
    ASSERT_FALSE(env.get("MYSQL_PASSWORD_FILE").has_value());
}

void test_secret_default()
{
    MapEnvironment env;
    SecretResolver resolver(env);
    ASSERT_EQ(resolver.resolve("MYSQL_ROOT_HOST", "%"), std::string("%"));
    ASSERT_EQ(resolver.resolve("MYSQL_DATABASE"), std::string(""));
}

void test_secret_unreadable_file()
{
    MapEnvironment env(std::map<std::string, std::string>{{"MYSQL_PASSWORD_FILE", "/nonexistent/nodeboot/secret"}});
    SecretResolver resolver(env);
    ASSERT_BOOT_ERROR(resolver.resolve("MYSQL_PASSWORD"), InvalidConfiguration);
}

// ============================================================================
// Settings
// ============================================================================

void test_settings_defaults()
{
    MapEnvironment env;
    Settings s = Settings::load(env);
    ASSERT_EQ(s.product, std::string("mysql-wsrep"));
    ASSERT_TRUE(s.root_password_mode == RootPasswordMode::Random);
    ASSERT_EQ(s.root_host, std::string("%"));
    ASSERT_TRUE(s.load_tzinfo);
    ASSERT_FALSE(s.onetime_password);
    ASSERT_EQ(s.initdb_dir, std::string("/codership-initdb.d"));
    ASSERT_TRUE(s.shutdown_timeout == std::chrono::seconds(300));
    ASSERT_TRUE(s.log_level == nodeboot::infra::LogLevel::INFO);
}

void test_settings_root_password_modes()
{
    MapEnvironment literal(std::map<std::string, std::string>{{"MYSQL_ROOT_PASSWORD", "hunter2"}});
    Settings s = Settings::load(literal);
    ASSERT_TRUE(s.root_password_mode == RootPasswordMode::Literal);
    ASSERT_EQ(s.root_password, std::string("hunter2"));

    MapEnvironment sentinel(std::map<std::string, std::string>{{"MYSQL_ROOT_PASSWORD", "EMPTY"}});
    ASSERT_TRUE(Settings::load(sentinel).root_password_mode == RootPasswordMode::Empty);

    MapEnvironment allow(std::map<std::string, std::string>{{"MYSQL_ALLOW_EMPTY_PASSWORD", "1"}});
    ASSERT_TRUE(Settings::load(allow).root_password_mode == RootPasswordMode::Empty);

    MapEnvironment off(std::map<std::string, std::string>{{"MYSQL_ALLOW_EMPTY_PASSWORD", "0"}});
    ASSERT_TRUE(Settings::load(off).root_password_mode == RootPasswordMode::Random);
}

void test_settings_root_password_conflicts()
{
    MapEnvironment both_flags(
        {{"MYSQL_ALLOW_EMPTY_PASSWORD", "1"}, {"MYSQL_RANDOM_ROOT_PASSWORD", "yes"}});
    ASSERT_BOOT_ERROR(Settings::load(both_flags), ConfigurationConflict);

    MapEnvironment literal_and_flag(
        {{"MYSQL_ROOT_PASSWORD", "hunter2"}, {"MYSQL_RANDOM_ROOT_PASSWORD", "1"}});
    ASSERT_BOOT_ERROR(Settings::load(literal_and_flag), ConfigurationConflict);
}

void test_settings_tzinfo_switches()
{
    MapEnvironment skip(std::map<std::string, std::string>{{"MYSQL_INITDB_SKIP_TZINFO", "1"}});
    ASSERT_FALSE(Settings::load(skip).load_tzinfo);

    MapEnvironment disabled(std::map<std::string, std::string>{{"MYSQL_INITDB_TZINFO", "0"}});
    ASSERT_FALSE(Settings::load(disabled).load_tzinfo);
}

void test_settings_invalid_values()
{
    MapEnvironment timeout(std::map<std::string, std::string>{{"NODEBOOT_SHUTDOWN_TIMEOUT", "5m"}});
    ASSERT_BOOT_ERROR(Settings::load(timeout), InvalidConfiguration);

    MapEnvironment level(std::map<std::string, std::string>{{"NODEBOOT_LOG_LEVEL", "chatty"}});
    ASSERT_BOOT_ERROR(Settings::load(level), InvalidConfiguration);
}

void test_settings_imagedebug_traces()
{
    MapEnvironment env(std::map<std::string, std::string>{{"IMAGEDEBUG", "1"}, {"NODEBOOT_LOG_LEVEL", "warn"}});
    Settings s = Settings::load(env);
    ASSERT_TRUE(s.image_debug);
    ASSERT_TRUE(s.log_level == nodeboot::infra::LogLevel::TRACE);
}

void test_settings_join_trimmed()
{
    MapEnvironment env(std::map<std::string, std::string>{{"WSREP_JOIN", "  node1,node2 "}});
    ASSERT_EQ(Settings::load(env).wsrep_join, std::string("node1,node2"));
}

/**
 * @brief Secrets are resolved at load time whatever the route, so a joining
 * node with contradictory provisioning secrets still fails before boot.
 */
void test_settings_secrets_checked_on_join()
{
    MapEnvironment conflict(
        {{"WSREP_JOIN", "node1"}, {"MYSQL_USER", "app"}, {"MYSQL_USER_FILE", "/run/secrets/user"}});
    ASSERT_BOOT_ERROR(Settings::load(conflict), ConfigurationConflict);

    MapEnvironment unreadable(
        {{"WSREP_JOIN", "node1"}, {"MYSQL_PASSWORD_FILE", "/nonexistent/nodeboot-secret"}});
    ASSERT_BOOT_ERROR(Settings::load(unreadable), InvalidConfiguration);
}

/**
 * @brief Overrides yield a new value; only the root account keys apply.
 */
void test_settings_overrides()
{
    MapEnvironment env(std::map<std::string, std::string>{{"MYSQL_DATABASE", "app"}});
    const Settings base = Settings::load(env);

    Settings next = base.with_overrides({{"MYSQL_ROOT_PASSWORD", "fromscript"},
                                         {"MYSQL_ROOT_HOST", "10.0.%"},
                                         {"MYSQL_ONETIME_PASSWORD", "1"},
                                         {"MYSQL_DATABASE", "hijacked"}});
    ASSERT_TRUE(next.root_password_mode == RootPasswordMode::Literal);
    ASSERT_EQ(next.root_password, std::string("fromscript"));
    ASSERT_EQ(next.root_host, std::string("10.0.%"));
    ASSERT_TRUE(next.onetime_password);
    ASSERT_EQ(next.database, std::string("app"));

    // The original is untouched.
    ASSERT_TRUE(base.root_password_mode == RootPasswordMode::Random);
    ASSERT_EQ(base.root_host, std::string("%"));
}

void test_settings_to_environment()
{
    MapEnvironment env(std::map<std::string, std::string>{{"MYSQL_ALLOW_EMPTY_PASSWORD", "1"}, {"MYSQL_USER", "app"}});
    auto vars = Settings::load(env).to_environment();
    ASSERT_EQ(vars["MYSQL_ROOT_PASSWORD"], std::string("EMPTY"));
    ASSERT_EQ(vars["MYSQL_USER"], std::string("app"));
    ASSERT_EQ(vars["PRODUCT"], std::string("mysql-wsrep"));
}
