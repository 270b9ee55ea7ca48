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
 * @file statements_test.cpp
 * @brief Tests for provisioning SQL composition and timezone normalization.
 */

#include "framework.hpp"
#include "nodeboot/setup/statements.hpp"
#include "nodeboot/setup/timezone_loader.hpp"

#include <algorithm>
#include <string>
#include <vector>

using nodeboot::config::RootPasswordMode;
using nodeboot::config::Settings;
using nodeboot::setup::Statements;

namespace {

bool has_statement(const std::vector<std::string>& sql, const std::string& needle)
{
    return std::any_of(sql.begin(), sql.end(),
                       [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

} // namespace

/**
 * @brief Every combination of mode, host and one-time flag ends with the flush;
 * only `Empty` omits the local password change.
 */
void test_root_batch_invariants()
{
    const RootPasswordMode modes[] = {RootPasswordMode::Literal, RootPasswordMode::Random,
                                      RootPasswordMode::Empty};
    const char* hosts[] = {"%", "localhost", "", "10.0.%"};

    for (auto mode : modes) {
        for (const char* host : hosts) {
            for (bool onetime : {false, true}) {
                Settings s;
                s.root_password_mode = mode;
                s.root_host = host;
                s.onetime_password = onetime;

                auto sql = Statements::root_setup(s, mode == RootPasswordMode::Empty ? "" : "pw");
                ASSERT_EQ(sql.front(), std::string("SET @@SESSION.SQL_LOG_BIN=0;"));
                ASSERT_EQ(sql.back(), std::string("FLUSH PRIVILEGES;"));

                bool alters_local = has_statement(sql, "ALTER USER 'root'@'localhost' IDENTIFIED BY");
                ASSERT_EQ(alters_local, mode != RootPasswordMode::Empty);
            }
        }
    }
}

void test_root_batch_remote_host()
{
    Settings s;
    s.root_password_mode = RootPasswordMode::Literal;
    s.root_host = "10.0.%";
    s.onetime_password = true;

    auto sql = Statements::root_setup(s, "pw");
    ASSERT_TRUE(has_statement(sql, "CREATE USER IF NOT EXISTS 'root'@'10.0.%' IDENTIFIED BY 'pw';"));
    ASSERT_TRUE(has_statement(sql, "GRANT ALL ON *.* TO 'root'@'10.0.%' WITH GRANT OPTION;"));
    ASSERT_TRUE(has_statement(sql, "ALTER USER 'root'@'10.0.%' PASSWORD EXPIRE;"));

    s.root_host = "localhost";
    ASSERT_FALSE(has_statement(Statements::root_setup(s, "pw"), "CREATE USER"));
}

void test_root_batch_escapes_password()
{
    Settings s;
    s.root_password_mode = RootPasswordMode::Literal;
    s.root_host = "localhost";
    auto sql = Statements::root_setup(s, "a'b");
    ASSERT_TRUE(has_statement(sql, "IDENTIFIED BY 'a\\'b';"));
}

void test_create_user_statements()
{
    auto with_db = Statements::create_user("app", "pw", "shop");
    ASSERT_EQ(with_db.size(), static_cast<size_t>(3));
    ASSERT_EQ(with_db[0], std::string("CREATE USER IF NOT EXISTS 'app'@'%' IDENTIFIED BY 'pw';"));
    ASSERT_EQ(with_db[1], std::string("GRANT ALL ON `shop`.* TO 'app'@'%';"));
    ASSERT_EQ(with_db[2], std::string("FLUSH PRIVILEGES;"));

    auto without_db = Statements::create_user("app", "pw", "");
    ASSERT_EQ(without_db.size(), static_cast<size_t>(2));

    ASSERT_EQ(Statements::create_database("shop"),
              std::string("CREATE DATABASE IF NOT EXISTS `shop`;"));
    ASSERT_EQ(Statements::batch({"A;", "B;"}), std::string("A;\nB;\n"));
}

void test_timezone_normalize()
{
    std::string sql = "INSERT INTO x VALUES ('Local time zone must be set--see zic manual page');";
    ASSERT_EQ(nodeboot::setup::TimezoneLoader::normalize(sql),
              std::string("INSERT INTO x VALUES ('FCTY');"));
}
