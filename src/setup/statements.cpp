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
 * @file statements.cpp
 * @brief Implementation of the provisioning statement builders.
 */

#include "nodeboot/setup/statements.hpp"

#include "nodeboot/infra/string.hpp"

namespace nodeboot::setup {

namespace {

std::string account(const std::string& user, const std::string& host)
{
    return "'" + infra::String::sql_literal(user) + "'@'" + infra::String::sql_literal(host) + "'";
}

} // namespace

std::string Statements::create_database(const std::string& name)
{
    return "CREATE DATABASE IF NOT EXISTS " + infra::String::sql_identifier(name) + ";";
}

std::vector<std::string> Statements::create_user(const std::string& user,
                                                 const std::string& password,
                                                 const std::string& database)
{
    const std::string who = account(user, "%");
    std::vector<std::string> sql = {
        "CREATE USER IF NOT EXISTS " + who + " IDENTIFIED BY '" +
            infra::String::sql_literal(password) + "';",
    };
    if (!database.empty()) {
        sql.push_back("GRANT ALL ON " + infra::String::sql_identifier(database) + ".* TO " + who +
                      ";");
    }
    sql.emplace_back("FLUSH PRIVILEGES;");
    return sql;
}

std::vector<std::string> Statements::root_setup(const config::Settings& settings,
                                                const std::string& password)
{
    std::vector<std::string> sql;
    sql.emplace_back("SET @@SESSION.SQL_LOG_BIN=0;");

    const std::string& host = settings.root_host;
    if (!host.empty() && host != "localhost") {
        const std::string remote = account("root", host);
        sql.push_back("CREATE USER IF NOT EXISTS " + remote + " IDENTIFIED BY '" +
                      infra::String::sql_literal(password) + "';");
        sql.push_back("GRANT ALL ON *.* TO " + remote + " WITH GRANT OPTION;");
        if (settings.onetime_password) {
            sql.push_back("ALTER USER " + remote + " PASSWORD EXPIRE;");
        }
    }

    if (settings.root_password_mode != config::RootPasswordMode::Empty) {
        const std::string local = account("root", "localhost");
        sql.push_back("GRANT ALL ON *.* TO " + local + " WITH GRANT OPTION;");
        sql.push_back("ALTER USER " + local + " IDENTIFIED BY '" +
                      infra::String::sql_literal(password) + "';");
    }

    sql.emplace_back("FLUSH PRIVILEGES;");
    return sql;
}

std::string Statements::batch(const std::vector<std::string>& statements)
{
    std::string out;
    for (const auto& s : statements) {
        out += s;
        out += '\n';
    }
    return out;
}

} // namespace nodeboot::setup
