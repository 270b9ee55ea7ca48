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
 * @file settings.cpp
 * @brief Schema-driven construction and validation of `Settings`.
 */

#include "nodeboot/config/settings.hpp"

#include "nodeboot/config/secret_resolver.hpp"
#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace nodeboot::config {

namespace {

const char* const kRandomSentinel = "RANDOM";
const char* const kEmptySentinel = "EMPTY";

/// Docker convention: a flag is on when set to anything but an explicit "off".
bool flag_enabled(const std::string& value)
{
    std::string v = infra::String::to_lower(infra::String::trim(value));
    return !v.empty() && v != "0" && v != "false" && v != "no" && v != "off";
}

RootPasswordMode mode_of(const std::string& raw)
{
    if (raw.empty() || raw == kRandomSentinel) {
        return RootPasswordMode::Random;
    }
    if (raw == kEmptySentinel) {
        return RootPasswordMode::Empty;
    }
    return RootPasswordMode::Literal;
}

std::chrono::seconds parse_seconds(const std::string& name, const std::string& raw)
{
    std::string v = infra::String::trim(raw);
    if (v.empty() || !std::all_of(v.begin(), v.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               name + " must be a whole number of seconds, got '" + raw + "'");
    }
    try {
        return std::chrono::seconds(std::stoll(v));
    } catch (const std::out_of_range&) {
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               name + " is out of range: '" + raw + "'");
    }
}

} // namespace

const char* to_string(RootPasswordMode mode)
{
    switch (mode) {
    case RootPasswordMode::Literal:
        return "literal";
    case RootPasswordMode::Random:
        return "random";
    case RootPasswordMode::Empty:
        return "empty";
    }
    return "unknown";
}

const std::vector<OptionSpec>& Settings::schema()
{
    static const std::vector<OptionSpec> options = {
        {"MYSQL_USER", "", true},
        {"MYSQL_PASSWORD", "", true},
        {"MYSQL_DATABASE", "", true},
        {"MYSQL_ROOT_PASSWORD", "", true},
        {"MYSQL_ALLOW_EMPTY_PASSWORD", "", false},
        {"MYSQL_RANDOM_ROOT_PASSWORD", "", false},
        {"MYSQL_ROOT_HOST", "%", true},
        {"MYSQL_ONETIME_PASSWORD", "", false},
        {"MYSQL_INITDB_TZINFO", "1", false},
        {"MYSQL_INITDB_SKIP_TZINFO", "", false},
        {"WSREP_JOIN", "", false},
        {"PRODUCT", "mysql-wsrep", false},
        {"NODEBOOT_INITDB_DIR", "/codership-initdb.d", false},
        {"NODEBOOT_SHUTDOWN_TIMEOUT", "300", false},
        {"NODEBOOT_LOG_LEVEL", "info", false},
        {"IMAGEDEBUG", "0", false},
    };
    return options;
}

const std::vector<std::string>& Settings::overridable_keys()
{
    static const std::vector<std::string> keys = {"MYSQL_ROOT_PASSWORD", "MYSQL_ROOT_HOST",
                                                  "MYSQL_ONETIME_PASSWORD"};
    return keys;
}

Settings Settings::load(Environment& env)
{
    SecretResolver resolver(env);
    std::map<std::string, std::string> raw;
    for (const auto& option : schema()) {
        if (option.file_indirection) {
            raw[option.name] = resolver.resolve(option.name, option.fallback);
        } else {
            raw[option.name] = env.get_non_empty(option.name).value_or(option.fallback);
        }
    }

    Settings s;
    s.product = raw["PRODUCT"];
    s.user = raw["MYSQL_USER"];
    s.password = raw["MYSQL_PASSWORD"];
    s.database = raw["MYSQL_DATABASE"];
    s.root_host = raw["MYSQL_ROOT_HOST"];
    s.onetime_password = flag_enabled(raw["MYSQL_ONETIME_PASSWORD"]);
    s.wsrep_join = infra::String::trim(raw["WSREP_JOIN"]);
    s.initdb_dir = raw["NODEBOOT_INITDB_DIR"];
    s.shutdown_timeout = parse_seconds("NODEBOOT_SHUTDOWN_TIMEOUT", raw["NODEBOOT_SHUTDOWN_TIMEOUT"]);

    s.load_tzinfo = infra::String::trim(raw["MYSQL_INITDB_TZINFO"]) == "1" &&
                    !flag_enabled(raw["MYSQL_INITDB_SKIP_TZINFO"]);

    // Root password: one literal, or one of the two sentinel modes.
    bool allow_empty = flag_enabled(raw["MYSQL_ALLOW_EMPTY_PASSWORD"]);
    bool want_random = flag_enabled(raw["MYSQL_RANDOM_ROOT_PASSWORD"]);
    const std::string& root_raw = raw["MYSQL_ROOT_PASSWORD"];

    if (allow_empty && want_random) {
        throw infra::BootError(infra::ErrorCode::ConfigurationConflict,
                               "Both MYSQL_ALLOW_EMPTY_PASSWORD and MYSQL_RANDOM_ROOT_PASSWORD are "
                               "set (but are exclusive)");
    }
    if ((allow_empty || want_random) && mode_of(root_raw) == RootPasswordMode::Literal) {
        throw infra::BootError(infra::ErrorCode::ConfigurationConflict,
                               std::string("Both MYSQL_ROOT_PASSWORD and ") +
                                   (allow_empty ? "MYSQL_ALLOW_EMPTY_PASSWORD"
                                                : "MYSQL_RANDOM_ROOT_PASSWORD") +
                                   " are set (but are exclusive)");
    }

    if (allow_empty) {
        s.root_password_mode = RootPasswordMode::Empty;
    } else if (want_random) {
        s.root_password_mode = RootPasswordMode::Random;
    } else {
        s.root_password_mode = mode_of(root_raw);
    }
    if (s.root_password_mode == RootPasswordMode::Literal) {
        s.root_password = root_raw;
    }

    // Log verbosity: IMAGEDEBUG=1 wins over NODEBOOT_LOG_LEVEL.
    s.image_debug = infra::String::trim(raw["IMAGEDEBUG"]) == "1";
    auto level = infra::Logger::parse_level(raw["NODEBOOT_LOG_LEVEL"]);
    if (!level) {
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               "NODEBOOT_LOG_LEVEL has unknown level '" +
                                   raw["NODEBOOT_LOG_LEVEL"] + "'");
    }
    s.log_level = s.image_debug ? infra::LogLevel::TRACE : *level;

    return s;
}

Settings Settings::with_overrides(const std::map<std::string, std::string>& overrides) const
{
    Settings next = *this;
    for (const auto& [key, value] : overrides) {
        if (key == "MYSQL_ROOT_PASSWORD") {
            next.root_password_mode = mode_of(value);
            next.root_password =
                next.root_password_mode == RootPasswordMode::Literal ? value : std::string();
        } else if (key == "MYSQL_ROOT_HOST") {
            next.root_host = value;
        } else if (key == "MYSQL_ONETIME_PASSWORD") {
            next.onetime_password = flag_enabled(value);
        } else {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Config: Ignoring override of '" + key +
                                   "' (only root account settings can be overridden)");
            continue;
        }
        infra::Logger::log(infra::LogLevel::INFO, "Config: " + key + " overridden by init script");
    }
    return next;
}

std::map<std::string, std::string> Settings::to_environment() const
{
    std::string root;
    switch (root_password_mode) {
    case RootPasswordMode::Literal:
        root = root_password;
        break;
    case RootPasswordMode::Random:
        root = kRandomSentinel;
        break;
    case RootPasswordMode::Empty:
        root = kEmptySentinel;
        break;
    }

    return {
        {"PRODUCT", product},
        {"MYSQL_USER", user},
        {"MYSQL_PASSWORD", password},
        {"MYSQL_DATABASE", database},
        {"MYSQL_ROOT_PASSWORD", root},
        {"MYSQL_ROOT_HOST", root_host},
        {"MYSQL_ONETIME_PASSWORD", onetime_password ? "1" : ""},
        {"WSREP_JOIN", wsrep_join},
    };
}

} // namespace nodeboot::config
