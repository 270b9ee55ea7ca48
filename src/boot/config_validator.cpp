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
 * @file config_validator.cpp
 * @brief Implementation of configuration validation and introspection.
 */

#include "nodeboot/boot/config_validator.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/random.hpp"
#include "nodeboot/infra/string.hpp"

namespace nodeboot::boot {

EffectiveConfig EffectiveConfig::parse(const std::string& help_output)
{
    std::map<std::string, std::string> values;
    for (const auto& line : infra::String::split_lines(help_output)) {
        auto tokens = infra::String::split_whitespace(line);
        if (tokens.size() < 2) {
            continue;
        }
        values.emplace(tokens[0], tokens[1]);
    }
    return EffectiveConfig(std::move(values));
}

std::optional<std::string> EffectiveConfig::get(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ConfigValidator::help_command(const std::vector<std::string>& argv)
{
    std::vector<std::string> cmd = argv;
    cmd.emplace_back("--verbose");
    cmd.emplace_back("--help");
    // A throwaway index so that parsing the config never opens the real binlog index.
    cmd.push_back("--log-bin-index=" + infra::Random::scratch_path("nodeboot-binlog"));
    return cmd;
}

void ConfigValidator::validate(const std::vector<std::string>& argv)
{
    process::Invocation inv;
    inv.argv = help_command(argv);
    auto result = runner_.run(inv);

    std::string errors = infra::String::trim(result.err);
    if (!result.ok() && errors.empty()) {
        errors = "exit status " + std::to_string(result.exit_code);
    }
    if (!errors.empty()) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Config validation error, please check your configuration!");
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               "Command failed: " + infra::String::join_command(inv.argv) +
                                   "\nError output: " + errors);
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Config: server accepted its configuration");
}

EffectiveConfig ConfigValidator::introspect(const std::vector<std::string>& argv)
{
    process::Invocation inv;
    inv.argv = help_command(argv);
    auto result = runner_.run(inv);
    if (!result.ok()) {
        throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                               "Introspection failed: " + infra::String::join_command(inv.argv) +
                                   " exited with " + std::to_string(result.exit_code) +
                                   "\nError output: " + infra::String::trim(result.err));
    }
    return EffectiveConfig::parse(result.out);
}

std::optional<std::string> ConfigValidator::effective_value(const std::vector<std::string>& argv,
                                                            const std::string& key)
{
    auto value = introspect(argv).get(key);
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Config: effective " + key + " = " + value.value_or("<unset>"));
    return value;
}

} // namespace nodeboot::boot
