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
 * @file secret_resolver.cpp
 * @brief Implementation of value-or-file resolution.
 */

#include "nodeboot/config/secret_resolver.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

#include <fstream>
#include <sstream>

namespace nodeboot::config {

std::string SecretResolver::resolve(const std::string& name, const std::string& def)
{
    const std::string file_var = name + kFileSuffix;
    auto direct = env_.get_non_empty(name);
    auto file_path = env_.get_non_empty(file_var);

    if (direct && file_path) {
        throw infra::BootError(infra::ErrorCode::ConfigurationConflict,
                               "Both " + name + " and " + file_var + " are set (but are exclusive)");
    }

    std::string value = def;
    if (direct) {
        value = *direct;
    } else if (file_path) {
        std::ifstream in(*file_path, std::ios::binary);
        if (!in.is_open()) {
            throw infra::BootError(infra::ErrorCode::InvalidConfiguration,
                                   file_var + " points at unreadable file '" + *file_path + "'");
        }
        std::ostringstream content;
        content << in.rdbuf();
        value = infra::String::trim(content.str());
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Config: " + name + " read from " + file_var + " (" + *file_path + ")");
    }

    env_.unset(file_var);
    return value;
}

} // namespace nodeboot::config
