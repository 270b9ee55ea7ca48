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

#include "nodeboot/setup/timezone_loader.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

namespace nodeboot::setup {

std::string TimezoneLoader::normalize(const std::string& sql)
{
    return infra::String::replace_all(sql, kBenignWarning, kReplacement);
}

void TimezoneLoader::load(const std::string& converter, const std::string& zoneinfo_dir)
{
    infra::Logger::log(infra::LogLevel::INFO, "Setup: Loading TZINFO...");

    process::Invocation inv;
    inv.argv = {converter, zoneinfo_dir};
    auto result = runner_.run(inv);
    if (!result.ok()) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                               converter + " exited with " + std::to_string(result.exit_code) +
                                   ": " + infra::String::trim(result.err));
    }
    if (!result.err.empty()) {
        // Skipped zone files are reported on stderr; they do not affect the load.
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Setup: " + converter + ": " + infra::String::trim(result.err));
    }

    client_.execute(normalize(result.out), "mysql", "timezone load");
}

} // namespace nodeboot::setup
