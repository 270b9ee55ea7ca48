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
 * @file timezone_loader.hpp
 * @brief Loads the system zoneinfo database into the `mysql` schema.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"
#include "nodeboot/setup/sql_client.hpp"

#include <string>

namespace nodeboot::setup {

/**
 * @class TimezoneLoader
 * @brief `mysql_tzinfo_to_sql <zoneinfo> | mysql mysql`.
 */
class TimezoneLoader {
  public:
    /**
     * @brief Line the converter emits for zoneinfo files without a local time type.
     *
     * It lands inside the SQL stream and would break the load; it is rewritten
     * to the placeholder zone abbreviation instead (MySQL bug #20545).
     */
    static constexpr const char* kBenignWarning = "Local time zone must be set--see zic manual page";
    static constexpr const char* kReplacement = "FCTY";

    TimezoneLoader(process::ProcessRunner& runner, SqlClient& client) : runner_(runner), client_(client)
    {
    }

    /// @brief Rewrites every occurrence of the benign warning.
    static std::string normalize(const std::string& sql);

    /**
     * @brief Converts `zoneinfo_dir` with `converter` and loads the result.
     *
     * @throws infra::BootError `ProvisioningFailed` when the converter or the
     * client fails.
     */
    void load(const std::string& converter, const std::string& zoneinfo_dir);

  private:
    process::ProcessRunner& runner_;
    SqlClient& client_;
};

} // namespace nodeboot::setup
