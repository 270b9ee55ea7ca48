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
 * @file init_scripts.hpp
 * @brief Custom initialization files supplied by the image user.
 *
 * @details
 * Files in the init directory run once per setup pass, in byte-wise
 * lexicographic order of their names, dispatched by extension:
 *
 * - `*.sh`: run as `/bin/sh <file>` (see override channel below).
 * - `*.sql`: streamed to the client.
 * - `*.sql.gz`: gunzipped with zlib, then streamed to the client.
 * - anything else: skipped with a notice.
 *
 * **Override channel.** A shell script is an external program. It sees the
 * resolved settings as `MYSQL_*` variables, the setup socket in
 * `NODEBOOT_SOCKET`, the data directory in `NODEBOOT_DATADIR`, and the path
 * of an empty file in `NODEBOOT_OVERRIDES`. To influence the root account
 * step it writes one JSON object of strings into that file:
 *
 * @code
 * printf '{"MYSQL_ROOT_HOST":"10.0.%%"}' > "$NODEBOOT_OVERRIDES"
 * @endcode
 *
 * Only the keys in `config::Settings::overridable_keys()` take effect.
 */

#pragma once

#include "nodeboot/config/settings.hpp"
#include "nodeboot/process/process_runner.hpp"
#include "nodeboot/setup/sql_client.hpp"

#include <map>
#include <string>
#include <vector>

namespace nodeboot::setup {

enum class ScriptKind { Shell, Sql, CompressedSql, Unknown };

/**
 * @class InitScriptRunner
 * @brief Executes the init directory against the setup instance.
 */
class InitScriptRunner {
  public:
    /// @brief Variable naming the override file handed to shell scripts.
    static constexpr const char* kOverridesVar = "NODEBOOT_OVERRIDES";

    InitScriptRunner(process::ProcessRunner& runner, SqlClient& client)
        : runner_(runner), client_(client)
    {
    }

    static ScriptKind kind_of(const std::string& path);

    /// @brief Regular files in `dir`, sorted by name. A missing directory yields none.
    static std::vector<std::string> list(const std::string& dir);

    /**
     * @brief Parses the override file written by a shell script.
     *
     * Blank content means no overrides. Non-string members are skipped with a
     * warning.
     *
     * @throws infra::BootError `ProvisioningFailed` when the content is not a
     * JSON object.
     */
    static std::map<std::string, std::string> parse_overrides(const std::string& json,
                                                              const std::string& source);

    /**
     * @brief Decompresses a gzip file into memory.
     *
     * @throws infra::BootError `ProvisioningFailed` on open or inflate errors.
     */
    static std::string gunzip(const std::string& path);

    /**
     * @brief Runs every file of `dir` and folds script overrides into `settings`.
     *
     * @return the settings in effect after the last script.
     * @throws infra::BootError `ProvisioningFailed` on the first failing file.
     */
    config::Settings run_all(const std::string& dir, const config::Settings& settings,
                             const std::string& data_dir);

  private:
    process::ProcessRunner& runner_;
    SqlClient& client_;

    std::map<std::string, std::string> run_shell(const std::string& path,
                                                 const config::Settings& settings,
                                                 const std::string& data_dir);
};

} // namespace nodeboot::setup
