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
 * @file config_validator.hpp
 * @brief Configuration check and introspection through the server binary itself.
 *
 * @details
 * The server merges option files, includes and command line arguments in ways
 * the entrypoint cannot reproduce. Instead of parsing `my.cnf`, the validator
 * asks the binary: `mysqld <args> --verbose --help` parses the complete
 * configuration, reports problems on stderr and prints the effective value of
 * every variable on stdout.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodeboot::boot {

/**
 * @class EffectiveConfig
 * @brief Variable name to value map as reported by the server binary.
 *
 * Authoritative over any config file on disk.
 */
class EffectiveConfig {
  public:
    EffectiveConfig() = default;
    explicit EffectiveConfig(std::map<std::string, std::string> values) : values_(std::move(values))
    {
    }

    /**
     * @brief Parses `--verbose --help` output.
     *
     * Every line whose first whitespace-separated token is followed by a
     * second token contributes `first -> second`. The first occurrence of a
     * key wins, matching a scan for the first exact key match.
     */
    static EffectiveConfig parse(const std::string& help_output);

    /// @brief Value of `key`, or empty optional when the binary did not report it.
    std::optional<std::string> get(const std::string& key) const;

    std::size_t size() const
    {
        return values_.size();
    }

  private:
    std::map<std::string, std::string> values_;
};

/**
 * @class ConfigValidator
 * @brief Runs the server binary in its self-check mode.
 */
class ConfigValidator {
  public:
    explicit ConfigValidator(process::ProcessRunner& runner) : runner_(runner) {}

    /**
     * @brief Fails fast on a configuration the server would reject.
     *
     * Runs `argv --verbose --help --log-bin-index=<scratch>`. Anything on
     * stderr, or a non-zero exit, is fatal. Not retried: a bad configuration
     * does not become valid by waiting.
     *
     * @throws infra::BootError `InvalidConfiguration` with the exact command and
     * captured output.
     */
    void validate(const std::vector<std::string>& argv);

    /**
     * @brief Full effective configuration for `argv`.
     *
     * @throws infra::BootError `InvalidConfiguration` when the binary exits non-zero.
     */
    EffectiveConfig introspect(const std::vector<std::string>& argv);

    /**
     * @brief Effective value of one variable, re-invoking introspection.
     *
     * @code
     * auto datadir = validator.effective_value(argv, "datadir"); // "/var/lib/mysql/"
     * @endcode
     */
    std::optional<std::string> effective_value(const std::vector<std::string>& argv,
                                               const std::string& key);

    /// @brief `argv` followed by the introspection flags and a fresh scratch path.
    static std::vector<std::string> help_command(const std::vector<std::string>& argv);

  private:
    process::ProcessRunner& runner_;
};

} // namespace nodeboot::boot
