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
 * @file environment.hpp
 * @brief Read/write access to environment variables.
 *
 * @details
 * Configuration is read from the container environment exactly once, while
 * `Settings` is built. The `Environment` interface keeps that single read
 * testable: production code uses `ProcessEnvironment`, tests use
 * `MapEnvironment`.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace nodeboot::config {

/**
 * @class Environment
 * @brief Abstract key/value view of environment variables.
 */
class Environment {
  public:
    virtual ~Environment() = default;

    /// @brief Value of `name`, or empty optional when the variable is unset.
    virtual std::optional<std::string> get(const std::string& name) const = 0;

    virtual void set(const std::string& name, const std::string& value) = 0;

    /// @brief Removes `name`. Removing an unset variable is a no-op.
    virtual void unset(const std::string& name) = 0;

    /**
     * @brief Value of `name` when set and non-empty.
     *
     * Container tooling often exports variables as empty strings; for every
     * option in the schema, empty and unset mean the same thing.
     */
    std::optional<std::string> get_non_empty(const std::string& name) const
    {
        auto value = get(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    }
};

/**
 * @class ProcessEnvironment
 * @brief The real process environment (`getenv`/`setenv`/`unsetenv`).
 *
 * Changes are inherited by every child spawned afterwards.
 */
class ProcessEnvironment : public Environment {
  public:
    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value) override;
    void unset(const std::string& name) override;
};

/**
 * @class MapEnvironment
 * @brief In-memory environment for tests and dry runs.
 */
class MapEnvironment : public Environment {
  public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string> vars) : vars_(std::move(vars)) {}

    std::optional<std::string> get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value) override;
    void unset(const std::string& name) override;

  private:
    std::map<std::string, std::string> vars_;
};

} // namespace nodeboot::config
