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

#include "nodeboot/config/environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace nodeboot::config {

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const
{
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

void ProcessEnvironment::set(const std::string& name, const std::string& value)
{
    if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
        throw std::runtime_error("setenv(" + name + ") failed: " + std::strerror(errno));
    }
}

void ProcessEnvironment::unset(const std::string& name)
{
    if (::unsetenv(name.c_str()) != 0) {
        throw std::runtime_error("unsetenv(" + name + ") failed: " + std::strerror(errno));
    }
}

std::optional<std::string> MapEnvironment::get(const std::string& name) const
{
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MapEnvironment::set(const std::string& name, const std::string& value)
{
    vars_[name] = value;
}

void MapEnvironment::unset(const std::string& name)
{
    vars_.erase(name);
}

} // namespace nodeboot::config
