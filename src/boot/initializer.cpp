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
 * @file initializer.cpp
 * @brief Implementation of the one-time data store initialization.
 */

#include "nodeboot/boot/initializer.hpp"

#include "nodeboot/boot/classifier.hpp"
#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace nodeboot::boot {

void Initializer::reset_directory(const std::string& data_dir)
{
    std::error_code ec;
    if (fs::exists(data_dir, ec)) {
        // Clear the contents, not the directory: it is usually a mount point.
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(data_dir, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            throw infra::BootError(infra::ErrorCode::InitializationFailed,
                                   "Unable to list " + data_dir + ": " + ec.message());
        }
        for (const auto& entry : entries) {
            fs::remove_all(entry, ec);
            if (ec) {
                throw infra::BootError(infra::ErrorCode::InitializationFailed,
                                       "Unable to remove " + entry.string() + ": " + ec.message());
            }
        }
    }

    fs::create_directories(data_dir, ec);
    if (ec || !fs::is_directory(data_dir)) {
        throw infra::BootError(infra::ErrorCode::InitializationFailed,
                               "Unable to create data directory " + data_dir +
                                   (ec ? ": " + ec.message() : std::string()));
    }
}

bool Initializer::ensure(const std::string& data_dir, const std::vector<std::string>& argv)
{
    if (NodeState::inspect(data_dir).data_store_marker) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Init: " + data_dir + "/" + kSystemSchemaDir +
                               " exists, data directory already initialized");
        return false;
    }

    reset_directory(data_dir);

    infra::Logger::log(infra::LogLevel::INFO, "Init: Initializing data directory...");
    process::Invocation inv;
    inv.argv = argv;
    inv.argv.emplace_back("--initialize-insecure");
    inv.argv.emplace_back("--tls-version=");
    inv.capture_output = false;

    auto result = runner_.run(inv);
    if (!result.ok()) {
        throw infra::BootError(infra::ErrorCode::InitializationFailed,
                               "Data directory initialization failed: " +
                                   infra::String::join_command(inv.argv) + " exited with " +
                                   std::to_string(result.exit_code));
    }

    if (!NodeState::inspect(data_dir).data_store_marker) {
        throw infra::BootError(infra::ErrorCode::InitializationFailed,
                               "Initialization reported success but " + data_dir + "/" +
                                   kSystemSchemaDir + " was not created");
    }

    infra::Logger::log(infra::LogLevel::INFO, "Init: Data directory initialized");
    return true;
}

} // namespace nodeboot::boot
