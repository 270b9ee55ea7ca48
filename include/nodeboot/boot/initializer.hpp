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
 * @file initializer.hpp
 * @brief One-time creation of the on-disk data store.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

#include <string>
#include <vector>

namespace nodeboot::boot {

/**
 * @class Initializer
 * @brief Creates the system schema once per data directory.
 *
 * @details
 * Guarded by the data-store marker (`<datadir>/mysql/`). Once that marker
 * exists the initializer is a no-op for the lifetime of the directory,
 * across any number of restarts.
 */
class Initializer {
  public:
    explicit Initializer(process::ProcessRunner& runner) : runner_(runner) {}

    /**
     * @brief Initializes `data_dir` unless it already holds a system schema.
     *
     * When the marker is absent:
     * 1. Every entry under `data_dir` is removed and the directory recreated.
     * 2. `argv --initialize-insecure --tls-version=` runs. The root account is
     *    created without a password and TLS is off for this step only.
     * 3. The marker must now exist.
     *
     * On failure the directory is left as-is for post-mortem inspection.
     *
     * @return true when initialization ran, false when it was skipped.
     * @throws infra::BootError `InitializationFailed`.
     */
    bool ensure(const std::string& data_dir, const std::vector<std::string>& argv);

  private:
    process::ProcessRunner& runner_;

    static void reset_directory(const std::string& data_dir);
};

} // namespace nodeboot::boot
