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
 * @file handoff.hpp
 * @brief Terminal transfer of the process slot to the database server.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

#include <string>
#include <vector>

namespace nodeboot::boot {

/**
 * @class HandoffRunner
 * @brief Replaces the entrypoint with the final server invocation.
 *
 * @details
 * After `exec` the server owns the entrypoint's PID, so the container runtime
 * signals it directly and its exit status becomes the container's.
 */
class HandoffRunner {
  public:
    explicit HandoffRunner(process::ProcessRunner& runner) : runner_(runner) {}

    /**
     * @brief Execs `argv`. Never returns control on success.
     *
     * No retry: a failed exec means the binary or its arguments are broken.
     *
     * @throws infra::BootError `HandoffFailed`.
     */
    [[noreturn]] void hand_off(const std::vector<std::string>& argv);

  private:
    process::ProcessRunner& runner_;
};

} // namespace nodeboot::boot
