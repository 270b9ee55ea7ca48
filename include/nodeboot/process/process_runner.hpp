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
 * @file process_runner.hpp
 * @brief Process-supervision abstraction used by every bootstrap stage.
 *
 * @details
 * The entrypoint drives external programs in three ways:
 *
 * 1. **Run to completion** (`run`): introspection, initialization, SQL
 *    batches, init scripts. Output is captured and the exit status returned.
 * 2. **Spawn and supervise** (`spawn`): the temporary setup instance. The
 *    caller receives a `ProcessHandle` that it alone owns.
 * 3. **Terminal handoff** (`exec`): replaces the current process image with
 *    the final server. It never returns control on success.
 *
 * Components depend on the abstract `ProcessRunner`, so the pipeline can be
 * exercised in tests with scripted fakes instead of real database binaries.
 */

#pragma once

#include "nodeboot/infra/clock.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace nodeboot::process {

/**
 * @struct Invocation
 * @brief Everything needed to start one child process.
 */
struct Invocation {
    /// @brief `argv[0]` is resolved through `PATH` when it contains no `/`.
    std::vector<std::string> argv;

    /// @brief Written to the child's stdin, which is then closed. Empty: stdin is `/dev/null`.
    std::string stdin_data;

    /// @brief Variables added to (or replacing those of) the inherited environment.
    std::map<std::string, std::string> env;

    /// @brief When false, stdout/stderr are inherited instead of captured.
    bool capture_output = true;
};

/**
 * @struct ExecResult
 * @brief Outcome of a run-to-completion invocation.
 */
struct ExecResult {
    /// @brief Exit status; `128 + signo` when the child was killed by a signal.
    int exit_code = 0;
    std::string out;
    std::string err;

    bool ok() const
    {
        return exit_code == 0;
    }
};

/**
 * @class ProcessHandle
 * @brief Exclusive ownership of one running child.
 *
 * A handle is move-only by virtue of being held in a `std::unique_ptr`.
 * Destroying a handle whose child is still running kills and reaps it.
 */
class ProcessHandle {
  public:
    virtual ~ProcessHandle() = default;

    virtual pid_t pid() const = 0;

    /// @brief Non-blocking liveness check. Reaps the child if it has exited.
    virtual bool alive() = 0;

    /// @brief Sends SIGTERM. A child that already exited is not an error.
    virtual void terminate() = 0;

    /// @brief Blocks until the child exits and returns its exit status.
    virtual int wait() = 0;

    /**
     * @brief Waits at most `timeout` for the child to exit.
     *
     * @return the exit status, or an empty optional when the child is still
     * running after `timeout`.
     */
    virtual std::optional<int> wait_for(infra::Clock& clock, infra::Clock::Duration timeout) = 0;
};

/**
 * @class ProcessRunner
 * @brief Factory for child processes and the terminal `exec`.
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a program to completion.
     *
     * A program that cannot be started yields exit status 127 and the reason
     * in `err`, the way a shell reports "command not found".
     */
    virtual ExecResult run(const Invocation& invocation) = 0;

    /**
     * @brief Starts a program without waiting for it.
     *
     * Output is inherited regardless of `capture_output`.
     *
     * @throws std::runtime_error when the process cannot be forked.
     */
    virtual std::unique_ptr<ProcessHandle> spawn(const Invocation& invocation) = 0;

    /**
     * @brief Replaces the current process image with `argv`.
     *
     * Pending output on `stdout`/`stderr` is flushed first. On success this
     * call never returns.
     *
     * @throws infra::BootError `HandoffFailed` when `execvp` fails.
     */
    [[noreturn]] virtual void exec(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Finds an executable by name.
     *
     * Searches `PATH` first, then recursively below each of `extra_roots`.
     *
     * @return the absolute path, or an empty optional when not found.
     */
    virtual std::optional<std::string> locate(const std::string& program,
                                              const std::vector<std::string>& extra_roots = {}) = 0;
};

} // namespace nodeboot::process
