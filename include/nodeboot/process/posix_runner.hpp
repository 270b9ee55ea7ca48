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
 * @file posix_runner.hpp
 * @brief `fork`/`execvp`/`waitpid` implementation of `ProcessRunner`.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

namespace nodeboot::process {

/**
 * @class ScopedFd
 * @brief RAII owner of a file descriptor.
 *
 * Closes the descriptor when the guard goes out of scope, so early returns
 * and exceptions in the pipe plumbing never leak descriptors into the
 * final server process.
 */
class ScopedFd {
  public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept;

    ~ScopedFd()
    {
        reset();
    }

    int get() const
    {
        return fd_;
    }

    bool valid() const
    {
        return fd_ >= 0;
    }

    /// @brief Gives up ownership without closing.
    int release()
    {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /// @brief Closes the current descriptor (if any) and adopts `fd`.
    void reset(int fd = -1);

  private:
    int fd_ = -1;
};

/**
 * @class PosixProcessHandle
 * @brief Handle to a child created by `fork`.
 */
class PosixProcessHandle : public ProcessHandle {
  public:
    explicit PosixProcessHandle(pid_t pid) : pid_(pid) {}

    PosixProcessHandle(const PosixProcessHandle&) = delete;
    PosixProcessHandle& operator=(const PosixProcessHandle&) = delete;

    /// @brief Kills (SIGKILL) and reaps the child if it is still running.
    ~PosixProcessHandle() override;

    pid_t pid() const override
    {
        return pid_;
    }

    bool alive() override;
    void terminate() override;
    int wait() override;
    std::optional<int> wait_for(infra::Clock& clock, infra::Clock::Duration timeout) override;

  private:
    pid_t pid_;
    std::optional<int> exit_code_;

    /// @brief `waitpid` wrapper; records the status once the child is reaped.
    bool reap(bool block);
};

/**
 * @class PosixProcessRunner
 * @brief Runs programs as real child processes.
 */
class PosixProcessRunner : public ProcessRunner {
  public:
    ExecResult run(const Invocation& invocation) override;
    std::unique_ptr<ProcessHandle> spawn(const Invocation& invocation) override;
    [[noreturn]] void exec(const std::vector<std::string>& argv) override;
    std::optional<std::string> locate(const std::string& program,
                                      const std::vector<std::string>& extra_roots = {}) override;
};

} // namespace nodeboot::process
