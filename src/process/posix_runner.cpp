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
 * @file posix_runner.cpp
 * @brief Child process management on top of POSIX primitives.
 *
 * @details
 * `run()` multiplexes the child's stdin, stdout and stderr with `poll()` so
 * that a large SQL payload can be streamed in while diagnostics are read
 * out, without either side blocking the other. All pipe ends are created
 * close-on-exec; only the ends `dup2`'ed onto 0/1/2 reach the child.
 */

#include "nodeboot/process/posix_runner.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace nodeboot::process {

namespace {

/// Exit status a shell uses for "command not found / not executable".
constexpr int kExecFailedStatus = 127;

std::string errno_text(int err)
{
    return std::strerror(err);
}

int decode_status(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

/// Pointers into `args`; valid as long as `args` is alive and unmodified.
std::vector<char*> make_argv(const std::vector<std::string>& args)
{
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

struct Pipe {
    ScopedFd read;
    ScopedFd write;
};

Pipe make_pipe()
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe2 failed: " + errno_text(errno));
    }
    return Pipe{ScopedFd(fds[0]), ScopedFd(fds[1])};
}

/**
 * @brief Ignores SIGPIPE for the lifetime of the guard.
 *
 * A child may exit without draining its stdin (e.g. the client rejects the
 * first statement). The write then fails with EPIPE instead of killing the
 * entrypoint. The previous disposition is restored so the final server does
 * not inherit an ignored SIGPIPE across `exec`.
 */
class SigpipeGuard {
  public:
    SigpipeGuard()
    {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

    ~SigpipeGuard()
    {
        if (installed_) {
            ::sigaction(SIGPIPE, &previous_, nullptr);
        }
    }

  private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

/**
 * @brief Child-side setup between `fork` and `execvp`. Never returns.
 *
 * DON'T THROW IN THIS BLOCK - the child must leave through `_exit`.
 */
[[noreturn]] void exec_child(char* const* argv, const std::map<std::string, std::string>& env,
                             int stdin_fd, int stdout_fd, int stderr_fd)
{
    ::signal(SIGPIPE, SIG_DFL);

    if ((stdin_fd >= 0 && ::dup2(stdin_fd, STDIN_FILENO) == -1) ||
        (stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) == -1) ||
        (stderr_fd >= 0 && ::dup2(stderr_fd, STDERR_FILENO) == -1)) {
        std::fprintf(stderr, "Unable to dup2 child stdio: %s\n", std::strerror(errno));
        ::_exit(kExecFailedStatus);
    }

    for (const auto& [name, value] : env) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    ::execvp(argv[0], argv);

    std::fprintf(stderr, "Unable to start program %s: %s\n", argv[0], std::strerror(errno));
    ::_exit(kExecFailedStatus);
}

bool is_executable_file(const fs::path& p)
{
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

} // namespace

// ============================================================================
//  ScopedFd
// ============================================================================

ScopedFd& ScopedFd::operator=(ScopedFd&& other) noexcept
{
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

void ScopedFd::reset(int fd)
{
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

// ============================================================================
//  PosixProcessHandle
// ============================================================================

PosixProcessHandle::~PosixProcessHandle()
{
    if (exit_code_) {
        return;
    }
    // An owner that drops a live handle has lost track of the child. Do not
    // leave it running against the data directory.
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
}

bool PosixProcessHandle::reap(bool block)
{
    if (exit_code_) {
        return true;
    }

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exit_code_ = decode_status(status);
        return true;
    }
    if (r == 0) {
        return false;
    }
    throw std::runtime_error("waitpid(" + std::to_string(pid_) + ") failed: " + errno_text(errno));
}

bool PosixProcessHandle::alive()
{
    return !reap(false);
}

void PosixProcessHandle::terminate()
{
    if (exit_code_) {
        return;
    }
    if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        throw std::runtime_error("kill(" + std::to_string(pid_) + ", SIGTERM) failed: " +
                                 errno_text(errno));
    }
}

int PosixProcessHandle::wait()
{
    reap(true);
    return *exit_code_;
}

std::optional<int> PosixProcessHandle::wait_for(infra::Clock& clock,
                                                infra::Clock::Duration timeout)
{
    bool exited = infra::poll_until(
        clock, std::chrono::milliseconds(100),
        [this] { return reap(false) ? infra::Probe::Ready : infra::Probe::Pending; }, timeout);
    if (!exited) {
        return std::nullopt;
    }
    return exit_code_;
}

// ============================================================================
//  PosixProcessRunner
// ============================================================================

ExecResult PosixProcessRunner::run(const Invocation& invocation)
{
    if (invocation.argv.empty()) {
        throw std::invalid_argument("PosixProcessRunner::run: empty argv");
    }
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Process: run " + infra::String::join_command(invocation.argv));

    SigpipeGuard sigpipe;

    Pipe in;
    Pipe out;
    Pipe err;
    ScopedFd devnull;
    if (invocation.stdin_data.empty()) {
        devnull.reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!devnull.valid()) {
            throw std::runtime_error("open(/dev/null) failed: " + errno_text(errno));
        }
    } else {
        in = make_pipe();
    }
    if (invocation.capture_output) {
        out = make_pipe();
        err = make_pipe();
    }

    auto argv = make_argv(invocation.argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork failed: " + errno_text(errno));
    }
    if (pid == 0) {
        exec_child(argv.data(), invocation.env, devnull.valid() ? devnull.get() : in.read.get(),
                   out.write.get(), err.write.get());
    }

    // Parent keeps only its own ends.
    devnull.reset();
    in.read.reset();
    out.write.reset();
    err.write.reset();

    if (in.write.valid()) {
        int flags = ::fcntl(in.write.get(), F_GETFL);
        ::fcntl(in.write.get(), F_SETFL, flags | O_NONBLOCK);
    }

    ExecResult result;
    const std::string& payload = invocation.stdin_data;
    std::size_t written = 0;
    char buffer[8192];

    while (in.write.valid() || out.read.valid() || err.read.valid()) {
        struct pollfd fds[3];
        nfds_t n = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in.write.valid()) {
            in_idx = static_cast<int>(n);
            fds[n++] = {in.write.get(), POLLOUT, 0};
        }
        if (out.read.valid()) {
            out_idx = static_cast<int>(n);
            fds[n++] = {out.read.get(), POLLIN, 0};
        }
        if (err.read.valid()) {
            err_idx = static_cast<int>(n);
            fds[n++] = {err.read.get(), POLLIN, 0};
        }

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("poll failed: " + errno_text(errno));
        }

        if (in_idx >= 0 && fds[in_idx].revents != 0) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                in.write.reset();
            } else {
                ssize_t w = ::write(in.write.get(), payload.data() + written, payload.size() - written);
                if (w > 0) {
                    written += static_cast<std::size_t>(w);
                } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading. Its exit status tells the story.
                    in.write.reset();
                }
                if (written >= payload.size()) {
                    in.write.reset();
                }
            }
        }

        auto drain = [&buffer](ScopedFd& fd, std::string& sink) {
            ssize_t r = ::read(fd.get(), buffer, sizeof(buffer));
            if (r > 0) {
                sink.append(buffer, static_cast<std::size_t>(r));
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                fd.reset();
            }
        };
        if (out_idx >= 0 && fds[out_idx].revents != 0) {
            drain(out.read, result.out);
        }
        if (err_idx >= 0 && fds[err_idx].revents != 0) {
            drain(err.read, result.err);
        }
    }

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        throw std::runtime_error("waitpid failed: " + errno_text(errno));
    }
    result.exit_code = decode_status(status);

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Process: " + invocation.argv.front() + " exited with " +
                           std::to_string(result.exit_code));
    return result;
}

std::unique_ptr<ProcessHandle> PosixProcessRunner::spawn(const Invocation& invocation)
{
    if (invocation.argv.empty()) {
        throw std::invalid_argument("PosixProcessRunner::spawn: empty argv");
    }
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Process: spawn " + infra::String::join_command(invocation.argv));

    ScopedFd devnull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull.valid()) {
        throw std::runtime_error("open(/dev/null) failed: " + errno_text(errno));
    }

    auto argv = make_argv(invocation.argv);
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork failed: " + errno_text(errno));
    }
    if (pid == 0) {
        exec_child(argv.data(), invocation.env, devnull.get(), -1, -1);
    }
    return std::make_unique<PosixProcessHandle>(pid);
}

void PosixProcessRunner::exec(const std::vector<std::string>& args)
{
    if (args.empty()) {
        throw infra::BootError(infra::ErrorCode::HandoffFailed, "exec: empty command line");
    }

    auto argv = make_argv(args);
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    ::execvp(argv[0], argv.data());

    int e = errno;
    throw infra::BootError(infra::ErrorCode::HandoffFailed,
                           "exec of '" + infra::String::join_command(args) +
                               "' failed: " + errno_text(e));
}

std::optional<std::string> PosixProcessRunner::locate(const std::string& program,
                                                      const std::vector<std::string>& extra_roots)
{
    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) {
            return program;
        }
        return std::nullopt;
    }

    if (const char* path = std::getenv("PATH")) {
        std::string dirs = path;
        std::string::size_type pos = 0;
        while (pos <= dirs.size()) {
            auto colon = dirs.find(':', pos);
            std::string dir =
                dirs.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos);
            fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
            if (is_executable_file(candidate)) {
                return candidate.string();
            }
            if (colon == std::string::npos) {
                break;
            }
            pos = colon + 1;
        }
    }

    for (const auto& root : extra_roots) {
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied,
                                            ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->path().filename() == program && is_executable_file(it->path())) {
                return it->path().string();
            }
        }
    }
    return std::nullopt;
}

} // namespace nodeboot::process
