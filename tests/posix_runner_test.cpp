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
 * @file posix_runner_test.cpp
 * @brief Integration tests for the fork/exec backend, driven through `/bin/sh`.
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "nodeboot/infra/clock.hpp"
#include "nodeboot/process/posix_runner.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using nodeboot::process::Invocation;
using nodeboot::process::PosixProcessRunner;

namespace {

Invocation shell(const std::string& script)
{
    Invocation inv;
    inv.argv = {"/bin/sh", "-c", script};
    return inv;
}

} // namespace

void test_posix_run_captures_output()
{
    PosixProcessRunner runner;
    auto result = runner.run(shell("echo out; echo err >&2; exit 3"));
    ASSERT_EQ(result.exit_code, 3);
    ASSERT_EQ(result.out, std::string("out\n"));
    ASSERT_EQ(result.err, std::string("err\n"));
}

void test_posix_run_stdin_and_env()
{
    PosixProcessRunner runner;
    Invocation inv = shell("cat; printf '%s' \"$NODEBOOT_PROBE\"");
    inv.stdin_data = "SELECT @@wsrep_on;\n";
    inv.env["NODEBOOT_PROBE"] = "visible";
    auto result = runner.run(inv);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.out, std::string("SELECT @@wsrep_on;\nvisible"));
}

/**
 * @brief A child that never reads stdin must not block or kill the parent.
 */
void test_posix_run_ignored_stdin()
{
    PosixProcessRunner runner;
    Invocation inv = shell("exit 0");
    inv.stdin_data = std::string(1 << 20, 'x');
    ASSERT_EQ(runner.run(inv).exit_code, 0);
}

void test_posix_run_missing_program()
{
    PosixProcessRunner runner;
    Invocation inv;
    inv.argv = {"/nonexistent/nodeboot-binary"};
    auto result = runner.run(inv);
    ASSERT_EQ(result.exit_code, 127);
    ASSERT_FALSE(result.err.empty());
}

/**
 * @brief SIGTERM ends a spawned child; the shell-style status is 128 + 15.
 */
void test_posix_spawn_terminate()
{
    PosixProcessRunner runner;
    nodeboot::infra::SystemClock clock;

    Invocation inv;
    inv.argv = {"sleep", "30"};
    auto handle = runner.spawn(inv);
    ASSERT_TRUE(handle->alive());

    ASSERT_FALSE(handle->wait_for(clock, std::chrono::milliseconds(200)).has_value());

    handle->terminate();
    auto status = handle->wait_for(clock, std::chrono::milliseconds(5000));
    ASSERT_TRUE(status.has_value());
    ASSERT_EQ(*status, 128 + 15);
    ASSERT_FALSE(handle->alive());
}

void test_posix_locate()
{
    PosixProcessRunner runner;
    auto sh = runner.locate("sh");
    ASSERT_TRUE(sh.has_value());
    ASSERT_FALSE(runner.locate("nodeboot-no-such-helper", {"/nonexistent"}).has_value());

    nodeboot::test::ScratchDir dir;
    const std::string helper = dir / "bin/wsrep_recover";
    std::filesystem::create_directories(dir / "bin");
    std::ofstream(helper) << "#!/bin/sh\n";
    std::filesystem::permissions(helper, std::filesystem::perms::owner_all);
    ASSERT_EQ(runner.locate("wsrep_recover", {dir.path()}).value_or(""), helper);
}

void test_posix_exec_failure()
{
    PosixProcessRunner runner;
    ASSERT_BOOT_ERROR(runner.exec({"/nonexistent/nodeboot-binary"}), HandoffFailed);
}
