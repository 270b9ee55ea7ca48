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
 * @file initializer_test.cpp
 * @brief Tests for the one-time data directory initialization.
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "nodeboot/boot/initializer.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using nodeboot::boot::Initializer;

void test_initializer_skips_initialized()
{
    nodeboot::test::ScratchDir dir;
    fs::create_directories(dir / "mysql");
    std::ofstream(dir / "keep.me") << "x";

    nodeboot::test::FakeRunner runner;
    ASSERT_FALSE(Initializer(runner).ensure(dir.path(), {"mysqld"}));
    ASSERT_TRUE(runner.runs.empty());
    ASSERT_TRUE(fs::exists(dir / "keep.me"));
}

/**
 * @brief Stale content is cleared, the server is asked to initialize, and
 * the marker it creates is accepted.
 */
void test_initializer_runs_once()
{
    nodeboot::test::ScratchDir dir;
    std::ofstream(dir / "leftover.ibd") << "stale";
    const std::string data_dir = dir.path();

    nodeboot::test::FakeRunner runner;
    runner.on("mysqld", [&data_dir](const nodeboot::process::Invocation&) {
        fs::create_directories(data_dir + "/mysql");
        return nodeboot::test::exec_ok();
    });

    Initializer init(runner);
    ASSERT_TRUE(init.ensure(data_dir, {"mysqld", "--user=mysql"}));
    ASSERT_FALSE(fs::exists(dir / "leftover.ibd"));
    ASSERT_EQ(runner.runs.size(), static_cast<size_t>(1));

    const auto& argv = runner.runs[0].argv;
    ASSERT_TRUE(nodeboot::test::contains(argv, "--initialize-insecure"));
    ASSERT_TRUE(nodeboot::test::contains(argv, "--tls-version="));
    ASSERT_FALSE(runner.runs[0].capture_output);

    // Second call: marker present, no new run.
    ASSERT_FALSE(init.ensure(data_dir, {"mysqld", "--user=mysql"}));
    ASSERT_EQ(runner.runs.size(), static_cast<size_t>(1));
}

void test_initializer_failure_kept_for_inspection()
{
    nodeboot::test::ScratchDir dir;
    const std::string data_dir = dir.path();

    nodeboot::test::FakeRunner runner;
    runner.on("mysqld", [&data_dir](const nodeboot::process::Invocation&) {
        std::ofstream(data_dir + "/partial.log") << "half done";
        return nodeboot::test::exec_fail(1);
    });

    ASSERT_BOOT_ERROR(Initializer(runner).ensure(data_dir, {"mysqld"}), InitializationFailed);
    ASSERT_TRUE(fs::exists(dir / "partial.log"));
}

void test_initializer_requires_marker()
{
    nodeboot::test::ScratchDir dir;
    nodeboot::test::FakeRunner runner;
    runner.on("mysqld", nodeboot::test::exec_ok());
    ASSERT_BOOT_ERROR(Initializer(runner).ensure(dir.path(), {"mysqld"}), InitializationFailed);
}
