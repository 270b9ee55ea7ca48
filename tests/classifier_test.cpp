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
 * @file classifier_test.cpp
 * @brief Tests for the bootstrap decision table and position recovery.
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "nodeboot/boot/classifier.hpp"

#include <fstream>
#include <string>

using nodeboot::boot::BootstrapMode;
using nodeboot::boot::Classifier;
using nodeboot::boot::NodeState;
using nodeboot::boot::Route;

/**
 * @brief All four marker/join combinations map to distinct modes and routes.
 */
void test_classify_table()
{
    ASSERT_TRUE(Classifier::classify(true, "n1") == BootstrapMode::RecoverAndJoin);
    ASSERT_TRUE(Classifier::classify(false, "n1") == BootstrapMode::JoinExisting);
    ASSERT_TRUE(Classifier::classify(false, "") == BootstrapMode::BootstrapNew);
    ASSERT_TRUE(Classifier::classify(true, "") == BootstrapMode::StartNormally);

    ASSERT_TRUE(Classifier::route_of(BootstrapMode::RecoverAndJoin) == Route::Handoff);
    ASSERT_TRUE(Classifier::route_of(BootstrapMode::JoinExisting) == Route::Handoff);
    ASSERT_TRUE(Classifier::route_of(BootstrapMode::BootstrapNew) == Route::LocalSetup);
    ASSERT_TRUE(Classifier::route_of(BootstrapMode::StartNormally) == Route::LocalSetup);
}

void test_node_state_inspect()
{
    nodeboot::test::ScratchDir dir;
    NodeState empty = NodeState::inspect(dir.path());
    ASSERT_FALSE(empty.node_marker);
    ASSERT_FALSE(empty.data_store_marker);

    std::ofstream(dir / "grastate.dat") << "# GALERA saved state\n";
    std::filesystem::create_directories(dir / "mysql");
    NodeState full = NodeState::inspect(dir.path());
    ASSERT_TRUE(full.node_marker);
    ASSERT_TRUE(full.data_store_marker);
}

void test_plan_arguments()
{
    nodeboot::test::FakeRunner runner;
    Classifier classifier(runner);
    nodeboot::config::Settings settings;

    auto fresh = classifier.plan(NodeState{false, false}, settings);
    ASSERT_TRUE(fresh.mode == BootstrapMode::BootstrapNew);
    ASSERT_EQ(fresh.cluster_args.size(), static_cast<size_t>(1));
    ASSERT_EQ(fresh.cluster_args[0], std::string("--wsrep-new-cluster"));

    auto resume = classifier.plan(NodeState{true, true}, settings);
    ASSERT_TRUE(resume.mode == BootstrapMode::StartNormally);
    ASSERT_TRUE(resume.cluster_args.empty());

    settings.wsrep_join = "10.0.0.1,10.0.0.2";
    auto join = classifier.plan(NodeState{false, false}, settings);
    ASSERT_TRUE(join.mode == BootstrapMode::JoinExisting);
    ASSERT_EQ(join.cluster_args.size(), static_cast<size_t>(1));
    ASSERT_EQ(join.cluster_args[0],
              std::string("--wsrep-cluster-address=gcomm://10.0.0.1,10.0.0.2"));
}

/**
 * @brief A found helper contributes its trimmed output as one argument.
 */
void test_recover_position_appended()
{
    nodeboot::test::FakeRunner runner;
    runner.programs["wsrep_recover"] = "/usr/bin/wsrep_recover";
    runner.on("/usr/bin/wsrep_recover",
              nodeboot::test::exec_ok("--wsrep-start-position=abc:42\n"));

    nodeboot::config::Settings settings;
    settings.wsrep_join = "peer";
    auto plan = Classifier(runner).plan(NodeState{true, true}, settings);

    ASSERT_TRUE(plan.mode == BootstrapMode::RecoverAndJoin);
    ASSERT_EQ(plan.cluster_args.size(), static_cast<size_t>(2));
    ASSERT_EQ(plan.cluster_args[1], std::string("--wsrep-start-position=abc:42"));
}

/**
 * @brief Missing or failing helper: no position, no error.
 */
void test_recover_position_tolerated()
{
    nodeboot::config::Settings settings;
    settings.wsrep_join = "peer";

    nodeboot::test::FakeRunner missing;
    auto plan = Classifier(missing).plan(NodeState{true, true}, settings);
    ASSERT_EQ(plan.cluster_args.size(), static_cast<size_t>(1));
    ASSERT_TRUE(missing.runs.empty());

    nodeboot::test::FakeRunner failing;
    failing.programs["wsrep_recover"] = "/usr/bin/wsrep_recover";
    failing.on("/usr/bin/wsrep_recover", nodeboot::test::exec_fail(1, "no state"));
    plan = Classifier(failing).plan(NodeState{true, true}, settings);
    ASSERT_EQ(plan.cluster_args.size(), static_cast<size_t>(1));
    ASSERT_EQ(failing.runs.size(), static_cast<size_t>(1));
}
