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
 * @file classifier.cpp
 * @brief Implementation of the bootstrap decision state machine.
 */

#include "nodeboot/boot/classifier.hpp"

#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace nodeboot::boot {

const char* to_string(BootstrapMode mode)
{
    switch (mode) {
    case BootstrapMode::JoinExisting:
        return "JoinExisting";
    case BootstrapMode::RecoverAndJoin:
        return "RecoverAndJoin";
    case BootstrapMode::BootstrapNew:
        return "BootstrapNew";
    case BootstrapMode::StartNormally:
        return "StartNormally";
    }
    return "Unknown";
}

NodeState NodeState::inspect(const std::string& data_dir)
{
    std::error_code ec;
    NodeState state;
    state.node_marker = fs::is_regular_file(fs::path(data_dir) / kNodeMarkerFile, ec);
    state.data_store_marker = fs::is_directory(fs::path(data_dir) / kSystemSchemaDir, ec);
    return state;
}

BootstrapMode Classifier::classify(bool node_marker, const std::string& join)
{
    if (!join.empty()) {
        return node_marker ? BootstrapMode::RecoverAndJoin : BootstrapMode::JoinExisting;
    }
    return node_marker ? BootstrapMode::StartNormally : BootstrapMode::BootstrapNew;
}

Route Classifier::route_of(BootstrapMode mode)
{
    switch (mode) {
    case BootstrapMode::JoinExisting:
    case BootstrapMode::RecoverAndJoin:
        return Route::Handoff;
    case BootstrapMode::BootstrapNew:
    case BootstrapMode::StartNormally:
        return Route::LocalSetup;
    }
    return Route::LocalSetup;
}

std::string Classifier::cluster_address_arg(const std::string& join)
{
    return "--wsrep-cluster-address=gcomm://" + join;
}

BootPlan Classifier::plan(const NodeState& state, const config::Settings& settings)
{
    BootPlan plan;
    plan.mode = classify(state.node_marker, settings.wsrep_join);
    plan.route = route_of(plan.mode);

    switch (plan.mode) {
    case BootstrapMode::RecoverAndJoin:
        plan.cluster_args.push_back(cluster_address_arg(settings.wsrep_join));
        if (auto position = recover_position(settings.recover_binary)) {
            plan.cluster_args.push_back(*position);
        }
        break;
    case BootstrapMode::JoinExisting:
        plan.cluster_args.push_back(cluster_address_arg(settings.wsrep_join));
        break;
    case BootstrapMode::BootstrapNew:
        plan.cluster_args.emplace_back("--wsrep-new-cluster");
        break;
    case BootstrapMode::StartNormally:
        break;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       std::string("Boot: node classified as ") + to_string(plan.mode) +
                           (state.node_marker ? " (cluster state found)" : " (no cluster state)"));
    return plan;
}

std::optional<std::string> Classifier::recover_position(const std::string& helper)
{
    auto path = runner_.locate(helper, helper_roots_);
    if (!path) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Boot: " + helper +
                               " not found, relying on the server's own crash recovery");
        return std::nullopt;
    }

    infra::Logger::log(infra::LogLevel::INFO, "Boot: recovering cluster position with " + *path);
    process::Invocation inv;
    inv.argv = {*path};
    auto result = runner_.run(inv);
    if (!result.ok()) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Boot: " + *path + " exited with " + std::to_string(result.exit_code) +
                               ", continuing without a recovered position");
        return std::nullopt;
    }

    std::string position = infra::String::trim(result.out);
    if (position.empty()) {
        infra::Logger::log(infra::LogLevel::WARN, "Boot: " + *path + " reported no position");
        return std::nullopt;
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Boot: recovered position " + position);
    return position;
}

} // namespace nodeboot::boot
