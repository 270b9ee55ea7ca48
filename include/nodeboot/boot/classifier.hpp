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
 * @file classifier.hpp
 * @brief Bootstrap decision state machine.
 *
 * @details
 * Decides, from on-disk markers and the join address alone, how this node
 * comes up:
 *
 * | join  | grastate.dat | mode           | cluster arguments                     |
 * |-------|--------------|----------------|---------------------------------------|
 * | set   | present      | RecoverAndJoin | cluster address + recovered position  |
 * | set   | absent       | JoinExisting   | cluster address                       |
 * | empty | absent       | BootstrapNew   | `--wsrep-new-cluster`                 |
 * | empty | present      | StartNormally  | none                                  |
 *
 * Joining nodes receive their data through state transfer, so both join
 * modes go straight to handoff. The other two take the local path through
 * the initializer check.
 */

#pragma once

#include "nodeboot/config/settings.hpp"
#include "nodeboot/process/process_runner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nodeboot::boot {

/// @brief File the server keeps in the data directory once it ran as a cluster member.
inline constexpr const char* kNodeMarkerFile = "grastate.dat";

/// @brief System schema directory; exists once the data directory was initialized.
inline constexpr const char* kSystemSchemaDir = "mysql";

enum class BootstrapMode { JoinExisting, RecoverAndJoin, BootstrapNew, StartNormally };

const char* to_string(BootstrapMode mode);

/**
 * @enum Route
 * @brief Where control goes after classification.
 */
enum class Route {
    Handoff,   ///< Exec the server immediately.
    LocalSetup ///< Initializer check, then (when needed) the setup supervisor.
};

/**
 * @struct NodeState
 * @brief The two persistent markers, read once from the data directory.
 */
struct NodeState {
    bool node_marker = false;       ///< `<datadir>/grastate.dat` exists.
    bool data_store_marker = false; ///< `<datadir>/mysql/` exists.

    static NodeState inspect(const std::string& data_dir);
};

/**
 * @struct BootPlan
 * @brief Classification result: mode, route and the arguments it adds.
 */
struct BootPlan {
    BootstrapMode mode = BootstrapMode::StartNormally;
    Route route = Route::LocalSetup;
    std::vector<std::string> cluster_args;
};

/**
 * @class Classifier
 * @brief Computes the `BootPlan` for this container start.
 */
class Classifier {
  public:
    /**
     * @param runner Used to locate and run the position recovery helper.
     * @param helper_roots Directories searched recursively for the helper
     * after `PATH`.
     */
    explicit Classifier(process::ProcessRunner& runner,
                        std::vector<std::string> helper_roots = {"/usr"})
        : runner_(runner), helper_roots_(std::move(helper_roots))
    {
    }

    /// @brief Pure mode decision. `join` is the (trimmed) peer list.
    static BootstrapMode classify(bool node_marker, const std::string& join);

    static Route route_of(BootstrapMode mode);

    /// @brief `--wsrep-cluster-address=gcomm://<join>`.
    static std::string cluster_address_arg(const std::string& join);

    /**
     * @brief Classifies and composes the mode's arguments.
     *
     * For `RecoverAndJoin` the recovery helper runs if it can be found. Its
     * trimmed output is appended as one argument. A missing or failing
     * helper is logged and otherwise ignored: the server's own crash
     * recovery takes over.
     */
    BootPlan plan(const NodeState& state, const config::Settings& settings);

  private:
    process::ProcessRunner& runner_;
    std::vector<std::string> helper_roots_;

    std::optional<std::string> recover_position(const std::string& helper);
};

} // namespace nodeboot::boot
