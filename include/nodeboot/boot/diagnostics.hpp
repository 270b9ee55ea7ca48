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
 * @file diagnostics.hpp
 * @brief Evidence bundle emitted before every fatal exit.
 *
 * @details
 * Pure collection and output; no decisions are made here. Every failure
 * leaves behind the same bundle: who the process ran as, what the data
 * directory looked like, the tail of the server error log and the system
 * journal. Each collector tolerates its own failure so that one missing
 * piece never hides the others.
 */

#pragma once

#include "nodeboot/process/process_runner.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace nodeboot::boot {

/**
 * @struct DiagnosticsContext
 * @brief What is known about the node at the time of failure.
 *
 * Fields stay empty when the failure happened before they were resolved.
 */
struct DiagnosticsContext {
    std::string data_dir;
    std::string error_log;
};

/**
 * @class DiagnosticsReporter
 * @brief Collects and writes the diagnostic bundle.
 */
class DiagnosticsReporter {
  public:
    /// @brief Lines of the error log included in the bundle.
    static constexpr std::size_t kErrorLogTail = 1024;

    DiagnosticsReporter(process::ProcessRunner& runner, std::ostream& out,
                        std::string journal_binary = "journalctl")
        : runner_(runner), out_(out), journal_binary_(std::move(journal_binary))
    {
    }

    /// @brief Builds the full bundle as text.
    std::string collect(const DiagnosticsContext& ctx);

    /// @brief Writes `collect(ctx)` to the output stream and flushes it.
    void report(const DiagnosticsContext& ctx);

    /// @brief uid, gid, user name and pid of the entrypoint.
    static std::string identity();

    /// @brief `ls -l`-style listing: type, permissions, size, name.
    static std::string list_directory(const std::string& dir);

    /// @brief Last `lines` lines of `path`.
    static std::string tail_file(const std::string& path, std::size_t lines);

    /// @brief `journalctl -xe --no-pager` output, or why it is unavailable.
    std::string journal();

  private:
    process::ProcessRunner& runner_;
    std::ostream& out_;
    std::string journal_binary_;
};

} // namespace nodeboot::boot
