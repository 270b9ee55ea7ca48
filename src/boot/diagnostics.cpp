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
 * @file diagnostics.cpp
 * @brief Implementation of the diagnostic bundle collectors.
 */

#include "nodeboot/boot/diagnostics.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <grp.h>
#include <iomanip>
#include <ostream>
#include <pwd.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace nodeboot::boot {

namespace {

std::string user_name(uid_t uid)
{
    if (const struct passwd* pw = ::getpwuid(uid)) {
        return pw->pw_name;
    }
    return "?";
}

std::string group_name(gid_t gid)
{
    if (const struct group* gr = ::getgrgid(gid)) {
        return gr->gr_name;
    }
    return "?";
}

char type_char(fs::file_type t)
{
    switch (t) {
    case fs::file_type::directory:
        return 'd';
    case fs::file_type::symlink:
        return 'l';
    case fs::file_type::regular:
        return '-';
    case fs::file_type::fifo:
        return 'p';
    case fs::file_type::socket:
        return 's';
    case fs::file_type::block:
        return 'b';
    case fs::file_type::character:
        return 'c';
    default:
        return '?';
    }
}

std::string permission_string(fs::perms p)
{
    const std::pair<fs::perms, char> bits[] = {
        {fs::perms::owner_read, 'r'},  {fs::perms::owner_write, 'w'},  {fs::perms::owner_exec, 'x'},
        {fs::perms::group_read, 'r'},  {fs::perms::group_write, 'w'},  {fs::perms::group_exec, 'x'},
        {fs::perms::others_read, 'r'}, {fs::perms::others_write, 'w'}, {fs::perms::others_exec, 'x'},
    };
    std::string s;
    for (const auto& [bit, c] : bits) {
        s += (p & bit) != fs::perms::none ? c : '-';
    }
    return s;
}

} // namespace

std::string DiagnosticsReporter::identity()
{
    std::ostringstream ss;
    uid_t uid = ::getuid();
    gid_t gid = ::getgid();
    ss << "uid=" << uid << "(" << user_name(uid) << ") gid=" << gid << "(" << group_name(gid)
       << ")";

    int n = ::getgroups(0, nullptr);
    if (n > 0) {
        std::vector<gid_t> groups(static_cast<std::size_t>(n));
        n = ::getgroups(n, groups.data());
        if (n > 0) {
            ss << " groups=";
            for (int i = 0; i < n; ++i) {
                ss << (i ? "," : "") << groups[i] << "(" << group_name(groups[i]) << ")";
            }
        }
    }
    ss << " pid=" << ::getpid();
    return ss.str();
}

std::string DiagnosticsReporter::list_directory(const std::string& dir)
{
    if (dir.empty()) {
        return "(data directory not resolved yet)\n";
    }

    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return "ls: cannot access '" + dir + "': " + ec.message() + "\n";
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    std::ostringstream ss;
    ss << "total " << entries.size() << "\n";
    for (const auto& e : entries) {
        std::error_code st_ec;
        auto status = e.symlink_status(st_ec);
        std::uintmax_t size = 0;
        if (status.type() == fs::file_type::regular) {
            size = e.file_size(st_ec);
        }
        ss << type_char(status.type()) << permission_string(status.permissions()) << " "
           << std::setw(10) << size << " " << e.path().filename().string() << "\n";
    }
    return ss.str();
}

std::string DiagnosticsReporter::tail_file(const std::string& path, std::size_t lines)
{
    if (path.empty()) {
        return "(error log not resolved yet)\n";
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return "tail: cannot open '" + path + "' for reading\n";
    }

    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        window.push_back(std::move(line));
        if (window.size() > lines) {
            window.pop_front();
        }
    }

    std::string out;
    for (const auto& l : window) {
        out += l;
        out += '\n';
    }
    return out;
}

std::string DiagnosticsReporter::journal()
{
    process::Invocation inv;
    inv.argv = {journal_binary_, "-xe", "--no-pager"};
    try {
        auto result = runner_.run(inv);
        std::string text = result.out;
        if (!result.ok()) {
            text += result.err;
            text += "(" + journal_binary_ + " exited with " + std::to_string(result.exit_code) +
                    ")\n";
        }
        return text;
    } catch (const std::exception& e) {
        return "(" + journal_binary_ + " unavailable: " + e.what() + ")\n";
    }
}

std::string DiagnosticsReporter::collect(const DiagnosticsContext& ctx)
{
    std::ostringstream ss;
    ss << "Failure detected. Some diagnostic info below:\n";
    ss << "id:\n" << identity() << "\n\n";
    ss << "ls -l " << ctx.data_dir << ":\n" << list_directory(ctx.data_dir) << "\n";
    ss << "tail -n" << kErrorLogTail << " " << ctx.error_log << ":\n"
       << tail_file(ctx.error_log, kErrorLogTail) << "\n";
    ss << journal_binary_ << " -xe --no-pager:\n" << journal();
    return ss.str();
}

void DiagnosticsReporter::report(const DiagnosticsContext& ctx)
{
    out_ << collect(ctx);
    out_.flush();
}

} // namespace nodeboot::boot
