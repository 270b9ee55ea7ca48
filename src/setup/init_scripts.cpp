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
 * @file init_scripts.cpp
 * @brief Implementation of the init directory runner.
 *
 * @details
 * Two C resources are held here and both are released through small RAII
 * guards: the `cJSON` tree parsed from an override file (`ScopedJson`) and the
 * zlib stream of a compressed SQL file (`ScopedGzFile`). The override file
 * itself is removed by `ScopedScratchFile` whether the script succeeded or not.
 */

#include "nodeboot/setup/init_scripts.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/random.hpp"
#include "nodeboot/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <zlib.h>

namespace fs = std::filesystem;

namespace nodeboot::setup {

namespace {

class ScopedJson {
  public:
    explicit ScopedJson(cJSON* root) : root_(root) {}
    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    cJSON* get() const
    {
        return root_;
    }

  private:
    cJSON* root_;
};

class ScopedGzFile {
  public:
    explicit ScopedGzFile(gzFile file) : file_(file) {}
    ~ScopedGzFile()
    {
        if (file_) {
            gzclose(file_);
        }
    }

    ScopedGzFile(const ScopedGzFile&) = delete;
    ScopedGzFile& operator=(const ScopedGzFile&) = delete;

    gzFile get() const
    {
        return file_;
    }

  private:
    gzFile file_;
};

class ScopedScratchFile {
  public:
    explicit ScopedScratchFile(std::string path) : path_(std::move(path))
    {
        std::ofstream touch(path_, std::ios::trunc);
        if (!touch) {
            throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                                   "Cannot create override file " + path_);
        }
    }
    ~ScopedScratchFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    ScopedScratchFile(const ScopedScratchFile&) = delete;
    ScopedScratchFile& operator=(const ScopedScratchFile&) = delete;

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed, "Cannot read " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

ScriptKind InitScriptRunner::kind_of(const std::string& path)
{
    if (infra::String::ends_with(path, ".sh")) {
        return ScriptKind::Shell;
    }
    if (infra::String::ends_with(path, ".sql")) {
        return ScriptKind::Sql;
    }
    if (infra::String::ends_with(path, ".sql.gz")) {
        return ScriptKind::CompressedSql;
    }
    return ScriptKind::Unknown;
}

std::vector<std::string> InitScriptRunner::list(const std::string& dir)
{
    std::vector<std::string> files;
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        return files;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                               "Cannot list " + dir + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::map<std::string, std::string> InitScriptRunner::parse_overrides(const std::string& json,
                                                                     const std::string& source)
{
    std::map<std::string, std::string> overrides;
    if (infra::String::trim(json).empty()) {
        return overrides;
    }

    ScopedJson root(cJSON_Parse(json.c_str()));
    if (!root.get() || !cJSON_IsObject(root.get())) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                               source + " wrote overrides that are not a JSON object");
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        if (!cJSON_IsString(item) || item->valuestring == nullptr) {
            infra::Logger::log(infra::LogLevel::WARN,
                               std::string("Setup: ") + source + ": override '" + item->string +
                                   "' is not a string, ignoring");
            continue;
        }
        overrides[item->string] = item->valuestring;
    }
    return overrides;
}

std::string InitScriptRunner::gunzip(const std::string& path)
{
    ScopedGzFile file(gzopen(path.c_str(), "rb"));
    if (!file.get()) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed, "Cannot open " + path);
    }

    std::string out;
    char buffer[16384];
    for (;;) {
        int n = gzread(file.get(), buffer, sizeof(buffer));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(file.get(), &errnum);
            throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                                   "Cannot decompress " + path + ": " + (msg ? msg : "unknown"));
        }
        if (n == 0) {
            break;
        }
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

std::map<std::string, std::string> InitScriptRunner::run_shell(const std::string& path,
                                                               const config::Settings& settings,
                                                               const std::string& data_dir)
{
    ScopedScratchFile overrides(infra::Random::scratch_path("nodeboot-overrides"));

    process::Invocation inv;
    inv.argv = {"/bin/sh", path};
    inv.env = settings.to_environment();
    inv.env["NODEBOOT_SOCKET"] = client_.socket();
    inv.env["NODEBOOT_DATADIR"] = data_dir;
    inv.env[kOverridesVar] = overrides.path();
    inv.capture_output = false;

    auto result = runner_.run(inv);
    if (!result.ok()) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                               path + " exited with " + std::to_string(result.exit_code));
    }

    return parse_overrides(read_file(overrides.path()), path);
}

config::Settings InitScriptRunner::run_all(const std::string& dir,
                                           const config::Settings& settings,
                                           const std::string& data_dir)
{
    config::Settings current = settings;

    for (const auto& path : list(dir)) {
        switch (kind_of(path)) {
        case ScriptKind::Shell: {
            infra::Logger::log(infra::LogLevel::INFO, "Setup: running " + path);
            auto overrides = run_shell(path, current, data_dir);
            if (!overrides.empty()) {
                current = current.with_overrides(overrides);
            }
            break;
        }
        case ScriptKind::Sql:
            infra::Logger::log(infra::LogLevel::INFO, "Setup: running " + path);
            client_.execute(read_file(path), "", path);
            break;
        case ScriptKind::CompressedSql:
            infra::Logger::log(infra::LogLevel::INFO, "Setup: running " + path);
            client_.execute(gunzip(path), "", path);
            break;
        case ScriptKind::Unknown:
            infra::Logger::log(infra::LogLevel::INFO, "Setup: ignoring " + path);
            break;
        }
    }
    return current;
}

} // namespace nodeboot::setup
