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

#include "nodeboot/setup/sql_client.hpp"

#include "nodeboot/infra/error.hpp"
#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

namespace nodeboot::setup {

std::vector<std::string> SqlClient::command(const std::string& database) const
{
    std::vector<std::string> argv = {client_binary_, "--protocol=socket", "-uroot", "-hlocalhost",
                                     "--socket=" + socket_};
    if (!database.empty()) {
        argv.push_back(database);
    }
    return argv;
}

bool SqlClient::ping()
{
    process::Invocation inv;
    inv.argv = command();
    inv.stdin_data = kProbeQuery;
    return runner_.run(inv).ok();
}

std::string SqlClient::execute(const std::string& sql, const std::string& database,
                               const std::string& what)
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Setup: executing " + what);

    process::Invocation inv;
    inv.argv = command(database);
    inv.stdin_data = sql;
    auto result = runner_.run(inv);
    if (!result.ok()) {
        throw infra::BootError(infra::ErrorCode::ProvisioningFailed,
                               what + " failed (client exit " + std::to_string(result.exit_code) +
                                   "): " + infra::String::trim(result.err));
    }
    return result.out;
}

} // namespace nodeboot::setup
