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

#include "nodeboot/boot/handoff.hpp"

#include "nodeboot/infra/logger.hpp"
#include "nodeboot/infra/string.hpp"

namespace nodeboot::boot {

void HandoffRunner::hand_off(const std::vector<std::string>& argv)
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Handoff: Starting '" + infra::String::join_command(argv) + "'");
    runner_.exec(argv);
}

} // namespace nodeboot::boot
