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

#include "nodeboot/infra/error.hpp"

namespace nodeboot::infra {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::ConfigurationConflict:
        return "ConfigurationConflict";
    case ErrorCode::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorCode::InitializationFailed:
        return "InitializationFailed";
    case ErrorCode::StartupFailed:
        return "StartupFailed";
    case ErrorCode::ProvisioningFailed:
        return "ProvisioningFailed";
    case ErrorCode::ShutdownFailed:
        return "ShutdownFailed";
    case ErrorCode::HandoffFailed:
        return "HandoffFailed";
    }
    return "Unknown";
}

} // namespace nodeboot::infra
