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
 * @file random.hpp
 * @brief Random identifiers, scratch paths and generated passwords.
 *
 * @details
 * Two very different qualities of randomness live here. Scratch names only
 * need to be unique, so they come from a thread-local Mersenne Twister.
 * Generated root passwords are credentials, so they come from OpenSSL's
 * CSPRNG.
 */

#pragma once

#include <cstddef>
#include <string>

namespace nodeboot::infra {

/**
 * @class Random
 * @brief Static helpers producing random strings.
 */
class Random {
  public:
    /**
     * @brief Generates a Version 4 UUID string (`xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`).
     */
    static std::string uuid();

    /**
     * @brief Returns a path under the temp directory that does not exist yet.
     *
     * Nothing is created on disk. Used for throwaway options such as the
     * binary log index handed to the server's `--help` mode, so that
     * introspection never touches real state.
     *
     * @param prefix File name prefix, e.g. `"nodeboot-binlog"`.
     */
    static std::string scratch_path(const std::string& prefix);

    /**
     * @brief Generates a password from `bytes` bytes of CSPRNG output, base64 encoded.
     *
     * 24 bytes encode to 32 characters with no padding.
     *
     * @throws std::runtime_error when OpenSSL cannot supply entropy.
     */
    static std::string password(std::size_t bytes = 24);
};

} // namespace nodeboot::infra
