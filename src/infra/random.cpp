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
 * @file random.cpp
 * @brief Implementation of the random string helpers.
 */

#include "nodeboot/infra/random.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace nodeboot::infra {

/**
 * @brief Generates an RFC 4122 Version 4 UUID.
 *
 * A thread-local `mt19937_64` seeded from `std::random_device` supplies 128
 * bits; the version nibble is forced to `4` and the variant bits to `10`.
 */
std::string Random::uuid()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t p1 = dis(gen);
    uint64_t p2 = dis(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << static_cast<uint32_t>(p1 >> 32) << "-"
       << std::setw(4) << static_cast<uint16_t>((p1 >> 16) & 0xFFFF) << "-" << std::setw(4)
       << ((p1 & 0x0FFF) | 0x4000) << "-" << std::setw(4) << (((p2 >> 48) & 0x3FFF) | 0x8000)
       << "-" << std::setw(12) << (p2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

std::string Random::scratch_path(const std::string& prefix)
{
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return (dir / (prefix + "-" + uuid())).string();
}

std::string Random::password(std::size_t bytes)
{
    std::vector<unsigned char> raw(bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("Unable to acquire random bytes from OpenSSL: ") +
                                 reason);
    }

    // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL.
    std::vector<unsigned char> encoded(4 * ((bytes + 2) / 3) + 1);
    int len = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));
    OPENSSL_cleanse(raw.data(), raw.size());

    std::string out(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(len));
    OPENSSL_cleanse(encoded.data(), encoded.size());
    return out;
}

} // namespace nodeboot::infra
