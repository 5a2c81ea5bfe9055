/**
 * StreamVault - Hashing and random token helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace streamvault::crypto
{

    // Throws std::runtime_error if libsodium cannot be initialised.
    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

    // Hex encoding of `byte_count` bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t byte_count);

} // namespace streamvault::crypto
