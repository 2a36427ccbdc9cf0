/**
 * Ferry - Hashing and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace ferry::crypto
{

    // Name reported by hash_* for checksum negotiation with session backends.
    inline constexpr std::string_view kChecksumAlgorithm = "blake2b";

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Lower-case hex rendering of `byte_count` random bytes.
    std::string random_hex(std::size_t byte_count);

} // namespace ferry::crypto
