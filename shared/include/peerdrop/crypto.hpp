/**
 * PeerDrop - Content hashing built on libsodium.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace peerdrop::crypto
{

    constexpr std::size_t kDigestSize = 32;

    // SHA-256 of some content. Equal digests are treated as equal content.
    using Digest = std::array<std::uint8_t, kDigestSize>;

    void ensure_sodium_init();

    Digest sha256_bytes(std::span<const std::byte> data);

    Digest sha256_stream(std::istream &input);

    // Throws std::system_error when the file cannot be opened. The message never names the path.
    Digest sha256_file(const std::filesystem::path &path);

    std::string to_hex(std::span<const std::uint8_t> data);

} // namespace peerdrop::crypto
