/**
 * PeerDrop - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace peerdrop::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Control frames are small; file bodies travel outside of frames.
    constexpr std::uint32_t kMaxFramePayload = 1u << 20;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws std::length_error when the announced payload exceeds kMaxFramePayload.
    std::uint32_t decode_frame_size(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace peerdrop::protocol
