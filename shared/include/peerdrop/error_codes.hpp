/**
 * PeerDrop - Shared error codes used by the receiver, the daemon and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace peerdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        Unavailable = 3,
        NotAccessible = 4,
        InvalidName = 5,
        AlreadyInProgress = 6,
        InvalidOffset = 7,
        IoError = 8,
        LengthMismatch = 9,
        TooManyCollisions = 10,
        NotFound = 11,
        Unsupported = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace peerdrop
