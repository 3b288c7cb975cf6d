#include "peerdrop/error_codes.hpp"

#include <array>

namespace peerdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::Unavailable, "unavailable"},
            {ErrorCode::NotAccessible, "not_accessible"},
            {ErrorCode::InvalidName, "invalid_name"},
            {ErrorCode::AlreadyInProgress, "already_in_progress"},
            {ErrorCode::InvalidOffset, "invalid_offset"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::LengthMismatch, "length_mismatch"},
            {ErrorCode::TooManyCollisions, "too_many_collisions"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace peerdrop
