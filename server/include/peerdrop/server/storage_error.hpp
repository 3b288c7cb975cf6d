#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "peerdrop/error_codes.hpp"

namespace peerdrop::server
{

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(peerdrop::ErrorCode code, std::string message);

        peerdrop::ErrorCode code() const noexcept { return code_; }

    private:
        peerdrop::ErrorCode code_;
    };

    // Replaces a local path with "redacted.<hash>" keeping only the extension.
    std::string redact_path(const std::filesystem::path &path);

    // "<action> <redacted path>: <os error>", safe to log and to return to peers.
    std::string redacted_message(std::string_view action, const std::filesystem::path &path,
                                 const std::error_code &ec);

} // namespace peerdrop::server
