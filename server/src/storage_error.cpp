#include "peerdrop/server/storage_error.hpp"

#include <span>

#include <spdlog/fmt/fmt.h>

#include "peerdrop/crypto.hpp"

namespace peerdrop::server
{

    namespace
    {
        constexpr std::size_t kRedactedHashBytes = 4;
    } // namespace

    StorageError::StorageError(peerdrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string redact_path(const std::filesystem::path &path)
    {
        const auto text = path.generic_string();
        const auto digest = crypto::sha256_bytes(std::as_bytes(std::span<const char>(text.data(), text.size())));
        auto redacted = "redacted." + crypto::to_hex(std::span<const std::uint8_t>(digest).first<kRedactedHashBytes>());
        const auto extension = path.extension().string();
        if (!extension.empty() && extension != ".")
        {
            redacted += extension;
        }
        return redacted;
    }

    std::string redacted_message(std::string_view action, const std::filesystem::path &path,
                                 const std::error_code &ec)
    {
        if (path.empty())
        {
            return fmt::format("{}: {}", action, ec.message());
        }
        return fmt::format("{} {}: {}", action, redact_path(path), ec.message());
    }

} // namespace peerdrop::server
