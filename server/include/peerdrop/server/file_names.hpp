#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace peerdrop::server
{

    inline constexpr std::string_view kPartialSuffix = ".partial";
    // Names the empty sender in sender-scoped partial names; no valid sender spells it.
    inline constexpr std::string_view kAnonymousSender = "~";

    // Throws StorageError(InvalidName) for anything that is not a plain base filename.
    void validate_base_name(std::string_view name);

    // An empty sender is valid; otherwise only letters, digits and "-_@+=" are allowed,
    // so a sender never contains a dot and partial names parse back unambiguously.
    void validate_sender(std::string_view sender);

    std::filesystem::path join_dir(const std::filesystem::path &root, std::string_view base_name);

    // ".<sender>.partial", with kAnonymousSender standing in for an empty sender.
    std::string partial_suffix(std::string_view sender);

    bool is_partial_name(std::string_view name) noexcept;

    /**
     * Next candidate for an occupied name:
     * "photo.jpg" -> "photo (1).jpg" -> "photo (2).jpg", "a.tar.gz" -> "a (1).tar.gz".
     * Never returns its input and always maps the same input to the same output.
     */
    std::string next_filename(std::string_view name);

    std::filesystem::path next_filename(const std::filesystem::path &path);

} // namespace peerdrop::server
