#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peerdrop::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::size_t transfer_threads{0};
        bool direct_file_mode{false};
        bool avoid_final_rename{false};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace peerdrop::server
