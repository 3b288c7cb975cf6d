#pragma once

#include <filesystem>
#include <functional>
#include <memory>

#include <spdlog/logger.h>

#include "peerdrop/clock.hpp"

namespace peerdrop::server
{

    struct ReceiveOptions
    {
        std::filesystem::path root;
        // Received files land directly in a user-visible folder rather than an inbox.
        bool direct_file_mode{};
        // With direct_file_mode, finished partial files keep their name; external tools rename them.
        bool avoid_final_rename{};
        // The platform only permits direct placement (e.g. Unraid).
        bool platform_requires_direct_mode{};
        std::function<bool()> feature_gate;
        std::function<void()> notify;
        std::shared_ptr<const Clock> clock;
        std::shared_ptr<spdlog::logger> logger;
    };

    // False when PEERDROP_DISABLE_RECEIVE is set to a true value.
    bool receive_enabled_from_env();

    bool detect_platform_requires_direct_mode();

} // namespace peerdrop::server
