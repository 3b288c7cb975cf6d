#include "peerdrop/server/receive_options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <system_error>

namespace peerdrop::server
{

    namespace
    {
        constexpr auto kDisableReceiveEnv = "PEERDROP_DISABLE_RECEIVE";
        constexpr auto kUnraidVersionFile = "/etc/unraid-version";

        bool parse_bool(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value == "1" || value == "true" || value == "yes" || value == "on";
        }
    } // namespace

    bool receive_enabled_from_env()
    {
        const char *value = std::getenv(kDisableReceiveEnv);
        if (value == nullptr)
        {
            return true;
        }
        return !parse_bool(value);
    }

    bool detect_platform_requires_direct_mode()
    {
        std::error_code ec;
        return std::filesystem::exists(kUnraidVersionFile, ec);
    }

} // namespace peerdrop::server
