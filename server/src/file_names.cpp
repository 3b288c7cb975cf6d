#include "peerdrop/server/file_names.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>

#include "peerdrop/server/storage_error.hpp"

namespace peerdrop::server
{

    namespace
    {

        bool is_control(char ch)
        {
            const auto value = static_cast<unsigned char>(ch);
            return value < 0x20 || value == 0x7F;
        }

        bool is_space(char ch)
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        bool is_separator(char ch)
        {
            return ch == '/' || ch == '\\' || ch == ':';
        }

        bool is_alnum(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0;
        }

        // No dot: the sender is always the last dot-separated group before ".partial".
        bool is_sender_char(char ch)
        {
            return is_alnum(ch) || ch == '-' || ch == '_' || ch == '@' || ch == '+' || ch == '=';
        }

        [[noreturn]] void reject(std::string_view what)
        {
            throw StorageError(peerdrop::ErrorCode::InvalidName, std::string(what));
        }

        std::filesystem::path normalized_root(const std::filesystem::path &root)
        {
            auto normal = root.lexically_normal();
            if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path())
            {
                normal = normal.parent_path();
            }
            return normal;
        }

        // Length of the trailing run of ".alnum" groups, ignoring one leading dot.
        std::size_t extension_start(std::string_view name)
        {
            const std::size_t floor = (!name.empty() && name.front() == '.') ? 1 : 0;
            std::size_t start = name.size();
            while (start > floor)
            {
                const auto dot = name.rfind('.', start - 1);
                if (dot == std::string_view::npos || dot < floor || dot + 1 == start)
                {
                    break;
                }
                bool alnum = true;
                for (auto i = dot + 1; i < start; ++i)
                {
                    alnum = alnum && is_alnum(name[i]);
                }
                if (!alnum)
                {
                    break;
                }
                start = dot;
            }
            return start;
        }

    } // namespace

    void validate_base_name(std::string_view name)
    {
        if (name.empty() || name == "." || name == "..")
        {
            reject("invalid filename");
        }
        for (const char ch : name)
        {
            if (is_separator(ch) || is_control(ch))
            {
                reject("filename contains invalid characters");
            }
        }
        if (is_space(name.front()) || is_space(name.back()))
        {
            reject("filename has surrounding whitespace");
        }
        if (is_partial_name(name))
        {
            reject("filename uses a reserved suffix");
        }
    }

    void validate_sender(std::string_view sender)
    {
        if (sender.empty())
        {
            return;
        }
        for (const char ch : sender)
        {
            if (!is_sender_char(ch))
            {
                reject("invalid sender identity");
            }
        }
    }

    std::filesystem::path join_dir(const std::filesystem::path &root, std::string_view base_name)
    {
        validate_base_name(base_name);
        const auto base = normalized_root(root);
        const auto candidate = (base / std::filesystem::path(std::string(base_name))).lexically_normal();
        const auto relative = candidate.lexically_relative(base);
        if (relative.empty() || std::distance(relative.begin(), relative.end()) != 1 ||
            relative.generic_string() == ".." || relative.generic_string() == ".")
        {
            reject("filename escapes the storage directory");
        }
        return candidate;
    }

    std::string partial_suffix(std::string_view sender)
    {
        std::string suffix = ".";
        suffix += sender.empty() ? kAnonymousSender : sender;
        suffix += kPartialSuffix;
        return suffix;
    }

    bool is_partial_name(std::string_view name) noexcept
    {
        return name.ends_with(kPartialSuffix);
    }

    std::string next_filename(std::string_view name)
    {
        const auto split = extension_start(name);
        auto base = name.substr(0, split);
        const auto extension = name.substr(split);

        std::uint64_t counter = 1;
        if (base.ends_with(')'))
        {
            const auto open = base.rfind(" (");
            if (open != std::string_view::npos && open + 2 < base.size() - 1)
            {
                const auto digits = base.substr(open + 2, base.size() - open - 3);
                std::uint64_t value = 0;
                const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
                if (ec == std::errc{} && end == digits.data() + digits.size() && value < UINT64_MAX)
                {
                    counter = value + 1;
                    base = base.substr(0, open);
                }
            }
        }

        std::string next(base);
        next += " (";
        next += std::to_string(counter);
        next += ')';
        next += extension;
        return next;
    }

    std::filesystem::path next_filename(const std::filesystem::path &path)
    {
        return path.parent_path() / next_filename(std::string_view(path.filename().string()));
    }

} // namespace peerdrop::server
