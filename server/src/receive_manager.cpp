#include "peerdrop/server/receive_manager.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "peerdrop/server/file_names.hpp"

namespace peerdrop::server
{

    ReceiveManager::ReceiveManager(ReceiveOptions options)
        : options_(std::move(options)),
          clock_(options_.clock ? options_.clock : peerdrop::system_clock()),
          logger_(options_.logger ? options_.logger : spdlog::default_logger())
    {
    }

    void ReceiveManager::check_available() const
    {
        if (options_.root.empty() || (options_.feature_gate && !options_.feature_gate()))
        {
            throw StorageError(peerdrop::ErrorCode::Unavailable, "file receiving is unavailable");
        }
        if (options_.platform_requires_direct_mode && !options_.direct_file_mode)
        {
            throw StorageError(peerdrop::ErrorCode::NotAccessible, "storage is not accessible in this mode");
        }
    }

    std::string ReceiveManager::naming_sender(const std::string &sender) const
    {
        if (options_.direct_file_mode && options_.avoid_final_rename)
        {
            return {};
        }
        return sender;
    }

    std::string ReceiveManager::partial_suffix_for(const std::string &sender) const
    {
        if (options_.direct_file_mode && options_.avoid_final_rename)
        {
            return std::string(kPartialSuffix);
        }
        return partial_suffix(sender);
    }

    void ReceiveManager::fail(std::string_view action, const std::filesystem::path &path, const std::error_code &ec,
                              peerdrop::ErrorCode code) const
    {
        auto message = redacted_message(action, path, ec);
        logger_->warn("put {} error: {}", action, message);
        throw StorageError(code, std::move(message));
    }

    void ReceiveManager::fail(std::string_view action, peerdrop::ErrorCode code, std::string message) const
    {
        logger_->warn("put {} error: {}", action, message);
        throw StorageError(code, std::move(message));
    }

    std::vector<std::string> ReceiveManager::partial_files(const std::string &sender) const
    {
        if (options_.root.empty())
        {
            throw StorageError(peerdrop::ErrorCode::Unavailable, "file receiving is unavailable");
        }
        validate_sender(sender);
        const auto suffix = partial_suffix_for(sender);

        std::vector<std::string> names;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(options_.root, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code type_error;
            if (!it->is_regular_file(type_error))
            {
                continue;
            }
            auto name = it->path().filename().string();
            if (name.ends_with(suffix))
            {
                names.push_back(std::move(name));
            }
        }
        if (ec)
        {
            throw StorageError(peerdrop::ErrorCode::IoError, redacted_message("ReadDir", options_.root, ec));
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    PartialFileDigest ReceiveManager::hash_partial_file(const std::string &sender, const std::string &base_name) const
    {
        if (options_.root.empty())
        {
            throw StorageError(peerdrop::ErrorCode::Unavailable, "file receiving is unavailable");
        }
        validate_sender(sender);
        auto partial = join_dir(options_.root, base_name);
        partial += partial_suffix_for(sender);

        std::error_code ec;
        const auto size = std::filesystem::file_size(partial, ec);
        if (ec == std::errc::no_such_file_or_directory)
        {
            throw StorageError(peerdrop::ErrorCode::NotFound, "no partial file");
        }
        if (ec)
        {
            throw StorageError(peerdrop::ErrorCode::IoError, redacted_message("Stat", partial, ec));
        }
        try
        {
            return PartialFileDigest{.size = size, .digest = crypto::sha256_file(partial)};
        }
        catch (const std::system_error &error)
        {
            throw StorageError(peerdrop::ErrorCode::IoError, redacted_message("Hash", partial, error.code()));
        }
    }

    std::vector<TransferSnapshot> ReceiveManager::incoming_files() const
    {
        return registry_.snapshot();
    }

    bool ReceiveManager::has_files_waiting() const
    {
        if (options_.root.empty() || options_.direct_file_mode)
        {
            return false;
        }
        if (known_empty_.load())
        {
            return false;
        }
        std::error_code ec;
        for (std::filesystem::directory_iterator it(options_.root, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code type_error;
            if (it->is_regular_file(type_error) && !is_partial_name(it->path().filename().string()))
            {
                return true;
            }
        }
        if (!ec)
        {
            known_empty_.store(true);
        }
        return false;
    }

    std::vector<WaitingFile> ReceiveManager::waiting_files() const
    {
        std::vector<WaitingFile> files;
        if (options_.root.empty() || options_.direct_file_mode)
        {
            return files;
        }
        std::error_code ec;
        for (std::filesystem::directory_iterator it(options_.root, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entry_error;
            if (!it->is_regular_file(entry_error))
            {
                continue;
            }
            auto name = it->path().filename().string();
            if (is_partial_name(name))
            {
                continue;
            }
            const auto size = it->file_size(entry_error);
            if (entry_error)
            {
                continue;
            }
            files.push_back(WaitingFile{.name = std::move(name), .size = size});
        }
        if (ec)
        {
            throw StorageError(peerdrop::ErrorCode::IoError, redacted_message("ReadDir", options_.root, ec));
        }
        std::sort(files.begin(), files.end(), [](const WaitingFile &lhs, const WaitingFile &rhs)
                  { return lhs.name < rhs.name; });
        return files;
    }

} // namespace peerdrop::server
