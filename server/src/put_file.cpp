#include "peerdrop/server/receive_manager.hpp"

#include <optional>

#include <spdlog/fmt/fmt.h>

#include "peerdrop/server/file_names.hpp"
#include "peerdrop/server/partial_file.hpp"
#include "peerdrop/server/progress_writer.hpp"

namespace peerdrop::server
{

    std::int64_t ReceiveManager::put_file(const std::string &sender, const std::string &base_name,
                                          peerdrop::io::Reader &reader, std::int64_t offset, std::int64_t length)
    {
        check_available();
        validate_sender(sender);
        const auto destination = join_dir(options_.root, base_name);

        // Callers relying on avoid_final_rename know partial files by their exact name,
        // so the sender is neither part of that name nor of the transfer key.
        const bool avoid_partial_rename = options_.direct_file_mode && options_.avoid_final_rename;
        auto partial = destination;
        partial += partial_suffix_for(sender);

        const TransferKey key{naming_sender(sender), base_name};
        auto loaded = registry_.load_or_init(key, [&]
                                             {
            std::optional<std::filesystem::path> exposed_partial;
            if (options_.direct_file_mode)
            {
                exposed_partial = partial;
            }
            return std::make_shared<IncomingTransfer>(key, clock_->now(), length, options_.notify,
                                                      std::move(exposed_partial)); });
        if (loaded.already_existed)
        {
            throw StorageError(peerdrop::ErrorCode::AlreadyInProgress, "transfer already in progress");
        }
        TransferSlot slot(registry_, key);
        auto &transfer = *loaded.transfer;

        std::int64_t file_length = 0;
        try
        {
            file_length = receive(transfer, partial, reader, offset, length);
        }
        catch (const StorageError &error)
        {
            // Nobody resumes these; other modes keep the partial file for a later resume.
            // A rejected offset never touched the file, so it stays either way.
            if (avoid_partial_rename && error.code() != peerdrop::ErrorCode::InvalidOffset)
            {
                std::error_code ec;
                std::filesystem::remove(partial, ec);
            }
            throw;
        }

        if (!avoid_partial_rename)
        {
            publish(partial, destination, file_length);
        }

        transfer.mark_done();
        known_empty_.store(false);
        transfer.notify();
        logger_->debug("put {} complete: {} bytes", redact_path(destination), file_length);
        return file_length;
    }

    std::int64_t ReceiveManager::receive(IncomingTransfer &transfer, const std::filesystem::path &partial,
                                         peerdrop::io::Reader &reader, std::int64_t offset, std::int64_t length)
    {
        PartialFile file;
        try
        {
            file.open(partial);
        }
        catch (const std::system_error &error)
        {
            fail("Create", partial, error.code());
        }

        std::int64_t current_length = 0;
        try
        {
            current_length = file.size();
        }
        catch (const std::system_error &error)
        {
            fail("Seek", partial, error.code());
        }
        if (offset < 0 || offset > current_length)
        {
            fail("Seek", peerdrop::ErrorCode::InvalidOffset,
                 fmt::format("resume offset {} outside partial file of {} bytes", offset, current_length));
        }

        try
        {
            file.truncate(offset);
        }
        catch (const std::system_error &error)
        {
            fail("Truncate", partial, error.code());
        }

        ProgressWriter writer(file, transfer, *clock_);
        std::int64_t copied = 0;
        try
        {
            copied = peerdrop::io::copy(writer, reader);
        }
        catch (const std::system_error &error)
        {
            fail("Copy", partial, error.code());
        }
        catch (const std::exception &error)
        {
            fail("Copy", peerdrop::ErrorCode::IoError, error.what());
        }
        if (length >= 0 && copied != length)
        {
            fail("Copy", peerdrop::ErrorCode::LengthMismatch,
                 fmt::format("copied an unexpected number of bytes: {} of {}", copied, length));
        }

        try
        {
            file.close();
        }
        catch (const std::system_error &error)
        {
            fail("Close", partial, error.code());
        }
        return offset + copied;
    }

    void ReceiveManager::publish(const std::filesystem::path &partial, std::filesystem::path destination,
                                 std::int64_t file_length)
    {
        std::optional<crypto::Digest> partial_digest;

        for (int attempt = 0; attempt < kMaxRenameAttempts; ++attempt)
        {
            std::optional<std::uintmax_t> existing_size;
            {
                std::lock_guard lock(rename_mutex_);
                std::error_code ec;
                const auto status = std::filesystem::status(destination, ec);
                if (status.type() == std::filesystem::file_type::not_found)
                {
                    ec.clear();
                    std::filesystem::rename(partial, destination, ec);
                    if (ec)
                    {
                        fail("Rename", destination, ec);
                    }
                    return;
                }
                if (ec)
                {
                    fail("Rename", destination, ec);
                }
                if (std::filesystem::is_regular_file(status))
                {
                    existing_size = std::filesystem::file_size(destination, ec);
                    if (ec)
                    {
                        fail("Rename", destination, ec);
                    }
                }
            }

            if (existing_size && static_cast<std::int64_t>(*existing_size) == file_length)
            {
                crypto::Digest destination_digest{};
                std::error_code hash_error;
                std::string hash_failure;
                try
                {
                    if (!partial_digest)
                    {
                        partial_digest = crypto::sha256_file(partial);
                    }
                    destination_digest = crypto::sha256_file(destination);
                }
                catch (const std::system_error &error)
                {
                    hash_error = error.code();
                }
                catch (const std::runtime_error &error)
                {
                    hash_failure = error.what();
                }
                if (hash_error)
                {
                    fail("Rename", destination, hash_error);
                }
                if (!hash_failure.empty())
                {
                    fail("Rename", peerdrop::ErrorCode::IoError, hash_failure);
                }

                if (partial_digest && destination_digest == *partial_digest)
                {
                    std::error_code ec;
                    std::filesystem::remove(partial, ec);
                    if (ec)
                    {
                        fail("Remove", partial, ec);
                    }
                    return;
                }
            }

            destination = next_filename(destination);
        }

        fail("Rename", peerdrop::ErrorCode::TooManyCollisions, "too many naming collisions");
    }

} // namespace peerdrop::server
