#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/logger.h>

#include "peerdrop/clock.hpp"
#include "peerdrop/crypto.hpp"
#include "peerdrop/error_codes.hpp"
#include "peerdrop/io.hpp"
#include "peerdrop/server/receive_options.hpp"
#include "peerdrop/server/storage_error.hpp"
#include "peerdrop/server/transfer_registry.hpp"

namespace peerdrop::server
{

    struct PartialFileDigest
    {
        std::uint64_t size{};
        crypto::Digest digest{};
    };

    struct WaitingFile
    {
        std::string name;
        std::uint64_t size{};
    };

    class ReceiveManager
    {
    public:
        // Retry bound for publishing under a fresh name when the target holds different content.
        static constexpr int kMaxRenameAttempts = 10;

        explicit ReceiveManager(ReceiveOptions options);

        /**
         * Receives a file from sender into the storage root under base_name.
         *
         * offset resumes an earlier partial file (0 starts fresh); length is the
         * number of bytes expected from reader, negative when unknown. Returns the
         * length of the whole file. The partial file is kept on failure so the
         * sender can resume, except when partial files are never renamed.
         * Throws StorageError.
         */
        std::int64_t put_file(const std::string &sender, const std::string &base_name, peerdrop::io::Reader &reader,
                              std::int64_t offset, std::int64_t length);

        std::vector<std::string> partial_files(const std::string &sender) const;

        PartialFileDigest hash_partial_file(const std::string &sender, const std::string &base_name) const;

        std::vector<TransferSnapshot> incoming_files() const;

        bool has_files_waiting() const;

        std::vector<WaitingFile> waiting_files() const;

        const std::filesystem::path &root() const noexcept { return options_.root; }

    private:
        void check_available() const;
        std::string naming_sender(const std::string &sender) const;
        std::string partial_suffix_for(const std::string &sender) const;
        [[noreturn]] void fail(std::string_view action, const std::filesystem::path &path,
                               const std::error_code &ec, peerdrop::ErrorCode code = peerdrop::ErrorCode::IoError) const;
        [[noreturn]] void fail(std::string_view action, peerdrop::ErrorCode code, std::string message) const;

        std::int64_t receive(IncomingTransfer &transfer, const std::filesystem::path &partial,
                             peerdrop::io::Reader &reader, std::int64_t offset, std::int64_t length);
        void publish(const std::filesystem::path &partial, std::filesystem::path destination,
                     std::int64_t file_length);

        ReceiveOptions options_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<spdlog::logger> logger_;

        TransferRegistry registry_;
        // Serializes "does the destination exist, and if not claim it".
        std::mutex rename_mutex_;
        mutable std::atomic<bool> known_empty_{false};
    };

} // namespace peerdrop::server
