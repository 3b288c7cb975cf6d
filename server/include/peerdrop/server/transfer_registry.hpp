#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "peerdrop/clock.hpp"

namespace peerdrop::server
{

    // At most one transfer per key may be in flight.
    struct TransferKey
    {
        std::string sender;
        std::string name;

        auto operator<=>(const TransferKey &) const = default;
    };

    struct TransferSnapshot
    {
        TransferKey key;
        Clock::time_point started{};
        std::int64_t declared_length{-1};
        std::int64_t copied{};
        bool done{};
        std::optional<std::filesystem::path> partial_path;
    };

    class IncomingTransfer
    {
    public:
        IncomingTransfer(TransferKey key, Clock::time_point started, std::int64_t declared_length,
                         std::function<void()> notify, std::optional<std::filesystem::path> partial_path);

        const TransferKey &key() const noexcept { return key_; }
        Clock::time_point started() const noexcept { return started_; }
        std::int64_t declared_length() const noexcept { return declared_length_; }

        // Adds to the copied counter. Returns true when observers should be notified:
        // on the first call and then only once more than a second has passed since the last notification.
        bool record_progress(std::size_t bytes, Clock::time_point now);

        void mark_done();

        // Must not be called while holding the transfer's mutex.
        void notify() const;

        TransferSnapshot snapshot() const;

    private:
        const TransferKey key_;
        const Clock::time_point started_;
        const std::int64_t declared_length_;
        const std::function<void()> notify_;
        const std::optional<std::filesystem::path> partial_path_;

        mutable std::mutex mutex_;
        std::int64_t copied_{};
        bool done_{};
        std::optional<Clock::time_point> last_notify_;
    };

    class TransferRegistry
    {
    public:
        using Factory = std::function<std::shared_ptr<IncomingTransfer>()>;

        struct LoadResult
        {
            std::shared_ptr<IncomingTransfer> transfer;
            bool already_existed{};
        };

        // Returns the existing entry for key, or inserts the one made by factory.
        LoadResult load_or_init(const TransferKey &key, const Factory &factory);

        void remove(const TransferKey &key);

        std::vector<TransferSnapshot> snapshot() const;

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<TransferKey, std::shared_ptr<IncomingTransfer>> transfers_;
    };

    // Removes its key from the registry when the owning put leaves scope.
    class TransferSlot
    {
    public:
        TransferSlot(TransferRegistry &registry, TransferKey key);
        ~TransferSlot();

        TransferSlot(const TransferSlot &) = delete;
        TransferSlot &operator=(const TransferSlot &) = delete;

    private:
        TransferRegistry &registry_;
        TransferKey key_;
    };

} // namespace peerdrop::server
