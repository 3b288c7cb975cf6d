#include "peerdrop/server/transfer_registry.hpp"

namespace peerdrop::server
{

    namespace
    {
        constexpr auto kNotifyInterval = std::chrono::seconds(1);
    } // namespace

    IncomingTransfer::IncomingTransfer(TransferKey key, Clock::time_point started, std::int64_t declared_length,
                                       std::function<void()> notify,
                                       std::optional<std::filesystem::path> partial_path)
        : key_(std::move(key)),
          started_(started),
          declared_length_(declared_length),
          notify_(std::move(notify)),
          partial_path_(std::move(partial_path))
    {
    }

    bool IncomingTransfer::record_progress(std::size_t bytes, Clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        copied_ += static_cast<std::int64_t>(bytes);
        if (!last_notify_ || now - *last_notify_ > kNotifyInterval)
        {
            last_notify_ = now;
            return true;
        }
        return false;
    }

    void IncomingTransfer::mark_done()
    {
        std::lock_guard lock(mutex_);
        done_ = true;
    }

    void IncomingTransfer::notify() const
    {
        if (notify_)
        {
            notify_();
        }
    }

    TransferSnapshot IncomingTransfer::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return TransferSnapshot{
            .key = key_,
            .started = started_,
            .declared_length = declared_length_,
            .copied = copied_,
            .done = done_,
            .partial_path = partial_path_,
        };
    }

    TransferRegistry::LoadResult TransferRegistry::load_or_init(const TransferKey &key, const Factory &factory)
    {
        std::lock_guard lock(mutex_);
        if (auto it = transfers_.find(key); it != transfers_.end())
        {
            return {.transfer = it->second, .already_existed = true};
        }
        auto transfer = factory();
        transfers_.emplace(key, transfer);
        return {.transfer = std::move(transfer), .already_existed = false};
    }

    void TransferRegistry::remove(const TransferKey &key)
    {
        std::lock_guard lock(mutex_);
        transfers_.erase(key);
    }

    std::vector<TransferSnapshot> TransferRegistry::snapshot() const
    {
        std::vector<std::shared_ptr<IncomingTransfer>> transfers;
        {
            std::lock_guard lock(mutex_);
            transfers.reserve(transfers_.size());
            for (const auto &[key, transfer] : transfers_)
            {
                transfers.push_back(transfer);
            }
        }
        std::vector<TransferSnapshot> result;
        result.reserve(transfers.size());
        for (const auto &transfer : transfers)
        {
            result.push_back(transfer->snapshot());
        }
        return result;
    }

    std::size_t TransferRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return transfers_.size();
    }

    TransferSlot::TransferSlot(TransferRegistry &registry, TransferKey key)
        : registry_(registry), key_(std::move(key)) {}

    TransferSlot::~TransferSlot()
    {
        registry_.remove(key_);
    }

} // namespace peerdrop::server
