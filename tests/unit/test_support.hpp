#pragma once

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include "peerdrop/clock.hpp"
#include "peerdrop/io.hpp"
#include "peerdrop/server/receive_options.hpp"

namespace peerdrop::test
{

    class ManualClock final : public peerdrop::Clock
    {
    public:
        explicit ManualClock(time_point start = time_point{std::chrono::seconds{1700000000}}) : now_(start) {}

        time_point now() const override
        {
            std::lock_guard lock(mutex_);
            return now_;
        }

        void advance(std::chrono::milliseconds step)
        {
            std::lock_guard lock(mutex_);
            now_ += step;
        }

    private:
        mutable std::mutex mutex_;
        time_point now_;
    };

    // Hands out the data in reads of at most chunk_size bytes.
    class MemoryReader : public peerdrop::io::Reader
    {
    public:
        explicit MemoryReader(std::string data, std::size_t chunk_size = 0)
            : data_(std::move(data)), chunk_size_(chunk_size) {}

        std::size_t read(std::span<std::byte> buffer) override
        {
            auto count = std::min(buffer.size(), data_.size() - position_);
            if (chunk_size_ > 0)
            {
                count = std::min(count, chunk_size_);
            }
            std::memcpy(buffer.data(), data_.data() + position_, count);
            position_ += count;
            return count;
        }

    private:
        std::string data_;
        std::size_t chunk_size_;
        std::size_t position_{0};
    };

    // Delivers data, then fails like a dropped connection.
    class FailingReader final : public peerdrop::io::Reader
    {
    public:
        explicit FailingReader(std::string data) : inner_(std::move(data)) {}

        std::size_t read(std::span<std::byte> buffer) override
        {
            const auto count = inner_.read(buffer);
            if (count == 0)
            {
                throw std::runtime_error("connection reset by peer");
            }
            return count;
        }

    private:
        MemoryReader inner_;
    };

    class TempRoot
    {
    public:
        explicit TempRoot(const std::string &name)
            : path_(std::filesystem::temp_directory_path() / ("peerdrop_" + name))
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
            std::filesystem::create_directories(path_);
        }

        ~TempRoot()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::shared_ptr<spdlog::logger> quiet_logger()
    {
        return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    inline peerdrop::server::ReceiveOptions quiet_options(const std::filesystem::path &root)
    {
        peerdrop::server::ReceiveOptions options;
        options.root = root;
        options.logger = quiet_logger();
        return options;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    inline std::vector<std::string> list_names(const std::filesystem::path &root)
    {
        std::vector<std::string> names;
        for (const auto &entry : std::filesystem::directory_iterator(root))
        {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    inline std::string pattern(std::size_t size, char seed)
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>(seed + static_cast<char>(i % 31));
        }
        return data;
    }

} // namespace peerdrop::test
