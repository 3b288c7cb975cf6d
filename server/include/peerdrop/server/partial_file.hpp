#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

#include "peerdrop/io.hpp"

namespace peerdrop::server
{

    // Read-write handle on a partial file. Failures throw std::system_error
    // whose message never contains the path.
    class PartialFile final : public peerdrop::io::Writer
    {
    public:
        PartialFile() = default;
        ~PartialFile() override;

        PartialFile(const PartialFile &) = delete;
        PartialFile &operator=(const PartialFile &) = delete;

        // Creates the file when absent; existing content is kept.
        void open(const std::filesystem::path &path);

        std::int64_t size();

        // Drops everything past offset and positions the write cursor there.
        void truncate(std::int64_t offset);

        std::size_t write(std::span<const std::byte> data) override;

        void close();

        void close_quietly() noexcept;

        bool is_open() const noexcept { return file_.is_open(); }

    private:
        std::filesystem::path path_;
        std::fstream file_;
    };

} // namespace peerdrop::server
