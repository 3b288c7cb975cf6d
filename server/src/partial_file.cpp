#include "peerdrop/server/partial_file.hpp"

#include <cerrno>
#include <system_error>

namespace peerdrop::server
{

    namespace
    {
        [[noreturn]] void throw_last_error(const char *operation)
        {
            const int error = errno != 0 ? errno : EIO;
            throw std::system_error(error, std::generic_category(), operation);
        }
    } // namespace

    PartialFile::~PartialFile()
    {
        close_quietly();
    }

    void PartialFile::open(const std::filesystem::path &path)
    {
        path_ = path;
        errno = 0;
        {
            std::ofstream create(path, std::ios::binary | std::ios::app);
            if (!create.is_open())
            {
                throw_last_error("create");
            }
        }
        errno = 0;
        file_.open(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!file_.is_open())
        {
            throw_last_error("open");
        }
    }

    std::int64_t PartialFile::size()
    {
        errno = 0;
        file_.seekg(0, std::ios::end);
        const auto end = file_.tellg();
        if (!file_ || end < 0)
        {
            file_.clear();
            throw_last_error("seek");
        }
        return static_cast<std::int64_t>(end);
    }

    void PartialFile::truncate(std::int64_t offset)
    {
        file_.flush();
        std::error_code ec;
        std::filesystem::resize_file(path_, static_cast<std::uintmax_t>(offset), ec);
        if (ec)
        {
            throw std::system_error(ec, "truncate");
        }
        errno = 0;
        file_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file_)
        {
            file_.clear();
            throw_last_error("seek");
        }
    }

    std::size_t PartialFile::write(std::span<const std::byte> data)
    {
        errno = 0;
        file_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file_)
        {
            throw_last_error("write");
        }
        return data.size();
    }

    void PartialFile::close()
    {
        if (!file_.is_open())
        {
            return;
        }
        errno = 0;
        file_.flush();
        const bool flushed = static_cast<bool>(file_);
        file_.close();
        if (!flushed || file_.fail())
        {
            throw_last_error("close");
        }
    }

    void PartialFile::close_quietly() noexcept
    {
        if (file_.is_open())
        {
            file_.close();
        }
    }

} // namespace peerdrop::server
