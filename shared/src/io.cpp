#include "peerdrop/io.hpp"

#include <stdexcept>
#include <vector>

namespace peerdrop::io
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 64 * 1024;
    } // namespace

    StreamReader::StreamReader(std::istream &input) : input_(input) {}

    std::size_t StreamReader::read(std::span<std::byte> buffer)
    {
        if (buffer.empty() || input_.eof())
        {
            return 0;
        }
        input_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (input_.bad())
        {
            throw std::runtime_error("stream read failed");
        }
        return static_cast<std::size_t>(input_.gcount());
    }

    std::int64_t copy(Writer &writer, Reader &reader)
    {
        std::vector<std::byte> buffer(kCopyBufferSize);
        std::int64_t total = 0;
        while (true)
        {
            const auto read_count = reader.read(buffer);
            if (read_count == 0)
            {
                break;
            }
            std::span<const std::byte> pending(buffer.data(), read_count);
            while (!pending.empty())
            {
                const auto written = writer.write(pending);
                if (written == 0)
                {
                    throw std::runtime_error("short write");
                }
                total += static_cast<std::int64_t>(written);
                pending = pending.subspan(written);
            }
        }
        return total;
    }

} // namespace peerdrop::io
