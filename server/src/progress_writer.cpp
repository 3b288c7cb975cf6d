#include "peerdrop/server/progress_writer.hpp"

namespace peerdrop::server
{

    ProgressWriter::ProgressWriter(peerdrop::io::Writer &destination, IncomingTransfer &transfer, const Clock &clock)
        : destination_(destination), transfer_(transfer), clock_(clock) {}

    std::size_t ProgressWriter::write(std::span<const std::byte> data)
    {
        const auto written = destination_.write(data);
        if (written > 0 && transfer_.record_progress(written, clock_.now()))
        {
            transfer_.notify();
        }
        return written;
    }

} // namespace peerdrop::server
