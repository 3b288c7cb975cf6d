#pragma once

#include <span>

#include "peerdrop/clock.hpp"
#include "peerdrop/io.hpp"
#include "peerdrop/server/transfer_registry.hpp"

namespace peerdrop::server
{

    // Forwards to the destination, then counts the bytes on the transfer and
    // fires its notifier at most once per second (always on the first write).
    class ProgressWriter final : public peerdrop::io::Writer
    {
    public:
        ProgressWriter(peerdrop::io::Writer &destination, IncomingTransfer &transfer, const Clock &clock);

        std::size_t write(std::span<const std::byte> data) override;

    private:
        peerdrop::io::Writer &destination_;
        IncomingTransfer &transfer_;
        const Clock &clock_;
    };

} // namespace peerdrop::server
