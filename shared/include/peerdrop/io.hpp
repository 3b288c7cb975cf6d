/**
 * PeerDrop - Minimal byte stream interfaces used to feed the receiver.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>

namespace peerdrop::io
{

    class Reader
    {
    public:
        virtual ~Reader() = default;

        // Returns 0 at end of stream. Failures throw.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    class Writer
    {
    public:
        virtual ~Writer() = default;

        virtual std::size_t write(std::span<const std::byte> data) = 0;
    };

    class StreamReader final : public Reader
    {
    public:
        explicit StreamReader(std::istream &input);

        std::size_t read(std::span<std::byte> buffer) override;

    private:
        std::istream &input_;
    };

    // Copies until the reader is exhausted and returns the number of bytes written.
    std::int64_t copy(Writer &writer, Reader &reader);

} // namespace peerdrop::io
