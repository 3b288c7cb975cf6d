/**
 * PeerDrop - Wall clock abstraction, substitutable in tests.
 */
#pragma once

#include <chrono>
#include <memory>

namespace peerdrop
{

    class Clock
    {
    public:
        using time_point = std::chrono::system_clock::time_point;

        virtual ~Clock() = default;

        virtual time_point now() const = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        time_point now() const override;
    };

    std::shared_ptr<const Clock> system_clock();

} // namespace peerdrop
