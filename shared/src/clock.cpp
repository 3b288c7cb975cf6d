#include "peerdrop/clock.hpp"

namespace peerdrop
{

    Clock::time_point SystemClock::now() const
    {
        return std::chrono::system_clock::now();
    }

    std::shared_ptr<const Clock> system_clock()
    {
        static const auto clock = std::make_shared<const SystemClock>();
        return clock;
    }

} // namespace peerdrop
