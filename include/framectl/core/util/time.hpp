/**
 * @file time.hpp
 * @brief Time helpers shared by tokens, the correlation engine and REST timing.
 */
#pragma once
#include <chrono>
#include <cstdint>

namespace framectl {

    using SteadyClock = std::chrono::steady_clock;
    using WallClock   = std::chrono::system_clock;

    /**
     * @brief Current wall-clock time in milliseconds since the Unix epoch.
     */
    inline std::uint64_t epochMillis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(
            system_clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Convert epoch milliseconds back to a wall-clock time point.
     */
    inline WallClock::time_point fromEpochMillis(std::uint64_t ms)
    {
        return WallClock::time_point(std::chrono::milliseconds(ms));
    }

    inline std::uint64_t toEpochMillis(WallClock::time_point tp)
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(tp.time_since_epoch()).count();
    }

    /**
     * @brief Milliseconds elapsed since @p start on the steady clock.
     */
    inline std::chrono::milliseconds elapsedSince(SteadyClock::time_point start)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
    }
}
