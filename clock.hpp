#pragma once
/* clock.hpp – time sources for the stopwatch
    ----------------------------------------------------------------
    Instants drive every duration computation; wall times are only
    captured for the human readable log ranges.
------------------------------------------------------------------ */
#include <chrono>

namespace sw {

using Instant  = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;
using Duration = std::chrono::steady_clock::duration;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Instant  now() const = 0;          // monotonic
    virtual WallTime wall_now() const = 0;     // local wall clock
};

class SystemClock : public Clock {
public:
    Instant  now() const override      { return std::chrono::steady_clock::now(); }
    WallTime wall_now() const override { return std::chrono::system_clock::now(); }
};

// a - b, floored at zero
inline Duration saturating_sub(Duration a, Duration b)
{
    return a > b ? a - b : Duration::zero();
}

inline Duration saturating_sub(Instant a, Instant b)
{
    return a > b ? a - b : Duration::zero();
}

} // namespace sw
