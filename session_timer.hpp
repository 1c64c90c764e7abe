#pragma once
/* session_timer.hpp – main goal run state
    ----------------------------------------------------------------
    Idle --start--> Running --stop--> Paused --resume--> Running
    any  --reset--> Idle
    `start` from Running/Paused throws the old session away.
------------------------------------------------------------------ */
#include "clock.hpp"

#include <optional>
#include <string>
#include <utility>

namespace sw {

enum class TimerState { Idle, Running, Paused };

class SessionTimer {
    std::optional<std::string> goal_;
    bool     running_ = false;
    Duration elapsed_ = Duration::zero();   // frozen total of finished segments
    Instant  segmentStart_{};               // valid only while running
    WallTime startWall_{};
public:
    void start(std::string goal, Instant now, WallTime wall)
    {
        goal_         = std::move(goal);
        elapsed_      = Duration::zero();
        segmentStart_ = now;
        startWall_    = wall;
        running_      = true;
    }

    void stop(Instant now)
    {
        if (!running_) return;
        elapsed_ += saturating_sub(now, segmentStart_);
        running_  = false;
    }

    void resume(Instant now)
    {
        if (running_) return;
        segmentStart_ = now;
        running_      = true;
    }

    void reset()
    {
        goal_.reset();
        elapsed_ = Duration::zero();
        running_ = false;
    }

    Duration total_elapsed(Instant now) const
    {
        if (!running_) return elapsed_;
        return elapsed_ + saturating_sub(now, segmentStart_);
    }

    TimerState state() const
    {
        if (running_) return TimerState::Running;
        return goal_ ? TimerState::Paused : TimerState::Idle;
    }

    bool running() const { return running_; }
    const std::optional<std::string>& goal() const { return goal_; }
    WallTime start_wall() const { return startWall_; }
};

} // namespace sw
