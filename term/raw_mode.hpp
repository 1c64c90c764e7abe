#pragma once
/* raw_mode.hpp – scoped terminal state
    ----------------------------------------------------------------
    RawMode  : non-canonical, no echo, single key reads; restored
               by the destructor on every exit path.
    Suspend  : cooked mode for the lifetime of a line prompt.
    Switches use TCSANOW so keys typed ahead survive the change.
    When stdin is not a tty both are no-ops.
------------------------------------------------------------------ */
#include <cerrno>
#include <system_error>

#include <termios.h>
#include <unistd.h>

namespace sw {

class RawMode {
    int     fd_;
    termios saved_{};
    bool    tty_    = false;
    bool    active_ = false;
public:
    explicit RawMode(int fd = STDIN_FILENO) : fd_(fd)
    {
        tty_ = ::isatty(fd_) == 1;
        if (!tty_) return;
        if (::tcgetattr(fd_, &saved_) != 0)
            throw std::system_error(errno, std::generic_category(), "tcgetattr");
        enable();
    }

    ~RawMode() { disable(); }

    RawMode(const RawMode&)            = delete;
    RawMode& operator=(const RawMode&) = delete;

    void enable()
    {
        if (!tty_ || active_) return;
        termios raw = saved_;
        raw.c_iflag &= ~static_cast<tcflag_t>(ICRNL | IXON);
        raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
        raw.c_cc[VMIN]  = 1;
        raw.c_cc[VTIME] = 0;
        if (::tcsetattr(fd_, TCSANOW, &raw) != 0)
            throw std::system_error(errno, std::generic_category(), "tcsetattr");
        active_ = true;
    }

    // also runs from the destructor, so it never throws
    void disable() noexcept
    {
        if (!active_) return;
        ::tcsetattr(fd_, TCSANOW, &saved_);
        active_ = false;
    }

    bool active() const { return active_; }

    class Suspend {
        RawMode& mode_;
        bool     was_;
    public:
        explicit Suspend(RawMode& m) : mode_(m), was_(m.active()) { mode_.disable(); }
        ~Suspend() { if (was_) mode_.enable(); }
        Suspend(const Suspend&)            = delete;
        Suspend& operator=(const Suspend&) = delete;
    };
};

} // namespace sw
