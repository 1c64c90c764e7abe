#pragma once
#include "input.hpp"
#include "raw_mode.hpp"
#include "../util/format_time.hpp"

#include <cerrno>
#include <chrono>
#include <iostream>
#include <ostream>
#include <string>
#include <system_error>

#include <poll.h>
#include <unistd.h>

namespace sw {

/* Polls stdin for one tick period; silence becomes a Tick, EOF a 'q'. */
class StdinKeys : public EventSource {
    int                       fd_;
    std::chrono::milliseconds tick_;
public:
    explicit StdinKeys(std::chrono::milliseconds tick, int fd = STDIN_FILENO)
        : fd_(fd), tick_(tick) {}

    Event next() override
    {
        pollfd p{fd_, POLLIN, 0};
        int rc = ::poll(&p, 1, static_cast<int>(tick_.count()));
        if (rc < 0) {
            if (errno == EINTR) return Event::tick();
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (rc == 0) return Event::tick();

        char c = 0;
        ssize_t n = ::read(fd_, &c, 1);
        if (n == 0) return Event::key_press('q');
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return Event::tick();
            throw std::system_error(errno, std::generic_category(), "read");
        }
        return Event::key_press(c);
    }
};

/* Cooked-mode prompt below the controls legend.
   Reads the same fd as StdinKeys, one byte at a time, so nothing past the
   newline is buffered away from the key poller. */
class StdinLineReader : public LineReader {
    RawMode&      raw_;
    int           fd_;
    std::ostream& out_;
public:
    explicit StdinLineReader(RawMode& raw, int fd = STDIN_FILENO, std::ostream& out = std::cout)
        : raw_(raw), fd_(fd), out_(out) {}

    std::string read_line(const std::string& prompt) override
    {
        RawMode::Suspend cooked(raw_);
        out_ << '\n' << prompt << std::flush;

        std::string line;
        char c = 0;
        for (;;) {
            ssize_t n = ::read(fd_, &c, 1);
            if (n == 0) break;                // EOF: next poll reports it as quit
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "read");
            }
            if (c == '\n') break;
            line += c;
        }
        return util::trim(line);
    }
};

} // namespace sw
