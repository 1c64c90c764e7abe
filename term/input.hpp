#pragma once
#include <string>

namespace sw {

/* one merged stream: poll timeout → Tick, keystroke → Key */
struct Event {
    enum class Kind { Tick, Key };
    Kind kind = Kind::Tick;
    char key  = 0;

    static Event tick()           { return {Kind::Tick, 0}; }
    static Event key_press(char c){ return {Kind::Key, c}; }
};

class EventSource {
public:
    virtual ~EventSource() = default;
    virtual Event next() = 0;                    // blocks at most one tick period
};

class LineReader {
public:
    virtual ~LineReader() = default;
    virtual std::string read_line(const std::string& prompt) = 0;   // trimmed
};

} // namespace sw
