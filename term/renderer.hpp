#pragma once
#include "../render_model.hpp"

#include <cstddef>
#include <string>

namespace sw {

enum class Tone { Plain, Heading, Active };

class Renderer {
public:
    virtual ~Renderer() = default;
    virtual void clear() = 0;                                  // whole screen, cursor home
    virtual void move_to(std::size_t row, std::size_t col) = 0;
    virtual void erase_line() = 0;                             // current row
    virtual void print(const std::string& text, Tone tone = Tone::Plain) = 0;
    virtual void flush() = 0;                                  // throws on a dead terminal
};

enum class PaintMode { Full, Live };

/* fixed layout rows */
constexpr std::size_t ROW_TITLE  = 0;
constexpr std::size_t ROW_GOAL   = 1;
constexpr std::size_t ROW_TIME   = 2;
constexpr std::size_t ROW_HEADER = 3;
constexpr std::size_t ROW_SPLITS = 4;

inline std::size_t controls_row(const DrawModel& m)
{
    return ROW_SPLITS + m.rows.size() + 1;
}

/* Live mode only touches the time line and the rows still running. */
inline void paint(Renderer& r, const DrawModel& m, PaintMode mode)
{
    auto line = [&r](std::size_t row, std::size_t col, const std::string& text, Tone tone) {
        r.move_to(row, 0);
        r.erase_line();
        if (col) r.move_to(row, col);
        r.print(text, tone);
    };

    if (mode == PaintMode::Full) {
        r.clear();
        line(ROW_TITLE,  0, m.title,        Tone::Heading);
        line(ROW_GOAL,   0, m.goalLine,     Tone::Plain);
        line(ROW_HEADER, 0, m.splitsHeader, Tone::Plain);
        line(controls_row(m), 0, m.controls, Tone::Plain);
    }

    line(ROW_TIME, 0, m.timeLine, Tone::Plain);

    for (std::size_t i = 0; i < m.rows.size(); ++i) {
        const DrawRow& row = m.rows[i];
        if (mode == PaintMode::Live && !row.open) continue;
        line(ROW_SPLITS + i, row.indent, row.text, row.active ? Tone::Active : Tone::Plain);
    }

    r.move_to(controls_row(m) + 1, 0);
    r.flush();
}

} // namespace sw
