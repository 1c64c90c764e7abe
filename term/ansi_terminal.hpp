#pragma once
#include "input.hpp"
#include "renderer.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>

#include <indicators/cursor_control.hpp>
#include <indicators/cursor_movement.hpp>
#include <indicators/termcolor.hpp>

namespace sw {

/* hides the cursor while the stopwatch owns the screen */
class CursorGuard {
public:
    CursorGuard()  { indicators::show_console_cursor(false); }
    ~CursorGuard() { indicators::show_console_cursor(true); std::cout << std::flush; }
    CursorGuard(const CursorGuard&)            = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;
};

/* shows the cursor for the length of a name prompt */
class VisibleCursorPrompt : public LineReader {
    LineReader& inner_;
public:
    explicit VisibleCursorPrompt(LineReader& inner) : inner_(inner) {}

    std::string read_line(const std::string& prompt) override
    {
        indicators::show_console_cursor(true);
        std::string line = inner_.read_line(prompt);
        indicators::show_console_cursor(false);
        return line;
    }
};

/* Renderer over std::cout: ANSI home/clear + indicators cursor moves */
class AnsiTerminal : public Renderer {
public:
    void clear() override
    {
        std::cout << "\033[2J\033[H";
    }

    void move_to(std::size_t row, std::size_t col) override
    {
        std::cout << "\033[H";
        if (row) indicators::move_down(static_cast<int>(row));
        if (col) indicators::move_right(static_cast<int>(col));
    }

    void erase_line() override
    {
        indicators::erase_line();
    }

    void print(const std::string& text, Tone tone) override
    {
        switch (tone) {
            case Tone::Heading: std::cout << termcolor::bold << text << termcolor::reset; break;
            case Tone::Active:  std::cout << termcolor::green << text << termcolor::reset; break;
            case Tone::Plain:   std::cout << text; break;
        }
    }

    void flush() override
    {
        std::cout.flush();
        if (!std::cout)
            throw std::runtime_error("terminal output failed");
    }
};

} // namespace sw
