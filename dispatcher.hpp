/**********************************************************************
 * dispatcher.hpp
 * --------------------------------------------------------------------
 *    Single consumer of the merged tick/key stream. Every mutation of
 *    the SessionTimer and SplitTree happens here, on the thread that
 *    calls run(). Commands whose guard fails are silently dropped.
 *********************************************************************/
#pragma once
#include "clock.hpp"
#include "log_exporter.hpp"
#include "org_log.hpp"
#include "render_model.hpp"
#include "session_timer.hpp"
#include "split_tree.hpp"
#include "term/input.hpp"
#include "term/renderer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace sw {

/* ────────────────────────────────────────────────────────────────
*  1.  Key map
* ────────────────────────────────────────────────────────────────*/
enum class Command {
    StartStop, Resume, Reset, OpenSplit, OpenNested,
    CloseSplit, Ascend, Redraw, SaveLog, Quit
};

inline std::optional<Command> command_for_key(char key)
{
    switch (key) {
        case 's': return Command::StartStop;
        case 'c': return Command::Resume;
        case 'r': return Command::Reset;
        case 'g': return Command::OpenSplit;
        case 'n': return Command::OpenNested;
        case 'h': return Command::CloseSplit;
        case 'u': return Command::Ascend;
        case 'd': return Command::Redraw;
        case 't': return Command::SaveLog;
        case 'q': return Command::Quit;
        default:  return std::nullopt;
    }
}

/* what a handler asks the loop to do next */
struct Effect {
    enum class Kind { None, Prompt, Render, Persist, Quit };
    Kind        kind = Kind::None;
    std::string prompt;

    static Effect none()                  { return {Kind::None, {}}; }
    static Effect render()                { return {Kind::Render, {}}; }
    static Effect ask(std::string text)   { return {Kind::Prompt, std::move(text)}; }
    static Effect persist()               { return {Kind::Persist, {}}; }
    static Effect quit()                  { return {Kind::Quit, {}}; }
};

/* ────────────────────────────────────────────────────────────────
*  2.  Dispatcher
* ────────────────────────────────────────────────────────────────*/
class Dispatcher {
    Clock&      clock_;
    Renderer&   renderer_;
    LineReader& reader_;
    LogSink&    sink_;

    SessionTimer timer_;
    SplitTree    tree_;

    // split start captured on the key press, before the name prompt
    Duration pendingOffset_{};
    WallTime pendingWall_{};

    std::size_t saves_       = 0;
    std::size_t failedSaves_ = 0;

public:
    Dispatcher(Clock& clock, Renderer& renderer, LineReader& reader, LogSink& sink,
               std::size_t capacity = MAX_SPLITS)
        : clock_(clock), renderer_(renderer), reader_(reader), sink_(sink), tree_(capacity)
    {}

    /* paints once, then drains `events` until a quit command */
    void run(EventSource& events)
    {
        repaint(PaintMode::Full);
        while (dispatch(events.next())) {}
    }

    /* returns false once the loop should stop */
    bool dispatch(const Event& ev)
    {
        if (ev.kind == Event::Kind::Tick) {
            if (timer_.running()) repaint(PaintMode::Live);
            return true;
        }

        auto cmd = command_for_key(ev.key);
        if (!cmd) return true;

        Effect fx = handle(*cmd);
        switch (fx.kind) {
            case Effect::Kind::None:
                break;
            case Effect::Kind::Prompt:
                complete(*cmd, reader_.read_line(fx.prompt));
                repaint(PaintMode::Full);
                break;
            case Effect::Kind::Render:
                repaint(PaintMode::Full);
                break;
            case Effect::Kind::Persist:
                persist();
                break;
            case Effect::Kind::Quit:
                return false;
        }
        return true;
    }

    const SessionTimer& timer() const { return timer_; }
    const SplitTree&    tree()  const { return tree_; }
    std::size_t saves()        const { return saves_; }
    std::size_t failed_saves() const { return failedSaves_; }

private:
    /* guard + any mutation that needs no user text */
    Effect handle(Command cmd)
    {
        const Instant now = clock_.now();

        switch (cmd) {
        case Command::StartStop:
            if (timer_.running()) {
                timer_.stop(now);
                return Effect::render();
            }
            return Effect::ask("Enter main goal: ");

        case Command::Resume:
            if (timer_.state() != TimerState::Paused) return Effect::none();
            timer_.resume(now);
            return Effect::render();

        case Command::Reset:
            timer_.reset();
            tree_.clear();
            return Effect::render();

        case Command::OpenSplit:
            if (!timer_.running() || tree_.full()) return Effect::none();
            capture_split_start(now);
            return Effect::ask("Enter subgoal name: ");

        case Command::OpenNested:
            if (!timer_.running() || !tree_.active() || tree_.full()) return Effect::none();
            capture_split_start(now);
            return Effect::ask("Enter nested subgoal name: ");

        case Command::CloseSplit:
            if (!tree_.close_active(timer_.total_elapsed(now), clock_.wall_now()))
                return Effect::none();
            return Effect::render();

        case Command::Ascend:
            if (!tree_.ascend()) return Effect::none();
            return Effect::render();

        case Command::Redraw:
            return Effect::render();

        case Command::SaveLog:
            if (timer_.running() || !timer_.goal()) return Effect::none();
            return Effect::persist();

        case Command::Quit:
            return Effect::quit();
        }
        return Effect::none();
    }

    /* second half of a prompting command */
    void complete(Command cmd, std::string text)
    {
        switch (cmd) {
        case Command::StartStop:
            tree_.clear();
            timer_.start(std::move(text), clock_.now(), clock_.wall_now());
            break;
        // handle() already checked capacity and the active split
        case Command::OpenSplit:
            tree_.open_top_or_sibling(std::move(text), pendingOffset_, pendingWall_);
            break;
        case Command::OpenNested:
            tree_.open_nested(std::move(text), pendingOffset_, pendingWall_);
            break;
        default:
            break;
        }
    }

    void capture_split_start(Instant now)
    {
        pendingOffset_ = timer_.total_elapsed(now);
        pendingWall_   = clock_.wall_now();
    }

    // write failures are counted, never surfaced on screen
    void persist()
    {
        SaveResult res = sink_.append(export_session(timer_, tree_, clock_.now(), clock_.wall_now()));
        ++saves_;
        if (!res.success) ++failedSaves_;
    }

    void repaint(PaintMode mode)
    {
        paint(renderer_, build_draw_model(timer_, tree_, clock_.now()), mode);
    }
};

} // namespace sw
