#pragma once
/* render_model.hpp – drawable snapshot of the stopwatch
    ----------------------------------------------------------------
    Pure: (timer, tree, now) -> DrawModel. Painting lives in
    term/renderer.hpp.
------------------------------------------------------------------ */
#include "session_timer.hpp"
#include "split_tree.hpp"
#include "util/format_time.hpp"

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace sw {

constexpr char TITLE[]    = "=== Enhanced Stopwatch ===";
constexpr char CONTROLS[] =
    "Controls: s/start-stop c/continue r/reset g/start-subgoal n/nested-subgoal "
    "h/stop u/up d/redraw t/save-log q/quit";

struct DrawRow {
    std::string text;
    std::size_t indent;    // columns, level * 2
    bool        open;
    bool        active;
};

struct DrawModel {
    std::string          title;
    std::string          goalLine;
    std::string          timeLine;
    std::string          splitsHeader;
    std::vector<DrawRow> rows;
    std::string          controls;
};

/* " 1) 00:00:01.000 -> 00:00:05.000 = 00:00:04.000 Outline" */
inline std::string format_row(const SplitRow& r)
{
    std::ostringstream oss;
    oss << std::setw(2) << r.index + 1 << ") "
        << r.start << " -> " << r.end << " = " << r.duration << ' ' << r.name;
    return oss.str();
}

inline DrawModel build_draw_model(const SessionTimer& timer,
                                  const SplitTree&    tree,
                                  Instant             now)
{
    const Duration total = timer.total_elapsed(now);

    DrawModel m;
    m.title    = TITLE;
    m.goalLine = "Goal  : " + (timer.goal() ? *timer.goal() : std::string("(none)"));
    m.timeLine = "Time  : " + util::format_duration(total);
    if (timer.state() == TimerState::Paused)
        m.timeLine += "  [paused]";
    m.splitsHeader = "Subgoals (" + std::to_string(tree.size()) + "):";

    for (const SplitRow& r : tree.snapshot(total))
        m.rows.push_back({format_row(r), r.level * 2, r.open, r.active});

    m.controls = CONTROLS;
    return m;
}

} // namespace sw
