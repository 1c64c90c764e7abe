#pragma once
/* log_exporter.hpp – session → outline records
    ----------------------------------------------------------------
    One depth-1 record for the goal, then one record per closed
    split (depth level+2) in insertion order. Open splits are left
    out; nothing is deduplicated across saves.
------------------------------------------------------------------ */
#include "session_timer.hpp"
#include "split_tree.hpp"
#include "util/format_time.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sw {

struct LogRecord {
    std::size_t depth;        // number of leading '*'
    std::string heading;
    std::string clockStart;
    std::string clockEnd;
    std::string duration;     // HH:MM:SS.mmm
};

inline std::vector<LogRecord> export_session(const SessionTimer& timer,
                                             const SplitTree&    tree,
                                             Instant             now,
                                             WallTime            wallNow)
{
    std::vector<LogRecord> out;
    if (!timer.goal()) return out;

    out.push_back({1, *timer.goal(),
                   util::format_wall(timer.start_wall(), util::SESSION_STAMP),
                   util::format_wall(wallNow, util::SESSION_STAMP),
                   util::format_duration(timer.total_elapsed(now))});

    for (const Split& s : tree.splits()) {
        if (s.open()) continue;
        out.push_back({s.level + 2, s.name,
                       util::format_wall(s.startWall, util::SPLIT_STAMP),
                       util::format_wall(*s.endWall, util::SPLIT_STAMP),
                       util::format_duration(s.duration(*s.endOffset))});
    }
    return out;
}

} // namespace sw
