#pragma once
/* org_log.hpp – append-only Org-mode logbook
    ----------------------------------------------------------------
        * Write report
          :LOGBOOK:
          CLOCK: [2025-05-14 18:22]--[2025-05-14 18:32] => 00:00:10.000
          :END:

        ** Draft
          ...
------------------------------------------------------------------ */
#include "log_exporter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sw {

struct SaveResult {
    bool     success;   // false -> file could not be opened / written
    fs::path log;       // file that was (or should have been) appended
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual SaveResult append(const std::vector<LogRecord>& records) = 0;
};

inline std::string render_org(const std::vector<LogRecord>& records)
{
    std::ostringstream out;
    for (const LogRecord& r : records) {
        out << std::string(r.depth, '*') << ' ' << r.heading << '\n'
            << "  :LOGBOOK:\n"
            << "  CLOCK: [" << r.clockStart << "]--[" << r.clockEnd << "] => "
            << r.duration << '\n'
            << "  :END:\n\n";
    }
    return out.str();
}

class OrgLogFile : public LogSink {
    fs::path path_;
public:
    explicit OrgLogFile(fs::path path) : path_(std::move(path)) {}

    SaveResult append(const std::vector<LogRecord>& records) override
    {
        std::ofstream f(path_, std::ios::out | std::ios::app);
        if (!f) return {false, path_};
        f << render_org(records);
        f.flush();
        return {static_cast<bool>(f), path_};
    }
};

} // namespace sw
