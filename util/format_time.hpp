#pragma once
//  util/format_time.hpp
//
//  Text helpers shared by the draw model and the log exporter:
//  "HH:MM:SS.mmm" durations, strftime-style wall stamps, trimming.
//
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace util
{
/// Return a duration as HH:MM:SS.mmm
/// • Hours are padded to two digits and grow wider past 99.
/// • Negative input prints as zero.
template <class Rep, class Period>
inline std::string
format_duration(std::chrono::duration<Rep, Period> d)
{
    using namespace std::chrono;
    long long ms = duration_cast<milliseconds>(d).count();
    if (ms < 0) ms = 0;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << ms / 3600000 << ':'
        << std::setw(2) << (ms / 60000) % 60 << ':'
        << std::setw(2) << (ms / 1000) % 60 << '.'
        << std::setw(3) << ms % 1000;
    return oss.str();
}

/// Local-time rendering of a wall clock instant, `fmt` as for std::put_time.
inline std::string
format_wall(std::chrono::system_clock::time_point tp, const char* fmt)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream stamp;
    stamp << std::put_time(&tm, fmt);
    return stamp.str();
}

constexpr char SESSION_STAMP[] = "%Y-%m-%d %H:%M";      // session record range
constexpr char SPLIT_STAMP[]   = "%Y-%m-%d %H:%M:%S";   // split record range

inline std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
} // namespace util
