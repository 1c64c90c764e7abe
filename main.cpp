/**********************************************************************
 * main.cpp – interactive split stopwatch
 *********************************************************************/
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "clock.hpp"
#include "dispatcher.hpp"
#include "org_log.hpp"
#include "term/ansi_terminal.hpp"
#include "term/raw_mode.hpp"
#include "term/stdin_input.hpp"

namespace fs = std::filesystem;

/*────────────────────── options ─────────────────────────────────*/
struct Opt {
    fs::path                  log_path = "done.org";
    std::chrono::milliseconds tick{30};
    bool                      verbose  = false;
};

/* SPLITWATCH_TICK_MS=<n>, clamped to [5, 1000] */
static std::chrono::milliseconds env_tick(std::chrono::milliseconds fallback)
{
    const char* v = std::getenv("SPLITWATCH_TICK_MS");
    if (!v || !*v) return fallback;
    try {
        long ms = std::stol(v);
        return std::chrono::milliseconds{std::clamp(ms, 5L, 1000L)};
    } catch (const std::exception&) {
        return fallback;
    }
}

static bool env_flag(const char* name)
{
    const char* v = std::getenv(name);
    return v && *v && std::string(v) != "0";
}

/*────────────────────── option parser ───────────────────────────*/
/* one optional positional: the log file; anything after it is ignored */
static Opt parse(int argc, char* argv[])
{
    Opt o;
    if (argc > 1 && argv[1][0] != '\0') o.log_path = argv[1];
    o.tick    = env_tick(o.tick);
    o.verbose = env_flag("SPLITWATCH_VERBOSE");
    return o;
}

/*──────────────────────── main ────────────────────────────────*/
int main(int argc, char* argv[])
{
    Opt opt = parse(argc, argv);

    sw::SystemClock clock;
    sw::OrgLogFile  logFile(opt.log_path);
    std::size_t     saves = 0, failed = 0;

    try {
        sw::RawMode         raw;
        sw::CursorGuard     cursor;
        sw::AnsiTerminal    screen;
        sw::StdinLineReader lines(raw);
        sw::VisibleCursorPrompt reader(lines);
        sw::StdinKeys       keys(opt.tick);

        sw::Dispatcher disp(clock, screen, reader, logFile);
        disp.run(keys);

        saves  = disp.saves();
        failed = disp.failed_saves();
    } catch (const std::exception& e) {
        std::cerr << "\nsplitwatch: " << e.what() << '\n';
        return 1;
    }

    std::cout << '\n';
    if (opt.verbose) {
        std::cout << "=============== Summary ===============\n";
        std::cout << "      Saves      : " << saves  << '\n';
        std::cout << "      Failed     : " << failed << '\n';
        std::cout << "Log file " << opt.log_path << '\n';
    }
    return 0;
}
