#include "test_helpers.hpp"

#include "log_exporter.hpp"
#include "org_log.hpp"
#include "util/format_time.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace swtest;
namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST(ExportSession, NoGoalNoRecords) {
    sw::SessionTimer timer;
    sw::SplitTree    tree;
    ManualClock      clk;
    EXPECT_TRUE(sw::export_session(timer, tree, clk.now(), clk.wall_now()).empty());
}

TEST(ExportSession, OneRecordPerClosedSplitWithDepth) {
    sw::SessionTimer timer;
    sw::SplitTree    tree;
    ManualClock      clk;

    timer.start("goal", clk.now(), clk.wall_now());
    tree.open_top_or_sibling("a", 0s, clk.wall_now());
    tree.open_nested("b", 0s, clk.wall_now());
    tree.open_nested("c", 0s, clk.wall_now());       // left open
    tree.ascend();
    clk.advance(2s);
    tree.close_active(timer.total_elapsed(clk.now()), clk.wall_now());  // b
    tree.close_active(timer.total_elapsed(clk.now()), clk.wall_now());  // a
    tree.open_top_or_sibling("d", 2s, clk.wall_now());                  // open, top level
    timer.stop(clk.now());

    auto recs = sw::export_session(timer, tree, clk.now(), clk.wall_now());
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].depth, 1u);
    EXPECT_EQ(recs[0].heading, "goal");
    EXPECT_EQ(recs[1].heading, "a");
    EXPECT_EQ(recs[1].depth, 2u);
    EXPECT_EQ(recs[2].heading, "b");
    EXPECT_EQ(recs[2].depth, 3u);
}

TEST(ExportSession, ClockRangesUseWallTime) {
    sw::SessionTimer timer;
    sw::SplitTree    tree;
    ManualClock      clk;
    const sw::WallTime t0 = clk.wall_now();

    timer.start("goal", clk.now(), t0);
    clk.advance(1s);
    tree.open_top_or_sibling("s", timer.total_elapsed(clk.now()), clk.wall_now());
    clk.advance(90s);
    tree.close_active(timer.total_elapsed(clk.now()), clk.wall_now());
    timer.stop(clk.now());

    auto recs = sw::export_session(timer, tree, clk.now(), clk.wall_now());
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].clockStart, util::format_wall(t0, util::SESSION_STAMP));
    EXPECT_EQ(recs[0].clockEnd, util::format_wall(t0 + 91s, util::SESSION_STAMP));
    EXPECT_EQ(recs[0].duration, "00:01:31.000");
    EXPECT_EQ(recs[1].clockStart, util::format_wall(t0 + 1s, util::SPLIT_STAMP));
    EXPECT_EQ(recs[1].clockEnd, util::format_wall(t0 + 91s, util::SPLIT_STAMP));
    EXPECT_EQ(recs[1].duration, "00:01:30.000");
}

TEST(RenderOrg, LogbookLayout) {
    std::vector<sw::LogRecord> recs{
        {1, "Write report", "2025-05-14 18:22", "2025-05-14 18:32", "00:00:10.000"},
        {3, "Outline", "2025-05-14 18:22:01", "2025-05-14 18:22:05", "00:00:04.000"}};

    EXPECT_EQ(sw::render_org(recs),
              "* Write report\n"
              "  :LOGBOOK:\n"
              "  CLOCK: [2025-05-14 18:22]--[2025-05-14 18:32] => 00:00:10.000\n"
              "  :END:\n"
              "\n"
              "*** Outline\n"
              "  :LOGBOOK:\n"
              "  CLOCK: [2025-05-14 18:22:01]--[2025-05-14 18:22:05] => 00:00:04.000\n"
              "  :END:\n"
              "\n");
}

TEST(OrgLogFile, AppendsWithoutRewriting) {
    fs::path dir = fs::temp_directory_path() / "splitwatch_test_append";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path file = dir / "done.org";

    sw::OrgLogFile log(file);
    std::vector<sw::LogRecord> recs{{1, "goal", "a", "b", "00:00:01.000"}};

    EXPECT_TRUE(log.append(recs).success);
    EXPECT_TRUE(log.append(recs).success);

    std::string one = sw::render_org(recs);
    EXPECT_EQ(slurp(file), one + one);
    fs::remove_all(dir);
}

TEST(OrgLogFile, UnopenablePathReportsFailure) {
    fs::path dir = fs::temp_directory_path() / "splitwatch_test_dir_as_file";
    fs::create_directories(dir);

    sw::OrgLogFile log(dir);                    // a directory cannot be appended to
    sw::SaveResult res = log.append({{1, "goal", "a", "b", "c"}});
    EXPECT_FALSE(res.success);
    EXPECT_TRUE(res.log == dir);
    fs::remove_all(dir);
}
