#include "test_helpers.hpp"

#include "dispatcher.hpp"
#include "term/raw_mode.hpp"
#include "term/stdin_input.hpp"

#include <chrono>
#include <cstdlib>
#include <sstream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace swtest;
using sw::Event;

namespace {

// owns both ends of a pipe; the write end can be closed early for EOF
struct Pipe {
    int rd = -1;
    int wr = -1;

    Pipe()
    {
        int fds[2];
        if (::pipe(fds) == 0) { rd = fds[0]; wr = fds[1]; }
    }
    ~Pipe() { close_read(); close_write(); }

    void write(const std::string& bytes) const
    {
        ASSERT_EQ(::write(wr, bytes.data(), bytes.size()),
                  static_cast<ssize_t>(bytes.size()));
    }
    void close_write() { if (wr >= 0) ::close(wr); wr = -1; }
    void close_read()  { if (rd >= 0) ::close(rd); rd = -1; }
};

// master side of a pseudo terminal plus its opened slave
struct Pty {
    int master = -1;
    int slave  = -1;

    Pty()
    {
        master = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master < 0) return;
        if (::grantpt(master) != 0 || ::unlockpt(master) != 0) return;
        const char* name = ::ptsname(master);
        if (name) slave = ::open(name, O_RDWR | O_NOCTTY);
    }
    ~Pty()
    {
        if (slave >= 0) ::close(slave);
        if (master >= 0) ::close(master);
    }
    bool ok() const { return master >= 0 && slave >= 0; }
};

} // namespace

TEST(StdinKeys, SilenceIsATick) {
    Pipe p;
    ASSERT_GE(p.rd, 0);
    sw::StdinKeys keys(5ms, p.rd);
    EXPECT_EQ(keys.next().kind, Event::Kind::Tick);
}

TEST(StdinKeys, EndOfInputQuits) {
    Pipe p;
    ASSERT_GE(p.rd, 0);
    p.write("g");
    p.close_write();
    sw::StdinKeys keys(5ms, p.rd);

    Event e = keys.next();
    EXPECT_EQ(e.kind, Event::Kind::Key);
    EXPECT_EQ(e.key, 'g');
    EXPECT_EQ(keys.next().key, 'q');
}

TEST(StdinLineReader, LeavesFollowingKeysUnread) {
    Pipe p;
    ASSERT_GE(p.rd, 0);
    p.write("  Write report \nh");

    sw::RawMode raw(p.rd);                          // not a tty: no-op
    std::ostringstream out;
    sw::StdinLineReader reader(raw, p.rd, out);
    sw::StdinKeys keys(5ms, p.rd);

    EXPECT_EQ(reader.read_line("Enter main goal: "), "Write report");
    EXPECT_EQ(out.str(), "\nEnter main goal: ");
    EXPECT_EQ(keys.next().key, 'h');
}

TEST(StdinLineReader, EndOfInputMidLine) {
    Pipe p;
    ASSERT_GE(p.rd, 0);
    p.write("Dra");
    p.close_write();

    sw::RawMode raw(p.rd);
    std::ostringstream out;
    sw::StdinLineReader reader(raw, p.rd, out);
    sw::StdinKeys keys(5ms, p.rd);

    EXPECT_EQ(reader.read_line("Enter subgoal name: "), "Dra");
    EXPECT_EQ(keys.next().key, 'q');
}

// the whole session arrives in one burst, as when input is piped or pasted
TEST(StdinInput, ScriptedSessionThroughOneDescriptor) {
    Pipe p;
    ASSERT_GE(p.rd, 0);
    p.write("sWrite report\ngDraft\nh");
    p.close_write();

    ManualClock   clock;
    GridRenderer  screen;
    MemorySink    sink;
    sw::RawMode   raw(p.rd);
    std::ostringstream out;
    sw::StdinLineReader reader(raw, p.rd, out);
    sw::StdinKeys keys(5ms, p.rd);

    sw::Dispatcher disp(clock, screen, reader, sink);
    disp.run(keys);

    EXPECT_EQ(*disp.timer().goal(), "Write report");
    ASSERT_EQ(disp.tree().size(), 1u);
    EXPECT_EQ(disp.tree()[0].name, "Draft");
    EXPECT_FALSE(disp.tree()[0].open());
    EXPECT_FALSE(disp.tree().active().has_value());
}

TEST(RawMode, SwitchingKeepsTypedAheadInput) {
    Pty pty;
    if (!pty.ok()) GTEST_SKIP() << "no pseudo terminal available";

    sw::RawMode raw(pty.slave);
    ASSERT_TRUE(raw.active());

    // typed while still in raw mode, before the prompt switches to cooked
    ASSERT_EQ(::write(pty.master, "Draft\n", 6), 6);
    pollfd pending{pty.slave, POLLIN, 0};
    ASSERT_EQ(::poll(&pending, 1, 1000), 1);

    // a flushing switch would drop "Draft"; the late line keeps it from blocking
    const int master = pty.master;
    std::thread late([master] {
        std::this_thread::sleep_for(300ms);
        ssize_t n = ::write(master, "Late\n", 5);
        (void)n;
    });

    std::ostringstream out;
    sw::StdinLineReader reader(raw, pty.slave, out);
    std::string line = reader.read_line("Enter subgoal name: ");
    late.join();

    EXPECT_EQ(line, "Draft");
    EXPECT_TRUE(raw.active());
}
