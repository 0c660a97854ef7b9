#include <gtest/gtest.h>
#include "logq.hpp"
#include <csignal>
#include <cstdlib>

#include <poll.h>
#include <unistd.h>

using logq::InputEvent;
using logq::SignalGuard;
using logq::TerminalInput;
using logq::WakePipe;

namespace {

bool readable(int fd) {
    struct pollfd p;
    p.fd = fd;
    p.events = POLLIN;
    p.revents = 0;
    return ::poll(&p, 1, 0) == 1 && (p.revents & POLLIN);
}

} // anonymous namespace

class TerminalInputTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(keys), 0);
    }

    void TearDown() override {
        if (keys[0] >= 0) ::close(keys[0]);
        if (keys[1] >= 0) ::close(keys[1]);
    }

    void press(char c) {
        ASSERT_EQ(::write(keys[1], &c, 1), 1);
    }

    int keys[2];
    WakePipe wake;
};

TEST_F(TerminalInputTest, WakePipeNotifyAndDrain) {
    EXPECT_FALSE(readable(wake.readFd()));
    wake.notify();
    wake.notify();
    EXPECT_TRUE(readable(wake.readFd()));
    wake.drain();
    EXPECT_FALSE(readable(wake.readFd()));
}

TEST_F(TerminalInputTest, KeysArriveInOrder) {
    TerminalInput input(keys[0], wake, keys[0]);
    press('l');
    press('E');
    InputEvent first = input.next();
    ASSERT_EQ(first.type, InputEvent::Type::Key);
    EXPECT_EQ(first.key, 'l');
    EXPECT_EQ(input.next().key, 'E');
}

TEST_F(TerminalInputTest, KeysBeforeWake) {
    TerminalInput input(keys[0], wake, keys[0]);
    wake.notify();
    press('q');
    InputEvent e = input.next();
    ASSERT_EQ(e.type, InputEvent::Type::Key);
    EXPECT_EQ(e.key, 'q');
    EXPECT_EQ(input.next().type, InputEvent::Type::Wake);
}

TEST_F(TerminalInputTest, ClosedInputIsEndOfInput) {
    TerminalInput input(keys[0], wake, keys[0]);
    ::close(keys[1]);
    keys[1] = -1;
    EXPECT_EQ(input.next().type, InputEvent::Type::EndOfInput);
}

TEST_F(TerminalInputTest, SigintBecomesInterrupt) {
    SignalGuard guard(wake);
    TerminalInput input(keys[0], wake, keys[0]);
    ::raise(SIGINT);
    EXPECT_EQ(input.next().type, InputEvent::Type::Interrupt);
}

TEST_F(TerminalInputTest, SigwinchBecomesResize) {
    setenv("LINES", "30", 1);
    setenv("COLUMNS", "100", 1);
    SignalGuard guard(wake);
    TerminalInput input(keys[0], wake, keys[0]);
    ::raise(SIGWINCH);
    InputEvent e = input.next();
    ASSERT_EQ(e.type, InputEvent::Type::Resize);
    EXPECT_EQ(e.rows, 30u);
    EXPECT_EQ(e.columns, 100u);
    unsetenv("LINES");
    unsetenv("COLUMNS");
}

TEST(TerminalSizeTest, FallsBackWithoutTerminal) {
    unsetenv("LINES");
    unsetenv("COLUMNS");
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    logq::TerminalSize size = logq::queryTerminalSize(fds[0]);
    EXPECT_EQ(size.rows, 24u);
    EXPECT_EQ(size.columns, 80u);
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(RawTerminalTest, InactiveOnPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    {
        logq::RawTerminal raw(fds[0], fds[1]);
        EXPECT_FALSE(raw.active());
    }
    EXPECT_FALSE(readable(fds[0]));
    ::close(fds[0]);
    ::close(fds[1]);
}
