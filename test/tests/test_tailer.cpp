#include <gtest/gtest.h>
#include "logq.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using logq::FilterState;
using logq::LevelFilter;
using logq::LiveFilter;
using logq::RingBuffer;
using logq::Snapshot;
using logq::Tailer;
using logq::TailOptions;
using logq::TailState;
using logq::ViewState;

class TailerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupLogFiles();
        dir = TestUtils::makeTempDir();
        path = dir + "/logcat.txt";
    }

    void TearDown() override {
        TestUtils::cleanupLogFiles();
    }

    TailOptions options(bool seed = true) const {
        TailOptions o;
        o.path = path;
        o.seedExisting = seed;
        o.pollInterval = std::chrono::milliseconds(10);
        return o;
    }

    static std::string line(char level, const std::string& tag, const std::string& msg) {
        return TestUtils::threadtimeLine(100, level, tag, msg) + "\n";
    }

    static std::vector<std::string> messages(const RingBuffer& buffer) {
        std::vector<std::string> out;
        Snapshot snap = buffer.snapshot();
        for (size_t i = 0; i < snap.size(); ++i) out.push_back(snap[i].message);
        return out;
    }

    std::string dir;
    std::string path;
    RingBuffer buffer;
    LiveFilter filter;
    ViewState view;
};

TEST_F(TailerTest, MissingFileThrows) {
    Tailer tailer(options(), buffer, filter, view);
    EXPECT_THROW(tailer.open(), std::runtime_error);
    EXPECT_EQ(tailer.state(), TailState::Error);
    EXPECT_NE(tailer.status().message.find("cannot open"), std::string::npos);
    EXPECT_FALSE(tailer.isOpen());
}

TEST_F(TailerTest, SeedsExistingContent) {
    TestUtils::writeFile(path, line('I', "MyTag", "hello") + line('E', "MyTag", "boom"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    EXPECT_EQ(tailer.state(), TailState::Following);
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "hello");
    EXPECT_EQ(msgs[1], "boom");
    EXPECT_EQ(tailer.linesRead(), 2u);
}

TEST_F(TailerTest, FollowOnlySkipsExistingContent) {
    TestUtils::writeFile(path, line('I', "MyTag", "old"));
    Tailer tailer(options(false), buffer, filter, view);
    tailer.open();
    EXPECT_EQ(buffer.size(), 0u);

    TestUtils::appendFile(path, line('I', "MyTag", "new"));
    EXPECT_TRUE(tailer.pollOnce());
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "new");
}

TEST_F(TailerTest, SeedingFromLargeFileDropsPartialFirstLine) {
    TestUtils::writeFile(path, line('I', "T", "first") + line('I', "T", "second") + line('I', "T", "third"));
    TailOptions o = options();
    // Land inside the second line.
    o.seedByteLimit = line('I', "T", "second").size() + line('I', "T", "third").size() - 3;
    Tailer tailer(o, buffer, filter, view);
    tailer.open();
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "third");
}

TEST_F(TailerTest, SeedingOnLineBoundaryKeepsFirstLine) {
    TestUtils::writeFile(path, line('I', "T", "first") + line('I', "T", "second"));
    TailOptions o = options();
    o.seedByteLimit = line('I', "T", "second").size();
    Tailer tailer(o, buffer, filter, view);
    tailer.open();
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "second");
}

TEST_F(TailerTest, PartialLineWaitsForNewline) {
    TestUtils::writeFile(path, "");
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();

    std::string full = line('W', "Net", "slow request");
    TestUtils::appendFile(path, full.substr(0, 20));
    EXPECT_FALSE(tailer.pollOnce());
    EXPECT_EQ(buffer.size(), 0u);

    TestUtils::appendFile(path, full.substr(20));
    EXPECT_TRUE(tailer.pollOnce());
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "slow request");
}

TEST_F(TailerTest, UnparsedAndBlankLines) {
    TestUtils::writeFile(path, "--------- beginning of main\n\n" + line('I', "T", "ok"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    Snapshot snap = buffer.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_FALSE(snap[0].ok());
    EXPECT_EQ(snap[0].raw, "--------- beginning of main");
    EXPECT_TRUE(snap[1].ok());
}

TEST_F(TailerTest, TruncateAndRewriteDoesNotDuplicate) {
    TestUtils::writeFile(path, line('I', "Old", "one") + line('I', "Old", "two") + line('I', "Old", "three"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    ASSERT_EQ(buffer.size(), 3u);

    TestUtils::truncateFile(path);
    TestUtils::appendFile(path, line('E', "New", "fresh"));
    tailer.pollOnce();

    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[0], "one");
    EXPECT_EQ(msgs[1], "two");
    EXPECT_EQ(msgs[2], "three");
    EXPECT_EQ(msgs[3], "fresh");
    EXPECT_EQ(tailer.state(), TailState::Following);
    EXPECT_EQ(tailer.status().rotations, 1u);

    TestUtils::appendFile(path, line('I', "New", "after"));
    tailer.pollOnce();
    msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 5u);
    EXPECT_EQ(msgs[4], "after");
}

TEST_F(TailerTest, RewriteToLargerSizeIsDetected) {
    TestUtils::writeFile(path, line('I', "Alpha", "short"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    ASSERT_EQ(buffer.size(), 1u);

    // Rewritten in place with more content than before; offset alone
    // cannot tell, the leading bytes can.
    TestUtils::writeFile(path, line('E', "Bravo", "replacement one") + line('E', "Bravo", "replacement two"));
    tailer.pollOnce();

    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_EQ(msgs[1], "replacement one");
    EXPECT_EQ(msgs[2], "replacement two");
    EXPECT_EQ(tailer.status().rotations, 1u);
}

TEST_F(TailerTest, ReplacedFileIsReopened) {
    TestUtils::writeFile(path, line('I', "T", "before"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();

    // Tail of the old file written just before the swap.
    TestUtils::appendFile(path, line('I', "T", "last words"));
    std::string next = dir + "/logcat.next";
    TestUtils::writeFile(next, line('I', "T", "rotated"));
    ASSERT_EQ(std::rename(next.c_str(), path.c_str()), 0);

    tailer.pollOnce();
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_EQ(msgs[1], "last words");
    EXPECT_EQ(msgs[2], "rotated");
    EXPECT_EQ(tailer.state(), TailState::Following);
}

TEST_F(TailerTest, RemovedFileWaitsAndRecoversWhenRecreated) {
    TestUtils::writeFile(path, line('I', "T", "x"));
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    TestUtils::appendFile(path, line('I', "T", "before removal"));
    ASSERT_EQ(std::remove(path.c_str()), 0);

    tailer.pollOnce();
    EXPECT_EQ(tailer.state(), TailState::Rotated);
    EXPECT_TRUE(tailer.isOpen());
    ASSERT_EQ(buffer.size(), 2u);

    // Still missing: keep waiting.
    EXPECT_FALSE(tailer.pollOnce());
    EXPECT_EQ(tailer.state(), TailState::Rotated);

    TestUtils::writeFile(path, line('I', "T", "after recreate"));
    tailer.pollOnce();
    EXPECT_EQ(tailer.state(), TailState::Following);
    EXPECT_EQ(tailer.status().message, "file recreated");
    EXPECT_EQ(tailer.status().rotations, 1u);

    TestUtils::appendFile(path, line('I', "T", "appended"));
    tailer.pollOnce();
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[1], "before removal");
    EXPECT_EQ(msgs[2], "after recreate");
    EXPECT_EQ(msgs[3], "appended");
}

TEST_F(TailerTest, RemovedFileWithExitedProducerStops) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);

    TestUtils::writeFile(path, line('I', "T", "x"));
    TailOptions o = options();
    o.producerPid = static_cast<int>(child);
    Tailer tailer(o, buffer, filter, view);
    tailer.open();
    ASSERT_EQ(std::remove(path.c_str()), 0);

    tailer.pollOnce();
    EXPECT_EQ(tailer.state(), TailState::Error);
    EXPECT_EQ(buffer.size(), 1u);
    EXPECT_FALSE(tailer.pollOnce());
}

TEST_F(TailerTest, RecordsCarryOwningProcess) {
    TestUtils::writeFile(path,
        TestUtils::threadtimeLine(1234, 'I', "ActivityManager",
                                  "Start proc 4321:com.example.app/u0a123 for activity") + "\n" +
        TestUtils::threadtimeLine(4321, 'I', "MyTag", "hello") + "\n" +
        TestUtils::threadtimeLine(5555, 'I', "MyTag", "someone else") + "\n");
    Tailer tailer(options(), buffer, filter, view);
    tailer.open();

    Snapshot snap = buffer.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[1].process, "com.example.app");
    EXPECT_TRUE(snap[2].process.empty());

    FilterState f;
    f.setPackageName("com.example.app");
    f.setPackageEnabled(true);
    EXPECT_TRUE(f.matches(snap[0]));
    EXPECT_TRUE(f.matches(snap[1]));
    EXPECT_FALSE(f.matches(snap[2]));
}

TEST_F(TailerTest, UnreadablePathFailsToOpen) {
    ASSERT_EQ(::mkdir(path.c_str(), 0700), 0);
    Tailer tailer(options(), buffer, filter, view);
    EXPECT_THROW(tailer.open(), std::runtime_error);
    EXPECT_EQ(tailer.state(), TailState::Error);
}

TEST_F(TailerTest, ReadErrorBeforeReopenStaysReported) {
    ASSERT_EQ(::mkdir(path.c_str(), 0700), 0);
    Tailer tailer(options(false), buffer, filter, view);
    tailer.open();
    ASSERT_EQ(::rmdir(path.c_str()), 0);
    TestUtils::writeFile(path, line('I', "T", "new"));

    tailer.pollOnce();
    EXPECT_EQ(tailer.state(), TailState::Error);
    EXPECT_NE(tailer.status().message.find("read failed"), std::string::npos);
    EXPECT_EQ(tailer.status().rotations, 0u);
    EXPECT_EQ(buffer.size(), 0u);
}

TEST_F(TailerTest, ExitedProducerStopsFollowing) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);

    TestUtils::writeFile(path, line('I', "T", "x"));
    TailOptions o = options();
    o.producerPid = static_cast<int>(child);
    Tailer tailer(o, buffer, filter, view);
    tailer.open();
    TestUtils::appendFile(path, line('I', "T", "final"));

    tailer.pollOnce();
    EXPECT_EQ(tailer.state(), TailState::Error);
    EXPECT_NE(tailer.status().message.find("exited"), std::string::npos);
    std::vector<std::string> msgs = messages(buffer);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[1], "final");
}

TEST_F(TailerTest, NotifiesOnlyForVisibleRecords) {
    TestUtils::writeFile(path, "");
    FilterState f;
    f.setLevel(LevelFilter::parse("E"));
    filter.set(f);

    Tailer tailer(options(), buffer, filter, view);
    tailer.open();
    std::atomic<int> notified(0);
    tailer.setNotifier([&notified]() { ++notified; });

    TestUtils::appendFile(path, line('I', "T", "hidden"));
    tailer.pollOnce();
    EXPECT_EQ(notified.load(), 0);
    EXPECT_EQ(buffer.size(), 1u);

    TestUtils::appendFile(path, line('E', "T", "shown"));
    tailer.pollOnce();
    EXPECT_EQ(notified.load(), 1);

    view.setPaused(true);
    TestUtils::appendFile(path, line('E', "T", "while paused"));
    tailer.pollOnce();
    EXPECT_EQ(notified.load(), 1);
    EXPECT_EQ(buffer.size(), 3u);
}

TEST_F(TailerTest, BackgroundThreadFollowsGrowth) {
    TestUtils::writeFile(path, line('I', "T", "seed"));
    Tailer tailer(options(), buffer, filter, view);
    std::atomic<int> notified(0);
    tailer.setNotifier([&notified]() { ++notified; });
    tailer.open();
    tailer.start();
    EXPECT_TRUE(tailer.running());

    TestUtils::appendFile(path, line('I', "T", "live"));
    EXPECT_TRUE(TestUtils::waitFor([this]() { return buffer.size() == 2u; }));
    EXPECT_GT(notified.load(), 0);

    tailer.stop();
    EXPECT_FALSE(tailer.running());
    EXPECT_FALSE(tailer.isOpen());
    tailer.stop();
}
