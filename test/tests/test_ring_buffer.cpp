#include <gtest/gtest.h>
#include "logq.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using logq::LogRecord;
using logq::RingBuffer;
using logq::Snapshot;

namespace {

LogRecord recordWithMessage(const std::string& message) {
    LogRecord r;
    r.raw = message;
    r.message = message;
    return r;
}

} // anonymous namespace

TEST(RingBufferTest, AssignsIncreasingSequences) {
    RingBuffer buffer(8);
    EXPECT_EQ(buffer.lastSequence(), 0u);
    EXPECT_EQ(buffer.append(recordWithMessage("a")), 1u);
    EXPECT_EQ(buffer.append(recordWithMessage("b")), 2u);
    EXPECT_EQ(buffer.lastSequence(), 2u);

    Snapshot snap = buffer.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].message, "a");
    EXPECT_EQ(snap[0].sequence, 1u);
    EXPECT_EQ(snap[1].message, "b");
    EXPECT_EQ(snap[1].sequence, 2u);
}

TEST(RingBufferTest, DefaultCapacityEvictsOldest) {
    RingBuffer buffer;
    const size_t capacity = RingBuffer::kDefaultCapacity;
    EXPECT_EQ(buffer.capacity(), capacity);

    for (int i = 1; i <= 10001; ++i) {
        buffer.append(recordWithMessage("record " + std::to_string(i)));
    }

    EXPECT_EQ(buffer.size(), capacity);
    EXPECT_EQ(buffer.evictedCount(), 1u);

    Snapshot snap = buffer.snapshot();
    ASSERT_EQ(snap.size(), capacity);
    EXPECT_EQ(snap[0].message, "record 2");
    EXPECT_EQ(snap[0].sequence, 2u);
    EXPECT_EQ(snap[snap.size() - 1].message, "record 10001");
    EXPECT_EQ(snap[snap.size() - 1].sequence, 10001u);
    for (size_t i = 1; i < snap.size(); ++i) {
        ASSERT_EQ(snap[i].sequence, snap[i - 1].sequence + 1);
    }
}

TEST(RingBufferTest, SnapshotAfterReturnsOnlyNewer) {
    RingBuffer buffer(4);
    for (int i = 0; i < 6; ++i) {
        buffer.append(recordWithMessage(std::to_string(i)));
    }
    // Held: sequences 3..6
    Snapshot all = buffer.snapshotAfter(0);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].sequence, 3u);

    Snapshot tail = buffer.snapshotAfter(4);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].sequence, 5u);
    EXPECT_EQ(tail[1].sequence, 6u);

    EXPECT_TRUE(buffer.snapshotAfter(6).empty());
    EXPECT_TRUE(buffer.snapshotAfter(100).empty());
}

TEST(RingBufferTest, SnapshotIsStableWhileAppending) {
    RingBuffer buffer(3);
    buffer.append(recordWithMessage("x"));
    buffer.append(recordWithMessage("y"));
    Snapshot snap = buffer.snapshot();

    for (int i = 0; i < 10; ++i) {
        buffer.append(recordWithMessage("later"));
    }

    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].message, "x");
    EXPECT_EQ(snap[1].message, "y");

    size_t count = 0;
    for (Snapshot::const_iterator it = snap.begin(); it != snap.end(); ++it) ++count;
    EXPECT_EQ(count, 2u);
}

TEST(RingBufferTest, ConcurrentAppendAndSnapshot) {
    RingBuffer buffer(100);
    std::atomic<bool> done(false);
    std::atomic<int> badSnapshots(0);

    std::thread reader([&]() {
        while (!done.load()) {
            Snapshot snap = buffer.snapshot();
            for (size_t i = 1; i < snap.size(); ++i) {
                if (snap[i].sequence != snap[i - 1].sequence + 1) {
                    ++badSnapshots;
                    break;
                }
            }
        }
    });

    for (int i = 0; i < 20000; ++i) {
        buffer.append(recordWithMessage("m"));
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(badSnapshots.load(), 0);
    EXPECT_EQ(buffer.size(), 100u);
    EXPECT_EQ(buffer.lastSequence(), 20000u);
}
