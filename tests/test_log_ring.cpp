// =============================================================================
// Unit tests for LogRing (src/log_ring.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "log_ring.hpp"

using namespace pelo;

TEST(LogRingTest, AppendKeepsArrivalOrder) {
    LogRing ring(10);
    ring.append("first", "info");
    ring.append("second", "status");
    ring.append("third", "error");

    auto entries = ring.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "first");
    EXPECT_EQ(entries[1].category, "status");
    EXPECT_EQ(entries[2].message, "third");
}

TEST(LogRingTest, EvictsOldestBeyondCapacity) {
    LogRing ring(3);
    for (int i = 0; i < 5; i++) {
        ring.append("msg" + std::to_string(i), "info");
    }

    auto entries = ring.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().message, "msg2");
    EXPECT_EQ(entries.back().message, "msg4");
}

TEST(LogRingTest, DefaultCapacity) {
    LogRing ring;
    EXPECT_EQ(ring.capacity(), LogRing::DEFAULT_CAPACITY);
    for (size_t i = 0; i < LogRing::DEFAULT_CAPACITY + 1; i++) {
        ring.append("x", "info");
    }
    EXPECT_EQ(ring.size(), LogRing::DEFAULT_CAPACITY);
}

TEST(LogRingTest, ZeroCapacityClampsToOne) {
    LogRing ring(0);
    ring.append("a", "info");
    ring.append("b", "info");
    ASSERT_EQ(ring.size(), 1u);
    EXPECT_EQ(ring.entries()[0].message, "b");
}

TEST(LogRingTest, AppendReturnsStampedEntry) {
    LogRing ring;
    LogEntry e = ring.append("Checking device connection...", "status");
    EXPECT_EQ(e.message, "Checking device connection...");
    EXPECT_EQ(e.category, "status");
    // "[HH:MM:SS]"
    ASSERT_EQ(e.timestamp.size(), 10u);
    EXPECT_EQ(e.timestamp.front(), '[');
    EXPECT_EQ(e.timestamp.back(), ']');
    EXPECT_EQ(e.timestamp[3], ':');
    EXPECT_EQ(e.timestamp[6], ':');
}

TEST(LogRingTest, Clear) {
    LogRing ring;
    ring.append("a", "info");
    ring.clear();
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_TRUE(ring.entries().empty());
}
