#include "runtime/TransitionHistory.h"
#include <gtest/gtest.h>

using namespace ACE;

class TransitionHistoryTest : public ::testing::Test {};

TEST_F(TransitionHistoryTest, UnboundedKeepsEverything) {
    TransitionHistory history;
    EXPECT_FALSE(history.isBounded());
    EXPECT_TRUE(history.empty());

    history.restart("root");
    for (int i = 0; i < 100; ++i) {
        history.record("s" + std::to_string(i), i);
    }

    EXPECT_EQ(101u, history.size());
    EXPECT_EQ(HistoryRecord("root", Value()), history.snapshot().front());
    EXPECT_EQ(HistoryRecord("s99", 99), history.snapshot().back());
}

TEST_F(TransitionHistoryTest, BoundedEvictsOldestFirst) {
    TransitionHistory history(3);
    history.restart("root");

    history.record("a", 1);
    history.record("b", 2);
    history.record("c", 3);
    history.record("d", 4);

    History expected{{"b", 2}, {"c", 3}, {"d", 4}};
    EXPECT_EQ(expected, history.snapshot());
    EXPECT_EQ(3u, history.getMaxHistory());
}

TEST_F(TransitionHistoryTest, BoundHoldsForLongRuns) {
    const size_t limit = 4;
    TransitionHistory history(limit);
    history.restart("root");

    for (int i = 0; i < 50; ++i) {
        history.record("s", i);
        EXPECT_LE(history.size(), limit);
    }

    auto records = history.snapshot();
    ASSERT_EQ(limit, records.size());
    for (size_t i = 0; i < limit; ++i) {
        EXPECT_EQ(Value(46 + static_cast<int>(i)), records[i].input);
    }
}

TEST_F(TransitionHistoryTest, RestartReturnsPreviousRunAndReseeds) {
    TransitionHistory history(10);
    history.restart("root");
    history.record("a", "x");

    auto previous = history.restart("root");

    History expectedPrevious{{"root", Value()}, {"a", "x"}};
    EXPECT_EQ(expectedPrevious, previous);

    History expectedCurrent{{"root", Value()}};
    EXPECT_EQ(expectedCurrent, history.snapshot());
}

TEST_F(TransitionHistoryTest, SnapshotIsIndependentCopy) {
    TransitionHistory history;
    history.restart("root");

    auto before = history.snapshot();
    history.record("a", 1);

    EXPECT_EQ(1u, before.size());
    EXPECT_EQ(2u, history.size());
}
