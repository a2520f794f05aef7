#include <gtest/gtest.h>
#include "sage_join/join/stream_stream_join.h"
#include "join_test_utils.h"
#include <stdexcept>

using namespace sage_join;
using namespace sage_join::test;

class OuterJoinTest : public ::testing::Test {
protected:
    void SetUp() override {
        left_store = std::make_unique<InMemoryWindowStore>("left", 10000);
        right_store = std::make_unique<InMemoryWindowStore>("right", 10000);
        outer_store = std::make_unique<InMemoryOuterJoinStore>("outer");
    }

    /**
     * @brief Join with unthrottled outer scans
     */
    std::unique_ptr<StreamStreamJoin> make_join(const JoinWindows& windows,
                                                bool with_outer_store = true) {
        return std::make_unique<StreamStreamJoin>(
            windows.with_emit_interval(0), *left_store, *right_store,
            with_outer_store ? outer_store.get() : nullptr, string_joiner(), context);
    }

    static JoinWindows left_join(int64_t before, int64_t after, int64_t grace = 0) {
        return JoinWindows::of_time_difference_and_grace(0, grace)
            .before(before).after(after).with_join_type(JoinType::LEFT);
    }

    CollectingContext context;
    std::unique_ptr<InMemoryWindowStore> left_store;
    std::unique_ptr<InMemoryWindowStore> right_store;
    std::unique_ptr<InMemoryOuterJoinStore> outer_store;
};

TEST_F(OuterJoinTest, EmitsUnmatchedLeftOnceWindowCloses) {
    auto join = make_join(left_join(0, 5));

    join->process_left(make_record("1", "leftVal", 10));
    EXPECT_TRUE(context.results.empty());
    EXPECT_TRUE(outer_store->contains(TimestampedSideKey::make_left("1", 10)));

    join->process_right(make_record("2", "other", 16));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(context.results[0].key, "1");
    EXPECT_EQ(result_value(context.results[0]), "leftVal+null");
    EXPECT_EQ(context.results[0].timestamp, 10);
    EXPECT_FALSE(outer_store->contains(TimestampedSideKey::make_left("1", 10)));
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, NotEmittedWhileWindowOpen) {
    auto join = make_join(left_join(0, 5));

    join->process_left(make_record("1", "A", 10));
    // stream time 15 equals ts + after: still open
    join->process_right(make_record("2", "B", 15));

    EXPECT_TRUE(context.results.empty());
    EXPECT_EQ(outer_store->size(), 1);
}

TEST_F(OuterJoinTest, GraceDelaysEmission) {
    auto join = make_join(left_join(5, 5, 10));

    join->process_left(make_record("k", "A", 10));
    join->process_right(make_record("z", "B", 20));
    join->process_right(make_record("z", "B", 25));
    EXPECT_TRUE(context.results.empty());

    join->process_right(make_record("z", "B", 26));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+null");
}

TEST_F(OuterJoinTest, NoSpuriousResultAfterLateMatch) {
    auto join = make_join(left_join(5, 5));

    join->process_left(make_record("k", "A", 10));
    join->process_right(make_record("k", "B", 12));
    join->process_right(make_record("other", "C", 100));
    join->process_left(make_record("other2", "D", 200));

    ASSERT_GE(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+B");
    for (const auto& result : context.results) {
        EXPECT_NE(result_value(result), "A+null");
    }
    EXPECT_FALSE(outer_store->contains(TimestampedSideKey::make_left("k", 10)));
}

TEST_F(OuterJoinTest, ScannerIsIdempotent) {
    auto join = make_join(left_join(0, 5));

    join->process_left(make_record("1", "A", 10));
    join->process_right(make_record("2", "B", 16));
    ASSERT_EQ(context.results.size(), 1);

    auto stats_after_first = outer_store->get_statistics();
    join->process_right(make_record("3", "C", 16));
    join->process_right(make_record("4", "D", 17));

    EXPECT_EQ(context.results.size(), 1);
    auto stats_after_second = outer_store->get_statistics();
    EXPECT_EQ(stats_after_second.total_deletes, stats_after_first.total_deletes);
    EXPECT_EQ(stats_after_second.total_scans, stats_after_first.total_scans);
}

TEST_F(OuterJoinTest, FullOuterEmitsBothSidesInEventTimeOrder) {
    auto join = make_join(JoinWindows::of_time_difference_no_grace(5)
                              .with_join_type(JoinType::OUTER));

    join->process_left(make_record("a", "A", 10));
    join->process_right(make_record("b", "B", 11));
    join->process_left(make_record("c", "C", 30));

    ASSERT_EQ(context.results.size(), 2);
    EXPECT_EQ(context.results[0].key, "a");
    EXPECT_EQ(result_value(context.results[0]), "A+null");
    EXPECT_EQ(context.results[0].timestamp, 10);
    EXPECT_EQ(context.results[1].key, "b");
    EXPECT_EQ(result_value(context.results[1]), "null+B");
    EXPECT_EQ(context.results[1].timestamp, 11);
    EXPECT_EQ(outer_store->size(), 1);
}

TEST_F(OuterJoinTest, RightJoinEmitsUnmatchedRight) {
    auto join = make_join(JoinWindows::of_time_difference_no_grace(5)
                              .with_join_type(JoinType::RIGHT));

    join->process_right(make_record("k", "B", 10));
    join->process_left(make_record("z", "A", 20));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "null+B");
    // unmatched left records of a right join are never buffered
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, DuplicateCandidatesShareOneDelete) {
    auto join = make_join(left_join(5, 5));

    join->process_left(make_record("k", "A1", 10));
    join->process_left(make_record("k", "A2", 10));
    EXPECT_EQ(outer_store->get(TimestampedSideKey::make_left("k", 10)).size(), 2);

    auto deletes_before = outer_store->get_statistics().total_deletes;
    join->process_right(make_record("z", "B", 20));

    ASSERT_EQ(context.results.size(), 2);
    EXPECT_EQ(result_value(context.results[0]), "A1+null");
    EXPECT_EQ(result_value(context.results[1]), "A2+null");
    EXPECT_TRUE(outer_store->empty());
    EXPECT_EQ(outer_store->get_statistics().total_deletes, deletes_before + 1);
}

TEST_F(OuterJoinTest, OutOfOrderRecordWithClosedWindowEmittedImmediately) {
    auto join = make_join(left_join(5, 5));

    join->process_right(make_record("x", "B", 100));
    join->process_left(make_record("k", "A", 10));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+null");
    EXPECT_EQ(context.results[0].timestamp, 10);
    EXPECT_TRUE(outer_store->empty());
    EXPECT_EQ(join->metrics().outer_results_immediate, 1);
}

TEST_F(OuterJoinTest, WithoutOuterStoreUnmatchedEmittedImmediately) {
    auto join = make_join(left_join(5, 5), false);

    join->process_left(make_record("k", "A", 10));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+null");
    EXPECT_FALSE(join->buffers_outer_results());
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, NullKeyPassThrough) {
    auto join = make_join(left_join(5, 5));

    join->process_left(Record(std::nullopt, RecordValue(std::string("A")), 7));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_FALSE(context.results[0].key.has_value());
    EXPECT_EQ(result_value(context.results[0]), "A+null");
    EXPECT_EQ(context.results[0].timestamp, 7);
    EXPECT_EQ(left_store->size(), 0);
    EXPECT_TRUE(outer_store->empty());
    EXPECT_EQ(join->time_tracker().stream_time, 7);
    EXPECT_EQ(join->metrics().dropped_records, 0);
}

TEST_F(OuterJoinTest, NullKeyDroppedOnNonOuterSide) {
    auto join = make_join(left_join(5, 5));

    join->process_right(Record(std::nullopt, RecordValue(std::string("B")), 7));

    EXPECT_TRUE(context.results.empty());
    EXPECT_EQ(join->metrics().dropped_records, 1);
}

TEST_F(OuterJoinTest, ScanStopsAtFirstOpenWindow) {
    auto join = make_join(JoinWindows::of_time_difference_no_grace(100)
                              .with_join_type(JoinType::OUTER));

    for (int i = 0; i < 5; ++i) {
        join->process_left(make_record("a" + std::to_string(i), "A", i));
    }
    for (int i = 0; i < 100; ++i) {
        join->process_left(make_record("b" + std::to_string(i), "B", 50 + i / 2));
    }
    EXPECT_EQ(join->metrics().outer_scans, 0);
    EXPECT_EQ(outer_store->size(), 105);

    join->process_right(make_record("z", "Z", 150));

    EXPECT_EQ(context.results.size(), 5);
    EXPECT_EQ(join->metrics().outer_scans, 1);
    // five closed candidates plus the first open one
    EXPECT_EQ(join->metrics().outer_scan_steps, 6);
    EXPECT_EQ(outer_store->get_statistics().scan_steps, 6);
    EXPECT_EQ(outer_store->size(), 101);
}

TEST_F(OuterJoinTest, AsymmetricLookbackKeepsScanningOtherSide) {
    // left candidates close after 2ms, right candidates after 20ms
    auto join = make_join(JoinWindows::of_time_difference_no_grace(0)
                              .before(20).after(2)
                              .with_join_type(JoinType::OUTER));

    join->process_right(make_record("r", "R", 10));   // closes once stream time > 30
    join->process_left(make_record("l", "L", 12));    // closes once stream time > 14
    join->process_left(make_record("z", "Z", 20));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "L+null");
    EXPECT_TRUE(outer_store->contains(TimestampedSideKey::make_right("r", 10)));

    join->process_left(make_record("y", "Y", 31));

    ASSERT_EQ(context.results.size(), 3);
    EXPECT_EQ(result_value(context.results[1]), "null+R");
    EXPECT_EQ(result_value(context.results[2]), "Z+null");
}

TEST_F(OuterJoinTest, EmitIntervalThrottlesScans) {
    auto join = std::make_unique<StreamStreamJoin>(
        left_join(5, 5).with_emit_interval(100), *left_store, *right_store,
        outer_store.get(), string_joiner(), context);

    join->process_left(make_record("a", "A", 10));
    join->process_left(make_record("b", "B", 16));
    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(join->time_tracker().next_time_to_emit, 100);

    join->process_left(make_record("c", "C", 30));
    EXPECT_EQ(context.results.size(), 1);

    context.now_ms = 100;
    join->process_left(make_record("d", "D", 31));

    ASSERT_EQ(context.results.size(), 2);
    EXPECT_EQ(context.results[1].key, "b");
    EXPECT_EQ(join->metrics().outer_scans, 2);
}

TEST_F(OuterJoinTest, OnlyNewStreamTimeTriggersScan) {
    auto join = make_join(left_join(5, 5));

    join->process_left(make_record("a", "A", 10));
    join->process_right(make_record("x", "X", 12));
    join->process_right(make_record("late", "L", 1));
    EXPECT_EQ(join->metrics().outer_scans, 0);

    join->process_right(make_record("x", "X", 20));
    EXPECT_EQ(join->metrics().outer_scans, 1);
}

TEST_F(OuterJoinTest, ScanIteratorReleasedWhenForwardThrows) {
    class ThrowingContext : public CollectingContext {
    public:
        void forward(const Record&) override {
            throw std::runtime_error("sink closed");
        }
    };
    ThrowingContext throwing;
    StreamStreamJoin join(left_join(0, 5).with_emit_interval(0), *left_store, *right_store,
                          outer_store.get(), string_joiner(), throwing);

    join.process_left(make_record("1", "A", 10));
    EXPECT_THROW(join.process_right(make_record("2", "B", 16)), std::runtime_error);

    EXPECT_EQ(outer_store->open_iterators(), 0);
    // the sink failed before the candidate was deleted
    EXPECT_TRUE(outer_store->contains(TimestampedSideKey::make_left("1", 10)));
}

TEST_F(OuterJoinTest, CandidateEmittedOnceAfterSinkRecovers) {
    class FailOnceContext : public CollectingContext {
    public:
        void forward(const Record& record) override {
            if (fail_next) {
                fail_next = false;
                throw std::runtime_error("sink unavailable");
            }
            CollectingContext::forward(record);
        }
        bool fail_next = true;
    };
    FailOnceContext flaky;
    StreamStreamJoin join(left_join(0, 5).with_emit_interval(0), *left_store, *right_store,
                          outer_store.get(), string_joiner(), flaky);

    join.process_left(make_record("1", "A", 10));
    EXPECT_THROW(join.process_right(make_record("2", "B", 16)), std::runtime_error);
    EXPECT_EQ(join.time_tracker().min_time, 10);

    for (int64_t ts = 17; ts < 1000; ts += 10) {
        join.process_right(make_record("2", "B", ts));
    }

    ASSERT_EQ(flaky.results.size(), 1);
    EXPECT_EQ(flaky.results[0].key, "1");
    EXPECT_EQ(result_value(flaky.results[0]), "A+null");
    EXPECT_EQ(flaky.results[0].timestamp, 10);
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, SinkFailureKeepsEarlierDeletes) {
    class FailSecondContext : public CollectingContext {
    public:
        void forward(const Record& record) override {
            if (++calls == 2) {
                throw std::runtime_error("sink unavailable");
            }
            CollectingContext::forward(record);
        }
        int calls = 0;
    };
    FailSecondContext flaky;
    StreamStreamJoin join(left_join(0, 5).with_emit_interval(0), *left_store, *right_store,
                          outer_store.get(), string_joiner(), flaky);

    join.process_left(make_record("a", "A", 10));
    join.process_left(make_record("b", "B", 11));
    EXPECT_THROW(join.process_right(make_record("z", "Z", 20)), std::runtime_error);

    EXPECT_FALSE(outer_store->contains(TimestampedSideKey::make_left("a", 10)));
    EXPECT_TRUE(outer_store->contains(TimestampedSideKey::make_left("b", 11)));

    join.process_right(make_record("z", "Z", 21));

    ASSERT_EQ(flaky.results.size(), 2);
    EXPECT_EQ(result_value(flaky.results[0]), "A+null");
    EXPECT_EQ(result_value(flaky.results[1]), "B+null");
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, LateRecordWithinGraceIsBufferedAndJoins) {
    auto join = make_join(left_join(5, 5, 10));

    join->process_right(make_record("z", "Z", 100));
    // time_to 95 is behind stream time, but 95 + grace is not
    join->process_left(make_record("k", "A", 90));
    EXPECT_TRUE(context.results.empty());
    EXPECT_TRUE(outer_store->contains(TimestampedSideKey::make_left("k", 90)));

    join->process_right(make_record("k", "B", 92));
    join->process_right(make_record("z", "Z", 200));
    join->process_right(make_record("z", "Z", 300));

    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+B");
    EXPECT_EQ(context.results[0].timestamp, 92);
    EXPECT_EQ(join->metrics().outer_results_immediate, 0);
    EXPECT_EQ(join->metrics().outer_results_buffered, 0);
    EXPECT_TRUE(outer_store->empty());
}

TEST_F(OuterJoinTest, FastExitIgnoresNonOuterSideLookback) {
    // left look-back 10, right look-back 1; only the left side buffers
    auto join = make_join(left_join(1, 10));

    join->process_left(make_record("k", "A", 10));
    join->process_right(make_record("x", "X", 12));
    join->process_right(make_record("x", "X", 15));
    join->process_right(make_record("x", "X", 20));
    EXPECT_EQ(join->metrics().outer_scans, 0);
    EXPECT_TRUE(context.results.empty());

    join->process_right(make_record("x", "X", 21));

    EXPECT_EQ(join->metrics().outer_scans, 1);
    ASSERT_EQ(context.results.size(), 1);
    EXPECT_EQ(result_value(context.results[0]), "A+null");
}

TEST_F(OuterJoinTest, Statistics) {
    auto join = make_join(left_join(0, 5));

    join->process_left(make_record("1", "A", 10));
    join->process_right(make_record("2", "B", 16));

    auto stats = join->get_stats();
    EXPECT_EQ(stats.at("buffered_records"), 1);
    EXPECT_EQ(stats.at("outer_results_buffered"), 1);
    EXPECT_EQ(stats.at("outer_scans"), 1);
}
