#include <gtest/gtest.h>
#include "aggregation/ResultAggregator.hpp"

using namespace data_agent;

TEST(ResultAggregator, LaterObjectOverwritesEarlierKeys) {
    ResultAggregator agg;
    agg.fold(0, R"({"x": 1, "y": "a"})");
    agg.fold(1, R"({"x": 2})");
    EXPECT_EQ(agg.interim()["x"], 2);
    EXPECT_EQ(agg.interim()["y"], "a");
}

TEST(ResultAggregator, NonObjectOutputIsStoredRaw) {
    ResultAggregator agg;
    agg.fold(2, "hello");
    agg.fold(3, "[1, 2]");
    agg.fold(4, "");
    EXPECT_EQ(agg.interim()["block_2_raw"], "hello");
    EXPECT_EQ(agg.interim()["block_3_raw"], "[1, 2]");
    EXPECT_EQ(agg.interim()["block_4_raw"], "");
}

TEST(ResultAggregator, SurroundingWhitespaceStillParses) {
    ResultAggregator agg;
    agg.fold(0, "\n  {\"sum\": 42}\n");
    EXPECT_EQ(agg.interim()["sum"], 42);
}

TEST(ResultAggregator, RecordsFailures) {
    ResultAggregator agg;
    agg.record_failure(1, "boom", 2, false, "Traceback...");
    const auto& e = agg.interim()["block_1_error"];
    EXPECT_EQ(e["error"], "boom");
    EXPECT_EQ(e["exit_code"], 2);
    EXPECT_EQ(e["timed_out"], false);
    EXPECT_EQ(e["output"], "Traceback...");
}

TEST(OrderedResultBuffer, MergesInPlanOrderRegardlessOfArrival) {
    OrderedResultBuffer buf(3);
    buf.put(2, {true, R"({"k": "third"})"});
    buf.put(0, {true, R"({"k": "first"})"});
    buf.put(1, {false, "partial", "exit 1", 1, false});

    ResultAggregator agg;
    buf.drain_into(agg);
    EXPECT_EQ(agg.interim()["k"], "third");
    EXPECT_EQ(agg.interim()["block_1_error"]["output"], "partial");
    EXPECT_THROW(buf.put(3, {}), std::out_of_range);
}
