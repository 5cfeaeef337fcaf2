#include <gtest/gtest.h>
#include "kernel/resources.hpp"

using namespace helm::kernel;
namespace util = helm::util;

namespace {

ProcessControlBlock make_pcb(const std::string& pid) {
    return ProcessControlBlock(ProcessId(pid), RequestId("req"), UserId("user"), SessionId("sess"));
}

} // namespace

// ============================================================================
// Quota checks
// ============================================================================

TEST(ResourceTrackerTest, WithinQuotaHasNoViolation) {
    ResourceTracker tracker;
    auto pcb = make_pcb("p1");
    pcb.usage.llm_calls = 3;

    EXPECT_FALSE(tracker.check_quota(pcb).has_value());
}

TEST(ResourceTrackerTest, ReportsFirstExhaustedDimension) {
    ResourceTracker tracker;
    auto pcb = make_pcb("p1");
    pcb.quota.max_llm_calls = 1;
    pcb.quota.max_tool_calls = 1;
    pcb.usage.llm_calls = 1;
    pcb.usage.tool_calls = 4;

    auto violation = tracker.check_quota(pcb);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->dimension, "llm_calls");
    EXPECT_DOUBLE_EQ(violation->usage, 1);
    EXPECT_DOUBLE_EQ(violation->limit, 1);
}

TEST(ResourceTrackerTest, RefreshesElapsedTimeBeforeChecking) {
    ResourceTracker tracker;
    auto pcb = make_pcb("p1");
    pcb.quota.timeout_seconds = 5;
    auto started = util::now();
    pcb.start(started);

    EXPECT_FALSE(tracker.check_quota(pcb, started + util::seconds(1)).has_value());

    auto violation = tracker.check_quota(pcb, started + util::seconds(6));
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->dimension, "elapsed_seconds");
    EXPECT_GE(pcb.usage.elapsed_seconds, 6.0);
}

TEST(ResourceTrackerTest, SoftLimitsOnlyWarn) {
    ResourceTracker tracker;
    auto pcb = make_pcb("p1");
    pcb.quota.max_llm_calls = 10;
    pcb.usage.llm_calls = 9;

    EXPECT_FALSE(tracker.check_quota(pcb).has_value());
    EXPECT_FALSE(tracker.check_quota(pcb).has_value());
    tracker.forget("p1");
}

// ============================================================================
// Per-user aggregates
// ============================================================================

TEST(ResourceTrackerTest, AggregatesPerUser) {
    ResourceTracker tracker;
    tracker.record_usage("alice", 2, 1, 100, 50);
    tracker.record_usage("alice", 1, 0, 10, 5);
    tracker.record_usage("bob", 4, 2, 0, 0);

    const auto* alice = tracker.get_user_usage("alice");
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->llm_calls, 3);
    EXPECT_EQ(alice->tool_calls, 1);
    EXPECT_EQ(alice->tokens_in, 110);
    EXPECT_EQ(alice->tokens_out, 55);
    EXPECT_EQ(alice->records, 2);

    auto total = tracker.system_usage();
    EXPECT_EQ(total.llm_calls, 7);
    EXPECT_EQ(total.tool_calls, 3);
    EXPECT_EQ(total.records, 3);

    EXPECT_EQ(tracker.get_user_usage("carol"), nullptr);
}

TEST(ResourceTrackerTest, CleanupDropsInactiveUsers) {
    ResourceTracker tracker;
    tracker.record_usage("alice", 1, 0, 0, 0);
    tracker.record_usage("bob", 1, 0, 0, 0);

    EXPECT_EQ(tracker.cleanup_stale_users({"alice"}, 100), 1u);
    EXPECT_NE(tracker.get_user_usage("alice"), nullptr);
    EXPECT_EQ(tracker.get_user_usage("bob"), nullptr);
}

TEST(ResourceTrackerTest, CleanupCapsEntriesByAge) {
    ResourceTracker tracker;
    auto t0 = util::now();
    tracker.record_usage("oldest", 1, 0, 0, 0, t0);
    tracker.record_usage("middle", 1, 0, 0, 0, t0 + util::seconds(1));
    tracker.record_usage("newest", 1, 0, 0, 0, t0 + util::seconds(2));

    EXPECT_EQ(tracker.cleanup_stale_users({"oldest", "middle", "newest"}, 2), 1u);
    EXPECT_EQ(tracker.user_count(), 2u);
    EXPECT_EQ(tracker.get_user_usage("oldest"), nullptr);
    EXPECT_NE(tracker.get_user_usage("newest"), nullptr);
}
