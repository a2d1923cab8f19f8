#include <marksync/clock.hpp>

#include <gtest/gtest.h>

using namespace marksync;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

}  // namespace

// -- HybridTimestamp ----------------------------------------------------------

TEST(HybridTimestamp, orders_by_physical_then_logical_then_replica) {
    const auto a = HybridTimestamp{.physical_ms = 10, .logical = 5, .replica = replica(9)};
    const auto b = HybridTimestamp{.physical_ms = 11, .logical = 0, .replica = replica(1)};
    const auto c = HybridTimestamp{.physical_ms = 11, .logical = 1, .replica = replica(1)};
    const auto d = HybridTimestamp{.physical_ms = 11, .logical = 1, .replica = replica(2)};

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_LT(c, d);
}

// -- HybridClock --------------------------------------------------------------

TEST(HybridClock, now_is_strictly_increasing_with_stalled_time) {
    auto clock = HybridClock{replica(1), [] { return std::int64_t{1000}; }};
    auto prev = clock.now();
    for (int i = 0; i < 100; ++i) {
        auto next = clock.now();
        EXPECT_LT(prev, next);
        prev = next;
    }
    EXPECT_EQ(prev.physical_ms, 1000);
}

TEST(HybridClock, now_survives_clock_moving_backwards) {
    auto time = std::int64_t{5000};
    auto clock = HybridClock{replica(1), [&] { return time; }};
    const auto first = clock.now();
    time = 100;
    const auto second = clock.now();

    EXPECT_LT(first, second);
    EXPECT_EQ(second.physical_ms, 5000);
}

TEST(HybridClock, now_resets_logical_when_time_advances) {
    auto time = std::int64_t{10};
    auto clock = HybridClock{replica(1), [&] { return time; }};
    (void)clock.now();
    (void)clock.now();
    time = 20;
    const auto ts = clock.now();
    EXPECT_EQ(ts.physical_ms, 20);
    EXPECT_EQ(ts.logical, 0u);
}

TEST(HybridClock, observe_orders_later_writes_after_remote) {
    auto clock = HybridClock{replica(1), [] { return std::int64_t{100}; }};
    const auto remote = HybridTimestamp{.physical_ms = 900, .logical = 7, .replica = replica(2)};

    clock.observe(remote);
    const auto local = clock.now();

    EXPECT_LT(remote, local);
    EXPECT_EQ(local.replica, replica(1));
}

TEST(HybridClock, observe_with_older_remote_still_advances) {
    auto clock = HybridClock{replica(1), [] { return std::int64_t{500}; }};
    const auto before = clock.now();
    clock.observe(HybridTimestamp{.physical_ms = 10, .logical = 0, .replica = replica(2)});
    EXPECT_LT(before, clock.last());
}

// -- VersionSummary -----------------------------------------------------------

TEST(VersionSummary, empty_summary_covers_nothing) {
    const auto vs = VersionSummary{};
    EXPECT_TRUE(vs.empty());
    EXPECT_EQ(vs.get(replica(1)), 0u);
    EXPECT_FALSE(vs.covers(OpId{1, replica(1)}));
}

TEST(VersionSummary, advance_never_lowers) {
    auto vs = VersionSummary{};
    vs.advance(replica(1), 5);
    vs.advance(replica(1), 3);
    EXPECT_EQ(vs.get(replica(1)), 5u);
    EXPECT_TRUE(vs.covers(OpId{5, replica(1)}));
    EXPECT_FALSE(vs.covers(OpId{6, replica(1)}));
}

TEST(VersionSummary, advance_to_zero_adds_no_entry) {
    auto vs = VersionSummary{};
    vs.advance(replica(1), 0);
    EXPECT_TRUE(vs.empty());
}

TEST(VersionSummary, merge_is_pointwise_max) {
    auto a = VersionSummary{};
    a.advance(replica(1), 5);
    a.advance(replica(2), 1);
    auto b = VersionSummary{};
    b.advance(replica(1), 2);
    b.advance(replica(3), 4);

    a.merge(b);
    EXPECT_EQ(a.get(replica(1)), 5u);
    EXPECT_EQ(a.get(replica(2)), 1u);
    EXPECT_EQ(a.get(replica(3)), 4u);
    EXPECT_EQ(a.total(), 10u);
}

TEST(VersionSummary, meet_is_pointwise_min) {
    auto a = VersionSummary{};
    a.advance(replica(1), 5);
    a.advance(replica(2), 3);
    auto b = VersionSummary{};
    b.advance(replica(1), 2);

    const auto m = a.meet(b);
    EXPECT_EQ(m.get(replica(1)), 2u);
    EXPECT_EQ(m.get(replica(2)), 0u);
    EXPECT_EQ(m.entries().size(), 1u);
}

TEST(VersionSummary, dominates) {
    auto a = VersionSummary{};
    a.advance(replica(1), 5);
    a.advance(replica(2), 3);
    auto b = VersionSummary{};
    b.advance(replica(1), 5);

    EXPECT_TRUE(a.dominates(b));
    EXPECT_FALSE(b.dominates(a));
    EXPECT_TRUE(a.dominates(VersionSummary{}));
    EXPECT_TRUE(a.dominates(a));
}
