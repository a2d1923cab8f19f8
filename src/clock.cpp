#include <marksync/clock.hpp>

#include <algorithm>
#include <chrono>

namespace marksync {

auto system_time_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// -- HybridClock --------------------------------------------------------------

HybridClock::HybridClock(ReplicaId replica, TimeSource source)
    : replica_{replica}, source_{std::move(source)} {}

auto HybridClock::now() -> HybridTimestamp {
    auto lock = std::scoped_lock{mutex_};
    const auto pt = source_();
    if (pt > physical_) {
        physical_ = pt;
        logical_ = 0;
    } else {
        ++logical_;
    }
    return HybridTimestamp{.physical_ms = physical_, .logical = logical_, .replica = replica_};
}

void HybridClock::observe(const HybridTimestamp& remote) {
    auto lock = std::scoped_lock{mutex_};
    const auto pt = source_();
    const auto next = std::max({physical_, remote.physical_ms, pt});
    if (next == physical_ && next == remote.physical_ms) {
        logical_ = std::max(logical_, remote.logical) + 1;
    } else if (next == physical_) {
        ++logical_;
    } else if (next == remote.physical_ms) {
        logical_ = remote.logical + 1;
    } else {
        logical_ = 0;
    }
    physical_ = next;
}

auto HybridClock::last() const -> HybridTimestamp {
    auto lock = std::scoped_lock{mutex_};
    return HybridTimestamp{.physical_ms = physical_, .logical = logical_, .replica = replica_};
}

auto HybridClock::physical_now() const -> std::int64_t {
    return source_();
}

// -- VersionSummary -----------------------------------------------------------

auto VersionSummary::get(const ReplicaId& replica) const -> std::uint64_t {
    auto it = counters_.find(replica);
    return it != counters_.end() ? it->second : 0;
}

void VersionSummary::advance(const ReplicaId& replica, std::uint64_t counter) {
    if (counter == 0) return;
    auto& current = counters_[replica];
    current = std::max(current, counter);
}

void VersionSummary::merge(const VersionSummary& other) {
    for (const auto& [replica, counter] : other.counters_) {
        advance(replica, counter);
    }
}

auto VersionSummary::meet(const VersionSummary& other) const -> VersionSummary {
    auto result = VersionSummary{};
    for (const auto& [replica, counter] : counters_) {
        result.advance(replica, std::min(counter, other.get(replica)));
    }
    return result;
}

auto VersionSummary::dominates(const VersionSummary& other) const -> bool {
    return std::ranges::all_of(other.counters_, [this](const auto& entry) {
        return get(entry.first) >= entry.second;
    });
}

auto VersionSummary::total() const -> std::uint64_t {
    auto sum = std::uint64_t{0};
    for (const auto& [replica, counter] : counters_) sum += counter;
    return sum;
}

}  // namespace marksync
