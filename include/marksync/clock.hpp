/// @file clock.hpp
/// @brief Causality tracking: HybridTimestamp, HybridClock, VersionSummary.

#pragma once

#include <marksync/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace marksync {

/// A hybrid logical timestamp: (physical-time hint, logical counter, replica).
///
/// Totally ordered by (physical, logical) with the replica as the final
/// tie-breaker, so two timestamps produced by different writes never
/// compare equal. Used for last-writer-wins resolution.
struct HybridTimestamp {
    std::int64_t physical_ms{0};  ///< Wall-clock hint, milliseconds since epoch.
    std::uint64_t logical{0};     ///< Logical counter within one physical tick.
    ReplicaId replica{};          ///< The replica that produced the timestamp.

    auto operator<=>(const HybridTimestamp&) const = default;
    auto operator==(const HybridTimestamp&) const -> bool = default;
};

/// Milliseconds since the Unix epoch from the system clock.
auto system_time_ms() -> std::int64_t;

/// A hybrid logical clock for one replica.
///
/// Timestamps returned by now() are strictly increasing even when the
/// physical source stalls or moves backwards. observe() folds in remote
/// timestamps so that local writes issued after a merge order after
/// everything merged.
class HybridClock {
public:
    using TimeSource = std::function<std::int64_t()>;

    explicit HybridClock(ReplicaId replica, TimeSource source = system_time_ms);

    HybridClock(const HybridClock&) = delete;
    auto operator=(const HybridClock&) -> HybridClock& = delete;

    /// Produce a timestamp for a local event.
    auto now() -> HybridTimestamp;

    /// Advance past a timestamp received from another replica.
    void observe(const HybridTimestamp& remote);

    /// The most recent timestamp issued or observed.
    auto last() const -> HybridTimestamp;

    /// The physical time reported by the time source.
    auto physical_now() const -> std::int64_t;

    auto replica() const -> const ReplicaId& { return replica_; }

private:
    ReplicaId replica_;
    TimeSource source_;
    mutable std::mutex mutex_;
    std::int64_t physical_{0};
    std::uint64_t logical_{0};
};

/// A causal frontier: per-replica highest contiguous operation counter seen.
///
/// An entry (R, N) means operations 1..N authored by R have been observed.
/// Replicas without an entry are at 0.
class VersionSummary {
public:
    VersionSummary() = default;

    /// The highest counter seen for a replica (0 if none).
    auto get(const ReplicaId& replica) const -> std::uint64_t;

    /// Whether the operation is reflected in this summary.
    auto covers(const OpId& id) const -> bool {
        return get(id.replica) >= id.counter;
    }

    /// Raise a replica's counter (never lowers it).
    void advance(const ReplicaId& replica, std::uint64_t counter);

    /// Raise the counter for the operation's replica to the op's counter.
    void advance(const OpId& id) { advance(id.replica, id.counter); }

    /// Pointwise maximum (union of knowledge).
    void merge(const VersionSummary& other);

    /// Pointwise minimum (knowledge shared by both).
    auto meet(const VersionSummary& other) const -> VersionSummary;

    /// True if every entry of other is covered by this summary.
    auto dominates(const VersionSummary& other) const -> bool;

    /// Sum of all counters (number of operations observed).
    auto total() const -> std::uint64_t;

    auto entries() const -> const std::map<ReplicaId, std::uint64_t>& { return counters_; }
    auto empty() const -> bool { return counters_.empty(); }

    auto operator==(const VersionSummary&) const -> bool = default;

private:
    std::map<ReplicaId, std::uint64_t> counters_;
};

}  // namespace marksync
