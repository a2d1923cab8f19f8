/// @file delta_log.hpp
/// @brief Append-only operation log, checkpoints and compaction.

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/config.hpp>
#include <marksync/op.hpp>
#include <marksync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace marksync {

/// Folded history: document states reflecting every operation covered by
/// the frontier, plus the identifiers of purged tombstones.
struct Snapshot {
    VersionSummary frontier;
    std::vector<BookmarkDocument> documents;  ///< Ascending by id.
    std::vector<Identifier> purged;           ///< Ascending.

    auto empty() const -> bool {
        return frontier.empty() && documents.empty() && purged.empty();
    }

    auto operator==(const Snapshot&) const -> bool = default;
};

/// What one replica sends another: an optional checkpoint the peer has
/// not fully seen, followed by operations in causal order.
struct Delta {
    std::optional<Snapshot> base;
    std::vector<Operation> ops;

    auto empty() const -> bool { return !base && ops.empty(); }

    auto operator==(const Delta&) const -> bool = default;
};

/// An operation with its log sequence number (its storage key).
struct LogEntry {
    std::uint64_t lsn{0};
    Operation op;
};

/// Outcome of a compaction pass.
struct CompactionResult {
    std::size_t folded_ops{0};                ///< Operations moved into the checkpoint.
    std::vector<Identifier> purged;           ///< Tombstones physically dropped.
    std::vector<std::uint64_t> dropped_lsns;  ///< Log entries no longer needed.
};

/// The delta log of one replica.
///
/// Entries are kept in application order, which is a causal order: an
/// operation is appended only after all its dependencies. The summary
/// covers exactly the appended operations plus everything folded into the
/// checkpoint, so it doubles as the de-duplication index.
class DeltaLog {
public:
    DeltaLog() = default;

    /// Append an operation whose dependencies are satisfied.
    void append(Operation op, std::uint64_t lsn);

    auto summary() const -> const VersionSummary& { return summary_; }

    /// Whether an operation has already been recorded.
    auto contains(const OpId& id) const -> bool { return summary_.covers(id); }

    /// Whether op is the author's next operation and all its deps are known.
    auto dependencies_satisfied(const Operation& op) const -> bool;

    /// The most recent operation recorded for a document.
    auto latest_for(const Identifier& document) const -> std::optional<OpId>;

    /// Everything the peer is missing, in causal order. The purged set always
    /// travels: a peer that already dominates the frontier gets a base
    /// carrying only the purged identifiers.
    auto delta_since(const VersionSummary& peer) const -> Delta;

    auto entries() const -> const std::vector<LogEntry>& { return entries_; }
    auto size() const -> std::size_t { return entries_.size(); }
    auto appended_since_checkpoint() const -> std::size_t { return since_checkpoint_; }

    /// The frontier below which history has been folded.
    auto frontier() const -> const VersionSummary& { return frontier_; }

    /// The checkpoint as a transmittable snapshot.
    auto checkpoint() const -> Snapshot;

    auto is_purged(const Identifier& id) const -> bool { return purged_.contains(id); }

    auto needs_compaction(const CompactionPolicy& policy) const -> bool;

    /// Fold every operation covered by stable into the checkpoint and purge
    /// tombstones whose entire history is stable. stable is clamped to the
    /// local summary.
    auto compact(const VersionSummary& stable) -> CompactionResult;

    /// Merge a checkpoint received from a peer (or loaded from storage).
    /// @return The lsns of local entries now covered by the merged frontier.
    auto install_snapshot(const Snapshot& snapshot) -> std::vector<std::uint64_t>;

private:
    void purge(const Identifier& id);

    std::vector<LogEntry> entries_;
    VersionSummary summary_;
    VersionSummary frontier_;
    std::map<Identifier, OpId> latest_;
    std::map<Identifier, BookmarkDocument> folded_;
    std::set<Identifier> purged_;
    std::size_t since_checkpoint_{0};
};

}  // namespace marksync
