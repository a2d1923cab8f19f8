#include <marksync/delta_log.hpp>

#include <algorithm>
#include <ranges>
#include <utility>

namespace marksync {

void DeltaLog::append(Operation op, std::uint64_t lsn) {
    summary_.advance(op.id);
    if (!purged_.contains(op.document)) {
        latest_[op.document] = op.id;
    }
    entries_.push_back(LogEntry{.lsn = lsn, .op = std::move(op)});
    ++since_checkpoint_;
}

auto DeltaLog::dependencies_satisfied(const Operation& op) const -> bool {
    if (op.id.counter != summary_.get(op.id.replica) + 1) return false;
    return std::ranges::all_of(op.deps, [&](const OpId& dep) {
        return summary_.covers(dep);
    });
}

auto DeltaLog::latest_for(const Identifier& document) const -> std::optional<OpId> {
    auto it = latest_.find(document);
    if (it == latest_.end()) return std::nullopt;
    return it->second;
}

auto DeltaLog::delta_since(const VersionSummary& peer) const -> Delta {
    auto delta = Delta{};
    if (!frontier_.empty() && !peer.dominates(frontier_)) {
        delta.base = checkpoint();
    } else if (!purged_.empty()) {
        // A peer past the frontier may still hold a purged document,
        // revived by an edit made after it saw the tombstone.
        delta.base = Snapshot{.frontier = {}, .documents = {}, .purged = {}};
        delta.base->purged.assign(purged_.begin(), purged_.end());
    }
    for (const auto& entry : entries_) {
        if (!peer.covers(entry.op.id)) {
            delta.ops.push_back(entry.op);
        }
    }
    return delta;
}

auto DeltaLog::checkpoint() const -> Snapshot {
    auto snapshot = Snapshot{.frontier = frontier_, .documents = {}, .purged = {}};
    snapshot.documents.reserve(folded_.size());
    for (const auto& [_, doc] : folded_) {
        snapshot.documents.push_back(doc);
    }
    snapshot.purged.assign(purged_.begin(), purged_.end());
    return snapshot;
}

auto DeltaLog::needs_compaction(const CompactionPolicy& policy) const -> bool {
    return entries_.size() >= policy.max_log_ops
        || since_checkpoint_ >= policy.checkpoint_interval_ops;
}

auto DeltaLog::compact(const VersionSummary& stable) -> CompactionResult {
    auto result = CompactionResult{};
    const auto bound = stable.meet(summary_);

    auto kept = std::vector<LogEntry>{};
    kept.reserve(entries_.size());
    for (auto& entry : entries_) {
        if (!bound.covers(entry.op.id)) {
            kept.push_back(std::move(entry));
            continue;
        }
        result.dropped_lsns.push_back(entry.lsn);
        ++result.folded_ops;
        if (purged_.contains(entry.op.document)) continue;

        auto [it, _] = folded_.try_emplace(entry.op.document, entry.op.document);
        // Unknown kinds come back as unknown_field but are still preserved.
        if (auto err = it->second.apply_operation(entry.op);
            err && err->kind != ErrorKind::unknown_field) {
            throw Exception{*err};
        }
    }
    entries_ = std::move(kept);
    frontier_.merge(bound);

    auto pending = std::set<Identifier>{};
    for (const auto& entry : entries_) {
        pending.insert(entry.op.document);
    }
    auto tombstones = std::vector<Identifier>{};
    for (const auto& [id, doc] : folded_) {
        if (doc.deleted() && !pending.contains(id)) {
            tombstones.push_back(id);
        }
    }
    for (const auto& id : tombstones) {
        purge(id);
        result.purged.push_back(id);
    }

    since_checkpoint_ = 0;
    return result;
}

auto DeltaLog::install_snapshot(const Snapshot& snapshot) -> std::vector<std::uint64_t> {
    for (const auto& id : snapshot.purged) {
        purge(id);
    }
    for (const auto& doc : snapshot.documents) {
        if (purged_.contains(doc.id())) continue;
        auto [it, inserted] = folded_.try_emplace(doc.id(), doc);
        if (!inserted) it->second.merge(doc);
    }
    frontier_.merge(snapshot.frontier);
    summary_.merge(snapshot.frontier);

    auto dropped = std::vector<std::uint64_t>{};
    std::erase_if(entries_, [&](const LogEntry& entry) {
        if (!frontier_.covers(entry.op.id)) return false;
        dropped.push_back(entry.lsn);
        return true;
    });
    return dropped;
}

void DeltaLog::purge(const Identifier& id) {
    folded_.erase(id);
    latest_.erase(id);
    purged_.insert(id);
}

}  // namespace marksync
