/// @file replica_store.hpp
/// @brief ReplicaStore: one device's bookmark collection and delta log.
///
/// All writes (local mutations, remote operations, snapshots, compaction)
/// are serialised on one writer lock. Readers take a shared lock only long
/// enough to copy a document pointer or the document table, so queries run
/// in parallel with writes and never observe a half-applied operation.
///
/// @code
/// auto store = marksync::ReplicaStore{};
/// auto id = store.create({.url = "https://a.example", .tags = {"x"}});
/// store.set_title(id, "Example");
/// for (const auto& doc : store.list_active()) { ... }
/// @endcode

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/config.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/error.hpp>
#include <marksync/op.hpp>
#include <marksync/storage.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace marksync {

/// Delivered to subscribers after every change to a document.
struct ChangeNotification {
    Identifier id;
    std::shared_ptr<const BookmarkDocument> document;  ///< Null once purged.
    bool deleted{false};
    std::uint64_t sequence{0};  ///< Strictly increasing per store.
};

using ChangeListener = std::function<void(const ChangeNotification&)>;

/// Outcome of applying one remote operation.
enum class ApplyStatus : std::uint8_t {
    applied,             ///< Recorded and applied.
    duplicate,           ///< Already known; nothing changed.
    missing_dependency,  ///< A dependency is unknown; retry once it arrives.
    discarded,           ///< Recorded, but the target document was purged.
};

constexpr auto to_string_view(ApplyStatus status) noexcept -> std::string_view {
    switch (status) {
        case ApplyStatus::applied:            return "applied";
        case ApplyStatus::duplicate:          return "duplicate";
        case ApplyStatus::missing_dependency: return "missing_dependency";
        case ApplyStatus::discarded:          return "discarded";
    }
    return "unknown";
}

/// A restartable, read-only view over a consistent copy of the document
/// table. Iterating twice yields the same documents.
class DocumentView {
public:
    using Table = std::map<Identifier, std::shared_ptr<const BookmarkDocument>>;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = BookmarkDocument;
        using difference_type = std::ptrdiff_t;
        using pointer = const BookmarkDocument*;
        using reference = const BookmarkDocument&;

        iterator() = default;

        auto operator*() const -> reference { return *it_->second; }
        auto operator->() const -> pointer { return it_->second.get(); }

        auto operator++() -> iterator& {
            ++it_;
            skip();
            return *this;
        }

        auto operator++(int) -> iterator {
            auto copy = *this;
            ++*this;
            return copy;
        }

        auto operator==(const iterator& other) const -> bool { return it_ == other.it_; }

    private:
        friend class DocumentView;

        iterator(Table::const_iterator it, Table::const_iterator end, bool active_only)
            : it_{it}, end_{end}, active_only_{active_only} { skip(); }

        void skip() {
            while (active_only_ && it_ != end_ && it_->second->deleted()) ++it_;
        }

        Table::const_iterator it_{};
        Table::const_iterator end_{};
        bool active_only_{true};
    };

    DocumentView(std::shared_ptr<const Table> table, bool active_only)
        : table_{std::move(table)}, active_only_{active_only} {}

    auto begin() const -> iterator { return {table_->begin(), table_->end(), active_only_}; }
    auto end() const -> iterator { return {table_->end(), table_->end(), active_only_}; }

    /// Number of documents the view yields.
    auto size() const -> std::size_t {
        return static_cast<std::size_t>(std::distance(begin(), end()));
    }

    auto empty() const -> bool { return begin() == end(); }

private:
    std::shared_ptr<const Table> table_;
    bool active_only_;
};

/// The full state of one replica.
class ReplicaStore {
public:
    using TimeSource = HybridClock::TimeSource;

    /// An ephemeral replica (no persistence).
    explicit ReplicaStore(ReplicaId replica = ReplicaId::generate(),
                          EngineConfig config = {},
                          TimeSource time = system_time_ms);

    /// A replica persisting every operation to storage. The storage must
    /// be empty or belong to the same replica; use open() to restore.
    ReplicaStore(ReplicaId replica, EngineConfig config,
                 std::shared_ptr<Storage> storage,
                 TimeSource time = system_time_ms);

    ReplicaStore(const ReplicaStore&) = delete;
    auto operator=(const ReplicaStore&) -> ReplicaStore& = delete;

    /// Restore a replica from storage (or create one in empty storage).
    /// @throws Exception{storage_failure} on I/O errors or corrupt records.
    static auto open(std::shared_ptr<Storage> storage,
                     EngineConfig config = {},
                     TimeSource time = system_time_ms) -> std::unique_ptr<ReplicaStore>;

    // -- Local writes ---------------------------------------------------------
    //
    // Each write records one operation per field, persists it, applies it
    // and notifies subscribers. Storage failures throw before any in-memory
    // state changes.

    /// Create a bookmark from initial fields; returns its new identifier.
    ///
    /// All field operations are persisted before any is applied. If storage
    /// fails partway the records already written are removed and nothing is
    /// applied or notified. A failure of that removal is logged, and the
    /// written prefix reappears on the next open().
    auto create(const BookmarkFields& fields) -> Identifier;

    /// Apply one field mutation to an existing document.
    ///
    /// A RemoveTag with no observed tags removes every tag instance this
    /// replica currently sees.
    /// @return not_found if the document is unknown or purged;
    ///   unknown_field for an opaque mutation (still recorded).
    auto mutate(const Identifier& id, Mutation mutation) -> std::optional<Error>;

    auto set_url(const Identifier& id, std::string url) -> std::optional<Error>;
    auto set_title(const Identifier& id, std::optional<std::string> title) -> std::optional<Error>;
    auto add_tag(const Identifier& id, std::string tag) -> std::optional<Error>;
    auto remove_tag(const Identifier& id, std::string tag) -> std::optional<Error>;
    auto set_metadata(const Identifier& id, std::string key, Value value) -> std::optional<Error>;
    auto set_embedding(const Identifier& id, std::optional<Vector> embedding) -> std::optional<Error>;

    /// Mark a document deleted (a tombstone).
    auto remove(const Identifier& id) -> std::optional<Error>;

    // -- Remote writes --------------------------------------------------------

    /// Apply an operation received from a peer.
    auto apply_remote(const Operation& op) -> ApplyStatus;

    /// Merge a checkpoint received from a peer.
    void apply_snapshot(const Snapshot& snapshot);

    // -- Reads ----------------------------------------------------------------

    /// The document, tombstones included; null if unknown or purged.
    auto get(const Identifier& id) const -> std::shared_ptr<const BookmarkDocument>;

    /// Documents not marked deleted, ascending by id.
    auto list_active() const -> DocumentView;

    /// Every document including tombstones, ascending by id.
    auto list_all() const -> DocumentView;

    auto size() const -> std::size_t;
    auto active_count() const -> std::size_t;

    auto replica_id() const -> const ReplicaId& { return replica_; }
    auto config() const -> const EngineConfig& { return config_; }
    auto summary() const -> VersionSummary;

    /// CRC-32 of the canonical encoding of the active documents.
    auto digest() const -> std::uint32_t;

    /// Whether a document's tombstone has been purged by compaction.
    auto is_purged(const Identifier& id) const -> bool;

    /// Operations currently retained in the delta log.
    auto log_size() const -> std::size_t;

    // -- Sync support ---------------------------------------------------------

    /// Everything the peer is missing.
    auto delta_since(const VersionSummary& peer) const -> Delta;

    /// Record that a peer has observed everything in its summary.
    void acknowledge(const ReplicaId& peer, const VersionSummary& summary);

    /// Pointwise minimum of this replica's summary and the acknowledged
    /// summaries of every other replica it has heard of.
    auto stable_frontier() const -> VersionSummary;

    /// Fold stable history into the checkpoint and purge stable tombstones.
    auto compact() -> CompactionResult;

    /// compact() if the configured policy says the log has grown enough.
    auto maybe_compact() -> std::optional<CompactionResult>;

    // -- Change notifications -------------------------------------------------

    /// Register a listener. Listeners run synchronously on the writing
    /// thread, in the order changes are produced, and must not write to
    /// this store.
    auto subscribe(ChangeListener listener) -> std::uint64_t;
    void unsubscribe(std::uint64_t subscription);

private:
    using WriteLock = std::unique_lock<std::mutex>;

    auto next_op(const Identifier& document, Mutation mutation) -> Operation;
    auto record(const Operation& op, bool apply) -> std::optional<Error>;
    void persist(const Operation& op, std::uint64_t lsn, const VersionSummary& summary);
    void persist_all(const std::vector<Operation>& ops, const VersionSummary& summary);
    void persist_checkpoint(const DeltaLog& log, const std::vector<std::uint64_t>& dropped);
    void notify(const std::vector<ChangeNotification>& changes);
    auto stable_frontier_locked() const -> VersionSummary;
    void restore();

    ReplicaId replica_;
    EngineConfig config_;
    HybridClock clock_;
    std::shared_ptr<Storage> storage_;

    mutable std::mutex write_mutex_;          // serialises writers
    mutable std::shared_mutex data_mutex_;    // guards the fields below
    DocumentView::Table documents_;
    DeltaLog log_;
    std::map<ReplicaId, VersionSummary> acknowledged_;
    std::uint64_t next_lsn_{1};
    std::uint64_t sequence_{0};

    mutable std::mutex listener_mutex_;
    std::map<std::uint64_t, ChangeListener> listeners_;
    std::uint64_t next_listener_{1};
};

}  // namespace marksync
