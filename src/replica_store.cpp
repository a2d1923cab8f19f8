#include <marksync/replica_store.hpp>

#include <marksync/codec.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace marksync {

namespace {

constexpr auto replica_key = std::string_view{"meta/replica"};
constexpr auto summary_key = std::string_view{"meta/summary"};
constexpr auto checkpoint_key = std::string_view{"checkpoint"};
constexpr auto log_prefix = std::string_view{"log/"};
constexpr auto ack_prefix = std::string_view{"meta/ack/"};

auto log_key(std::uint64_t lsn) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto key = std::string{log_prefix};
    for (int shift = 60; shift >= 0; shift -= 4) {
        key.push_back(digits[(lsn >> shift) & 0xF]);
    }
    return key;
}

auto parse_lsn(std::string_view key) -> std::optional<std::uint64_t> {
    key.remove_prefix(log_prefix.size());
    if (key.size() != 16) return std::nullopt;
    auto lsn = std::uint64_t{0};
    for (auto c : key) {
        lsn <<= 4;
        if (c >= '0' && c <= '9') lsn |= static_cast<std::uint64_t>(c - '0');
        else if (c >= 'a' && c <= 'f') lsn |= static_cast<std::uint64_t>(c - 'a' + 10);
        else return std::nullopt;
    }
    return lsn;
}

auto corrupt(std::string what) -> Exception {
    return Exception{ErrorKind::storage_failure, "corrupt record: " + std::move(what)};
}

}  // anonymous namespace

// -- Construction -------------------------------------------------------------

ReplicaStore::ReplicaStore(ReplicaId replica, EngineConfig config, TimeSource time)
    : replica_{replica}
    , config_{validate(std::move(config))}
    , clock_{replica, std::move(time)} {}

ReplicaStore::ReplicaStore(ReplicaId replica, EngineConfig config,
                           std::shared_ptr<Storage> storage, TimeSource time)
    : ReplicaStore{replica, std::move(config), std::move(time)} {
    storage_ = std::move(storage);
    if (!storage_) return;
    if (auto existing = storage_->get(replica_key)) {
        if (existing->size() != ReplicaId::size
            || std::memcmp(existing->data(), replica_.bytes.data(), ReplicaId::size) != 0) {
            throw Exception{ErrorKind::storage_failure, "storage belongs to another replica"};
        }
    } else {
        storage_->put(replica_key, Bytes(replica_.bytes.begin(), replica_.bytes.end()));
    }
}

auto ReplicaStore::open(std::shared_ptr<Storage> storage, EngineConfig config,
                        TimeSource time) -> std::unique_ptr<ReplicaStore> {
    if (!storage) throw Exception{ErrorKind::storage_failure, "no storage given"};

    auto replica = ReplicaId::generate();
    if (auto bytes = storage->get(replica_key)) {
        if (bytes->size() != ReplicaId::size) throw corrupt(std::string{replica_key});
        std::memcpy(replica.bytes.data(), bytes->data(), ReplicaId::size);
    }

    auto store = std::make_unique<ReplicaStore>(replica, std::move(config),
                                                std::move(storage), std::move(time));
    store->restore();
    return store;
}

void ReplicaStore::restore() {
    auto lock = WriteLock{write_mutex_};
    auto data = std::unique_lock{data_mutex_};

    if (auto bytes = storage_->get(checkpoint_key)) {
        auto snapshot = decode_snapshot(*bytes);
        if (!snapshot) throw corrupt(std::string{checkpoint_key});
        static_cast<void>(log_.install_snapshot(*snapshot));
        for (const auto& doc : snapshot->documents) {
            if (log_.is_purged(doc.id())) continue;
            clock_.observe(doc.updated_at());
            documents_[doc.id()] = std::make_shared<const BookmarkDocument>(doc);
        }
    }

    auto replayed = std::size_t{0};
    for (auto& [key, bytes] : storage_->scan(log_prefix)) {
        auto lsn = parse_lsn(key);
        auto op = decode_operation(bytes);
        if (!lsn || !op) throw corrupt(key);
        next_lsn_ = std::max(next_lsn_, *lsn + 1);
        if (log_.contains(op->id)) continue;
        if (!log_.dependencies_satisfied(*op)) {
            throw corrupt(key + " precedes its dependencies");
        }
        clock_.observe(op->timestamp);
        if (!log_.is_purged(op->document)) {
            auto it = documents_.find(op->document);
            auto next = it == documents_.end()
                ? std::make_shared<BookmarkDocument>(op->document)
                : std::make_shared<BookmarkDocument>(*it->second);
            static_cast<void>(next->apply_operation(*op));
            documents_[op->document] = std::move(next);
        }
        log_.append(std::move(*op), *lsn);
        ++replayed;
    }

    for (const auto& [key, bytes] : storage_->scan(ack_prefix)) {
        auto peer = parse_replica_id(std::string_view{key}.substr(ack_prefix.size()));
        auto summary = decode_summary(bytes);
        if (!peer || !summary) throw corrupt(key);
        acknowledged_[*peer] = std::move(*summary);
    }

    if (auto bytes = storage_->get(summary_key)) {
        auto stored = decode_summary(*bytes);
        if (!stored) throw corrupt(std::string{summary_key});
        if (!log_.summary().dominates(*stored)) {
            SPDLOG_WARN("replica {}: stored summary is ahead of the replayed log", to_hex(replica_));
        }
    }

    SPDLOG_INFO("restored replica {}: {} documents, {} log ops replayed",
                to_hex(replica_), documents_.size(), replayed);
}

// -- Local writes -------------------------------------------------------------

auto ReplicaStore::next_op(const Identifier& document, Mutation mutation) -> Operation {
    const auto counter = log_.summary().get(replica_) + 1;
    auto op = Operation{
        .id = OpId{counter, replica_},
        .timestamp = clock_.now(),
        .document = document,
        .mutation = std::move(mutation),
        .deps = {},
    };
    if (counter > 1) op.deps.push_back(OpId{counter - 1, replica_});
    if (auto latest = log_.latest_for(document); latest && latest->replica != replica_) {
        op.deps.push_back(*latest);
    }
    return op;
}

auto ReplicaStore::create(const BookmarkFields& fields) -> Identifier {
    auto lock = WriteLock{write_mutex_};
    const auto id = Identifier::generate();

    auto mutations = std::vector<Mutation>{SetUrl{fields.url}};
    if (fields.title) mutations.emplace_back(SetTitle{fields.title});
    for (const auto& tag : fields.tags) mutations.emplace_back(AddTag{tag});
    for (const auto& [key, value] : fields.metadata) {
        mutations.emplace_back(SetMetadataField{key, value});
    }
    if (fields.embedding) mutations.emplace_back(SetEmbedding{fields.embedding});

    // Every field is persisted before any is applied, so a bookmark is
    // never left half created.
    auto summary = log_.summary();
    auto ops = std::vector<Operation>{};
    auto states = std::vector<std::shared_ptr<BookmarkDocument>>{};
    auto state = std::make_shared<BookmarkDocument>(id);
    for (auto& mutation : mutations) {
        auto op = Operation{
            .id = OpId{summary.get(replica_) + 1, replica_},
            .timestamp = clock_.now(),
            .document = id,
            .mutation = std::move(mutation),
            .deps = {},
        };
        if (op.id.counter > 1) op.deps.push_back(OpId{op.id.counter - 1, replica_});
        summary.advance(op.id);

        state = std::make_shared<BookmarkDocument>(*state);
        if (auto err = state->apply_operation(op)) {
            SPDLOG_WARN("replica {}: {} on {}; kept as opaque metadata",
                        to_hex(replica_), err->message, to_string(id));
        }
        states.push_back(state);
        ops.push_back(std::move(op));
    }
    persist_all(ops, summary);

    auto changes = std::vector<ChangeNotification>{};
    {
        auto data = std::unique_lock{data_mutex_};
        for (std::size_t i = 0; i < ops.size(); ++i) {
            log_.append(std::move(ops[i]), next_lsn_++);
            changes.push_back(ChangeNotification{
                .id = id, .document = states[i], .deleted = false, .sequence = ++sequence_});
        }
        documents_[id] = state;
    }
    notify(changes);
    SPDLOG_DEBUG("replica {} created {}", to_hex(replica_), to_string(id));
    return id;
}

auto ReplicaStore::mutate(const Identifier& id, Mutation mutation) -> std::optional<Error> {
    auto lock = WriteLock{write_mutex_};
    auto it = documents_.find(id);
    if (it == documents_.end()) {
        return Error{ErrorKind::not_found, "no document " + to_string(id)};
    }
    if (auto* remove = std::get_if<RemoveTag>(&mutation); remove && remove->observed.empty()) {
        remove->observed = it->second->tag_set().live_tags(remove->tag);
    }
    return record(next_op(id, std::move(mutation)), true);
}

auto ReplicaStore::set_url(const Identifier& id, std::string url) -> std::optional<Error> {
    return mutate(id, SetUrl{std::move(url)});
}

auto ReplicaStore::set_title(const Identifier& id, std::optional<std::string> title)
    -> std::optional<Error> {
    return mutate(id, SetTitle{std::move(title)});
}

auto ReplicaStore::add_tag(const Identifier& id, std::string tag) -> std::optional<Error> {
    return mutate(id, AddTag{std::move(tag)});
}

auto ReplicaStore::remove_tag(const Identifier& id, std::string tag) -> std::optional<Error> {
    return mutate(id, RemoveTag{std::move(tag), {}});
}

auto ReplicaStore::set_metadata(const Identifier& id, std::string key, Value value)
    -> std::optional<Error> {
    return mutate(id, SetMetadataField{std::move(key), std::move(value)});
}

auto ReplicaStore::set_embedding(const Identifier& id, std::optional<Vector> embedding)
    -> std::optional<Error> {
    return mutate(id, SetEmbedding{std::move(embedding)});
}

auto ReplicaStore::remove(const Identifier& id) -> std::optional<Error> {
    return mutate(id, SetDeleted{true});
}

// Requires the write lock. Persists first so a storage failure leaves
// memory untouched.
auto ReplicaStore::record(const Operation& op, bool apply) -> std::optional<Error> {
    auto next = std::shared_ptr<BookmarkDocument>{};
    auto result = std::optional<Error>{};
    if (apply) {
        auto it = documents_.find(op.document);
        next = it == documents_.end()
            ? std::make_shared<BookmarkDocument>(op.document)
            : std::make_shared<BookmarkDocument>(*it->second);
        result = next->apply_operation(op);
        if (result) {
            SPDLOG_WARN("replica {}: {} on {}; kept as opaque metadata",
                        to_hex(replica_), result->message, to_string(op.document));
        }
    }

    auto summary = log_.summary();
    summary.advance(op.id);
    const auto lsn = next_lsn_;
    persist(op, lsn, summary);

    auto changes = std::vector<ChangeNotification>{};
    {
        auto data = std::unique_lock{data_mutex_};
        log_.append(op, lsn);
        ++next_lsn_;
        if (next) {
            documents_[op.document] = next;
            changes.push_back(ChangeNotification{
                .id = op.document,
                .document = next,
                .deleted = next->deleted(),
                .sequence = ++sequence_,
            });
        }
    }
    notify(changes);
    return result;
}

void ReplicaStore::persist(const Operation& op, std::uint64_t lsn, const VersionSummary& summary) {
    if (!storage_) return;
    storage_->put(log_key(lsn), encode(op));
    storage_->put(summary_key, encode(summary));
}

// Writes ops under consecutive lsns starting at next_lsn_. On failure the
// log records already written are removed again before rethrowing.
void ReplicaStore::persist_all(const std::vector<Operation>& ops, const VersionSummary& summary) {
    if (!storage_) return;
    auto written = std::vector<std::string>{};
    try {
        for (std::size_t i = 0; i < ops.size(); ++i) {
            auto key = log_key(next_lsn_ + i);
            storage_->put(key, encode(ops[i]));
            written.push_back(std::move(key));
        }
        storage_->put(summary_key, encode(summary));
    } catch (const Exception&) {
        for (const auto& key : written) {
            try {
                storage_->remove(key);
            } catch (const Exception& e) {
                SPDLOG_ERROR("replica {}: could not roll back {}: {}", to_hex(replica_), key, e.what());
            }
        }
        throw;
    }
}

void ReplicaStore::persist_checkpoint(const DeltaLog& log, const std::vector<std::uint64_t>& dropped) {
    if (!storage_) return;
    storage_->put(checkpoint_key, encode(log.checkpoint()));
    for (auto lsn : dropped) storage_->remove(log_key(lsn));
    storage_->put(summary_key, encode(log.summary()));
}

// -- Remote writes ------------------------------------------------------------

auto ReplicaStore::apply_remote(const Operation& op) -> ApplyStatus {
    auto lock = WriteLock{write_mutex_};
    if (log_.contains(op.id)) return ApplyStatus::duplicate;
    if (!log_.dependencies_satisfied(op)) return ApplyStatus::missing_dependency;

    clock_.observe(op.timestamp);
    if (log_.is_purged(op.document)) {
        static_cast<void>(record(op, false));
        SPDLOG_DEBUG("replica {}: discarded op on purged {}", to_hex(replica_), to_string(op.document));
        return ApplyStatus::discarded;
    }
    static_cast<void>(record(op, true));
    return ApplyStatus::applied;
}

void ReplicaStore::apply_snapshot(const Snapshot& snapshot) {
    auto lock = WriteLock{write_mutex_};
    const auto known = std::ranges::all_of(snapshot.purged, [this](const Identifier& id) {
        return log_.is_purged(id);
    });
    if (known && snapshot.documents.empty() && log_.frontier().dominates(snapshot.frontier)) return;

    auto log = log_;
    const auto dropped = log.install_snapshot(snapshot);

    auto updates = std::vector<std::shared_ptr<const BookmarkDocument>>{};
    for (const auto& doc : snapshot.documents) {
        if (log.is_purged(doc.id())) continue;
        clock_.observe(doc.updated_at());
        auto it = documents_.find(doc.id());
        if (it == documents_.end()) {
            updates.push_back(std::make_shared<const BookmarkDocument>(doc));
            continue;
        }
        auto merged_doc = merged(*it->second, doc);
        if (merged_doc != *it->second) {
            updates.push_back(std::make_shared<const BookmarkDocument>(std::move(merged_doc)));
        }
    }

    persist_checkpoint(log, dropped);

    auto changes = std::vector<ChangeNotification>{};
    {
        auto data = std::unique_lock{data_mutex_};
        log_ = std::move(log);
        for (const auto& id : snapshot.purged) {
            if (documents_.erase(id) > 0) {
                changes.push_back(ChangeNotification{
                    .id = id, .document = nullptr, .deleted = true, .sequence = ++sequence_});
            }
        }
        for (auto& doc : updates) {
            documents_[doc->id()] = doc;
            changes.push_back(ChangeNotification{
                .id = doc->id(), .document = doc, .deleted = doc->deleted(), .sequence = ++sequence_});
        }
    }
    SPDLOG_DEBUG("replica {}: installed snapshot ({} documents, {} purged, {} log entries dropped)",
                 to_hex(replica_), snapshot.documents.size(), snapshot.purged.size(), dropped.size());
    notify(changes);
}

// -- Reads --------------------------------------------------------------------

auto ReplicaStore::get(const Identifier& id) const -> std::shared_ptr<const BookmarkDocument> {
    auto data = std::shared_lock{data_mutex_};
    auto it = documents_.find(id);
    if (it == documents_.end()) return nullptr;
    return it->second;
}

auto ReplicaStore::list_active() const -> DocumentView {
    auto data = std::shared_lock{data_mutex_};
    return DocumentView{std::make_shared<const DocumentView::Table>(documents_), true};
}

auto ReplicaStore::list_all() const -> DocumentView {
    auto data = std::shared_lock{data_mutex_};
    return DocumentView{std::make_shared<const DocumentView::Table>(documents_), false};
}

auto ReplicaStore::size() const -> std::size_t {
    auto data = std::shared_lock{data_mutex_};
    return documents_.size();
}

auto ReplicaStore::active_count() const -> std::size_t {
    auto data = std::shared_lock{data_mutex_};
    return static_cast<std::size_t>(std::ranges::count_if(documents_, [](const auto& entry) {
        return !entry.second->deleted();
    }));
}

auto ReplicaStore::summary() const -> VersionSummary {
    auto data = std::shared_lock{data_mutex_};
    return log_.summary();
}

auto ReplicaStore::digest() const -> std::uint32_t {
    const auto view = list_active();
    auto docs = std::vector<const BookmarkDocument*>{};
    for (const auto& doc : view) docs.push_back(&doc);
    return state_digest(docs);
}

auto ReplicaStore::is_purged(const Identifier& id) const -> bool {
    auto data = std::shared_lock{data_mutex_};
    return log_.is_purged(id);
}

auto ReplicaStore::log_size() const -> std::size_t {
    auto data = std::shared_lock{data_mutex_};
    return log_.size();
}

// -- Sync support -------------------------------------------------------------

auto ReplicaStore::delta_since(const VersionSummary& peer) const -> Delta {
    auto data = std::shared_lock{data_mutex_};
    return log_.delta_since(peer);
}

void ReplicaStore::acknowledge(const ReplicaId& peer, const VersionSummary& summary) {
    if (peer == replica_) return;
    auto lock = WriteLock{write_mutex_};
    auto next = summary;
    if (auto it = acknowledged_.find(peer); it != acknowledged_.end()) {
        next.merge(it->second);
    }
    if (storage_) {
        storage_->put(std::string{ack_prefix} + to_hex(peer), encode(next));
    }
    auto data = std::unique_lock{data_mutex_};
    acknowledged_[peer] = std::move(next);
}

auto ReplicaStore::stable_frontier() const -> VersionSummary {
    auto data = std::shared_lock{data_mutex_};
    return stable_frontier_locked();
}

// Every replica that authored an operation we hold, or that acknowledged
// us, must have observed an operation before it is stable.
auto ReplicaStore::stable_frontier_locked() const -> VersionSummary {
    auto stable = log_.summary();
    const auto none = VersionSummary{};
    for (const auto& [author, _] : log_.summary().entries()) {
        if (author == replica_) continue;
        auto it = acknowledged_.find(author);
        stable = stable.meet(it == acknowledged_.end() ? none : it->second);
    }
    for (const auto& [peer, ack] : acknowledged_) {
        stable = stable.meet(ack);
    }
    return stable;
}

auto ReplicaStore::compact() -> CompactionResult {
    auto lock = WriteLock{write_mutex_};

    auto log = log_;
    auto result = log.compact(stable_frontier_locked());
    persist_checkpoint(log, result.dropped_lsns);

    auto changes = std::vector<ChangeNotification>{};
    {
        auto data = std::unique_lock{data_mutex_};
        log_ = std::move(log);
        for (const auto& id : result.purged) {
            if (documents_.erase(id) > 0) {
                changes.push_back(ChangeNotification{
                    .id = id, .document = nullptr, .deleted = true, .sequence = ++sequence_});
            }
        }
    }
    SPDLOG_INFO("replica {}: compacted {} ops, purged {} tombstones, {} ops retained",
                to_hex(replica_), result.folded_ops, result.purged.size(), log_.size());
    notify(changes);
    return result;
}

auto ReplicaStore::maybe_compact() -> std::optional<CompactionResult> {
    {
        auto data = std::shared_lock{data_mutex_};
        if (!log_.needs_compaction(config_.compaction)) return std::nullopt;
    }
    return compact();
}

// -- Change notifications -----------------------------------------------------

auto ReplicaStore::subscribe(ChangeListener listener) -> std::uint64_t {
    auto lock = std::lock_guard{listener_mutex_};
    const auto id = next_listener_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ReplicaStore::unsubscribe(std::uint64_t subscription) {
    auto lock = std::lock_guard{listener_mutex_};
    listeners_.erase(subscription);
}

void ReplicaStore::notify(const std::vector<ChangeNotification>& changes) {
    if (changes.empty()) return;
    auto listeners = std::vector<ChangeListener>{};
    {
        auto lock = std::lock_guard{listener_mutex_};
        for (const auto& [_, listener] : listeners_) listeners.push_back(listener);
    }
    for (const auto& change : changes) {
        for (const auto& listener : listeners) listener(change);
    }
}

}  // namespace marksync
