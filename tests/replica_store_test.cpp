#include <marksync/replica_store.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string_view>
#include <thread>

using namespace marksync;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

auto fixed_time(std::int64_t ms) -> ReplicaStore::TimeSource {
    return [ms] { return ms; };
}

// Accepts a fixed number of puts, then fails every put until healed.
class FlakyStorage : public MemoryStorage {
public:
    void put(std::string_view key, Bytes value) override {
        if (puts_left_ == 0) throw Exception{ErrorKind::storage_failure, "disk full"};
        if (puts_left_ > 0) --puts_left_;
        MemoryStorage::put(key, std::move(value));
    }

    void fail_after(int puts) { puts_left_ = puts; }
    void heal() { puts_left_ = -1; }

private:
    int puts_left_{-1};
};

}  // namespace

// -- Local writes -------------------------------------------------------------

TEST(ReplicaStore, create_records_one_op_per_field) {
    auto store = ReplicaStore{replica(1)};
    const auto id = store.create({
        .url = "https://a.example",
        .title = "A",
        .tags = {"x", "y"},
        .metadata = {{"stars", Value{3}}},
        .embedding = Vector{1.0f, 0.0f},
    });

    const auto doc = store.get(id);
    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(doc->url(), "https://a.example");
    EXPECT_EQ(doc->title(), "A");
    EXPECT_EQ(doc->tags(), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(doc->metadata("stars"), Value{3});
    EXPECT_TRUE(doc->embedding().has_value());
    EXPECT_EQ(store.summary().get(replica(1)), 6u);
    EXPECT_EQ(store.log_size(), 6u);
}

TEST(ReplicaStore, mutate_unknown_id_is_not_found) {
    auto store = ReplicaStore{};
    const auto err = store.set_title(Identifier::generate(), "x");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::not_found);
    EXPECT_EQ(store.log_size(), 0u);
}

TEST(ReplicaStore, wrappers_update_fields) {
    auto store = ReplicaStore{};
    const auto id = store.create({.url = "https://a.example"});

    EXPECT_FALSE(store.set_url(id, "https://b.example"));
    EXPECT_FALSE(store.set_title(id, "B"));
    EXPECT_FALSE(store.add_tag(id, "news"));
    EXPECT_FALSE(store.set_metadata(id, "read", Value{true}));
    EXPECT_FALSE(store.set_embedding(id, Vector{0.0f, 1.0f}));

    const auto doc = store.get(id);
    EXPECT_EQ(doc->url(), "https://b.example");
    EXPECT_EQ(doc->title(), "B");
    EXPECT_TRUE(doc->has_tag("news"));
    EXPECT_EQ(doc->metadata("read"), Value{true});

    EXPECT_FALSE(store.remove_tag(id, "news"));
    EXPECT_FALSE(store.get(id)->has_tag("news"));
}

TEST(ReplicaStore, each_op_depends_on_previous_own_op) {
    auto store = ReplicaStore{replica(1)};
    const auto id = store.create({.url = "u", .title = "t"});
    const auto delta = store.delta_since(VersionSummary{});
    ASSERT_EQ(delta.ops.size(), 2u);
    EXPECT_TRUE(delta.ops[0].deps.empty());
    EXPECT_EQ(delta.ops[1].deps, (std::vector<OpId>{OpId{1, replica(1)}}));
    EXPECT_EQ(delta.ops[1].document, id);
    EXPECT_LT(delta.ops[0].timestamp, delta.ops[1].timestamp);
}

TEST(ReplicaStore, remove_leaves_tombstone_visible_through_get) {
    auto store = ReplicaStore{};
    const auto keep = store.create({.url = "https://keep.example"});
    const auto gone = store.create({.url = "https://gone.example"});
    EXPECT_FALSE(store.remove(gone));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.active_count(), 1u);
    ASSERT_NE(store.get(gone), nullptr);
    EXPECT_TRUE(store.get(gone)->deleted());

    const auto active = store.list_active();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active.begin()->id(), keep);
    EXPECT_EQ(store.list_all().size(), 2u);
}

TEST(ReplicaStore, opaque_mutation_is_recorded_and_reported) {
    auto store = ReplicaStore{};
    const auto id = store.create({.url = "u"});
    const auto err = store.mutate(id, OpaqueMutation{.kind = 77, .payload = {std::byte{1}}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::unknown_field);
    EXPECT_TRUE(store.get(id)->metadata(opaque_metadata_key(77)).has_value());
    EXPECT_EQ(store.log_size(), 2u);
}

// -- Views --------------------------------------------------------------------

TEST(ReplicaStore, list_active_is_restartable_and_isolated_from_later_writes) {
    auto store = ReplicaStore{};
    store.create({.url = "https://1.example"});
    store.create({.url = "https://2.example"});

    const auto view = store.list_active();
    store.create({.url = "https://3.example"});

    auto first = std::vector<Identifier>{};
    for (const auto& doc : view) first.push_back(doc.id());
    auto second = std::vector<Identifier>{};
    for (const auto& doc : view) second.push_back(doc.id());

    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(std::ranges::is_sorted(first));
    EXPECT_EQ(store.list_active().size(), 3u);
}

TEST(ReplicaStore, readers_run_alongside_writer) {
    auto store = ReplicaStore{};
    const auto id = store.create({.url = "https://a.example"});
    auto writer = std::thread{[&] {
        for (int i = 0; i < 200; ++i) store.add_tag(id, "t" + std::to_string(i));
    }};
    for (int i = 0; i < 200; ++i) {
        const auto doc = store.get(id);
        ASSERT_NE(doc, nullptr);
        EXPECT_EQ(doc->url(), "https://a.example");
        static_cast<void>(store.list_active().size());
    }
    writer.join();
    EXPECT_EQ(store.get(id)->tags().size(), 200u);
}

// -- Notifications ------------------------------------------------------------

TEST(ReplicaStore, notifications_are_ordered_and_carry_snapshots) {
    auto store = ReplicaStore{};
    auto seen = std::vector<ChangeNotification>{};
    const auto sub = store.subscribe([&](const ChangeNotification& n) { seen.push_back(n); });

    const auto id = store.create({.url = "https://a.example", .title = "A"});
    store.remove(id);

    ASSERT_EQ(seen.size(), 3u);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_LT(seen[i - 1].sequence, seen[i].sequence);
    }
    EXPECT_FALSE(seen[0].document->title().has_value());
    EXPECT_EQ(seen[1].document->title(), "A");
    EXPECT_TRUE(seen[2].deleted);

    store.unsubscribe(sub);
    store.create({.url = "https://b.example"});
    EXPECT_EQ(seen.size(), 3u);
}

// -- Remote writes ------------------------------------------------------------

TEST(ReplicaStore, apply_remote_statuses) {
    auto source = ReplicaStore{replica(1)};
    source.create({.url = "u", .title = "t"});
    const auto ops = source.delta_since(VersionSummary{}).ops;

    auto target = ReplicaStore{replica(2)};
    EXPECT_EQ(target.apply_remote(ops[1]), ApplyStatus::missing_dependency);
    EXPECT_EQ(target.apply_remote(ops[0]), ApplyStatus::applied);
    EXPECT_EQ(target.apply_remote(ops[0]), ApplyStatus::duplicate);
    EXPECT_EQ(target.apply_remote(ops[1]), ApplyStatus::applied);
    EXPECT_EQ(target.get(ops[0].document)->title(), "t");
    EXPECT_EQ(target.summary(), source.summary());
    EXPECT_EQ(target.digest(), source.digest());
}

TEST(ReplicaStore, local_write_after_remote_orders_after_it) {
    auto source = ReplicaStore{replica(1), {}, fixed_time(1'000'000)};
    const auto id = source.create({.url = "u", .title = "remote"});

    auto target = ReplicaStore{replica(2), {}, fixed_time(10)};
    for (const auto& op : source.delta_since(VersionSummary{}).ops) target.apply_remote(op);
    target.set_title(id, "local");

    EXPECT_EQ(target.get(id)->title(), "local");
    const auto last = target.delta_since(source.summary()).ops;
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].deps.size(), 1u);
    EXPECT_EQ(last[0].deps[0].replica, replica(1));
}

// -- Persistence --------------------------------------------------------------

TEST(ReplicaStore, open_restores_documents_and_summary) {
    auto storage = std::make_shared<MemoryStorage>();
    auto id = Identifier{};
    auto replica_id = ReplicaId{};
    auto digest = std::uint32_t{0};
    {
        auto store = ReplicaStore::open(storage);
        replica_id = store->replica_id();
        id = store->create({.url = "https://a.example", .tags = {"x"}});
        store->set_title(id, "A");
        store->create({.url = "https://b.example"});
        digest = store->digest();
    }

    auto restored = ReplicaStore::open(storage);
    EXPECT_EQ(restored->replica_id(), replica_id);
    EXPECT_EQ(restored->size(), 2u);
    EXPECT_EQ(restored->get(id)->title(), "A");
    EXPECT_EQ(restored->digest(), digest);

    // New writes continue the counter sequence.
    restored->add_tag(id, "y");
    EXPECT_EQ(restored->summary().get(replica_id), 5u);
}

TEST(ReplicaStore, open_restores_after_compaction) {
    auto storage = std::make_shared<MemoryStorage>();
    auto digest = std::uint32_t{0};
    auto gone = Identifier{};
    {
        auto store = ReplicaStore::open(storage);
        store->create({.url = "https://keep.example", .title = "K"});
        gone = store->create({.url = "https://gone.example"});
        store->remove(gone);
        const auto result = store->compact();
        EXPECT_EQ(result.purged, (std::vector<Identifier>{gone}));
        store->create({.url = "https://after.example"});
        digest = store->digest();
    }

    auto restored = ReplicaStore::open(storage);
    EXPECT_EQ(restored->digest(), digest);
    EXPECT_TRUE(restored->is_purged(gone));
    EXPECT_EQ(restored->get(gone), nullptr);
    EXPECT_EQ(restored->log_size(), 1u);
}

TEST(ReplicaStore, storage_of_another_replica_is_rejected) {
    auto storage = std::make_shared<MemoryStorage>();
    auto first = ReplicaStore{replica(1), {}, storage};
    EXPECT_THROW((ReplicaStore{replica(2), {}, storage}), Exception);
}

TEST(ReplicaStore, failing_storage_leaves_state_unchanged) {
    auto storage = std::make_shared<MemoryStorage>();
    auto store = ReplicaStore{replica(1), {}, storage};
    const auto id = store.create({.url = "https://a.example"});
    const auto summary = store.summary();
    auto notified = 0;
    store.subscribe([&](const ChangeNotification&) { ++notified; });

    storage->set_failing(true);
    try {
        store.set_title(id, "never");
        FAIL() << "expected storage_failure";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::storage_failure);
    }
    storage->set_failing(false);

    EXPECT_EQ(store.summary(), summary);
    EXPECT_FALSE(store.get(id)->title().has_value());
    EXPECT_EQ(notified, 0);

    EXPECT_FALSE(store.set_title(id, "now"));
    EXPECT_EQ(store.get(id)->title(), "now");
}

TEST(ReplicaStore, create_interrupted_by_storage_leaves_no_partial_bookmark) {
    auto storage = std::make_shared<FlakyStorage>();
    auto store = ReplicaStore{replica(1), {}, storage};
    const auto stored = storage->size();
    auto notified = 0;
    store.subscribe([&](const ChangeNotification&) { ++notified; });

    storage->fail_after(2);
    EXPECT_THROW(store.create({.url = "https://a.example", .title = "T", .tags = {"x", "y"}}),
                 Exception);
    storage->heal();

    EXPECT_TRUE(store.summary().empty());
    EXPECT_EQ(store.log_size(), 0u);
    EXPECT_TRUE(store.list_all().empty());
    EXPECT_EQ(notified, 0);
    EXPECT_EQ(storage->size(), stored);
    EXPECT_TRUE(ReplicaStore::open(storage)->list_all().empty());

    const auto id = store.create({.url = "https://a.example", .title = "T", .tags = {"x", "y"}});
    EXPECT_EQ(store.summary().get(replica(1)), 4u);
    EXPECT_EQ(store.get(id)->tags(), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(ReplicaStore::open(storage)->get(id)->title(), "T");
}

TEST(ReplicaStore, corrupt_log_record_fails_open) {
    auto storage = std::make_shared<MemoryStorage>();
    {
        auto store = ReplicaStore::open(storage);
        store->create({.url = "u"});
    }
    storage->put("log/0000000000000001", Bytes{std::byte{0x00}});
    EXPECT_THROW(ReplicaStore::open(storage), Exception);
}

// -- Compaction ---------------------------------------------------------------

TEST(ReplicaStore, unacknowledged_foreign_ops_are_not_stable) {
    auto a = ReplicaStore{replica(1)};
    auto b = ReplicaStore{replica(2)};
    b.create({.url = "u"});
    for (const auto& op : b.delta_since(VersionSummary{}).ops) a.apply_remote(op);

    EXPECT_EQ(a.stable_frontier().get(replica(2)), 0u);
    a.acknowledge(replica(2), b.summary());
    EXPECT_EQ(a.stable_frontier().get(replica(2)), 1u);
}

TEST(ReplicaStore, acknowledged_peer_bounds_local_stability) {
    auto a = ReplicaStore{replica(1)};
    a.create({.url = "u", .title = "t"});
    EXPECT_EQ(a.stable_frontier().get(replica(1)), 2u);

    a.acknowledge(replica(2), VersionSummary{});
    EXPECT_EQ(a.stable_frontier().get(replica(1)), 0u);
}

TEST(ReplicaStore, maybe_compact_follows_policy) {
    auto config = EngineConfig{};
    config.compaction = CompactionPolicy{.max_log_ops = 1000, .checkpoint_interval_ops = 4};
    auto store = ReplicaStore{replica(1), config};
    store.create({.url = "u", .title = "t"});
    EXPECT_FALSE(store.maybe_compact().has_value());
    store.create({.url = "v", .title = "w"});
    const auto result = store.maybe_compact();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->folded_ops, 4u);
    EXPECT_EQ(store.log_size(), 0u);
    EXPECT_EQ(store.active_count(), 2u);
}

TEST(ReplicaStore, compaction_notifies_purge) {
    auto store = ReplicaStore{};
    const auto id = store.create({.url = "u"});
    store.remove(id);
    auto purged = std::vector<ChangeNotification>{};
    store.subscribe([&](const ChangeNotification& n) { purged.push_back(n); });

    store.compact();
    ASSERT_EQ(purged.size(), 1u);
    EXPECT_EQ(purged[0].id, id);
    EXPECT_EQ(purged[0].document, nullptr);
    EXPECT_EQ(store.get(id), nullptr);
    EXPECT_TRUE(store.set_url(id, "x").has_value());
}
