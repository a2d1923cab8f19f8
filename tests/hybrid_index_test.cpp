#include <marksync/hybrid_index.hpp>
#include <marksync/replica_store.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <limits>
#include <memory>
#include <string>

using namespace marksync;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

auto at(std::int64_t ms) -> HybridIndex::TimeSource {
    return [ms] { return ms; };
}

auto ids_of(const std::vector<SearchHit>& hits) -> std::vector<Identifier> {
    auto ids = std::vector<Identifier>{};
    for (const auto& hit : hits) ids.push_back(hit.id);
    return ids;
}

// A store and an attached index sharing one frozen clock.
struct Fixture {
    explicit Fixture(EngineConfig config = {})
        : store{replica(1), config, at(10'000)}
        , index{config, at(10'000)} {
        index.attach(store);
    }

    ReplicaStore store;
    HybridIndex index;
};

}  // namespace

// -- Lexical ------------------------------------------------------------------

TEST(HybridIndex, text_query_ranks_matching_documents) {
    auto f = Fixture{};
    const auto tokio = f.store.create({.url = "https://tokio.rs", .title = "Rust async runtime"});
    const auto book = f.store.create({.url = "https://doc.rust-lang.org/book", .title = "The Rust book"});
    f.store.create({.url = "https://pasta.example", .title = "Fresh pasta"});

    const auto hits = f.index.search("rust async", std::nullopt, 10);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, tokio);
    EXPECT_EQ(hits[1].id, book);
    EXPECT_DOUBLE_EQ(hits[0].lexical, 1.0);
    EXPECT_LT(hits[1].lexical, 1.0);
    EXPECT_DOUBLE_EQ(hits[0].recency, 1.0);
    EXPECT_DOUBLE_EQ(hits[0].vector, 0.0);
    EXPECT_NEAR(hits[0].score, 1.0, 1e-9);
}

TEST(HybridIndex, equal_scores_order_by_id) {
    auto f = Fixture{};
    auto created = std::vector<Identifier>{};
    for (int i = 0; i < 5; ++i) {
        created.push_back(f.store.create({.url = "https://mirror.example/" + std::to_string(i),
                                          .title = "Same words"}));
    }
    const auto hits = f.index.search("same words", std::nullopt, 10);
    ASSERT_EQ(hits.size(), 5u);
    std::ranges::sort(created);
    EXPECT_EQ(ids_of(hits), created);
    for (const auto& hit : hits) EXPECT_DOUBLE_EQ(hit.score, hits[0].score);
}

TEST(HybridIndex, unmatched_text_returns_nothing) {
    auto f = Fixture{};
    f.store.create({.url = "https://a.example", .title = "Gardening"});
    EXPECT_TRUE(f.index.search("quantum", std::nullopt, 10).empty());
    EXPECT_TRUE(f.index.search("the", std::nullopt, 10).empty());
}

// -- Vector and fused ---------------------------------------------------------

TEST(HybridIndex, vector_query_uses_cosine) {
    auto f = Fixture{};
    const auto east = f.store.create({.url = "https://east.example", .embedding = Vector{1.0f, 0.0f}});
    const auto north = f.store.create({.url = "https://north.example", .embedding = Vector{0.0f, 1.0f}});
    f.store.create({.url = "https://plain.example"});
    EXPECT_EQ(f.index.vector_count(), 2u);

    const auto hits = f.index.search(std::nullopt, Vector{1.0f, 0.0f}, 10);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].id, east);
    EXPECT_EQ(hits[1].id, north);
    EXPECT_NEAR(hits[0].vector, 1.0, 1e-6);
    EXPECT_NEAR(hits[1].vector, 0.5, 1e-6);
    // Weights 0.35 vector and 0.15 recency, renormalised to 0.7 and 0.3.
    EXPECT_NEAR(hits[0].score, 1.0, 1e-6);
    EXPECT_NEAR(hits[1].score, 0.7 * 0.5 + 0.3, 1e-6);
}

TEST(HybridIndex, fused_score_is_weighted_sum) {
    auto f = Fixture{};
    f.store.create({.url = "https://a.example", .title = "rust", .embedding = Vector{0.0f, 1.0f}});
    f.store.create({.url = "https://b.example", .title = "rust rust tooling", .embedding = Vector{1.0f, 1.0f}});
    f.store.create({.url = "https://c.example", .title = "other", .embedding = Vector{1.0f, 0.0f}});

    const auto hits = f.index.search("rust", Vector{1.0f, 0.0f}, 10);
    ASSERT_EQ(hits.size(), 3u);
    for (const auto& hit : hits) {
        EXPECT_NEAR(hit.score, 0.5 * hit.lexical + 0.35 * hit.vector + 0.15 * hit.recency, 1e-9);
        EXPECT_GE(hit.score, 0.0);
        EXPECT_LE(hit.score, 1.0 + 1e-9);
    }
    EXPECT_TRUE(std::ranges::is_sorted(hits, std::ranges::greater{}, &SearchHit::score));
}

TEST(HybridIndex, unusable_query_vector_counts_as_absent) {
    auto f = Fixture{};
    f.store.create({.url = "https://a.example", .title = "rust", .embedding = Vector{1.0f, 0.0f}});
    f.store.create({.url = "https://b.example", .title = "rust tooling"});
    const auto nan = std::numeric_limits<float>::quiet_NaN();
    const auto inf = std::numeric_limits<float>::infinity();

    const auto text_only = f.index.search("rust", std::nullopt, 10);
    ASSERT_EQ(text_only.size(), 2u);
    for (const auto& query : {Vector{}, Vector{0.0f, 0.0f}, Vector{nan, 1.0f}, Vector{inf, 0.0f},
                              Vector{1.0f, 0.0f, 0.0f}}) {
        EXPECT_EQ(f.index.search("rust", query, 10), text_only);
    }
    EXPECT_EQ(f.index.search(std::nullopt, Vector{0.0f, 0.0f}, 10),
              f.index.search(std::nullopt, std::nullopt, 10));
}

TEST(HybridIndex, neither_input_ranks_by_recency) {
    auto clock = std::make_shared<std::int64_t>(1'000);
    auto config = EngineConfig{};
    config.recency_half_life_ms = 1'000;
    auto store = ReplicaStore{replica(1), config, [clock] { return *clock; }};
    auto index = HybridIndex{config, at(3'000)};
    index.attach(store);

    const auto oldest = store.create({.url = "https://one.example"});
    *clock = 2'000;
    const auto middle = store.create({.url = "https://two.example"});
    *clock = 3'000;
    const auto newest = store.create({.url = "https://three.example"});

    const auto hits = index.search(std::nullopt, std::nullopt, 10);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(ids_of(hits), (std::vector<Identifier>{newest, middle, oldest}));
    EXPECT_NEAR(hits[0].recency, 1.0, 1e-9);
    EXPECT_NEAR(hits[1].recency, 0.5, 1e-9);
    EXPECT_NEAR(hits[2].recency, 0.25, 1e-9);
    EXPECT_NEAR(hits[2].score, 0.25, 1e-9);
}

TEST(HybridIndex, limit_truncates) {
    auto f = Fixture{};
    for (int i = 0; i < 8; ++i) {
        f.store.create({.url = "https://site.example/" + std::to_string(i), .title = "recipes"});
    }
    EXPECT_EQ(f.index.search("recipes", std::nullopt, 3).size(), 3u);
    EXPECT_TRUE(f.index.search("recipes", std::nullopt, 0).empty());
}

// -- Following the store ------------------------------------------------------

TEST(HybridIndex, edits_reindex_immediately) {
    auto f = Fixture{};
    const auto id = f.store.create({.url = "https://a.example", .title = "draft"});
    EXPECT_EQ(f.index.search("draft", std::nullopt, 10).size(), 1u);

    f.store.set_title(id, "final");
    EXPECT_TRUE(f.index.search("draft", std::nullopt, 10).empty());
    EXPECT_EQ(f.index.search("final", std::nullopt, 10).size(), 1u);

    f.store.add_tag(id, "keeper");
    EXPECT_EQ(f.index.search("keeper", std::nullopt, 10).size(), 1u);

    f.store.set_embedding(id, Vector{0.0f, 1.0f});
    EXPECT_EQ(f.index.vector_count(), 1u);
    f.store.set_embedding(id, std::nullopt);
    EXPECT_EQ(f.index.vector_count(), 0u);
}

TEST(HybridIndex, deleted_documents_leave_both_indexes) {
    auto f = Fixture{};
    const auto id = f.store.create({.url = "https://a.example", .title = "ephemeral",
                                    .embedding = Vector{1.0f, 0.0f}});
    ASSERT_TRUE(f.index.contains(id));

    f.store.remove(id);
    EXPECT_FALSE(f.index.contains(id));
    EXPECT_EQ(f.index.vector_count(), 0u);
    EXPECT_TRUE(f.index.search("ephemeral", Vector{1.0f, 0.0f}, 10).empty());
}

TEST(HybridIndex, purge_keeps_document_out) {
    auto f = Fixture{};
    const auto id = f.store.create({.url = "https://a.example", .title = "gone"});
    f.store.remove(id);
    f.store.compact();
    ASSERT_TRUE(f.store.is_purged(id));
    EXPECT_FALSE(f.index.contains(id));
    EXPECT_EQ(f.index.size(), 0u);
}

TEST(HybridIndex, attach_loads_existing_documents) {
    auto store = ReplicaStore{replica(1)};
    for (int i = 0; i < 50; ++i) {
        store.create({.url = "https://bulk.example/" + std::to_string(i), .title = "bulk item",
                      .embedding = Vector{1.0f, static_cast<float>(i)}});
    }
    const auto deleted = store.create({.url = "https://deleted.example"});
    store.remove(deleted);

    auto index = HybridIndex{};
    index.attach(store);
    EXPECT_EQ(index.size(), 50u);
    EXPECT_EQ(index.vector_count(), 50u);
    EXPECT_FALSE(index.contains(deleted));
    EXPECT_EQ(index.search("bulk", std::nullopt, 100).size(), 50u);
}

TEST(HybridIndex, detach_stops_following) {
    auto f = Fixture{};
    f.store.create({.url = "https://a.example"});
    f.index.detach();
    const auto later = f.store.create({.url = "https://b.example"});
    EXPECT_EQ(f.index.size(), 1u);
    EXPECT_FALSE(f.index.contains(later));
}

TEST(HybridIndex, index_detaches_when_destroyed) {
    auto store = ReplicaStore{};
    {
        auto index = HybridIndex{};
        index.attach(store);
    }
    EXPECT_NO_THROW(store.create({.url = "https://a.example"}));
}

TEST(HybridIndex, detached_index_outlives_its_store) {
    auto index = HybridIndex{};
    {
        auto store = ReplicaStore{};
        index.attach(store);
        store.create({.url = "https://a.example", .title = "kept"});
        index.detach();
    }
    EXPECT_EQ(index.search("kept", std::nullopt, 10).size(), 1u);
    index.detach();
}

TEST(HybridIndex, wrong_dimension_stays_lexical) {
    auto config = EngineConfig{};
    config.embedding_dimension = 3;
    auto f = Fixture{config};
    const auto id = f.store.create({.url = "https://a.example", .title = "flat",
                                    .embedding = Vector{1.0f, 0.0f}});
    EXPECT_TRUE(f.index.contains(id));
    EXPECT_EQ(f.index.vector_count(), 0u);
    EXPECT_EQ(f.index.search("flat", std::nullopt, 10).size(), 1u);
}

TEST(HybridIndex, replicated_documents_are_searchable) {
    auto a = ReplicaStore{replica(1)};
    auto b = ReplicaStore{replica(2)};
    auto index = HybridIndex{};
    index.attach(b);

    const auto id = a.create({.url = "https://shared.example", .title = "shared notes"});
    for (const auto& op : a.delta_since(b.summary()).ops) b.apply_remote(op);

    const auto hits = index.search("notes", std::nullopt, 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, id);
}

// -- Direct use ---------------------------------------------------------------

TEST(HybridIndex, manual_upsert_and_remove) {
    auto source = ReplicaStore{};
    const auto id = source.create({.url = "https://manual.example", .title = "standalone"});

    auto index = HybridIndex{};
    index.upsert(*source.get(id));
    EXPECT_EQ(index.search("standalone", std::nullopt, 10).size(), 1u);
    index.remove(id);
    EXPECT_EQ(index.size(), 0u);
}
