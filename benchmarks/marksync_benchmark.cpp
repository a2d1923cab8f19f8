// marksync benchmarks: throughput of local writes, the codec, sync and search.

#include <marksync/marksync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace marksync;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

const auto words = std::vector<std::string>{
    "rust", "async", "runtime", "compiler", "database", "index", "vector", "search",
    "replica", "network", "kernel", "garden", "recipe", "travel", "music", "physics",
};

auto random_vector(std::mt19937_64& rng, std::size_t dim) -> Vector {
    auto dist = std::normal_distribution<float>{0.0f, 1.0f};
    auto v = Vector(dim);
    for (auto& x : v) x = dist(rng);
    return v;
}

void populate(ReplicaStore& store, std::size_t count, std::size_t dim = 0) {
    auto rng = std::mt19937_64{count};
    for (std::size_t i = 0; i < count; ++i) {
        auto fields = BookmarkFields{
            .url = "https://site" + std::to_string(i) + ".example/" + words[rng() % words.size()],
            .title = words[rng() % words.size()] + " " + words[rng() % words.size()],
            .tags = {words[rng() % words.size()]},
        };
        if (dim != 0) fields.embedding = random_vector(rng, dim);
        store.create(fields);
    }
}

}  // namespace

// =============================================================================
// Local writes
// =============================================================================

static void bm_create(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    std::int64_t i = 0;
    for (auto _ : state) {
        store.create({.url = "https://a.example/" + std::to_string(i++), .title = "t", .tags = {"x"}});
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_create);

static void bm_set_title(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    const auto id = store.create({.url = "https://a.example"});
    std::int64_t i = 0;
    for (auto _ : state) {
        store.set_title(id, "title " + std::to_string(i++));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_title);

static void bm_compact(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto store = ReplicaStore{replica(1)};
        populate(store, n);
        state.ResumeTiming();
        auto result = store.compact();
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_compact)->Range(64, 4096);

// =============================================================================
// Codec
// =============================================================================

static void bm_encode_delta(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)));
    const auto message = SyncMessage{
        .type = MessageType::delta,
        .sender = store.replica_id(),
        .summary = store.summary(),
        .delta = store.delta_since(VersionSummary{}),
    };
    for (auto _ : state) {
        auto bytes = encode(message);
        benchmark::DoNotOptimize(bytes);
    }
}
BENCHMARK(bm_encode_delta)->Range(16, 1024);

static void bm_decode_delta(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)));
    const auto bytes = encode(SyncMessage{
        .type = MessageType::delta,
        .sender = store.replica_id(),
        .summary = store.summary(),
        .delta = store.delta_since(VersionSummary{}),
    });
    for (auto _ : state) {
        auto message = decode_message(bytes);
        benchmark::DoNotOptimize(message);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_decode_delta)->Range(16, 1024);

// =============================================================================
// Sync
// =============================================================================

static void bm_sync_fresh_replica(benchmark::State& state) {
    auto source = ReplicaStore{replica(1)};
    populate(source, static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto target = ReplicaStore{replica(2)};
        auto result = sync_replicas(source, target);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_sync_fresh_replica)->Range(16, 1024);

static void bm_sync_noop(benchmark::State& state) {
    auto a = ReplicaStore{replica(1)};
    auto b = ReplicaStore{replica(2)};
    populate(a, 256);
    sync_replicas(a, b);
    for (auto _ : state) {
        auto result = sync_replicas(a, b);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_sync_noop);

// =============================================================================
// Search
// =============================================================================

static void bm_attach_index(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)), 32);
    for (auto _ : state) {
        auto index = HybridIndex{};
        index.attach(store);
        auto indexed = index.size();
        benchmark::DoNotOptimize(indexed);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * state.range(0)));
}
BENCHMARK(bm_attach_index)->Range(64, 4096);

static void bm_search_text(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)));
    auto index = HybridIndex{};
    index.attach(store);
    for (auto _ : state) {
        auto hits = index.search("rust search", std::nullopt, 10);
        benchmark::DoNotOptimize(hits);
    }
}
BENCHMARK(bm_search_text)->Range(64, 4096);

static void bm_search_vector(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)), 32);
    auto index = HybridIndex{};
    index.attach(store);
    auto rng = std::mt19937_64{1};
    const auto query = random_vector(rng, 32);
    for (auto _ : state) {
        auto hits = index.search(std::nullopt, query, 10);
        benchmark::DoNotOptimize(hits);
    }
}
BENCHMARK(bm_search_vector)->Range(64, 4096);

static void bm_search_fused(benchmark::State& state) {
    auto store = ReplicaStore{replica(1)};
    populate(store, static_cast<std::size_t>(state.range(0)), 32);
    auto index = HybridIndex{};
    index.attach(store);
    auto rng = std::mt19937_64{2};
    const auto query = random_vector(rng, 32);
    for (auto _ : state) {
        auto hits = index.search("garden recipe", query, 10);
        benchmark::DoNotOptimize(hits);
    }
}
BENCHMARK(bm_search_fused)->Range(64, 4096);
