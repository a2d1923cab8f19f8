// search_demo: hybrid retrieval over a small bookmark collection
//
// Demonstrates:
//   - Loading an EngineConfig from JSON
//   - Attaching a HybridIndex to a ReplicaStore
//   - Refreshing embeddings through an external embedder
//   - Text, vector and fused queries
//   - Exporting the collection with nlohmann/json
//
// Run: ./build/examples/search_demo

#include <marksync/json.hpp>
#include <marksync/marksync.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace ms = marksync;
using json = nlohmann::json;

// Feature hashing over character trigrams; a stand-in for a real model.
static auto trigram_embedder(std::string_view text) -> std::optional<ms::Vector> {
    constexpr auto dim = std::size_t{64};
    auto v = ms::Vector(dim, 0.0f);
    for (std::size_t i = 0; i + 3 <= text.size(); ++i) {
        v[std::hash<std::string_view>{}(text.substr(i, 3)) % dim] += 1.0f;
    }
    return v;
}

static void show(const char* label, const ms::ReplicaStore& store,
                 const std::vector<ms::SearchHit>& hits) {
    std::printf("%s\n", label);
    for (const auto& hit : hits) {
        const auto doc = store.get(hit.id);
        std::printf("  %.3f  (lex %.2f vec %.2f rec %.2f)  %s\n", hit.score, hit.lexical,
                    hit.vector, hit.recency, doc ? doc->url().c_str() : "?");
    }
}

int main() {
    const auto config = ms::load_config(R"({
        "weights": {"lexical": 0.6, "vector": 0.3, "recency": 0.1},
        "hnsw": {"max_neighbors": 8},
        "embedding_dimension": 64,
        "log_level": "warn"
    })");
    ms::set_log_level(config.log_level);

    auto store = ms::ReplicaStore{ms::ReplicaId::generate(), config};
    auto index = ms::HybridIndex{config};
    index.attach(store);

    const auto bookmarks = std::vector<ms::BookmarkFields>{
        {.url = "https://tokio.rs", .title = "Tokio: an asynchronous Rust runtime", .tags = {"rust", "async"}},
        {.url = "https://doc.rust-lang.org/book", .title = "The Rust Programming Language", .tags = {"rust"}},
        {.url = "https://go.dev/tour", .title = "A Tour of Go", .tags = {"go"}},
        {.url = "https://crdt.tech", .title = "Conflict-free Replicated Data Types", .tags = {"distributed"}},
        {.url = "https://seriouseats.com/pasta", .title = "Fresh pasta at home", .tags = {"cooking"}},
    };
    for (const auto& fields : bookmarks) {
        const auto id = store.create(fields);
        if (auto err = ms::refresh_embedding(store, id, trigram_embedder, config.embedding_dimension)) {
            std::printf("embedding failed: %s\n", err->message.c_str());
        }
    }
    std::printf("%zu documents indexed, %zu with vectors\n\n", index.size(), index.vector_count());

    show("text \"rust async\":", store, index.search("rust async", std::nullopt, 3));

    const auto query = trigram_embedder("replicated data");
    show("vector \"replicated data\":", store, index.search(std::nullopt, query, 3));
    show("fused \"rust\" + \"asynchronous runtime\":", store,
         index.search("rust", trigram_embedder("asynchronous runtime"), 3));
    show("recency only:", store, index.search(std::nullopt, std::nullopt, 3));

    std::printf("\nexport:\n%s\n", ms::export_json(store).dump(2).c_str());
    return 0;
}
