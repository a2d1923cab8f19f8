// sync_demo: three replicas editing bookmarks offline, then converging
//
// Demonstrates: ReplicaStore, sync_replicas, concurrent title edits,
//               add-wins tags, tombstones and compaction

#include <marksync/marksync.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace ms = marksync;

static auto replica(std::uint8_t tag) -> ms::ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ms::ReplicaId{raw};
}

static void print_store(const char* name, const ms::ReplicaStore& store) {
    std::printf("%s (%zu active, digest %08x)\n", name, store.active_count(), store.digest());
    for (const auto& doc : store.list_active()) {
        std::printf("  %s  %-28s %s [", ms::to_string(doc.id()).c_str(), doc.url().c_str(),
                    doc.title().value_or("(untitled)").c_str());
        auto first = true;
        for (const auto& tag : doc.tags()) {
            std::printf("%s%s", first ? "" : ", ", tag.c_str());
            first = false;
        }
        std::printf("]\n");
    }
}

static void sync_pair(const char* label, ms::ReplicaStore& a, ms::ReplicaStore& b) {
    const auto result = ms::sync_replicas(a, b);
    std::printf("sync %s: %s, sent %zu + %zu ops\n", label,
                result.converged() ? "converged" : "failed",
                result.first_stats.ops_sent, result.second_stats.ops_sent);
    if (result.error) {
        std::printf("  error: %s\n", result.error->message.c_str());
    }
}

int main() {
    auto laptop = ms::ReplicaStore{replica(1)};
    auto phone = ms::ReplicaStore{replica(2)};
    auto tablet = ms::ReplicaStore{replica(3)};

    // --- Scenario 1: offline creates ---
    std::printf("=== Scenario 1: offline creates ===\n");
    const auto rust = laptop.create({
        .url = "https://doc.rust-lang.org/book",
        .title = "The Rust Book",
        .tags = {"rust", "reading"},
    });
    phone.create({.url = "https://news.ycombinator.com", .tags = {"news"}});
    tablet.create({.url = "https://en.wikipedia.org/wiki/CRDT", .title = "CRDT"});

    sync_pair("laptop<->phone", laptop, phone);
    sync_pair("phone<->tablet", phone, tablet);
    sync_pair("laptop<->tablet", laptop, tablet);
    print_store("laptop", laptop);

    // --- Scenario 2: concurrent edits ---
    std::printf("\n=== Scenario 2: concurrent edits ===\n");
    phone.set_title(rust, "Rust Book (2nd ed.)");
    tablet.set_title(rust, "TRPL");
    laptop.remove_tag(rust, "reading");
    phone.add_tag(rust, "reading");

    sync_pair("phone<->tablet", phone, tablet);
    sync_pair("tablet<->laptop", tablet, laptop);
    sync_pair("laptop<->phone", laptop, phone);
    const auto doc = laptop.get(rust);
    std::printf("title everywhere: %s; still tagged reading: %s\n",
                doc->title().value_or("").c_str(), doc->has_tag("reading") ? "yes" : "no");

    // --- Scenario 3: delete and compact ---
    std::printf("\n=== Scenario 3: delete and compact ===\n");
    laptop.remove(rust);
    sync_pair("laptop<->phone", laptop, phone);
    sync_pair("phone<->tablet", phone, tablet);
    sync_pair("tablet<->laptop", tablet, laptop);
    sync_pair("laptop<->phone", laptop, phone);

    for (auto* store : {&laptop, &phone, &tablet}) {
        const auto result = store->compact();
        std::printf("replica %s: folded %zu ops, purged %zu documents, log now %zu\n",
                    ms::to_hex(store->replica_id()).c_str(), result.folded_ops,
                    result.purged.size(), store->log_size());
    }
    print_store("phone", phone);

    return laptop.digest() == phone.digest() && phone.digest() == tablet.digest() ? 0 : 1;
}
