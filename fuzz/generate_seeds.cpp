// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <marksync/marksync.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>

namespace ms = marksync;

static void write_seed(const std::string& path, const ms::Bytes& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    const std::uint8_t raw_a[16] = {1};
    const std::uint8_t raw_b[16] = {2};
    auto a = ms::ReplicaStore{ms::ReplicaId{raw_a}};
    auto b = ms::ReplicaStore{ms::ReplicaId{raw_b}};

    // Seed 1: opening summary of an empty replica
    auto session = ms::SyncSession{a};
    write_seed(dir + "/seed_summary_empty.bin", ms::encode(session.start()));

    // Seed 2: a delta carrying every mutation kind
    const auto id = a.create({
        .url = "https://seed.example",
        .title = "seed",
        .tags = {"x", "y"},
        .metadata = {{"stars", ms::Value{5}}, {"nested", ms::Value{ms::ValueMap{{"k", ms::Value{1.5}}}}}},
        .embedding = ms::Vector{0.25f, 0.5f, 1.0f},
    });
    a.remove_tag(id, "y");
    a.mutate(id, ms::OpaqueMutation{.kind = 99, .payload = {std::byte{1}, std::byte{2}}});
    a.remove(id);
    write_seed(dir + "/seed_delta.bin", ms::encode(ms::SyncMessage{
        .type = ms::MessageType::delta,
        .sender = a.replica_id(),
        .summary = a.summary(),
        .delta = a.delta_since(b.summary()),
    }));

    // Seed 3: a delta based on a checkpoint (compressed snapshot)
    for (int i = 0; i < 40; ++i) {
        a.create({.url = "https://bulk.example/" + std::to_string(i), .tags = {"bulk"}});
    }
    a.compact();
    write_seed(dir + "/seed_delta_snapshot.bin", ms::encode(ms::SyncMessage{
        .type = ms::MessageType::delta,
        .sender = a.replica_id(),
        .summary = a.summary(),
        .delta = a.delta_since(b.summary()),
    }));

    // Seed 4: a done message
    write_seed(dir + "/seed_done.bin", ms::encode(ms::SyncMessage{
        .type = ms::MessageType::done,
        .sender = a.replica_id(),
        .summary = a.summary(),
        .digest = a.digest(),
    }));

    // Seeds for the operation target
    const auto log = a.delta_since(ms::VersionSummary{});
    for (std::size_t i = 0; i < log.ops.size() && i < 8; ++i) {
        write_seed(dir + "/seed_op_" + std::to_string(i) + ".bin", ms::encode(log.ops[i]));
    }

    return 0;
}
