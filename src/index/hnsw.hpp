#pragma once

// Layered proximity graph (HNSW) over normalised embedding vectors.
// Internal header — not installed.
//
// Distances are 1 - cosine similarity. Each node links to at most M
// neighbours per upper layer and 2M on layer 0. All mutation happens under
// the exclusive lock and replaces a node's adjacency list wholesale, so a
// concurrent search (shared lock) never sees a half-updated node.

#include <marksync/config.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace marksync::index {

class HnswGraph {
public:
    explicit HnswGraph(HnswParams params, std::size_t dimension = 0);

    /// Insert or replace a vector. Returns false (and leaves the graph
    /// unchanged apart from removing any previous vector for id) if the
    /// vector is zero or of the wrong dimension.
    auto upsert(const Identifier& id, const Vector& vector) -> bool;

    /// Remove a node and repair its neighbours' links. No-op if absent.
    void remove(const Identifier& id);

    /// The k nearest nodes by cosine similarity, best first; ties by id.
    auto search(const Vector& query, std::size_t k) const
        -> std::vector<std::pair<Identifier, float>>;

    /// Whether a query can be compared: non-zero, finite, right dimension.
    auto accepts(const Vector& query) const -> bool;

    /// Cosine similarity between a stored node and the query, if present.
    auto similarity(const Identifier& id, const Vector& query) const -> std::optional<float>;

    auto contains(const Identifier& id) const -> bool;
    auto size() const -> std::size_t;

    /// Fixed by the first vector inserted unless configured.
    auto dimension() const -> std::size_t;

    /// Highest populated layer, or -1 when empty.
    auto top_level() const -> int;

private:
    using Slot = std::uint32_t;

    struct Node {
        Identifier id;
        Vector vector;                         // unit length
        std::vector<std::vector<Slot>> links;  // per layer
        bool alive{false};
    };

    struct Candidate {
        float distance;
        Slot slot;
        auto operator<(const Candidate& o) const -> bool {
            return distance != o.distance ? distance < o.distance : slot < o.slot;
        }
        auto operator>(const Candidate& o) const -> bool { return o < *this; }
    };

    auto normalized(const Vector& v) const -> std::optional<Vector>;
    auto distance(const Vector& a, const Vector& b) const -> float;
    auto random_level() -> int;
    auto max_links(int level) const -> std::size_t;

    auto greedy(const Vector& query, Slot entry, int level) const -> Slot;
    auto search_layer(const Vector& query, Slot entry, std::size_t ef, int level) const
        -> std::vector<Candidate>;
    auto select_neighbors(const Vector& base, std::vector<Candidate> candidates,
                          std::size_t limit) const -> std::vector<Slot>;
    void relink(Slot slot, int level, std::vector<Slot> candidates);
    void remove_locked(const Identifier& id);

    HnswParams params_;
    double level_mult_;
    std::mt19937_64 rng_;
    std::size_t dimension_;

    mutable std::shared_mutex mutex_;
    std::vector<Node> nodes_;
    std::vector<Slot> free_;
    std::map<Identifier, Slot> slots_;
    std::optional<Slot> entry_;
    int max_level_{-1};
};

}  // namespace marksync::index
