#include "hnsw.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <queue>
#include <unordered_set>

namespace marksync::index {

namespace {

constexpr int max_possible_level = 16;

auto dot(const Vector& a, const Vector& b) -> float {
    auto sum = 0.0f;
    for (std::size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
    return sum;
}

}  // anonymous namespace

HnswGraph::HnswGraph(HnswParams params, std::size_t dimension)
    : params_{params}
    , level_mult_{1.0 / std::log(static_cast<double>(std::max<std::size_t>(params.max_neighbors, 2)))}
    , rng_{params.seed}
    , dimension_{dimension} {}

auto HnswGraph::normalized(const Vector& v) const -> std::optional<Vector> {
    if (v.empty() || (dimension_ != 0 && v.size() != dimension_)) return std::nullopt;
    const auto norm = std::sqrt(dot(v, v));
    if (!(norm > 0.0f) || !std::isfinite(norm)) return std::nullopt;
    auto out = v;
    for (auto& x : out) x /= norm;
    return out;
}

auto HnswGraph::distance(const Vector& a, const Vector& b) const -> float {
    return 1.0f - dot(a, b);
}

auto HnswGraph::random_level() -> int {
    auto uniform = std::uniform_real_distribution<double>{0.0, 1.0};
    auto u = uniform(rng_);
    if (u <= 0.0) u = std::numeric_limits<double>::min();
    return std::min(static_cast<int>(-std::log(u) * level_mult_), max_possible_level);
}

auto HnswGraph::max_links(int level) const -> std::size_t {
    return level == 0 ? params_.max_neighbors * 2 : params_.max_neighbors;
}

auto HnswGraph::greedy(const Vector& query, Slot entry, int level) const -> Slot {
    auto current = entry;
    auto best = distance(query, nodes_[current].vector);
    auto changed = true;
    while (changed) {
        changed = false;
        const auto& links = nodes_[current].links;
        if (level >= static_cast<int>(links.size())) break;
        for (auto neighbor : links[level]) {
            const auto d = distance(query, nodes_[neighbor].vector);
            if (d < best) {
                best = d;
                current = neighbor;
                changed = true;
            }
        }
    }
    return current;
}

auto HnswGraph::search_layer(const Vector& query, Slot entry, std::size_t ef, int level) const
    -> std::vector<Candidate> {
    auto candidates = std::priority_queue<Candidate, std::vector<Candidate>, std::greater<>>{};
    auto best = std::priority_queue<Candidate>{};
    auto visited = std::unordered_set<Slot>{entry};

    const auto start = Candidate{distance(query, nodes_[entry].vector), entry};
    candidates.push(start);
    best.push(start);

    while (!candidates.empty()) {
        const auto current = candidates.top();
        candidates.pop();
        if (current.distance > best.top().distance && best.size() >= ef) break;

        const auto& links = nodes_[current.slot].links;
        if (level >= static_cast<int>(links.size())) continue;
        for (auto neighbor : links[level]) {
            if (!visited.insert(neighbor).second) continue;
            const auto c = Candidate{distance(query, nodes_[neighbor].vector), neighbor};
            if (best.size() < ef || c.distance < best.top().distance) {
                candidates.push(c);
                best.push(c);
                if (best.size() > ef) best.pop();
            }
        }
    }

    auto result = std::vector<Candidate>{};
    result.reserve(best.size());
    while (!best.empty()) {
        result.push_back(best.top());
        best.pop();
    }
    std::ranges::reverse(result);
    return result;
}

// Keep a candidate only if it is closer to base than to every neighbour
// already kept; top up with the closest rejects so sparse regions stay
// connected.
auto HnswGraph::select_neighbors(const Vector& /*base*/, std::vector<Candidate> candidates,
                                 std::size_t limit) const -> std::vector<Slot> {
    std::sort(candidates.begin(), candidates.end());
    auto kept = std::vector<Slot>{};
    auto rejected = std::vector<Slot>{};
    for (const auto& c : candidates) {
        if (kept.size() >= limit) break;
        const auto diverse = std::ranges::all_of(kept, [&](Slot k) {
            return c.distance < distance(nodes_[c.slot].vector, nodes_[k].vector);
        });
        (diverse ? kept : rejected).push_back(c.slot);
    }
    for (auto slot : rejected) {
        if (kept.size() >= limit) break;
        kept.push_back(slot);
    }
    return kept;
}

void HnswGraph::relink(Slot slot, int level, std::vector<Slot> candidates) {
    const auto& base = nodes_[slot].vector;
    auto scored = std::vector<Candidate>{};
    std::ranges::sort(candidates);
    const auto [first, last] = std::ranges::unique(candidates);
    candidates.erase(first, last);
    for (auto c : candidates) {
        if (c == slot || !nodes_[c].alive) continue;
        if (level >= static_cast<int>(nodes_[c].links.size())) continue;
        scored.push_back(Candidate{distance(base, nodes_[c].vector), c});
    }
    nodes_[slot].links[level] = select_neighbors(base, std::move(scored), max_links(level));
}

auto HnswGraph::upsert(const Identifier& id, const Vector& vector) -> bool {
    auto lock = std::unique_lock{mutex_};
    remove_locked(id);

    auto unit = normalized(vector);
    if (!unit) return false;
    if (dimension_ == 0) dimension_ = unit->size();

    const auto level = random_level();
    auto slot = Slot{0};
    if (!free_.empty()) {
        slot = free_.back();
        free_.pop_back();
    } else {
        slot = static_cast<Slot>(nodes_.size());
        nodes_.emplace_back();
    }
    nodes_[slot] = Node{.id = id, .vector = std::move(*unit),
                        .links = std::vector<std::vector<Slot>>(static_cast<std::size_t>(level) + 1),
                        .alive = true};
    slots_[id] = slot;

    if (!entry_) {
        entry_ = slot;
        max_level_ = level;
        return true;
    }

    const auto& query = nodes_[slot].vector;
    auto ep = *entry_;
    for (int l = max_level_; l > level; --l) {
        ep = greedy(query, ep, l);
    }
    for (int l = std::min(level, max_level_); l >= 0; --l) {
        auto found = search_layer(query, ep, params_.ef_construction, l);
        nodes_[slot].links[l] = select_neighbors(query, found, params_.max_neighbors);
        for (auto neighbor : nodes_[slot].links[l]) {
            auto links = nodes_[neighbor].links[l];
            links.push_back(slot);
            if (links.size() > max_links(l)) {
                relink(neighbor, l, std::move(links));
            } else {
                nodes_[neighbor].links[l] = std::move(links);
            }
        }
        if (!found.empty()) ep = found.front().slot;
    }

    if (level > max_level_) {
        max_level_ = level;
        entry_ = slot;
    }
    return true;
}

void HnswGraph::remove(const Identifier& id) {
    auto lock = std::unique_lock{mutex_};
    remove_locked(id);
}

void HnswGraph::remove_locked(const Identifier& id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) return;
    const auto slot = it->second;
    slots_.erase(it);

    auto& node = nodes_[slot];
    node.alive = false;
    const auto levels = static_cast<int>(node.links.size());

    // Any live node linking to slot gets its list rebuilt from its other
    // neighbours plus the removed node's neighbours.
    for (int l = 0; l < levels; ++l) {
        const auto orphaned = node.links[l];
        for (auto& other : nodes_) {
            if (!other.alive || l >= static_cast<int>(other.links.size())) continue;
            auto& links = other.links[l];
            if (std::ranges::find(links, slot) == links.end()) continue;
            auto candidates = std::vector<Slot>{};
            for (auto s : links) if (s != slot) candidates.push_back(s);
            candidates.insert(candidates.end(), orphaned.begin(), orphaned.end());
            relink(slots_.at(other.id), l, std::move(candidates));
        }
    }
    node.links.clear();
    node.vector.clear();
    free_.push_back(slot);

    if (entry_ == slot) {
        entry_.reset();
        max_level_ = -1;
        for (const auto& [_, s] : slots_) {
            const auto level = static_cast<int>(nodes_[s].links.size()) - 1;
            if (level > max_level_) {
                max_level_ = level;
                entry_ = s;
            }
        }
    }
}

auto HnswGraph::search(const Vector& query, std::size_t k) const
    -> std::vector<std::pair<Identifier, float>> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<std::pair<Identifier, float>>{};
    if (!entry_ || k == 0) return result;
    auto unit = normalized(query);
    if (!unit) return result;

    auto ep = *entry_;
    for (int l = max_level_; l > 0; --l) {
        ep = greedy(*unit, ep, l);
    }
    auto found = search_layer(*unit, ep, std::max(params_.ef_search, k), 0);
    for (const auto& c : found) {
        result.emplace_back(nodes_[c.slot].id, 1.0f - c.distance);
    }
    std::ranges::sort(result, [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });
    if (result.size() > k) result.resize(k);
    return result;
}

auto HnswGraph::accepts(const Vector& query) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return normalized(query).has_value();
}

auto HnswGraph::similarity(const Identifier& id, const Vector& query) const -> std::optional<float> {
    auto lock = std::shared_lock{mutex_};
    auto it = slots_.find(id);
    if (it == slots_.end()) return std::nullopt;
    auto unit = normalized(query);
    if (!unit) return std::nullopt;
    return dot(nodes_[it->second].vector, *unit);
}

auto HnswGraph::contains(const Identifier& id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return slots_.contains(id);
}

auto HnswGraph::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return slots_.size();
}

auto HnswGraph::dimension() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return dimension_;
}

auto HnswGraph::top_level() const -> int {
    auto lock = std::shared_lock{mutex_};
    return max_level_;
}

}  // namespace marksync::index
