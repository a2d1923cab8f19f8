#include <marksync/hybrid_index.hpp>

#include "executor.hpp"
#include "index/hnsw.hpp"
#include "index/lexical_index.hpp"
#include "index/tokenizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace marksync {

namespace detail {

struct IndexState {
    IndexState(EngineConfig cfg, HybridIndex::TimeSource time)
        : config{validate(std::move(cfg))}
        , now{std::move(time)}
        , graph{config.hnsw, config.embedding_dimension} {}

    EngineConfig config;
    HybridIndex::TimeSource now;

    mutable std::shared_mutex mutex;  // guards everything below except graph
    index::LexicalIndex lexical;
    std::map<Identifier, std::int64_t> updated_ms;
    std::map<Identifier, std::uint64_t> last_sequence;
    index::HnswGraph graph;  // locks internally

    ReplicaStore* store{nullptr};
    std::uint64_t subscription{0};

    // Requires the exclusive lock.
    void insert(const BookmarkDocument& doc, std::vector<std::string> terms) {
        if (doc.deleted()) {
            erase(doc.id());
            return;
        }
        lexical.upsert(doc.id(), terms);
        updated_ms[doc.id()] = doc.updated_at().physical_ms;
        if (const auto& embedding = doc.embedding()) {
            if (!graph.upsert(doc.id(), *embedding)) {
                SPDLOG_WARN("embedding of {} rejected (dimension {} expected {}); lexical only",
                            to_string(doc.id()), embedding->size(), graph.dimension());
            }
        } else {
            graph.remove(doc.id());
        }
    }

    void erase(const Identifier& id) {
        lexical.remove(id);
        updated_ms.erase(id);
        graph.remove(id);
    }

    auto recency(const Identifier& id, std::int64_t now_ms) const -> double {
        auto it = updated_ms.find(id);
        if (it == updated_ms.end()) return 0.0;
        const auto age = static_cast<double>(std::max<std::int64_t>(0, now_ms - it->second));
        return std::exp(-std::log(2.0) * age / static_cast<double>(config.recency_half_life_ms));
    }
};

}  // namespace detail

HybridIndex::HybridIndex(EngineConfig config, TimeSource now)
    : state_{std::make_unique<detail::IndexState>(std::move(config), std::move(now))} {}

HybridIndex::~HybridIndex() { detach(); }

void HybridIndex::attach(ReplicaStore& store) {
    detach();
    {
        auto lock = std::unique_lock{state_->mutex};
        state_->last_sequence.clear();
    }
    state_->store = &store;
    state_->subscription = store.subscribe([this](const ChangeNotification& change) {
        apply(change);
    });

    // Notifications that arrive while the bulk load runs are newer than the
    // view; they win.
    const auto view = store.list_active();
    auto docs = std::vector<const BookmarkDocument*>{};
    for (const auto& doc : view) docs.push_back(&doc);

    auto terms = std::vector<std::vector<std::string>>(docs.size());
    detail::parallel_for(docs.size(), [&](std::size_t i) {
        terms[i] = index::document_terms(*docs[i]);
    });

    auto lock = std::unique_lock{state_->mutex};
    auto indexed = std::size_t{0};
    for (std::size_t i = 0; i < docs.size(); ++i) {
        if (state_->last_sequence.contains(docs[i]->id())) continue;
        state_->insert(*docs[i], std::move(terms[i]));
        ++indexed;
    }
    SPDLOG_INFO("hybrid index attached to replica {}: {} documents indexed",
                to_hex(store.replica_id()), indexed);
}

void HybridIndex::detach() {
    if (!state_ || !state_->store) return;
    state_->store->unsubscribe(state_->subscription);
    state_->store = nullptr;
    state_->subscription = 0;
}

void HybridIndex::apply(const ChangeNotification& change) {
    auto lock = std::unique_lock{state_->mutex};
    auto& last = state_->last_sequence[change.id];
    if (change.sequence != 0 && change.sequence <= last) return;
    last = change.sequence;

    if (change.deleted || !change.document) {
        state_->erase(change.id);
        return;
    }
    state_->insert(*change.document, index::document_terms(*change.document));
}

void HybridIndex::upsert(const BookmarkDocument& doc) {
    auto terms = index::document_terms(doc);
    auto lock = std::unique_lock{state_->mutex};
    state_->insert(doc, std::move(terms));
}

void HybridIndex::remove(const Identifier& id) {
    auto lock = std::unique_lock{state_->mutex};
    state_->erase(id);
}

auto HybridIndex::search(const std::optional<std::string>& text,
                         const std::optional<Vector>& vector,
                         std::size_t limit) const -> std::vector<SearchHit> {
    auto hits = std::vector<SearchHit>{};
    if (limit == 0) return hits;

    const auto& s = *state_;
    const auto has_text = text.has_value();
    const auto has_vector = vector.has_value() && s.graph.accepts(*vector);

    auto w_lexical = has_text ? s.config.weights.lexical : 0.0;
    auto w_vector = has_vector ? s.config.weights.vector : 0.0;
    auto w_recency = s.config.weights.recency;
    const auto total = w_lexical + w_vector + w_recency;
    if (total <= 0.0) return hits;
    w_lexical /= total;
    w_vector /= total;
    w_recency /= total;

    const auto now_ms = s.now();
    auto lock = std::shared_lock{s.mutex};

    auto lexical = std::map<Identifier, double>{};
    if (has_text) lexical = s.lexical.score(index::tokenize(*text));

    auto cosine = std::map<Identifier, float>{};
    if (has_vector) {
        const auto k = std::max(limit * 4, s.config.hnsw.ef_search);
        for (const auto& [id, sim] : s.graph.search(*vector, k)) cosine.emplace(id, sim);
    }

    auto candidates = std::set<Identifier>{};
    for (const auto& [id, _] : lexical) candidates.insert(id);
    for (const auto& [id, _] : cosine) candidates.insert(id);
    if (!has_text && !has_vector) {
        for (const auto& [id, _] : s.updated_ms) candidates.insert(id);
    }

    hits.reserve(candidates.size());
    for (const auto& id : candidates) {
        auto hit = SearchHit{.id = id};
        if (auto it = lexical.find(id); it != lexical.end()) hit.lexical = it->second;
        if (has_vector) {
            auto it = cosine.find(id);
            auto sim = it != cosine.end() ? std::optional<float>{it->second}
                                          : s.graph.similarity(id, *vector);
            if (sim) hit.vector = std::clamp((1.0 + static_cast<double>(*sim)) / 2.0, 0.0, 1.0);
        }
        hit.recency = s.recency(id, now_ms);
        hit.score = w_lexical * hit.lexical + w_vector * hit.vector + w_recency * hit.recency;
        hits.push_back(hit);
    }

    std::ranges::sort(hits, [](const SearchHit& a, const SearchHit& b) {
        return a.score != b.score ? a.score > b.score : a.id < b.id;
    });
    if (hits.size() > limit) hits.resize(limit);
    return hits;
}

auto HybridIndex::size() const -> std::size_t {
    auto lock = std::shared_lock{state_->mutex};
    return state_->lexical.size();
}

auto HybridIndex::contains(const Identifier& id) const -> bool {
    auto lock = std::shared_lock{state_->mutex};
    return state_->lexical.contains(id);
}

auto HybridIndex::vector_count() const -> std::size_t {
    return state_->graph.size();
}

}  // namespace marksync
