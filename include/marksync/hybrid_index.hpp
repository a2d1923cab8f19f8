/// @file hybrid_index.hpp
/// @brief HybridIndex: fused lexical + vector + recency retrieval.
///
/// The index follows a ReplicaStore through its change notifications:
/// deleted or purged documents leave both sub-indexes, everything else is
/// re-indexed (remove + insert). Updates run synchronously on the store's
/// writer, so a mutation is searchable as soon as the call returns.
///
/// @code
/// auto index = marksync::HybridIndex{store.config()};
/// index.attach(store);
/// for (const auto& hit : index.search("rust async", query_vector, 10)) { ... }
/// @endcode

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/config.hpp>
#include <marksync/replica_store.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marksync {

namespace detail { struct IndexState; }

/// One ranked result. Component scores are each in [0, 1].
struct SearchHit {
    Identifier id;
    double score{0.0};
    double lexical{0.0};
    double vector{0.0};
    double recency{0.0};

    auto operator==(const SearchHit&) const -> bool = default;
};

class HybridIndex {
public:
    using TimeSource = std::function<std::int64_t()>;

    explicit HybridIndex(EngineConfig config = {}, TimeSource now = system_time_ms);

    /// Detaches from the attached store, which must therefore still be alive.
    ~HybridIndex();

    HybridIndex(const HybridIndex&) = delete;
    auto operator=(const HybridIndex&) -> HybridIndex& = delete;

    /// Subscribe to a store and index its active documents (in parallel).
    /// Detaches from any previously attached store.
    ///
    /// The index keeps a pointer to the store until detach(). The store must
    /// outlive the attachment: destroy the index first, or call detach()
    /// before destroying the store.
    void attach(ReplicaStore& store);

    /// Stop following the attached store. The index keeps its contents and
    /// no longer refers to the store.
    void detach();

    /// Handle one change notification.
    void apply(const ChangeNotification& change);

    /// Index or re-index a document; deleted documents are removed.
    void upsert(const BookmarkDocument& doc);

    void remove(const Identifier& id);

    /// Rank documents against a text query and/or a query vector.
    ///
    /// score = a*lexical + b*vector + c*recency with the configured weights.
    /// A missing input scores 0 and its weight is shared out proportionally
    /// among the others. Text queries only return documents matching at
    /// least one term; vector queries consider the approximate neighbours;
    /// with neither, every document is ranked by recency. A query vector the
    /// graph cannot use (zero, non-finite or of the wrong dimension) counts
    /// as missing.
    /// Ordered by descending score, then ascending id.
    auto search(const std::optional<std::string>& text,
                const std::optional<Vector>& vector,
                std::size_t limit) const -> std::vector<SearchHit>;

    auto size() const -> std::size_t;
    auto contains(const Identifier& id) const -> bool;

    /// Documents currently in the vector graph.
    auto vector_count() const -> std::size_t;

private:
    std::unique_ptr<detail::IndexState> state_;
};

}  // namespace marksync
