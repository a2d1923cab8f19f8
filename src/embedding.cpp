#include <marksync/embedding.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace marksync {

auto embedding_text(const BookmarkDocument& doc) -> std::string {
    auto text = doc.title().value_or(std::string{});
    if (!text.empty()) text += '\n';
    text += doc.url();
    for (const auto& tag : doc.tags()) {
        text += ' ';
        text += tag;
    }
    return text;
}

auto refresh_embedding(ReplicaStore& store, const Identifier& id,
                       const Embedder& embed,
                       std::size_t expected_dimension) -> std::optional<Error> {
    auto doc = store.get(id);
    if (!doc) return Error{ErrorKind::not_found, "no document " + to_string(id)};

    auto vector = std::optional<Vector>{};
    try {
        vector = embed(embedding_text(*doc));
    } catch (const std::exception& e) {
        SPDLOG_WARN("embedder failed for {}: {}", to_string(id), e.what());
        return std::nullopt;
    }

    if (!vector || vector->empty()) {
        SPDLOG_DEBUG("no embedding available for {}", to_string(id));
        return std::nullopt;
    }
    if (expected_dimension != 0 && vector->size() != expected_dimension) {
        SPDLOG_WARN("embedder returned {} dimensions for {}, expected {}",
                    vector->size(), to_string(id), expected_dimension);
        return std::nullopt;
    }
    if (!std::ranges::all_of(*vector, [](float x) { return std::isfinite(x); })) {
        SPDLOG_WARN("embedder returned non-finite values for {}", to_string(id));
        return std::nullopt;
    }
    return store.set_embedding(id, std::move(vector));
}

}  // namespace marksync
