/// @file embedding.hpp
/// @brief Integration with an external embedding function.

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/error.hpp>
#include <marksync/replica_store.hpp>
#include <marksync/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace marksync {

/// Produces a fixed-length vector for a text, or nullopt if unavailable.
using Embedder = std::function<std::optional<Vector>(std::string_view text)>;

/// The text a bookmark is embedded from: title, url and tags.
auto embedding_text(const BookmarkDocument& doc) -> std::string;

/// Compute and record an embedding for a document.
///
/// An embedder that returns nullopt, throws, or returns a vector of the
/// wrong dimension (when expected_dimension is non-zero) or with
/// non-finite components counts as "no embedding": nothing is recorded
/// and the document stays searchable lexically.
/// @return not_found if the document is unknown; nullopt otherwise.
auto refresh_embedding(ReplicaStore& store, const Identifier& id,
                       const Embedder& embed,
                       std::size_t expected_dimension = 0) -> std::optional<Error>;

}  // namespace marksync
