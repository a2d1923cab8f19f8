#pragma once

// Text normalisation for the lexical index.
// Internal header — not installed.

#include <marksync/bookmark.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace marksync::index {

/// Lowercase ASCII, split on anything that is not a letter or digit, drop
/// stopwords and tokens shorter than two characters. Repeats are kept.
auto tokenize(std::string_view text) -> std::vector<std::string>;

/// Whether a (lowercase) token is on the stopword list.
auto is_stopword(std::string_view token) -> bool;

/// All indexed terms of a document: url, title, tags and string metadata.
auto document_terms(const BookmarkDocument& doc) -> std::vector<std::string>;

}  // namespace marksync::index
