#pragma once

// Inverted index with BM25 scoring.
// Internal header — not installed.
//
// Not synchronised; HybridIndex guards it.

#include <marksync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace marksync::index {

struct Bm25Params {
    double k1{1.2};
    double b{0.75};
};

class LexicalIndex {
public:
    explicit LexicalIndex(Bm25Params params = {}) : params_{params} {}

    /// Replace a document's postings with the given terms.
    void upsert(const Identifier& id, const std::vector<std::string>& terms);

    void remove(const Identifier& id);

    /// BM25 score of every document matching at least one query term,
    /// divided by the best score among them (so the top match scores 1).
    auto score(const std::vector<std::string>& query) const -> std::map<Identifier, double>;

    auto contains(const Identifier& id) const -> bool { return docs_.contains(id); }
    auto size() const -> std::size_t { return docs_.size(); }
    auto document_frequency(const std::string& term) const -> std::size_t;

private:
    struct DocEntry {
        std::uint32_t length{0};
        std::map<std::string, std::uint32_t> frequencies;
    };

    auto idf(std::size_t df) const -> double;

    Bm25Params params_;
    std::map<Identifier, DocEntry> docs_;
    std::unordered_map<std::string, std::map<Identifier, std::uint32_t>> postings_;
    std::uint64_t total_length_{0};
};

}  // namespace marksync::index
