#include "lexical_index.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace marksync::index {

void LexicalIndex::upsert(const Identifier& id, const std::vector<std::string>& terms) {
    remove(id);
    auto entry = DocEntry{.length = static_cast<std::uint32_t>(terms.size()), .frequencies = {}};
    for (const auto& term : terms) ++entry.frequencies[term];
    for (const auto& [term, tf] : entry.frequencies) {
        postings_[term][id] = tf;
    }
    total_length_ += entry.length;
    docs_.emplace(id, std::move(entry));
}

void LexicalIndex::remove(const Identifier& id) {
    auto it = docs_.find(id);
    if (it == docs_.end()) return;
    for (const auto& [term, _] : it->second.frequencies) {
        auto posting = postings_.find(term);
        if (posting == postings_.end()) continue;
        posting->second.erase(id);
        if (posting->second.empty()) postings_.erase(posting);
    }
    total_length_ -= it->second.length;
    docs_.erase(it);
}

auto LexicalIndex::document_frequency(const std::string& term) const -> std::size_t {
    auto it = postings_.find(term);
    return it == postings_.end() ? 0 : it->second.size();
}

// Lucene's non-negative variant.
auto LexicalIndex::idf(std::size_t df) const -> double {
    const auto n = static_cast<double>(docs_.size());
    const auto d = static_cast<double>(df);
    return std::log(1.0 + (n - d + 0.5) / (d + 0.5));
}

auto LexicalIndex::score(const std::vector<std::string>& query) const
    -> std::map<Identifier, double> {
    auto scores = std::map<Identifier, double>{};
    if (docs_.empty()) return scores;

    const auto avg_length = std::max(
        1.0, static_cast<double>(total_length_) / static_cast<double>(docs_.size()));
    const auto unique = std::set<std::string>(query.begin(), query.end());

    for (const auto& term : unique) {
        auto posting = postings_.find(term);
        if (posting == postings_.end()) continue;
        const auto weight = idf(posting->second.size());
        for (const auto& [id, tf] : posting->second) {
            const auto length = static_cast<double>(docs_.at(id).length);
            const auto norm = 1.0 - params_.b + params_.b * (length / avg_length);
            const auto f = static_cast<double>(tf);
            scores[id] += weight * (f * (params_.k1 + 1.0)) / (f + params_.k1 * norm);
        }
    }

    auto best = 0.0;
    for (const auto& [_, s] : scores) best = std::max(best, s);
    if (best > 0.0) {
        for (auto& [_, s] : scores) s /= best;
    }
    return scores;
}

}  // namespace marksync::index
