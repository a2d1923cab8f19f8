#include "tokenizer.hpp"

#include <algorithm>
#include <array>

namespace marksync::index {

namespace {

// Sorted for binary search. Includes URL noise ("https", "www").
constexpr auto stopwords = std::array<std::string_view, 34>{
    "about", "an", "and", "are", "as", "at", "be", "but", "by", "com",
    "for", "from", "has", "have", "html", "http", "https", "in", "into", "is",
    "it", "its", "net", "not", "of", "on", "or", "org", "that", "the",
    "this", "to", "was", "www",
};

auto is_word_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

auto lower(char c) -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

void append_strings(const Value& value, std::vector<std::string>& out) {
    if (const auto* s = value.get_if<std::string>()) {
        auto tokens = tokenize(*s);
        out.insert(out.end(), tokens.begin(), tokens.end());
    } else if (const auto* m = value.get_if<ValueMap>()) {
        for (const auto& [_, v] : *m) append_strings(v, out);
    }
}

}  // anonymous namespace

auto is_stopword(std::string_view token) -> bool {
    return std::ranges::binary_search(stopwords, token);
}

auto tokenize(std::string_view text) -> std::vector<std::string> {
    auto tokens = std::vector<std::string>{};
    auto current = std::string{};
    auto flush = [&] {
        if (current.size() >= 2 && !is_stopword(current)) tokens.push_back(current);
        current.clear();
    };
    for (auto c : text) {
        if (is_word_char(c)) {
            current.push_back(lower(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

auto document_terms(const BookmarkDocument& doc) -> std::vector<std::string> {
    auto terms = tokenize(doc.url());
    if (const auto& title = doc.title()) {
        auto t = tokenize(*title);
        terms.insert(terms.end(), t.begin(), t.end());
    }
    for (const auto& tag : doc.tags()) {
        auto t = tokenize(tag);
        terms.insert(terms.end(), t.begin(), t.end());
    }
    for (const auto& [key, reg] : doc.metadata_map().entries()) {
        if (key.starts_with(opaque_metadata_prefix)) continue;
        append_strings(reg.value(), terms);
    }
    return terms;
}

}  // namespace marksync::index
