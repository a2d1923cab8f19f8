/// @file crdt.hpp
/// @brief Merge-able value types: LWWRegister, ORSet, LWWMap.
///
/// Every type here provides merge() that is commutative, associative and
/// idempotent, plus operation-level mutators that return the prior value.
/// Composite documents are assembled from these three primitives.

#pragma once

#include <marksync/clock.hpp>
#include <marksync/types.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace marksync {

/// A last-writer-wins register.
///
/// Holds one value and the timestamp of the write that produced it. The
/// write with the greater HybridTimestamp wins. Identical timestamps cannot
/// arise from distinct writes; if they do, the greater value wins so that
/// merge stays commutative.
template <typename T>
class LWWRegister {
public:
    LWWRegister() = default;

    LWWRegister(T value, HybridTimestamp ts)
        : value_{std::move(value)}, timestamp_{ts} {}

    auto value() const -> const T& { return value_; }
    auto timestamp() const -> const HybridTimestamp& { return timestamp_; }

    /// Apply a write and return the value held before it.
    /// Writes older than the current one leave the register unchanged.
    auto set(T value, const HybridTimestamp& ts) -> T {
        auto prior = value_;
        if (wins(value, ts)) {
            value_ = std::move(value);
            timestamp_ = ts;
        }
        return prior;
    }

    void merge(const LWWRegister& other) {
        if (wins(other.value_, other.timestamp_)) {
            value_ = other.value_;
            timestamp_ = other.timestamp_;
        }
    }

    auto operator==(const LWWRegister&) const -> bool = default;

private:
    auto wins(const T& value, const HybridTimestamp& ts) const -> bool {
        if (ts != timestamp_) return timestamp_ < ts;
        return value_ < value;
    }

    T value_{};
    HybridTimestamp timestamp_{};
};

/// An observed-remove set.
///
/// Every add carries a unique tag (the OpId of the adding operation); a
/// remove names the tags it observed. An element is present while it has
/// an add-tag not covered by a remove. Concurrent re-adds therefore survive
/// a remove that did not observe them.
template <typename T>
class ORSet {
public:
    using Tag = OpId;

    ORSet() = default;

    /// Record an add. Returns whether the element was present before.
    auto add(const T& element, const Tag& tag) -> bool {
        const auto prior = contains(element);
        adds_[element].insert(tag);
        return prior;
    }

    /// Record the removal of the observed tags. Returns whether the element
    /// was present before. Removing an absent element still records the
    /// element (and any tags given) so later merges see the removal.
    auto remove(const T& element, const std::vector<Tag>& observed) -> bool {
        const auto prior = contains(element);
        auto& tags = removes_[element];
        tags.insert(observed.begin(), observed.end());
        return prior;
    }

    auto contains(const T& element) const -> bool {
        return !live_tags(element).empty();
    }

    /// The add-tags of an element not yet covered by a remove.
    /// A local remove observes exactly these.
    auto live_tags(const T& element) const -> std::vector<Tag> {
        auto result = std::vector<Tag>{};
        auto it = adds_.find(element);
        if (it == adds_.end()) return result;
        auto rit = removes_.find(element);
        for (const auto& tag : it->second) {
            if (rit == removes_.end() || !rit->second.contains(tag)) {
                result.push_back(tag);
            }
        }
        return result;
    }

    /// Present elements in ascending order.
    auto elements() const -> std::vector<T> {
        auto result = std::vector<T>{};
        for (const auto& [element, tags] : adds_) {
            if (contains(element)) result.push_back(element);
        }
        return result;
    }

    auto size() const -> std::size_t { return elements().size(); }

    void merge(const ORSet& other) {
        for (const auto& [element, tags] : other.adds_) {
            adds_[element].insert(tags.begin(), tags.end());
        }
        for (const auto& [element, tags] : other.removes_) {
            removes_[element].insert(tags.begin(), tags.end());
        }
    }

    auto adds() const -> const std::map<T, std::set<Tag>>& { return adds_; }
    auto removes() const -> const std::map<T, std::set<Tag>>& { return removes_; }

    auto operator==(const ORSet&) const -> bool = default;

private:
    std::map<T, std::set<Tag>> adds_;
    std::map<T, std::set<Tag>> removes_;
};

/// A map whose keys each behave as an independent LWWRegister.
template <typename K, typename V>
class LWWMap {
public:
    using Register = LWWRegister<V>;

    LWWMap() = default;

    /// Write a key. Returns the value held before (nullopt if the key was absent).
    auto set(const K& key, V value, const HybridTimestamp& ts) -> std::optional<V> {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            entries_.emplace(key, Register{std::move(value), ts});
            return std::nullopt;
        }
        return it->second.set(std::move(value), ts);
    }

    auto get(const K& key) const -> std::optional<V> {
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second.value();
    }

    auto contains(const K& key) const -> bool { return entries_.contains(key); }

    auto keys() const -> std::vector<K> {
        auto result = std::vector<K>{};
        result.reserve(entries_.size());
        for (const auto& [key, reg] : entries_) result.push_back(key);
        return result;
    }

    auto size() const -> std::size_t { return entries_.size(); }

    auto entries() const -> const std::map<K, Register>& { return entries_; }

    /// Per-key register merge; keys present on one side only are kept.
    void merge(const LWWMap& other) {
        for (const auto& [key, reg] : other.entries_) {
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                entries_.emplace(key, reg);
            } else {
                it->second.merge(reg);
            }
        }
    }

    auto operator==(const LWWMap&) const -> bool = default;

private:
    std::map<K, Register> entries_;
};

/// Return a copy of a merged with b.
template <typename Crdt>
auto merged(Crdt a, const Crdt& b) -> Crdt {
    a.merge(b);
    return a;
}

}  // namespace marksync
