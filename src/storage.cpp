#include <marksync/storage.hpp>

#include <marksync/error.hpp>

#include <mutex>

namespace marksync {

void MemoryStorage::check() const {
    if (failing_.load()) {
        throw Exception{ErrorKind::storage_failure, "memory storage is in failure mode"};
    }
}

auto MemoryStorage::get(std::string_view key) const -> std::optional<Bytes> {
    check();
    auto lock = std::shared_lock{mutex_};
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void MemoryStorage::put(std::string_view key, Bytes value) {
    check();
    auto lock = std::unique_lock{mutex_};
    entries_.insert_or_assign(std::string{key}, std::move(value));
}

void MemoryStorage::remove(std::string_view key) {
    check();
    auto lock = std::unique_lock{mutex_};
    if (auto it = entries_.find(key); it != entries_.end()) {
        entries_.erase(it);
    }
}

auto MemoryStorage::scan(std::string_view prefix) const
    -> std::vector<std::pair<std::string, Bytes>> {
    check();
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<std::pair<std::string, Bytes>>{};
    for (auto it = entries_.lower_bound(prefix);
         it != entries_.end() && it->first.starts_with(prefix); ++it) {
        result.emplace_back(it->first, it->second);
    }
    return result;
}

auto MemoryStorage::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

}  // namespace marksync
