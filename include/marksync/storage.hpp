/// @file storage.hpp
/// @brief The byte-oriented key-value collaborator used for persistence.

#pragma once

#include <marksync/value.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace marksync {

/// A durable key-value store. Only read-after-write on a single key is
/// assumed.
///
/// Implementations report I/O errors by throwing Exception{storage_failure}.
class Storage {
public:
    virtual ~Storage() = default;

    virtual auto get(std::string_view key) const -> std::optional<Bytes> = 0;
    virtual void put(std::string_view key, Bytes value) = 0;
    virtual void remove(std::string_view key) = 0;

    /// Every entry whose key starts with prefix, ascending by key.
    virtual auto scan(std::string_view prefix) const
        -> std::vector<std::pair<std::string, Bytes>> = 0;
};

/// An in-memory Storage, thread-safe.
///
/// set_failing(true) makes every subsequent call throw
/// Exception{storage_failure}, for exercising error paths.
class MemoryStorage : public Storage {
public:
    MemoryStorage() = default;

    auto get(std::string_view key) const -> std::optional<Bytes> override;
    void put(std::string_view key, Bytes value) override;
    void remove(std::string_view key) override;
    auto scan(std::string_view prefix) const
        -> std::vector<std::pair<std::string, Bytes>> override;

    void set_failing(bool failing) { failing_.store(failing); }
    auto size() const -> std::size_t;

private:
    void check() const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Bytes, std::less<>> entries_;
    std::atomic<bool> failing_{false};
};

}  // namespace marksync
