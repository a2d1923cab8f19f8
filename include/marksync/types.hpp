/// @file types.hpp
/// @brief Core identity types: ReplicaId, Identifier, OpId.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace marksync {

/// A 16-byte stable identifier for a synchronizing device.
///
/// Assigned once at first run and immutable for the device's lifetime.
/// Lexicographic ordering on raw bytes is used as the final tie-breaker
/// when ordering timestamps.
struct ReplicaId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ReplicaId() = default;

    /// Construct from a byte array.
    explicit constexpr ReplicaId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ReplicaId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    /// Generate a random replica id.
    static auto generate() -> ReplicaId;

    auto operator<=>(const ReplicaId&) const = default;
    auto operator==(const ReplicaId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// A globally unique 128-bit document identifier.
///
/// Assigned once when a bookmark is created, never reused. Ordering is
/// bytewise and is the tie-breaker for search result ordering.
struct Identifier {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr Identifier() = default;

    /// Construct from a byte array.
    explicit constexpr Identifier(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit Identifier(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    /// Generate a random (version 4 layout) identifier.
    static auto generate() -> Identifier;

    auto operator<=>(const Identifier&) const = default;
    auto operator==(const Identifier&) const -> bool = default;

    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// Identifies a single operation: (counter, replica).
///
/// The counter is a per-replica sequence number starting at 1 with no
/// gaps, so a VersionSummary entry of N means "operations 1..N seen".
/// OpIds also serve as the unique tags of observed-remove set adds.
struct OpId {
    std::uint64_t counter{0};  ///< Per-replica sequence number.
    ReplicaId replica{};       ///< The replica that created this operation.

    constexpr OpId() = default;

    /// Construct with a counter and replica.
    constexpr OpId(std::uint64_t c, ReplicaId r) : counter{c}, replica{r} {}

    auto operator<=>(const OpId&) const = default;
    auto operator==(const OpId&) const -> bool = default;
};

/// Lowercase hex rendering of a replica id.
auto to_hex(const ReplicaId& id) -> std::string;

/// Canonical 8-4-4-4-12 rendering of an identifier.
auto to_string(const Identifier& id) -> std::string;

/// Parse 32 hex digits (dashes ignored) into a ReplicaId.
auto parse_replica_id(std::string_view text) -> std::optional<ReplicaId>;

/// Parse 32 hex digits (dashes ignored) into an Identifier.
auto parse_identifier(std::string_view text) -> std::optional<Identifier>;

}  // namespace marksync

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<marksync::ReplicaId> {
    auto operator()(const marksync::ReplicaId& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<marksync::Identifier> {
    auto operator()(const marksync::Identifier& id) const noexcept -> std::size_t {
        // Random identifiers: the first 8 bytes are already well distributed
        auto result = std::size_t{0};
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | static_cast<std::size_t>(id.bytes[i]);
        }
        return result;
    }
};

template <>
struct std::hash<marksync::OpId> {
    auto operator()(const marksync::OpId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.counter);
        auto h2 = std::hash<marksync::ReplicaId>{}(id.replica);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
