#pragma once

// Variable-length integers (LEB128). Every count, length and counter in
// the marksync wire format uses the unsigned form; timestamps use the
// signed form.
//
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace marksync::encoding {

/// Longest valid encoding of a 64-bit value.
inline constexpr std::size_t max_leb128_bytes = 10;

/// A decoded integer and how many input bytes it took.
template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& out) {
    while (value >= 0x80) {
        out.push_back(std::byte(0x80 | (value & 0x7F)));
        value >>= 7;
    }
    out.push_back(std::byte(value));
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    out.reserve(max_leb128_bytes);
    encode_uleb128(value, out);
    return out;
}

/// nullopt if the input ends mid-value or the value needs more than 64 bits.
inline auto decode_uleb128(std::span<const std::byte> in)
    -> std::optional<Decoded<std::uint64_t>> {
    auto result = std::uint64_t{0};
    const auto limit = in.size() < max_leb128_bytes ? in.size() : max_leb128_bytes;
    for (std::size_t i = 0; i < limit; ++i) {
        const auto b = std::to_integer<std::uint64_t>(in[i]);
        const auto payload = b & 0x7F;
        // The tenth byte may only carry the top bit.
        if (i == max_leb128_bytes - 1 && payload > 1) return std::nullopt;
        result |= payload << (7 * i);
        if ((b & 0x80) == 0) return Decoded<std::uint64_t>{.value = result, .bytes_read = i + 1};
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& out) {
    for (;;) {
        const auto low = static_cast<std::uint8_t>(value & 0x7F);
        value >>= 7;  // arithmetic
        const auto sign = (low & 0x40) != 0;
        if ((value == 0 && !sign) || (value == -1 && sign)) {
            out.push_back(std::byte(low));
            return;
        }
        out.push_back(std::byte(low | 0x80));
    }
}

inline auto encode_sleb128(std::int64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    out.reserve(max_leb128_bytes);
    encode_sleb128(value, out);
    return out;
}

inline auto decode_sleb128(std::span<const std::byte> in)
    -> std::optional<Decoded<std::int64_t>> {
    auto bits = std::uint64_t{0};
    const auto limit = in.size() < max_leb128_bytes ? in.size() : max_leb128_bytes;
    for (std::size_t i = 0; i < limit; ++i) {
        const auto b = std::to_integer<std::uint64_t>(in[i]);
        const auto shift = 7 * i;
        bits |= (b & 0x7F) << shift;
        if ((b & 0x80) != 0) continue;

        // Sign-extend from the last payload bit.
        if (shift + 7 < 64 && (b & 0x40) != 0) bits |= ~std::uint64_t{0} << (shift + 7);
        return Decoded<std::int64_t>{.value = static_cast<std::int64_t>(bits), .bytes_read = i + 1};
    }
    return std::nullopt;
}

}  // namespace marksync::encoding
