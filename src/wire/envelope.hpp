#pragma once

// Envelope framing every encoded record:
//   magic     4 bytes "MKSY"
//   checksum  4 bytes, CRC-32 of the body as transmitted, little endian
//   type      1 byte  (EnvelopeType)
//   flags     1 byte  (bit 0: body is raw DEFLATE)
//   length    ULEB128
//   body      length bytes
//
// Internal header — not installed.

#include "../encoding/leb128.hpp"
#include "compression.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace marksync::wire {

inline constexpr std::array<std::byte, 4> envelope_magic = {
    std::byte{'M'}, std::byte{'K'}, std::byte{'S'}, std::byte{'Y'}
};

enum class EnvelopeType : std::uint8_t {
    operation    = 0x01,
    summary      = 0x02,
    document     = 0x03,
    snapshot     = 0x04,
    sync_message = 0x05,
};

inline constexpr std::uint8_t flag_deflate = 0x01;

inline auto crc32_of(std::span<const std::byte> body) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(body.data()),
                  static_cast<uInt>(body.size()));
    return static_cast<std::uint32_t>(crc);
}

// Frame a body, deflating it when that pays off.
inline auto seal(EnvelopeType type, std::span<const std::byte> body) -> std::vector<std::byte> {
    auto flags = std::uint8_t{0};
    auto compressed = std::optional<std::vector<std::byte>>{};
    if (body.size() >= deflate_threshold) {
        compressed = deflate_compress(body);
        if (compressed && compressed->size() < body.size()) {
            flags |= flag_deflate;
            body = *compressed;
        }
    }

    auto output = std::vector<std::byte>{};
    output.reserve(body.size() + 16);
    output.insert(output.end(), envelope_magic.begin(), envelope_magic.end());
    const auto crc = crc32_of(body);
    for (int i = 0; i < 4; ++i) {
        output.push_back(static_cast<std::byte>(crc >> (i * 8)));
    }
    output.push_back(static_cast<std::byte>(type));
    output.push_back(static_cast<std::byte>(flags));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
    return output;
}

// Validate and unwrap an envelope of the expected type. Trailing bytes
// after the body are rejected.
inline auto open(EnvelopeType expected, std::span<const std::byte> data)
    -> std::optional<std::vector<std::byte>> {

    if (data.size() < 10) return std::nullopt;
    if (std::memcmp(data.data(), envelope_magic.data(), 4) != 0) return std::nullopt;

    auto crc = std::uint32_t{0};
    for (int i = 0; i < 4; ++i) {
        crc |= static_cast<std::uint32_t>(data[4 + i]) << (i * 8);
    }
    if (static_cast<EnvelopeType>(data[8]) != expected) return std::nullopt;
    const auto flags = static_cast<std::uint8_t>(data[9]);
    if ((flags & ~flag_deflate) != 0) return std::nullopt;

    auto len = encoding::decode_uleb128(data.subspan(10));
    if (!len) return std::nullopt;
    const auto offset = 10 + len->bytes_read;
    if (len->value != data.size() - offset) return std::nullopt;

    auto body = data.subspan(offset);
    if (crc32_of(body) != crc) return std::nullopt;

    if (flags & flag_deflate) return deflate_decompress(body);
    return std::vector<std::byte>(body.begin(), body.end());
}

}  // namespace marksync::wire
