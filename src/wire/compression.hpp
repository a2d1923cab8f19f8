#pragma once

// Raw DEFLATE for envelope bodies (no zlib/gzip header).
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace marksync::wire {

// Bodies shorter than this are sent uncompressed.
inline constexpr std::size_t deflate_threshold = 256;

// Upper bound on an inflated body.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                       -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    auto ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Returns nullopt on corrupt input or when the output would exceed max_output.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output = max_inflated_size)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto capacity = std::min(std::max<std::size_t>(input.size() * 4, 64), max_output);
    auto output = std::vector<std::byte>(capacity);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(capacity);

    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    auto ret = ::inflate(&stream, Z_FINISH);
    // Grow only while the output buffer is full; otherwise the input ran out.
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0 && capacity < max_output) {
        auto written = stream.total_out;
        capacity = std::min(capacity * 2, max_output);
        output.resize(capacity);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(capacity - written);
        ret = ::inflate(&stream, Z_FINISH);
    }
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace marksync::wire
