#include "../src/encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace marksync::encoding;

namespace {

auto bytes_of(std::initializer_list<unsigned> values) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    for (auto v : values) result.push_back(static_cast<std::byte>(v));
    return result;
}

}  // namespace

// -- Unsigned LEB128 ----------------------------------------------------------

TEST(Leb128, encode_uleb128_known_vectors) {
    EXPECT_EQ(encode_uleb128(0), bytes_of({0x00}));
    EXPECT_EQ(encode_uleb128(127), bytes_of({0x7F}));
    EXPECT_EQ(encode_uleb128(128), bytes_of({0x80, 0x01}));
    EXPECT_EQ(encode_uleb128(300), bytes_of({0xAC, 0x02}));
    EXPECT_EQ(encode_uleb128(624485), bytes_of({0xE5, 0x8E, 0x26}));
}

TEST(Leb128, uleb128_max_uint64_uses_ten_bytes) {
    const auto bytes = encode_uleb128(std::numeric_limits<std::uint64_t>::max());
    ASSERT_EQ(bytes.size(), 10u);
    const auto decoded = decode_uleb128(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value, std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(decoded->bytes_read, 10u);
}

TEST(Leb128, decode_uleb128_reports_bytes_read) {
    const auto bytes = bytes_of({0xAC, 0x02, 0xFF});
    const auto decoded = decode_uleb128(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value, 300u);
    EXPECT_EQ(decoded->bytes_read, 2u);
}

TEST(Leb128, decode_uleb128_rejects_truncated_and_empty) {
    EXPECT_FALSE(decode_uleb128(bytes_of({0x80, 0x80})).has_value());
    EXPECT_FALSE(decode_uleb128(std::vector<std::byte>{}).has_value());
}

TEST(Leb128, decode_uleb128_rejects_overflow) {
    // Ten bytes whose last group carries more than the one remaining bit.
    EXPECT_FALSE(decode_uleb128(
        bytes_of({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02})).has_value());
    // Eleven bytes.
    EXPECT_FALSE(decode_uleb128(
        bytes_of({0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x00})).has_value());
}

// -- Signed LEB128 ------------------------------------------------------------

TEST(Leb128, encode_sleb128_known_vectors) {
    EXPECT_EQ(encode_sleb128(0), bytes_of({0x00}));
    EXPECT_EQ(encode_sleb128(63), bytes_of({0x3F}));
    EXPECT_EQ(encode_sleb128(64), bytes_of({0xC0, 0x00}));
    EXPECT_EQ(encode_sleb128(-1), bytes_of({0x7F}));
    EXPECT_EQ(encode_sleb128(-128), bytes_of({0x80, 0x7F}));
}

TEST(Leb128, sleb128_extremes) {
    for (auto v : {std::numeric_limits<std::int64_t>::min(),
                   std::numeric_limits<std::int64_t>::max(),
                   std::int64_t{-1700000000000}}) {
        const auto decoded = decode_sleb128(encode_sleb128(v));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(decoded->value, v);
    }
}

TEST(Leb128, decode_sleb128_rejects_truncated) {
    EXPECT_FALSE(decode_sleb128(bytes_of({0xFF})).has_value());
}
