// Fuzz target for the LEB128 codec: overflow, truncation and maximum-length
// encodings. Any value that decodes must re-encode to no more bytes.

#include "src/encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    if (auto u = marksync::encoding::decode_uleb128(span)) {
        if (u->bytes_read > 10) std::abort();
        if (marksync::encoding::encode_uleb128(u->value).size() > u->bytes_read) std::abort();
    }

    if (auto s = marksync::encoding::decode_sleb128(span)) {
        if (s->bytes_read > 10) std::abort();
    }

    return 0;
}
