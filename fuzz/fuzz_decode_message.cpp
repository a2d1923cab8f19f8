// Fuzz target for decode_message(): envelope, inflate, and every nested
// payload of a sync message. A message that decodes must survive
// encode + decode unchanged.

#include <marksync/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto message = marksync::decode_message(span);
    if (message) {
        const auto encoded = marksync::encode(*message);
        const auto again = marksync::decode_message(encoded);
        if (!again || *again != *message) std::abort();
    }
    return 0;
}
