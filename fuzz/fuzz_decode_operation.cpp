// Fuzz target for decode_operation(), including mutations of unknown kinds.

#include <marksync/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    if (auto op = marksync::decode_operation(span)) {
        const auto again = marksync::decode_operation(marksync::encode(*op));
        if (!again || *again != *op) std::abort();
    }
    return 0;
}
