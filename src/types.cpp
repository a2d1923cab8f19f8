#include <marksync/types.hpp>

#include <random>

namespace marksync {

namespace {

template <std::size_t N>
auto random_bytes() -> std::array<std::byte, N> {
    thread_local auto engine = [] {
        auto rd = std::random_device{};
        auto seq = std::seed_seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64{seq};
    }();
    auto result = std::array<std::byte, N>{};
    for (std::size_t i = 0; i < N; i += 8) {
        auto word = engine();
        for (std::size_t j = 0; j < 8 && i + j < N; ++j) {
            result[i + j] = static_cast<std::byte>(word >> (j * 8));
        }
    }
    return result;
}

template <std::size_t N>
auto hex_of(const std::array<std::byte, N>& bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(N * 2);
    for (auto b : bytes) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

auto nibble(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <std::size_t N>
auto parse_hex(std::string_view text) -> std::optional<std::array<std::byte, N>> {
    auto result = std::array<std::byte, N>{};
    auto count = std::size_t{0};
    auto high = -1;
    for (auto c : text) {
        if (c == '-') continue;
        auto n = nibble(c);
        if (n < 0 || count >= N) return std::nullopt;
        if (high < 0) {
            high = n;
        } else {
            result[count++] = static_cast<std::byte>((high << 4) | n);
            high = -1;
        }
    }
    if (count != N || high >= 0) return std::nullopt;
    return result;
}

}  // namespace

auto ReplicaId::generate() -> ReplicaId {
    return ReplicaId{random_bytes<size>()};
}

auto Identifier::generate() -> Identifier {
    auto bytes = random_bytes<size>();
    // RFC 4122 version 4, variant 1
    bytes[6] = (bytes[6] & std::byte{0x0F}) | std::byte{0x40};
    bytes[8] = (bytes[8] & std::byte{0x3F}) | std::byte{0x80};
    return Identifier{bytes};
}

auto to_hex(const ReplicaId& id) -> std::string {
    return hex_of(id.bytes);
}

auto to_string(const Identifier& id) -> std::string {
    auto hex = hex_of(id.bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

auto parse_replica_id(std::string_view text) -> std::optional<ReplicaId> {
    auto bytes = parse_hex<ReplicaId::size>(text);
    if (!bytes) return std::nullopt;
    return ReplicaId{*bytes};
}

auto parse_identifier(std::string_view text) -> std::optional<Identifier> {
    auto bytes = parse_hex<Identifier::size>(text);
    if (!bytes) return std::nullopt;
    return Identifier{*bytes};
}

}  // namespace marksync
