#include <marksync/codec.hpp>

#include "wire/envelope.hpp"
#include "wire/reader.hpp"
#include "wire/writer.hpp"

#include <zlib.h>

#include <utility>

namespace marksync {

namespace {

// Decode a whole body with fn; trailing garbage is an error.
template <typename Fn>
auto decode_body(wire::EnvelopeType type, std::span<const std::byte> data, Fn&& fn)
    -> decltype(fn(std::declval<wire::Reader&>())) {
    auto body = wire::open(type, data);
    if (!body) return std::nullopt;
    auto reader = wire::Reader{*body};
    auto result = fn(reader);
    if (!result || !reader.at_end()) return std::nullopt;
    return result;
}

}  // anonymous namespace

auto encode(const Operation& op) -> Bytes {
    auto w = wire::Writer{};
    w.write_operation(op);
    return wire::seal(wire::EnvelopeType::operation, w.data());
}

auto encode(const VersionSummary& summary) -> Bytes {
    auto w = wire::Writer{};
    w.write_summary(summary);
    return wire::seal(wire::EnvelopeType::summary, w.data());
}

auto encode(const BookmarkDocument& doc) -> Bytes {
    auto w = wire::Writer{};
    w.write_document(doc);
    return wire::seal(wire::EnvelopeType::document, w.data());
}

auto encode(const Snapshot& snapshot) -> Bytes {
    auto w = wire::Writer{};
    w.write_snapshot(snapshot);
    return wire::seal(wire::EnvelopeType::snapshot, w.data());
}

auto encode(const SyncMessage& message) -> Bytes {
    auto w = wire::Writer{};
    w.write_u8(static_cast<std::uint8_t>(message.type));
    w.write_replica_id(message.sender);
    w.write_summary(message.summary);
    w.write_bool(message.delta.has_value());
    if (message.delta) w.write_delta(*message.delta);
    w.write_u32_le(message.digest);
    return wire::seal(wire::EnvelopeType::sync_message, w.data());
}

auto decode_operation(std::span<const std::byte> data) -> std::optional<Operation> {
    return decode_body(wire::EnvelopeType::operation, data,
                       [](wire::Reader& r) { return r.read_operation(); });
}

auto decode_summary(std::span<const std::byte> data) -> std::optional<VersionSummary> {
    return decode_body(wire::EnvelopeType::summary, data,
                       [](wire::Reader& r) { return r.read_summary(); });
}

auto decode_document(std::span<const std::byte> data) -> std::optional<BookmarkDocument> {
    return decode_body(wire::EnvelopeType::document, data,
                       [](wire::Reader& r) { return r.read_document(); });
}

auto decode_snapshot(std::span<const std::byte> data) -> std::optional<Snapshot> {
    return decode_body(wire::EnvelopeType::snapshot, data,
                       [](wire::Reader& r) { return r.read_snapshot(); });
}

auto decode_message(std::span<const std::byte> data) -> std::optional<SyncMessage> {
    return decode_body(wire::EnvelopeType::sync_message, data,
                       [](wire::Reader& r) -> std::optional<SyncMessage> {
        auto type = r.read_u8();
        if (!type || *type < 1 || *type > 3) return std::nullopt;
        auto sender = r.read_replica_id();
        if (!sender) return std::nullopt;
        auto summary = r.read_summary();
        if (!summary) return std::nullopt;
        auto has_delta = r.read_bool();
        if (!has_delta) return std::nullopt;

        auto message = SyncMessage{
            .type = static_cast<MessageType>(*type),
            .sender = *sender,
            .summary = std::move(*summary),
            .delta = std::nullopt,
            .digest = 0,
        };
        if (*has_delta) {
            auto delta = r.read_delta();
            if (!delta) return std::nullopt;
            message.delta = std::move(*delta);
        }
        auto digest = r.read_u32_le();
        if (!digest) return std::nullopt;
        message.digest = *digest;
        return message;
    });
}

auto state_digest(std::span<const BookmarkDocument* const> documents) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    for (const auto* doc : documents) {
        auto w = wire::Writer{};
        w.write_document(*doc);
        const auto& bytes = w.data();
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(bytes.data()),
                      static_cast<uInt>(bytes.size()));
    }
    return static_cast<std::uint32_t>(crc);
}

}  // namespace marksync
