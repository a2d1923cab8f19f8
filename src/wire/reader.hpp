#pragma once

// Byte stream reader for the marksync wire format.
// Internal header — not installed.
//
// Every read returns nullopt on truncated or malformed input; callers turn
// that into a decoding_error. Element counts are checked against the bytes
// left so a corrupt length cannot trigger a huge allocation.

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/op.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>
#include "../encoding/leb128.hpp"
#include "writer.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace marksync::wire {

// Nested metadata maps deeper than this are rejected.
inline constexpr std::size_t max_value_depth = 32;

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bool() -> std::optional<bool> {
        auto b = read_u8();
        if (!b || *b > 1) return std::nullopt;
        return *b == 1;
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    // A count of elements that each occupy at least min_size bytes.
    auto read_count(std::size_t min_size = 1) -> std::optional<std::size_t> {
        auto n = read_uleb128();
        if (!n) return std::nullopt;
        if (min_size > 0 && *n > remaining() / min_size) return std::nullopt;
        return static_cast<std::size_t>(*n);
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_count();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(*len);
        if (!bytes) return std::nullopt;
        auto s = std::string(*len, '\0');
        std::memcpy(s.data(), bytes->data(), *len);
        return s;
    }

    auto read_u32_le() -> std::optional<std::uint32_t> {
        auto bytes = read_bytes(4);
        if (!bytes) return std::nullopt;
        auto v = std::uint32_t{0};
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>((*bytes)[i]) << (i * 8);
        }
        return v;
    }

    auto read_u64_le() -> std::optional<std::uint64_t> {
        auto bytes = read_bytes(8);
        if (!bytes) return std::nullopt;
        auto v = std::uint64_t{0};
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>((*bytes)[i]) << (i * 8);
        }
        return v;
    }

    auto read_f32() -> std::optional<float> {
        auto bits = read_u32_le();
        if (!bits) return std::nullopt;
        return std::bit_cast<float>(*bits);
    }

    auto read_f64() -> std::optional<double> {
        auto bits = read_u64_le();
        if (!bits) return std::nullopt;
        return std::bit_cast<double>(*bits);
    }

    template <typename Id>
    auto read_id() -> std::optional<Id> {
        auto bytes = read_bytes(16);
        if (!bytes) return std::nullopt;
        auto id = Id{};
        std::memcpy(id.bytes.data(), bytes->data(), 16);
        return id;
    }

    auto read_replica_id() -> std::optional<ReplicaId> { return read_id<ReplicaId>(); }
    auto read_identifier() -> std::optional<Identifier> { return read_id<Identifier>(); }

    auto read_op_id() -> std::optional<OpId> {
        auto counter = read_uleb128();
        if (!counter || *counter == 0) return std::nullopt;
        auto replica = read_replica_id();
        if (!replica) return std::nullopt;
        return OpId{*counter, *replica};
    }

    auto read_timestamp() -> std::optional<HybridTimestamp> {
        auto physical = read_sleb128();
        if (!physical) return std::nullopt;
        auto logical = read_uleb128();
        if (!logical) return std::nullopt;
        auto replica = read_replica_id();
        if (!replica) return std::nullopt;
        return HybridTimestamp{.physical_ms = *physical, .logical = *logical, .replica = *replica};
    }

    auto read_value(std::size_t depth = 0) -> std::optional<Value> {
        if (depth > max_value_depth) return std::nullopt;
        auto tag = read_u8();
        if (!tag) return std::nullopt;

        switch (static_cast<ValueTag>(*tag)) {
            case ValueTag::null:
                return Value{Null{}};
            case ValueTag::boolean: {
                auto b = read_bool();
                if (!b) return std::nullopt;
                return Value{*b};
            }
            case ValueTag::integer: {
                auto i = read_sleb128();
                if (!i) return std::nullopt;
                return Value{*i};
            }
            case ValueTag::real: {
                auto d = read_f64();
                if (!d) return std::nullopt;
                return Value{*d};
            }
            case ValueTag::string: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return Value{std::move(*s)};
            }
            case ValueTag::map: {
                auto n = read_count(2);
                if (!n) return std::nullopt;
                auto map = ValueMap{};
                for (std::size_t i = 0; i < *n; ++i) {
                    auto key = read_string();
                    if (!key) return std::nullopt;
                    auto v = read_value(depth + 1);
                    if (!v) return std::nullopt;
                    map.insert_or_assign(std::move(*key), std::move(*v));
                }
                return Value{std::move(map)};
            }
        }
        return std::nullopt;
    }

    auto read_optional_string() -> std::optional<std::optional<std::string>> {
        auto present = read_bool();
        if (!present) return std::nullopt;
        if (!*present) return std::optional<std::string>{};
        auto s = read_string();
        if (!s) return std::nullopt;
        return std::optional<std::string>{std::move(*s)};
    }

    auto read_optional_vector() -> std::optional<std::optional<Vector>> {
        auto present = read_bool();
        if (!present) return std::nullopt;
        if (!*present) return std::optional<Vector>{};
        auto n = read_count(4);
        if (!n) return std::nullopt;
        auto v = Vector{};
        v.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto f = read_f32();
            if (!f) return std::nullopt;
            v.push_back(*f);
        }
        return std::optional<Vector>{std::move(v)};
    }

    auto read_summary() -> std::optional<VersionSummary> {
        auto n = read_count(17);
        if (!n) return std::nullopt;
        auto summary = VersionSummary{};
        for (std::size_t i = 0; i < *n; ++i) {
            auto replica = read_replica_id();
            if (!replica) return std::nullopt;
            auto counter = read_uleb128();
            if (!counter) return std::nullopt;
            summary.advance(*replica, *counter);
        }
        return summary;
    }

    auto read_op_ids() -> std::optional<std::vector<OpId>> {
        auto n = read_count(17);
        if (!n) return std::nullopt;
        auto ids = std::vector<OpId>{};
        ids.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto id = read_op_id();
            if (!id) return std::nullopt;
            ids.push_back(*id);
        }
        return ids;
    }

    // Unknown tags come back as OpaqueMutation with the payload untouched.
    auto read_mutation() -> std::optional<Mutation> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        auto len = read_count(0);
        if (!len) return std::nullopt;
        auto bytes = read_bytes(*len);
        if (!bytes) return std::nullopt;

        auto payload = Reader{*bytes};
        auto mutation = std::optional<Mutation>{};
        switch (*tag) {
            case static_cast<std::uint8_t>(MutationKind::set_url):
                if (auto url = payload.read_string()) mutation = SetUrl{std::move(*url)};
                break;
            case static_cast<std::uint8_t>(MutationKind::set_title):
                if (auto title = payload.read_optional_string()) mutation = SetTitle{std::move(*title)};
                break;
            case static_cast<std::uint8_t>(MutationKind::add_tag):
                if (auto t = payload.read_string()) mutation = AddTag{std::move(*t)};
                break;
            case static_cast<std::uint8_t>(MutationKind::remove_tag): {
                auto t = payload.read_string();
                if (!t) break;
                auto observed = payload.read_op_ids();
                if (!observed) break;
                mutation = RemoveTag{std::move(*t), std::move(*observed)};
                break;
            }
            case static_cast<std::uint8_t>(MutationKind::set_metadata): {
                auto key = payload.read_string();
                if (!key) break;
                auto v = payload.read_value();
                if (!v) break;
                mutation = SetMetadataField{std::move(*key), std::move(*v)};
                break;
            }
            case static_cast<std::uint8_t>(MutationKind::set_deleted):
                if (auto d = payload.read_bool()) mutation = SetDeleted{*d};
                break;
            case static_cast<std::uint8_t>(MutationKind::set_embedding):
                if (auto e = payload.read_optional_vector()) mutation = SetEmbedding{std::move(*e)};
                break;
            default:
                return Mutation{OpaqueMutation{*tag, Bytes(bytes->begin(), bytes->end())}};
        }
        if (!mutation || !payload.at_end()) return std::nullopt;
        return mutation;
    }

    auto read_operation() -> std::optional<Operation> {
        auto id = read_op_id();
        if (!id) return std::nullopt;
        auto ts = read_timestamp();
        if (!ts) return std::nullopt;
        auto document = read_identifier();
        if (!document) return std::nullopt;
        auto mutation = read_mutation();
        if (!mutation) return std::nullopt;
        auto deps = read_op_ids();
        if (!deps) return std::nullopt;
        return Operation{
            .id = *id,
            .timestamp = *ts,
            .document = *document,
            .mutation = std::move(*mutation),
            .deps = std::move(*deps),
        };
    }

    template <typename T, typename ReadValue>
    auto read_register(ReadValue&& read_value_fn) -> std::optional<LWWRegister<T>> {
        auto v = read_value_fn();
        if (!v) return std::nullopt;
        auto ts = read_timestamp();
        if (!ts) return std::nullopt;
        return LWWRegister<T>{std::move(*v), *ts};
    }

    // Calls sink(element, tags) for each entry of a tag map.
    template <typename Sink>
    auto read_tag_map(Sink&& sink) -> bool {
        auto n = read_count(2);
        if (!n) return false;
        for (std::size_t i = 0; i < *n; ++i) {
            auto element = read_string();
            if (!element) return false;
            auto count = read_count(17);
            if (!count) return false;
            auto tags = std::vector<OpId>{};
            tags.reserve(*count);
            for (std::size_t j = 0; j < *count; ++j) {
                auto id = read_op_id();
                if (!id) return false;
                tags.push_back(*id);
            }
            sink(*element, tags);
        }
        return true;
    }

    auto read_document() -> std::optional<BookmarkDocument> {
        auto id = read_identifier();
        if (!id) return std::nullopt;
        auto url = read_register<std::string>([this] { return read_string(); });
        if (!url) return std::nullopt;
        auto title = read_register<std::optional<std::string>>([this] { return read_optional_string(); });
        if (!title) return std::nullopt;

        auto tags = ORSet<std::string>{};
        auto added = read_tag_map([&](const std::string& element, const std::vector<OpId>& ids) {
            for (const auto& tag : ids) tags.add(element, tag);
        });
        if (!added) return std::nullopt;
        auto removed = read_tag_map([&](const std::string& element, const std::vector<OpId>& ids) {
            tags.remove(element, ids);
        });
        if (!removed) return std::nullopt;

        auto n = read_count(2);
        if (!n) return std::nullopt;
        auto metadata = LWWMap<std::string, Value>{};
        for (std::size_t i = 0; i < *n; ++i) {
            auto key = read_string();
            if (!key) return std::nullopt;
            auto reg = read_register<Value>([this] { return read_value(); });
            if (!reg) return std::nullopt;
            metadata.set(*key, reg->value(), reg->timestamp());
        }

        auto deleted = read_register<bool>([this] { return read_bool(); });
        if (!deleted) return std::nullopt;
        auto embedding = read_register<std::optional<Vector>>([this] { return read_optional_vector(); });
        if (!embedding) return std::nullopt;
        auto updated_at = read_timestamp();
        if (!updated_at) return std::nullopt;

        return BookmarkDocument::from_parts(*id, std::move(*url), std::move(*title),
                                            std::move(tags), std::move(metadata),
                                            std::move(*deleted), std::move(*embedding),
                                            *updated_at);
    }

    auto read_snapshot() -> std::optional<Snapshot> {
        auto frontier = read_summary();
        if (!frontier) return std::nullopt;
        auto n = read_count(16);
        if (!n) return std::nullopt;
        auto snapshot = Snapshot{.frontier = std::move(*frontier), .documents = {}, .purged = {}};
        snapshot.documents.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto doc = read_document();
            if (!doc) return std::nullopt;
            snapshot.documents.push_back(std::move(*doc));
        }
        auto purged = read_count(16);
        if (!purged) return std::nullopt;
        snapshot.purged.reserve(*purged);
        for (std::size_t i = 0; i < *purged; ++i) {
            auto id = read_identifier();
            if (!id) return std::nullopt;
            snapshot.purged.push_back(*id);
        }
        return snapshot;
    }

    auto read_delta() -> std::optional<Delta> {
        auto has_base = read_bool();
        if (!has_base) return std::nullopt;
        auto delta = Delta{};
        if (*has_base) {
            auto base = read_snapshot();
            if (!base) return std::nullopt;
            delta.base = std::move(*base);
        }
        auto n = read_count(20);
        if (!n) return std::nullopt;
        delta.ops.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto op = read_operation();
            if (!op) return std::nullopt;
            delta.ops.push_back(std::move(*op));
        }
        return delta;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace marksync::wire
