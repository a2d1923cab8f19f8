#pragma once

// Byte stream writer for the marksync wire format.
// Internal header — not installed.
//
// Layout conventions:
//   integers     ULEB128 (unsigned) / SLEB128 (signed)
//   strings      ULEB128 length + UTF-8 bytes
//   ids          raw 16 bytes
//   floats       IEEE-754 little endian
//   mutations    tag byte + ULEB128 payload length + payload, so readers can
//                carry unknown tags through untouched

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/op.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>
#include "../encoding/leb128.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace marksync::wire {

// Value tags.
enum class ValueTag : std::uint8_t {
    null    = 0,
    boolean = 1,
    integer = 2,
    real    = 3,
    string  = 4,
    map     = 5,
};

class Writer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bool(bool v) { write_u8(v ? 1 : 0); }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_u32_le(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            write_u8(static_cast<std::uint8_t>(v >> (i * 8)));
        }
    }

    void write_u64_le(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            write_u8(static_cast<std::uint8_t>(v >> (i * 8)));
        }
    }

    void write_f32(float v) { write_u32_le(std::bit_cast<std::uint32_t>(v)); }
    void write_f64(double v) { write_u64_le(std::bit_cast<std::uint64_t>(v)); }

    void write_replica_id(const ReplicaId& id) { write_bytes(id.bytes); }
    void write_identifier(const Identifier& id) { write_bytes(id.bytes); }

    void write_op_id(const OpId& id) {
        write_uleb128(id.counter);
        write_replica_id(id.replica);
    }

    void write_timestamp(const HybridTimestamp& ts) {
        write_sleb128(ts.physical_ms);
        write_uleb128(ts.logical);
        write_replica_id(ts.replica);
    }

    void write_value(const Value& value) {
        std::visit(overload{
            [this](Null) { write_u8(static_cast<std::uint8_t>(ValueTag::null)); },
            [this](bool b) {
                write_u8(static_cast<std::uint8_t>(ValueTag::boolean));
                write_bool(b);
            },
            [this](std::int64_t i) {
                write_u8(static_cast<std::uint8_t>(ValueTag::integer));
                write_sleb128(i);
            },
            [this](double d) {
                write_u8(static_cast<std::uint8_t>(ValueTag::real));
                write_f64(d);
            },
            [this](const std::string& s) {
                write_u8(static_cast<std::uint8_t>(ValueTag::string));
                write_string(s);
            },
            [this](const ValueMap& m) {
                write_u8(static_cast<std::uint8_t>(ValueTag::map));
                write_uleb128(m.size());
                for (const auto& [key, v] : m) {
                    write_string(key);
                    write_value(v);
                }
            },
        }, value.inner);
    }

    void write_optional_string(const std::optional<std::string>& s) {
        write_bool(s.has_value());
        if (s) write_string(*s);
    }

    void write_optional_vector(const std::optional<Vector>& v) {
        write_bool(v.has_value());
        if (!v) return;
        write_uleb128(v->size());
        for (auto f : *v) write_f32(f);
    }

    void write_summary(const VersionSummary& summary) {
        write_uleb128(summary.entries().size());
        for (const auto& [replica, counter] : summary.entries()) {
            write_replica_id(replica);
            write_uleb128(counter);
        }
    }

    void write_op_ids(const std::vector<OpId>& ids) {
        write_uleb128(ids.size());
        for (const auto& id : ids) write_op_id(id);
    }

    void write_mutation(const Mutation& mutation) {
        write_u8(mutation_tag(mutation));
        auto payload = Writer{};
        std::visit(overload{
            [&](const SetUrl& m) { payload.write_string(m.url); },
            [&](const SetTitle& m) { payload.write_optional_string(m.title); },
            [&](const AddTag& m) { payload.write_string(m.tag); },
            [&](const RemoveTag& m) {
                payload.write_string(m.tag);
                payload.write_op_ids(m.observed);
            },
            [&](const SetMetadataField& m) {
                payload.write_string(m.key);
                payload.write_value(m.value);
            },
            [&](const SetDeleted& m) { payload.write_bool(m.deleted); },
            [&](const SetEmbedding& m) { payload.write_optional_vector(m.embedding); },
            [&](const OpaqueMutation& m) { payload.write_bytes(m.payload); },
        }, mutation);
        write_uleb128(payload.data().size());
        write_bytes(payload.data());
    }

    void write_operation(const Operation& op) {
        write_op_id(op.id);
        write_timestamp(op.timestamp);
        write_identifier(op.document);
        write_mutation(op.mutation);
        write_op_ids(op.deps);
    }

    template <typename T, typename WriteValue>
    void write_register(const LWWRegister<T>& reg, WriteValue&& write_value_fn) {
        write_value_fn(reg.value());
        write_timestamp(reg.timestamp());
    }

    void write_tag_map(const std::map<std::string, std::set<OpId>>& tags) {
        write_uleb128(tags.size());
        for (const auto& [element, ids] : tags) {
            write_string(element);
            write_uleb128(ids.size());
            for (const auto& id : ids) write_op_id(id);
        }
    }

    void write_document(const BookmarkDocument& doc) {
        write_identifier(doc.id());
        write_register(doc.url_register(), [this](const std::string& s) { write_string(s); });
        write_register(doc.title_register(),
                       [this](const std::optional<std::string>& s) { write_optional_string(s); });
        write_tag_map(doc.tag_set().adds());
        write_tag_map(doc.tag_set().removes());
        const auto& metadata = doc.metadata_map().entries();
        write_uleb128(metadata.size());
        for (const auto& [key, reg] : metadata) {
            write_string(key);
            write_register(reg, [this](const Value& v) { write_value(v); });
        }
        write_register(doc.deleted_register(), [this](bool b) { write_bool(b); });
        write_register(doc.embedding_register(),
                       [this](const std::optional<Vector>& v) { write_optional_vector(v); });
        write_timestamp(doc.updated_at());
    }

    void write_snapshot(const Snapshot& snapshot) {
        write_summary(snapshot.frontier);
        write_uleb128(snapshot.documents.size());
        for (const auto& doc : snapshot.documents) write_document(doc);
        write_uleb128(snapshot.purged.size());
        for (const auto& id : snapshot.purged) write_identifier(id);
    }

    void write_delta(const Delta& delta) {
        write_bool(delta.base.has_value());
        if (delta.base) write_snapshot(*delta.base);
        write_uleb128(delta.ops.size());
        for (const auto& op : delta.ops) write_operation(op);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace marksync::wire
