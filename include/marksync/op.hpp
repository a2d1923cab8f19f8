/// @file op.hpp
/// @brief Operations: the immutable, causally scoped mutation records.

#pragma once

#include <marksync/clock.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marksync {

/// Wire tags of the mutation kinds this version understands.
enum class MutationKind : std::uint8_t {
    set_url       = 1,
    set_title     = 2,
    add_tag       = 3,
    remove_tag    = 4,
    set_metadata  = 5,
    set_deleted   = 6,
    set_embedding = 7,
};

/// Convert a MutationKind to its string representation.
constexpr auto to_string_view(MutationKind kind) noexcept -> std::string_view {
    switch (kind) {
        case MutationKind::set_url:       return "set_url";
        case MutationKind::set_title:     return "set_title";
        case MutationKind::add_tag:       return "add_tag";
        case MutationKind::remove_tag:    return "remove_tag";
        case MutationKind::set_metadata:  return "set_metadata";
        case MutationKind::set_deleted:   return "set_deleted";
        case MutationKind::set_embedding: return "set_embedding";
    }
    return "unknown";
}

struct SetUrl {
    std::string url;
    auto operator==(const SetUrl&) const -> bool = default;
};

struct SetTitle {
    std::optional<std::string> title;
    auto operator==(const SetTitle&) const -> bool = default;
};

/// Add a tag. The operation's OpId is the unique add-tag.
struct AddTag {
    std::string tag;
    auto operator==(const AddTag&) const -> bool = default;
};

/// Remove a tag, naming the add-tags observed at the origin.
/// Locally issued removes may leave observed empty; the store fills it in.
struct RemoveTag {
    std::string tag;
    std::vector<OpId> observed;
    auto operator==(const RemoveTag&) const -> bool = default;
};

/// Set one metadata key. A Null value clears the key.
struct SetMetadataField {
    std::string key;
    Value value;
    auto operator==(const SetMetadataField&) const -> bool = default;
};

struct SetDeleted {
    bool deleted{true};
    auto operator==(const SetDeleted&) const -> bool = default;
};

struct SetEmbedding {
    std::optional<Vector> embedding;
    auto operator==(const SetEmbedding&) const -> bool = default;
};

/// A mutation kind this version does not understand.
///
/// Produced by the decoder for unknown wire tags. The raw payload is kept
/// so the operation re-encodes byte-identically when relayed to peers.
struct OpaqueMutation {
    std::uint8_t kind{0};
    Bytes payload;
    auto operator==(const OpaqueMutation&) const -> bool = default;
};

/// The closed set of document mutations.
using Mutation = std::variant<
    SetUrl,
    SetTitle,
    AddTag,
    RemoveTag,
    SetMetadataField,
    SetDeleted,
    SetEmbedding,
    OpaqueMutation
>;

/// The wire tag of a mutation (the raw tag for opaque mutations).
auto mutation_tag(const Mutation& m) -> std::uint8_t;

/// Human-readable name of a mutation ("opaque" for unknown kinds).
auto mutation_name(const Mutation& m) -> std::string_view;

/// A single operation in the delta log.
///
/// Operations are immutable once created. The id is globally unique;
/// deps lists the operations that must be applied before this one (the
/// author's previous operation and the latest operation it had seen on
/// the same document).
struct Operation {
    OpId id;                    ///< Globally unique operation id.
    HybridTimestamp timestamp;  ///< Last-writer-wins ordering.
    Identifier document;        ///< The bookmark the operation targets.
    Mutation mutation;          ///< What changes.
    std::vector<OpId> deps;     ///< Causal dependencies.

    auto operator==(const Operation&) const -> bool = default;
};

}  // namespace marksync
