/// @file bookmark.hpp
/// @brief BookmarkDocument: the composite CRDT for one bookmark.

#pragma once

#include <marksync/clock.hpp>
#include <marksync/crdt.hpp>
#include <marksync/error.hpp>
#include <marksync/op.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marksync {

/// Initial field values for a new bookmark.
struct BookmarkFields {
    std::string url;
    std::optional<std::string> title;
    std::vector<std::string> tags;
    ValueMap metadata;
    std::optional<Vector> embedding;
};

/// Metadata keys under which mutations of unknown kinds are preserved.
inline constexpr std::string_view opaque_metadata_prefix = "~opaque/";

/// One bookmark's replicated state.
///
/// Every field is an independent CRDT; merge() merges them field by field.
/// A deleted document is a tombstone: it keeps its state so later merges
/// remain correct and is hidden from active views.
class BookmarkDocument {
public:
    explicit BookmarkDocument(Identifier id) : id_{id} {}

    auto id() const -> const Identifier& { return id_; }

    auto url() const -> const std::string& { return url_.value(); }
    auto title() const -> const std::optional<std::string>& { return title_.value(); }
    auto tags() const -> std::vector<std::string> { return tags_.elements(); }
    auto has_tag(const std::string& tag) const -> bool { return tags_.contains(tag); }
    auto metadata(const std::string& key) const -> std::optional<Value>;
    auto deleted() const -> bool { return deleted_.value(); }
    auto embedding() const -> const std::optional<Vector>& { return embedding_.value(); }

    /// The greatest timestamp of any operation reflected in this document.
    auto updated_at() const -> const HybridTimestamp& { return updated_at_; }

    // -- Field CRDTs (read access for encoding and inspection) ----------------

    auto url_register() const -> const LWWRegister<std::string>& { return url_; }
    auto title_register() const -> const LWWRegister<std::optional<std::string>>& { return title_; }
    auto tag_set() const -> const ORSet<std::string>& { return tags_; }
    auto metadata_map() const -> const LWWMap<std::string, Value>& { return metadata_; }
    auto deleted_register() const -> const LWWRegister<bool>& { return deleted_; }
    auto embedding_register() const -> const LWWRegister<std::optional<Vector>>& { return embedding_; }

    /// Apply an operation to the matching field CRDT.
    ///
    /// @return nullopt on success; an unknown_field error when the mutation
    ///   kind is not part of this schema. In that case the mutation is kept
    ///   as an opaque metadata entry and the document is still updated.
    /// @throws FatalMismatch if the operation targets another document.
    auto apply_operation(const Operation& op) -> std::optional<Error>;

    /// Merge another replica's state of the same document.
    /// @throws FatalMismatch if the identifiers differ.
    void merge(const BookmarkDocument& other);

    /// Rebuild a document from its field CRDTs (used by the decoder).
    static auto from_parts(Identifier id,
                           LWWRegister<std::string> url,
                           LWWRegister<std::optional<std::string>> title,
                           ORSet<std::string> tags,
                           LWWMap<std::string, Value> metadata,
                           LWWRegister<bool> deleted,
                           LWWRegister<std::optional<Vector>> embedding,
                           HybridTimestamp updated_at) -> BookmarkDocument;

    auto operator==(const BookmarkDocument&) const -> bool = default;

private:
    Identifier id_;
    LWWRegister<std::string> url_;
    LWWRegister<std::optional<std::string>> title_;
    ORSet<std::string> tags_;
    LWWMap<std::string, Value> metadata_;
    LWWRegister<bool> deleted_;
    LWWRegister<std::optional<Vector>> embedding_;
    HybridTimestamp updated_at_{};
};

/// The metadata key an opaque mutation kind is preserved under.
auto opaque_metadata_key(std::uint8_t kind) -> std::string;

}  // namespace marksync
