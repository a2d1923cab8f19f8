#include <marksync/bookmark.hpp>

#include <algorithm>
#include <string>

namespace marksync {

namespace {

auto hex_encode(const Bytes& data) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(data.size() * 2);
    for (auto b : data) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

}  // namespace

auto opaque_metadata_key(std::uint8_t kind) -> std::string {
    return std::string{opaque_metadata_prefix} + std::to_string(kind);
}

auto BookmarkDocument::metadata(const std::string& key) const -> std::optional<Value> {
    return metadata_.get(key);
}

auto BookmarkDocument::apply_operation(const Operation& op) -> std::optional<Error> {
    if (op.document != id_) {
        throw FatalMismatch{"operation for " + to_string(op.document) +
                            " applied to document " + to_string(id_)};
    }

    auto result = std::optional<Error>{};
    std::visit(overload{
        [&](const SetUrl& m) { url_.set(m.url, op.timestamp); },
        [&](const SetTitle& m) { title_.set(m.title, op.timestamp); },
        [&](const AddTag& m) { tags_.add(m.tag, op.id); },
        [&](const RemoveTag& m) { tags_.remove(m.tag, m.observed); },
        [&](const SetMetadataField& m) { metadata_.set(m.key, m.value, op.timestamp); },
        [&](const SetDeleted& m) { deleted_.set(m.deleted, op.timestamp); },
        [&](const SetEmbedding& m) { embedding_.set(m.embedding, op.timestamp); },
        [&](const OpaqueMutation& m) {
            auto entry = ValueMap{};
            entry.emplace("kind", Value{static_cast<std::int64_t>(m.kind)});
            entry.emplace("payload", Value{hex_encode(m.payload)});
            metadata_.set(opaque_metadata_key(m.kind), Value{std::move(entry)}, op.timestamp);
            result = Error{ErrorKind::unknown_field,
                           "mutation kind " + std::to_string(m.kind) + " kept as opaque metadata"};
        },
    }, op.mutation);

    updated_at_ = std::max(updated_at_, op.timestamp);
    return result;
}

void BookmarkDocument::merge(const BookmarkDocument& other) {
    if (other.id_ != id_) {
        throw FatalMismatch{"cannot merge document " + to_string(other.id_) +
                            " into " + to_string(id_)};
    }
    url_.merge(other.url_);
    title_.merge(other.title_);
    tags_.merge(other.tags_);
    metadata_.merge(other.metadata_);
    deleted_.merge(other.deleted_);
    embedding_.merge(other.embedding_);
    updated_at_ = std::max(updated_at_, other.updated_at_);
}

auto BookmarkDocument::from_parts(Identifier id,
                                  LWWRegister<std::string> url,
                                  LWWRegister<std::optional<std::string>> title,
                                  ORSet<std::string> tags,
                                  LWWMap<std::string, Value> metadata,
                                  LWWRegister<bool> deleted,
                                  LWWRegister<std::optional<Vector>> embedding,
                                  HybridTimestamp updated_at) -> BookmarkDocument {
    auto doc = BookmarkDocument{id};
    doc.url_ = std::move(url);
    doc.title_ = std::move(title);
    doc.tags_ = std::move(tags);
    doc.metadata_ = std::move(metadata);
    doc.deleted_ = std::move(deleted);
    doc.embedding_ = std::move(embedding);
    doc.updated_at_ = updated_at;
    return doc;
}

}  // namespace marksync
