/// @file codec.hpp
/// @brief Stable binary encoding of operations, summaries, documents and
/// sync messages.
///
/// Every encoder output is a self-contained envelope (magic, CRC-32, type,
/// flags, length, body). Decoders return nullopt for anything truncated,
/// corrupt or of the wrong envelope type; they never throw.
///
/// @code
/// auto bytes = marksync::encode(op);
/// auto back  = marksync::decode_operation(bytes);  // std::optional<Operation>
/// @endcode

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/op.hpp>
#include <marksync/sync_message.hpp>
#include <marksync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace marksync {

auto encode(const Operation& op) -> Bytes;
auto encode(const VersionSummary& summary) -> Bytes;
auto encode(const BookmarkDocument& doc) -> Bytes;
auto encode(const Snapshot& snapshot) -> Bytes;
auto encode(const SyncMessage& message) -> Bytes;

auto decode_operation(std::span<const std::byte> data) -> std::optional<Operation>;
auto decode_summary(std::span<const std::byte> data) -> std::optional<VersionSummary>;
auto decode_document(std::span<const std::byte> data) -> std::optional<BookmarkDocument>;
auto decode_snapshot(std::span<const std::byte> data) -> std::optional<Snapshot>;
auto decode_message(std::span<const std::byte> data) -> std::optional<SyncMessage>;

/// CRC-32 over the canonical (uncompressed) encoding of the documents,
/// taken in the order given.
auto state_digest(std::span<const BookmarkDocument* const> documents) -> std::uint32_t;

}  // namespace marksync
