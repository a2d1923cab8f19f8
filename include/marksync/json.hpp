/// @file json.hpp
/// @brief nlohmann/json interoperability for marksync.
///
/// ADL to_json/from_json for the data model and configuration, plus a JSON
/// export of a replica's active collection. Identifiers are rendered as
/// canonical UUID strings, replica ids as hex, opaque payloads as base64.

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/config.hpp>
#include <marksync/op.hpp>
#include <marksync/replica_store.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>

#include <nlohmann/json.hpp>

namespace marksync {

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

// -- Identity and causality ---------------------------------------------------

void to_json(nlohmann::json& j, const ReplicaId& id);
void from_json(const nlohmann::json& j, ReplicaId& id);

void to_json(nlohmann::json& j, const Identifier& id);
void from_json(const nlohmann::json& j, Identifier& id);

void to_json(nlohmann::json& j, const OpId& id);
void from_json(const nlohmann::json& j, OpId& id);

void to_json(nlohmann::json& j, const HybridTimestamp& ts);
void from_json(const nlohmann::json& j, HybridTimestamp& ts);

void to_json(nlohmann::json& j, const VersionSummary& summary);
void from_json(const nlohmann::json& j, VersionSummary& summary);

// -- Operations and documents -------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

/// The resolved view of a document (not its CRDT metadata).
void to_json(nlohmann::json& j, const BookmarkDocument& doc);

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const SearchWeights& w);
void from_json(const nlohmann::json& j, SearchWeights& w);
void to_json(nlohmann::json& j, const HnswParams& p);
void from_json(const nlohmann::json& j, HnswParams& p);
void to_json(nlohmann::json& j, const CompactionPolicy& p);
void from_json(const nlohmann::json& j, CompactionPolicy& p);
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

/// Validate a parsed configuration document.
/// @throws Exception{invalid_config}
auto load_config_json(const nlohmann::json& j) -> EngineConfig;

// -- Export -------------------------------------------------------------------

/// The active documents of a replica as a JSON array, ascending by id.
auto export_json(const ReplicaStore& store) -> nlohmann::json;

}  // namespace marksync
