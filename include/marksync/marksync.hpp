/// @file marksync.hpp
/// @brief Umbrella header for the marksync library.
///
/// Include this single header for access to all public types:
/// ReplicaStore, BookmarkDocument, the CRDT primitives, the sync protocol,
/// HybridIndex, the codec, configuration and Error.

#pragma once

#include <marksync/bookmark.hpp>
#include <marksync/clock.hpp>
#include <marksync/codec.hpp>
#include <marksync/config.hpp>
#include <marksync/crdt.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/embedding.hpp>
#include <marksync/error.hpp>
#include <marksync/hybrid_index.hpp>
#include <marksync/op.hpp>
#include <marksync/replica_store.hpp>
#include <marksync/storage.hpp>
#include <marksync/sync.hpp>
#include <marksync/sync_message.hpp>
#include <marksync/types.hpp>
#include <marksync/value.hpp>
