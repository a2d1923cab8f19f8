/// @file sync.hpp
/// @brief The delta synchronization protocol between two replicas.
///
/// Each side runs a SyncSession over its own ReplicaStore. Both sides may
/// open with start() (or one side only); messages are exchanged until both
/// report converged:
///
///   summary  ->  each side learns the other's frontier
///   delta    ->  each side applies what it was missing
///   done     ->  each side reports its final frontier and state digest
///
/// Applying is idempotent, so any message may be delivered more than once
/// and an aborted session can simply be retried from the start.
///
/// @code
/// auto result = marksync::sync_replicas(laptop, phone);
/// if (!result.converged()) { /* inspect result.error, retry later */ }
/// @endcode

#pragma once

#include <marksync/error.hpp>
#include <marksync/replica_store.hpp>
#include <marksync/sync_message.hpp>
#include <marksync/types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace marksync {

enum class SessionState : std::uint8_t {
    idle,
    exchanging_summaries,
    computing_delta,
    transmitting_delta,
    applying_remote_delta,
    converged,
    failed,
};

constexpr auto to_string_view(SessionState state) noexcept -> std::string_view {
    switch (state) {
        case SessionState::idle:                  return "idle";
        case SessionState::exchanging_summaries:  return "exchanging_summaries";
        case SessionState::computing_delta:       return "computing_delta";
        case SessionState::transmitting_delta:    return "transmitting_delta";
        case SessionState::applying_remote_delta: return "applying_remote_delta";
        case SessionState::converged:             return "converged";
        case SessionState::failed:                return "failed";
    }
    return "unknown";
}

struct SessionStats {
    std::size_t ops_sent{0};
    std::size_t ops_applied{0};
    std::size_t ops_duplicate{0};
    std::size_t ops_discarded{0};
    std::size_t ops_buffered{0};  ///< Ops that arrived before a dependency.
    std::size_t snapshots_applied{0};
};

/// One side of a synchronization with one peer.
class SyncSession {
public:
    explicit SyncSession(ReplicaStore& store) : store_{store} {}

    /// Open the session: idle -> exchanging_summaries.
    auto start() -> SyncMessage;

    /// Handle a message from the peer; returns the reply, if any.
    /// Storage failures fail the session rather than throw.
    auto receive(const SyncMessage& message) -> std::optional<SyncMessage>;

    /// Abort the session with an error (e.g. the transport failed).
    void fail(Error error);

    auto state() const -> SessionState { return state_; }
    auto error() const -> const std::optional<Error>& { return error_; }
    auto stats() const -> const SessionStats& { return stats_; }
    auto peer() const -> const std::optional<ReplicaId>& { return peer_; }

    auto finished() const -> bool {
        return state_ == SessionState::converged || state_ == SessionState::failed;
    }

private:
    void transition(SessionState next);
    auto make_delta(const VersionSummary& peer_summary) -> SyncMessage;
    auto make_done() -> SyncMessage;
    auto apply(const Delta& delta) -> std::optional<Error>;
    auto on_delta(const SyncMessage& message) -> std::optional<SyncMessage>;
    auto on_done(const SyncMessage& message) -> std::optional<SyncMessage>;

    ReplicaStore& store_;
    SessionState state_{SessionState::idle};
    std::optional<Error> error_;
    SessionStats stats_;
    std::optional<ReplicaId> peer_;
    bool sent_delta_{false};
    bool sent_done_{false};
};

/// A bidirectional channel carrying opaque encoded messages. At-least-once
/// delivery is sufficient.
class Transport {
public:
    virtual ~Transport() = default;

    /// @throws Exception{transport_failure} if the channel is closed.
    virtual void send(Bytes message) = 0;

    /// The next message, or nullopt after timeout (or once closed and drained).
    virtual auto receive(std::chrono::milliseconds timeout) -> std::optional<Bytes> = 0;
};

/// In-process Transport endpoint; see make_channel_pair().
class ChannelTransport : public Transport {
public:
    struct Queue {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<Bytes> messages;
        bool closed{false};
    };

    ChannelTransport(std::shared_ptr<Queue> inbox, std::shared_ptr<Queue> outbox)
        : inbox_{std::move(inbox)}, outbox_{std::move(outbox)} {}

    ~ChannelTransport() override { close(); }

    void send(Bytes message) override;
    auto receive(std::chrono::milliseconds timeout) -> std::optional<Bytes> override;

    /// Close both directions; pending receives on either end return.
    void close();

private:
    std::shared_ptr<Queue> inbox_;
    std::shared_ptr<Queue> outbox_;
};

/// Two connected in-memory endpoints.
auto make_channel_pair()
    -> std::pair<std::unique_ptr<ChannelTransport>, std::unique_ptr<ChannelTransport>>;

/// Drive one side of a session over a transport until it converges or
/// fails. A receive timeout fails the session with transport_failure.
auto run_session(SyncSession& session, Transport& transport,
                 std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> SessionState;

/// Outcome of an in-process sync between two replicas.
struct SyncResult {
    SessionState first{SessionState::idle};
    SessionState second{SessionState::idle};
    SessionStats first_stats;
    SessionStats second_stats;
    std::optional<Error> error;

    auto converged() const -> bool {
        return first == SessionState::converged && second == SessionState::converged;
    }
};

/// Synchronize two replicas in-process, passing every message through the
/// binary codec.
auto sync_replicas(ReplicaStore& first, ReplicaStore& second) -> SyncResult;

}  // namespace marksync
