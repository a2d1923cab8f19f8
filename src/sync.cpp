#include <marksync/sync.hpp>

#include <marksync/codec.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace marksync {

// -- SyncSession --------------------------------------------------------------

void SyncSession::transition(SessionState next) {
    if (state_ == next) return;
    SPDLOG_DEBUG("sync {} <-> {}: {} -> {}",
                 to_hex(store_.replica_id()),
                 peer_ ? to_hex(*peer_) : std::string{"?"},
                 to_string_view(state_), to_string_view(next));
    state_ = next;
}

void SyncSession::fail(Error error) {
    if (state_ == SessionState::failed) return;
    SPDLOG_WARN("sync {} failed: {}: {}", to_hex(store_.replica_id()),
                to_string_view(error.kind), error.message);
    error_ = std::move(error);
    transition(SessionState::failed);
}

auto SyncSession::start() -> SyncMessage {
    transition(SessionState::exchanging_summaries);
    return SyncMessage{
        .type = MessageType::summary,
        .sender = store_.replica_id(),
        .summary = store_.summary(),
        .delta = std::nullopt,
        .digest = 0,
    };
}

auto SyncSession::make_delta(const VersionSummary& peer_summary) -> SyncMessage {
    transition(SessionState::computing_delta);
    auto delta = store_.delta_since(peer_summary);
    stats_.ops_sent += delta.ops.size();
    sent_delta_ = true;
    transition(SessionState::transmitting_delta);
    return SyncMessage{
        .type = MessageType::delta,
        .sender = store_.replica_id(),
        .summary = store_.summary(),
        .delta = std::move(delta),
        .digest = 0,
    };
}

auto SyncSession::make_done() -> SyncMessage {
    sent_done_ = true;
    return SyncMessage{
        .type = MessageType::done,
        .sender = store_.replica_id(),
        .summary = store_.summary(),
        .delta = std::nullopt,
        .digest = store_.digest(),
    };
}

auto SyncSession::receive(const SyncMessage& message) -> std::optional<SyncMessage> {
    if (finished()) return std::nullopt;
    if (message.sender == store_.replica_id()) {
        fail(Error{ErrorKind::sync_error, "peer has the same replica id"});
        return std::nullopt;
    }
    if (peer_ && *peer_ != message.sender) {
        fail(Error{ErrorKind::sync_error, "message from an unexpected replica " + to_hex(message.sender)});
        return std::nullopt;
    }
    peer_ = message.sender;

    try {
        switch (message.type) {
            case MessageType::summary:
                if (state_ == SessionState::idle) transition(SessionState::exchanging_summaries);
                if (sent_delta_) return std::nullopt;
                return make_delta(message.summary);
            case MessageType::delta:
                return on_delta(message);
            case MessageType::done:
                return on_done(message);
        }
    } catch (const Exception& e) {
        fail(e.error());
        return std::nullopt;
    }
    fail(Error{ErrorKind::sync_error, "unknown message type"});
    return std::nullopt;
}

auto SyncSession::on_delta(const SyncMessage& message) -> std::optional<SyncMessage> {
    if (!message.delta) {
        fail(Error{ErrorKind::sync_error, "delta message without a delta"});
        return std::nullopt;
    }
    transition(SessionState::applying_remote_delta);
    if (auto err = apply(*message.delta)) {
        fail(std::move(*err));
        return std::nullopt;
    }
    store_.acknowledge(message.sender, message.summary);

    if (!sent_delta_) return make_delta(message.summary);
    return make_done();
}

auto SyncSession::on_done(const SyncMessage& message) -> std::optional<SyncMessage> {
    store_.acknowledge(message.sender, message.summary);
    auto reply = sent_done_ ? std::nullopt : std::optional<SyncMessage>{make_done()};

    if (store_.summary() == message.summary) {
        const auto local = store_.digest();
        if (local != message.digest) {
            fail(Error{ErrorKind::sync_error,
                       "equal summaries but state digests differ (" + std::to_string(local)
                       + " vs " + std::to_string(message.digest) + ")"});
            return reply;
        }
    } else {
        SPDLOG_DEBUG("sync {}: peer summary differs at done; writes raced the session",
                     to_hex(store_.replica_id()));
    }
    transition(SessionState::converged);
    SPDLOG_INFO("sync {} <-> {} converged: sent {}, applied {}, buffered {}",
                to_hex(store_.replica_id()), to_hex(message.sender),
                stats_.ops_sent, stats_.ops_applied, stats_.ops_buffered);
    return reply;
}

// Applies ops in repeated passes so that an op arriving before its
// dependency is retried once the dependency has been applied.
auto SyncSession::apply(const Delta& delta) -> std::optional<Error> {
    if (delta.base) {
        store_.apply_snapshot(*delta.base);
        ++stats_.snapshots_applied;
    }

    auto pending = std::vector<const Operation*>{};
    pending.reserve(delta.ops.size());
    for (const auto& op : delta.ops) pending.push_back(&op);

    auto first_pass = true;
    while (!pending.empty()) {
        auto waiting = std::vector<const Operation*>{};
        for (const auto* op : pending) {
            switch (store_.apply_remote(*op)) {
                case ApplyStatus::applied:            ++stats_.ops_applied; break;
                case ApplyStatus::duplicate:          ++stats_.ops_duplicate; break;
                case ApplyStatus::discarded:          ++stats_.ops_discarded; break;
                case ApplyStatus::missing_dependency: waiting.push_back(op); break;
            }
        }
        if (first_pass) stats_.ops_buffered += waiting.size();
        first_pass = false;
        if (waiting.size() == pending.size()) {
            SPDLOG_WARN("sync {}: {} ops still miss dependencies at end of delta",
                        to_hex(store_.replica_id()), waiting.size());
            return Error{ErrorKind::causality_gap,
                         std::to_string(waiting.size()) + " operations have unknown dependencies"};
        }
        pending = std::move(waiting);
    }
    return std::nullopt;
}

// -- ChannelTransport ---------------------------------------------------------

void ChannelTransport::send(Bytes message) {
    auto lock = std::unique_lock{outbox_->mutex};
    if (outbox_->closed) throw Exception{ErrorKind::transport_failure, "channel closed"};
    outbox_->messages.push_back(std::move(message));
    lock.unlock();
    outbox_->ready.notify_one();
}

auto ChannelTransport::receive(std::chrono::milliseconds timeout) -> std::optional<Bytes> {
    auto lock = std::unique_lock{inbox_->mutex};
    const auto ready = inbox_->ready.wait_for(lock, timeout, [this] {
        return !inbox_->messages.empty() || inbox_->closed;
    });
    if (!ready || inbox_->messages.empty()) return std::nullopt;
    auto message = std::move(inbox_->messages.front());
    inbox_->messages.pop_front();
    return message;
}

void ChannelTransport::close() {
    for (auto* queue : {inbox_.get(), outbox_.get()}) {
        {
            auto lock = std::lock_guard{queue->mutex};
            queue->closed = true;
        }
        queue->ready.notify_all();
    }
}

auto make_channel_pair()
    -> std::pair<std::unique_ptr<ChannelTransport>, std::unique_ptr<ChannelTransport>> {
    auto a_to_b = std::make_shared<ChannelTransport::Queue>();
    auto b_to_a = std::make_shared<ChannelTransport::Queue>();
    return {std::make_unique<ChannelTransport>(b_to_a, a_to_b),
            std::make_unique<ChannelTransport>(a_to_b, b_to_a)};
}

// -- Drivers ------------------------------------------------------------------

auto run_session(SyncSession& session, Transport& transport,
                 std::chrono::milliseconds timeout) -> SessionState {
    try {
        if (session.state() == SessionState::idle) {
            transport.send(encode(session.start()));
        }
        while (!session.finished()) {
            auto bytes = transport.receive(timeout);
            if (!bytes) {
                session.fail(Error{ErrorKind::transport_failure, "no message from peer before timeout"});
                break;
            }
            auto message = decode_message(*bytes);
            if (!message) {
                session.fail(Error{ErrorKind::decoding_error, "malformed sync message"});
                break;
            }
            if (auto reply = session.receive(*message)) {
                transport.send(encode(*reply));
            }
        }
    } catch (const Exception& e) {
        session.fail(e.error());
    }
    return session.state();
}

auto sync_replicas(ReplicaStore& first, ReplicaStore& second) -> SyncResult {
    auto a = SyncSession{first};
    auto b = SyncSession{second};

    auto to_a = std::deque<Bytes>{};
    auto to_b = std::deque<Bytes>{};
    to_b.push_back(encode(a.start()));
    to_a.push_back(encode(b.start()));

    auto deliver = [](SyncSession& session, std::deque<Bytes>& inbox, std::deque<Bytes>& outbox) {
        auto bytes = std::move(inbox.front());
        inbox.pop_front();
        auto message = decode_message(bytes);
        if (!message) {
            session.fail(Error{ErrorKind::decoding_error, "malformed sync message"});
            return;
        }
        if (auto reply = session.receive(*message)) {
            outbox.push_back(encode(*reply));
        }
    };

    while (!to_a.empty() || !to_b.empty()) {
        if (!to_b.empty()) deliver(b, to_b, to_a);
        if (!to_a.empty()) deliver(a, to_a, to_b);
    }

    auto result = SyncResult{
        .first = a.state(),
        .second = b.state(),
        .first_stats = a.stats(),
        .second_stats = b.stats(),
        .error = a.error() ? a.error() : b.error(),
    };
    if (!result.converged() && !result.error) {
        result.error = Error{ErrorKind::sync_error, "session ended before convergence"};
    }
    return result;
}

}  // namespace marksync
