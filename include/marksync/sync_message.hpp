/// @file sync_message.hpp
/// @brief Messages exchanged by two sync sessions.

#pragma once

#include <marksync/clock.hpp>
#include <marksync/delta_log.hpp>
#include <marksync/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace marksync {

enum class MessageType : std::uint8_t {
    summary = 1,  ///< Opening message: the sender's frontier.
    delta   = 2,  ///< What the receiver is missing, plus the sender's frontier.
    done    = 3,  ///< The sender has applied everything; carries its digest.
};

constexpr auto to_string_view(MessageType type) noexcept -> std::string_view {
    switch (type) {
        case MessageType::summary: return "summary";
        case MessageType::delta:   return "delta";
        case MessageType::done:    return "done";
    }
    return "unknown";
}

struct SyncMessage {
    MessageType type{MessageType::summary};
    ReplicaId sender{};
    VersionSummary summary;
    std::optional<Delta> delta;  ///< Present on delta messages only.
    std::uint32_t digest{0};     ///< CRC-32 of the sender's state; done messages only.

    auto operator==(const SyncMessage&) const -> bool = default;
};

}  // namespace marksync
