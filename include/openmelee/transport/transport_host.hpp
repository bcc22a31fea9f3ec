#pragma once

/// @file transport_host.hpp
/// @brief Event-driven datagram transport seen by the matchmaking loop.
///
/// A host owns the set of remote peers. The loop pulls one event at a time
/// with poll() and pushes payloads back with send(). Per-peer application
/// data is not stored here; the matchmaking layer keeps its own registry.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "openmelee/foundation/game_result.hpp"
#include "openmelee/foundation/types.hpp"

namespace openmelee::transport {

using foundation::PeerId;

/// Lifecycle of a remote peer.
enum class PeerState : uint8_t {
    Connecting,    ///< Handshake started, not yet reported to the loop
    Connected,     ///< Reported with a ConnectEvent, may send and receive
    Disconnecting  ///< Disconnect requested, draining queued reliable packets
};

constexpr std::string_view peerStateName(PeerState state) {
    switch (state) {
        case PeerState::Connecting:    return "Connecting";
        case PeerState::Connected:     return "Connected";
        case PeerState::Disconnecting: return "Disconnecting";
    }
    return "Unknown";
}

/// Delivery guarantee for an outbound payload.
enum class Reliability : uint8_t {
    ReliableOrdered,  ///< Acknowledged, retransmitted, delivered in order
    Unreliable        ///< Fire and forget
};

/// Snapshot of a peer.
struct PeerInfo {
    PeerId id;
    PeerState state = PeerState::Connecting;
    std::string address;  ///< "ip:port" as observed by the transport
};

struct ConnectEvent {
    PeerId peer;
    std::string address;
};

struct DisconnectEvent {
    PeerId peer;
};

struct ReceiveEvent {
    PeerId peer;
    uint8_t channel = 0;
    std::vector<uint8_t> payload;
};

using TransportEvent = std::variant<ConnectEvent, DisconnectEvent, ReceiveEvent>;

/// Abstract transport host.
class TransportHost {
public:
    virtual ~TransportHost() = default;

    /// Wait up to @p timeout for the next event. Returns at most one event.
    virtual std::optional<TransportEvent> poll(std::chrono::milliseconds timeout) = 0;

    /// Queue @p payload for @p peer.
    /// @return SessionNotFound, PeerNotConnected or SendFailed on failure.
    [[nodiscard]] virtual foundation::GameResult<void> send(
        PeerId peer, std::vector<uint8_t> payload, uint8_t channel = 0,
        Reliability reliability = Reliability::ReliableOrdered) = 0;

    /// Disconnect @p peer once @p delay has elapsed and its queued reliable
    /// payloads have been acknowledged.
    [[nodiscard]] virtual foundation::GameResult<void> disconnect(
        PeerId peer, std::chrono::milliseconds delay) = 0;

    [[nodiscard]] virtual std::vector<PeerInfo> peers() const = 0;

    [[nodiscard]] virtual std::optional<PeerInfo> peer(PeerId id) const = 0;
};

} // namespace openmelee::transport
