#pragma once

/// @file peer_ticket_registry.hpp
/// @brief Connected peers and their most recent ticket.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "openmelee/service/matchmaking_types.hpp"

namespace openmelee::service {

/// In-memory peer -> optional ticket map owned by the matchmaking loop.
///
/// Not thread-safe; only the loop thread touches it.
class PeerTicketRegistry {
public:
    /// Register a newly connected peer without a ticket.
    /// Returns false if the peer is already known.
    bool addPeer(PeerId id, std::string address);

    /// Forget a peer and its ticket. Returns false for an unknown peer.
    bool removePeer(PeerId id);

    /// Replace the peer's ticket. Returns false for an unknown peer.
    bool setTicket(PeerId id, protocol::CreateTicket ticket);

    /// Drop the peer's ticket, keeping the peer.
    void clearTicket(PeerId id);

    [[nodiscard]] const protocol::CreateTicket* ticket(PeerId id) const;
    [[nodiscard]] std::optional<std::string> address(PeerId id) const;

    [[nodiscard]] bool contains(PeerId id) const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t ticketedCount() const;

    /// Peers holding a ticket, oldest ticket first.
    [[nodiscard]] std::vector<TicketedPeer> snapshot() const;

private:
    struct Entry {
        std::string address;
        std::optional<protocol::CreateTicket> ticket;
        uint64_t ticketSeq = 0;
    };

    std::unordered_map<PeerId, Entry> entries_;
    uint64_t nextTicketSeq_ = 1;
};

} // namespace openmelee::service
