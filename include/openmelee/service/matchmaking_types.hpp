#pragma once

/// @file matchmaking_types.hpp
/// @brief Value types shared by the matchmaking components.

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "openmelee/foundation/types.hpp"
#include "openmelee/protocol/messages.hpp"

namespace openmelee::service {

using foundation::PeerId;

/// Client version advertised in every session descriptor.
inline constexpr std::string_view kLatestClientVersion = "2.5.1";

/// Runtime settings of the matchmaking loop.
struct MatchmakingConfig {
    std::chrono::milliseconds pollTimeout{1000};
    std::string latestVersion{kLatestClientVersion};
};

/// A connected peer holding a live ticket.
struct TicketedPeer {
    PeerId id;
    std::string address;
    protocol::CreateTicket ticket;
    uint64_t ticketSeq = 0;  ///< arrival order of the ticket
};

/// Peers the grouping engine found compatible.
struct MatchGroup {
    protocol::OnlinePlayMode mode = protocol::OnlinePlayMode::Direct;
    std::vector<PeerId> members;
};

/// Input of the session builder for one participant.
struct MatchMember {
    protocol::CreateTicket ticket;
    std::string address;  ///< transport-observed "ip:port"
};

/// A built match, rendered once per participant and then discarded.
struct MatchSession {
    std::string matchId;
    protocol::OnlinePlayMode mode = protocol::OnlinePlayMode::Direct;
    std::vector<protocol::Stage> stages;
    std::vector<protocol::Player> players;  ///< isLocalPlayer unset
    protocol::ControllerPort hostPort = protocol::ControllerPort::One;
};

/// Counters exposed by MatchmakingServer::stats().
struct MatchmakingStats {
    uint64_t ticketsAccepted = 0;
    uint64_t ticketsRejected = 0;   ///< valid tickets for an unsupported mode
    uint64_t malformedMessages = 0;
    uint64_t matchesFormed = 0;
    uint64_t sendFailures = 0;
    std::size_t connectedPeers = 0;
    std::size_t pendingTickets = 0;
};

} // namespace openmelee::service
