#pragma once

/// @file grouping_engine.hpp
/// @brief Partitions ticketed peers into match-ready groups.

#include <vector>

#include "openmelee/service/matchmaking_types.hpp"
#include "openmelee/transport/transport_host.hpp"

namespace openmelee::service {

/// Stateless grouping pass, re-run against a fresh snapshot every loop
/// iteration.
///
/// Only Direct mode has a rule. Two Direct tickets are compatible when each
/// targets the other's connect code; the bucket key is the unordered pair
/// {own code, target code}. Inside a bucket peers are taken in ticket
/// arrival order and each is paired with the earliest unmatched peer whose
/// own code equals its target, so every group has exactly two members and
/// any surplus peer keeps waiting.
class GroupingEngine {
public:
    /// Group @p candidates (any order).
    [[nodiscard]] std::vector<MatchGroup> group(
        const std::vector<TicketedPeer>& candidates) const;

    /// Group only the candidates that @p peers reports as Connected.
    [[nodiscard]] std::vector<MatchGroup> group(
        const std::vector<TicketedPeer>& candidates,
        const std::vector<transport::PeerInfo>& peers) const;

private:
    [[nodiscard]] std::vector<MatchGroup> groupDirect(
        const std::vector<const TicketedPeer*>& direct) const;
};

} // namespace openmelee::service
