/// @file peer_ticket_registry.cpp
/// @brief PeerTicketRegistry implementation.

#include "openmelee/service/peer_ticket_registry.hpp"

#include <algorithm>

namespace openmelee::service {

bool PeerTicketRegistry::addPeer(PeerId id, std::string address) {
    auto [it, inserted] = entries_.try_emplace(id);
    if (inserted) {
        it->second.address = std::move(address);
    }
    return inserted;
}

bool PeerTicketRegistry::removePeer(PeerId id) {
    return entries_.erase(id) > 0;
}

bool PeerTicketRegistry::setTicket(PeerId id, protocol::CreateTicket ticket) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.ticket = std::move(ticket);
    it->second.ticketSeq = nextTicketSeq_++;
    return true;
}

void PeerTicketRegistry::clearTicket(PeerId id) {
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        it->second.ticket.reset();
        it->second.ticketSeq = 0;
    }
}

const protocol::CreateTicket* PeerTicketRegistry::ticket(PeerId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end() || !it->second.ticket) {
        return nullptr;
    }
    return &*it->second.ticket;
}

std::optional<std::string> PeerTicketRegistry::address(PeerId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.address;
}

bool PeerTicketRegistry::contains(PeerId id) const {
    return entries_.count(id) > 0;
}

std::size_t PeerTicketRegistry::ticketedCount() const {
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(),
                      [](const auto& kv) { return kv.second.ticket.has_value(); }));
}

std::vector<TicketedPeer> PeerTicketRegistry::snapshot() const {
    std::vector<TicketedPeer> out;
    for (const auto& [id, entry] : entries_) {
        if (entry.ticket) {
            out.push_back(TicketedPeer{id, entry.address, *entry.ticket, entry.ticketSeq});
        }
    }
    std::sort(out.begin(), out.end(), [](const TicketedPeer& a, const TicketedPeer& b) {
        return a.ticketSeq < b.ticketSeq;
    });
    return out;
}

} // namespace openmelee::service
