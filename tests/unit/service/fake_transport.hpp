#pragma once

/// @file fake_transport.hpp
/// @brief Scripted TransportHost for matchmaking tests.

#include <chrono>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "openmelee/protocol/wire_codec.hpp"
#include "openmelee/transport/transport_host.hpp"

namespace openmelee::testing {

/// Replays queued events and records what the loop sends back.
class FakeTransport : public transport::TransportHost {
public:
    struct Sent {
        transport::PeerId peer;
        std::vector<uint8_t> payload;
    };

    struct Disconnect {
        transport::PeerId peer;
        std::chrono::milliseconds delay;
    };

    // -- Scripting --------------------------------------------------------------

    void connect(transport::PeerId peer, std::string address) {
        peers_[peer] = transport::PeerInfo{peer, transport::PeerState::Connected, address};
        events_.push_back(transport::ConnectEvent{peer, std::move(address)});
    }

    void receive(transport::PeerId peer, std::vector<uint8_t> payload) {
        events_.push_back(transport::ReceiveEvent{peer, 0, std::move(payload)});
    }

    void receiveTicket(transport::PeerId peer, const protocol::CreateTicket& ticket) {
        auto encoded = protocol::encodeTicket(ticket);
        receive(peer, encoded ? encoded.value() : std::vector<uint8_t>{});
    }

    void drop(transport::PeerId peer) {
        peers_.erase(peer);
        events_.push_back(transport::DisconnectEvent{peer});
    }

    void setState(transport::PeerId peer, transport::PeerState state) {
        peers_[peer].state = state;
    }

    void failSendsTo(transport::PeerId peer) { failing_.insert(peer); }

    [[nodiscard]] std::size_t pendingEvents() const { return events_.size(); }

    // -- Inspection -------------------------------------------------------------

    [[nodiscard]] const std::vector<Sent>& sent() const { return sent_; }
    [[nodiscard]] const std::vector<Disconnect>& disconnects() const { return disconnects_; }

    [[nodiscard]] std::vector<protocol::MatchmakingMessage> messagesTo(
        transport::PeerId peer) const {
        std::vector<protocol::MatchmakingMessage> out;
        for (const auto& s : sent_) {
            if (s.peer == peer) {
                auto decoded = protocol::decodeMessage(s.payload);
                if (decoded) {
                    out.push_back(decoded.value());
                }
            }
        }
        return out;
    }

    void clearRecords() {
        sent_.clear();
        disconnects_.clear();
    }

    // -- TransportHost ----------------------------------------------------------

    std::optional<transport::TransportEvent> poll(std::chrono::milliseconds) override {
        if (events_.empty()) {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    foundation::GameResult<void> send(transport::PeerId peer, std::vector<uint8_t> payload,
                                      uint8_t, transport::Reliability) override {
        if (failing_.count(peer) > 0) {
            return foundation::GameResult<void>::err(
                foundation::GameError(foundation::ErrorCode::SendFailed, "scripted failure"));
        }
        sent_.push_back(Sent{peer, std::move(payload)});
        return foundation::GameResult<void>::ok();
    }

    foundation::GameResult<void> disconnect(transport::PeerId peer,
                                            std::chrono::milliseconds delay) override {
        disconnects_.push_back(Disconnect{peer, delay});
        auto it = peers_.find(peer);
        if (it != peers_.end()) {
            it->second.state = transport::PeerState::Disconnecting;
        }
        return foundation::GameResult<void>::ok();
    }

    std::vector<transport::PeerInfo> peers() const override {
        std::vector<transport::PeerInfo> out;
        for (const auto& [id, info] : peers_) {
            out.push_back(info);
        }
        return out;
    }

    std::optional<transport::PeerInfo> peer(transport::PeerId id) const override {
        auto it = peers_.find(id);
        if (it == peers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::deque<transport::TransportEvent> events_;
    std::map<transport::PeerId, transport::PeerInfo> peers_;
    std::set<transport::PeerId> failing_;
    std::vector<Sent> sent_;
    std::vector<Disconnect> disconnects_;
};

/// Direct-mode ticket from @p own looking for @p target.
inline protocol::CreateTicket directTicket(const std::string& own, const std::string& target) {
    protocol::CreateTicket ticket;
    ticket.appVersion = "2.5.1";
    ticket.ipAddressLan = "192.168.1.10:51000";
    ticket.search.mode = protocol::OnlinePlayMode::Direct;
    ticket.search.targetConnectCode = target;
    ticket.user = protocol::User{"uid-" + own, "key-" + own, "name-" + own, own};
    return ticket;
}

} // namespace openmelee::testing
