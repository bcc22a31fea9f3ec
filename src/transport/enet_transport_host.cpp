/// @file enet_transport_host.cpp
/// @brief EnetTransportHost implementation.

#include "openmelee/transport/enet_transport_host.hpp"

#include <enet/enet.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <map>
#include <thread>
#include <unordered_map>

#include "openmelee/foundation/game_logger.hpp"

namespace openmelee::transport {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

static_assert(kMaxPeerSlots == ENET_PROTOCOL_MAXIMUM_PEER_ID);

namespace {

/// Process-wide enet_initialize(), undone at exit.
GameResult<void> initializeEnet() {
    static const int status = [] {
        int rc = enet_initialize();
        if (rc == 0) {
            std::atexit(enet_deinitialize);
        }
        return rc;
    }();
    if (status != 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::NetworkError, "enet_initialize failed"));
    }
    return GameResult<void>::ok();
}

std::string formatAddress(const ENetAddress& address) {
    char ip[64] = {};
    if (enet_address_get_host_ip(&address, ip, sizeof(ip)) != 0) {
        return "unknown:" + std::to_string(address.port);
    }
    return std::string(ip) + ":" + std::to_string(address.port);
}

enet_uint32 toEnetMillis(std::chrono::milliseconds ms) {
    auto count = std::clamp<int64_t>(ms.count(), 0, std::numeric_limits<enet_uint32>::max());
    return static_cast<enet_uint32>(count);
}

PeerState mapState(ENetPeerState state) {
    switch (state) {
        case ENET_PEER_STATE_CONNECTED:
            return PeerState::Connected;
        case ENET_PEER_STATE_DISCONNECT_LATER:
        case ENET_PEER_STATE_DISCONNECTING:
        case ENET_PEER_STATE_ACKNOWLEDGING_DISCONNECT:
        case ENET_PEER_STATE_ZOMBIE:
            return PeerState::Disconnecting;
        default:
            return PeerState::Connecting;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct EnetTransportHost::Impl {
    using Clock = std::chrono::steady_clock;

    HostConfig config;
    ENetHost* host = nullptr;

    std::map<PeerId, ENetPeer*> peers;
    std::unordered_map<const ENetPeer*, PeerId> ids;
    std::map<PeerId, Clock::time_point> pendingDisconnects;
    uint64_t nextPeerId = 1;

    explicit Impl(HostConfig cfg) : config(cfg) {}

    ENetPeer* find(PeerId id) const {
        auto it = peers.find(id);
        return it == peers.end() ? nullptr : it->second;
    }

    PeerInfo info(PeerId id, const ENetPeer* peer) const {
        auto state = mapState(peer->state);
        if (state == PeerState::Connected && pendingDisconnects.count(id) > 0) {
            state = PeerState::Disconnecting;
        }
        return PeerInfo{id, state, formatAddress(peer->address)};
    }

    void forget(PeerId id) {
        auto it = peers.find(id);
        if (it != peers.end()) {
            ids.erase(it->second);
            peers.erase(it);
        }
        pendingDisconnects.erase(id);
    }

    /// Start the disconnects whose delay has elapsed.
    void flushPendingDisconnects() {
        const auto now = Clock::now();
        for (auto it = pendingDisconnects.begin(); it != pendingDisconnects.end();) {
            if (it->second > now) {
                ++it;
                continue;
            }
            if (auto* peer = find(it->first)) {
                enet_peer_disconnect_later(peer, 0);
            }
            it = pendingDisconnects.erase(it);
        }
    }

    std::optional<TransportEvent> translate(ENetEvent& event) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT: {
                PeerId id(nextPeerId++);
                peers.emplace(id, event.peer);
                ids.emplace(event.peer, id);

                const auto timeout = toEnetMillis(config.peerTimeout);
                enet_peer_timeout(event.peer, 0, std::min<enet_uint32>(timeout, 5000), timeout);
                enet_peer_ping_interval(event.peer, toEnetMillis(config.pingInterval));

                return ConnectEvent{id, formatAddress(event.peer->address)};
            }

            case ENET_EVENT_TYPE_RECEIVE: {
                std::vector<uint8_t> payload(event.packet->data,
                                             event.packet->data + event.packet->dataLength);
                enet_packet_destroy(event.packet);

                auto it = ids.find(event.peer);
                if (it == ids.end()) {
                    return std::nullopt;
                }
                return ReceiveEvent{it->second, event.channelID, std::move(payload)};
            }

            case ENET_EVENT_TYPE_DISCONNECT:
                return dropped(event.peer);

            default:
                // Newer ENet releases report timeouts under their own event
                // type; the peer has been reset either way.
                if (event.peer != nullptr && event.peer->state == ENET_PEER_STATE_DISCONNECTED) {
                    return dropped(event.peer);
                }
                return std::nullopt;
        }
    }

    std::optional<TransportEvent> dropped(const ENetPeer* peer) {
        auto it = ids.find(peer);
        if (it == ids.end()) {
            return std::nullopt;
        }
        PeerId id = it->second;
        forget(id);
        return DisconnectEvent{id};
    }

    void shutdown() {
        if (host == nullptr) {
            return;
        }
        for (auto& [id, peer] : peers) {
            enet_peer_disconnect_now(peer, 0);
        }
        enet_host_flush(host);
        enet_host_destroy(host);
        host = nullptr;

        peers.clear();
        ids.clear();
        pendingDisconnects.clear();
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------

EnetTransportHost::EnetTransportHost(HostConfig config)
    : impl_(std::make_unique<Impl>(config)) {}

EnetTransportHost::~EnetTransportHost() {
    if (impl_) {
        impl_->shutdown();
    }
}

// ---------------------------------------------------------------------------
// listen() / stop()
// ---------------------------------------------------------------------------

GameResult<void> EnetTransportHost::listen(const std::string& address, uint16_t port) {
    if (impl_->host != nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "ENet host already listening"));
    }

    auto init = initializeEnet();
    if (!init) {
        return init;
    }

    ENetAddress bind{};
    bind.host = ENET_HOST_ANY;
    bind.port = port;
    if (!address.empty() && address != "0.0.0.0" &&
        enet_address_set_host(&bind, address.c_str()) != 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::ListenFailed, "cannot resolve listen address " + address));
    }

    // Channel limit 0 accepts as many channels as the client asks for.
    impl_->host = enet_host_create(&bind, impl_->config.maxPeers, 0, 0, 0);
    if (impl_->host == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::ListenFailed,
                      "failed to bind ENet host on " + address + ":" + std::to_string(port)));
    }

    OPENMELEE_LOG_INFO(LogCategory::Network,
        "listening on " + formatAddress(impl_->host->address) + " (max peers " +
            std::to_string(impl_->config.maxPeers) + ")");
    return GameResult<void>::ok();
}

void EnetTransportHost::stop() {
    impl_->shutdown();
}

bool EnetTransportHost::isListening() const noexcept {
    return impl_->host != nullptr;
}

uint16_t EnetTransportHost::boundPort() const noexcept {
    return impl_->host != nullptr ? impl_->host->address.port : 0;
}

const HostConfig& EnetTransportHost::config() const noexcept {
    return impl_->config;
}

// ---------------------------------------------------------------------------
// TransportHost
// ---------------------------------------------------------------------------

std::optional<TransportEvent> EnetTransportHost::poll(std::chrono::milliseconds timeout) {
    if (impl_->host == nullptr) {
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
    }

    impl_->flushPendingDisconnects();

    ENetEvent event;
    int rc = enet_host_service(impl_->host, &event, toEnetMillis(timeout));
    if (rc < 0) {
        OPENMELEE_LOG_WARN(LogCategory::Network, "enet_host_service failed");
        return std::nullopt;
    }
    if (rc == 0) {
        return std::nullopt;
    }
    return impl_->translate(event);
}

GameResult<void> EnetTransportHost::send(PeerId peer, std::vector<uint8_t> payload,
                                         uint8_t channel, Reliability reliability) {
    auto* enetPeer = impl_->find(peer);
    if (enetPeer == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::SessionNotFound,
                      "unknown peer " + std::to_string(peer.value())));
    }
    if (impl_->info(peer, enetPeer).state != PeerState::Connected) {
        return GameResult<void>::err(
            GameError(ErrorCode::PeerNotConnected,
                      "peer " + std::to_string(peer.value()) + " is not connected"));
    }

    enet_uint32 flags = reliability == Reliability::ReliableOrdered
                            ? ENET_PACKET_FLAG_RELIABLE
                            : 0;
    ENetPacket* packet = enet_packet_create(payload.data(), payload.size(), flags);
    if (packet == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::SendFailed, "enet_packet_create failed"));
    }
    if (enet_peer_send(enetPeer, channel, packet) < 0) {
        enet_packet_destroy(packet);
        return GameResult<void>::err(
            GameError(ErrorCode::SendFailed,
                      "enet_peer_send to peer " + std::to_string(peer.value()) +
                          " on channel " + std::to_string(channel) + " failed"));
    }
    return GameResult<void>::ok();
}

GameResult<void> EnetTransportHost::disconnect(PeerId peer, std::chrono::milliseconds delay) {
    auto* enetPeer = impl_->find(peer);
    if (enetPeer == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::SessionNotFound,
                      "unknown peer " + std::to_string(peer.value())));
    }

    if (delay.count() <= 0) {
        // Queued reliable packets are delivered before the disconnect.
        impl_->pendingDisconnects.erase(peer);
        enet_peer_disconnect_later(enetPeer, 0);
    } else {
        impl_->pendingDisconnects[peer] = Impl::Clock::now() + delay;
    }
    return GameResult<void>::ok();
}

std::vector<PeerInfo> EnetTransportHost::peers() const {
    std::vector<PeerInfo> out;
    out.reserve(impl_->peers.size());
    for (const auto& [id, peer] : impl_->peers) {
        out.push_back(impl_->info(id, peer));
    }
    return out;
}

std::optional<PeerInfo> EnetTransportHost::peer(PeerId id) const {
    const auto* enetPeer = impl_->find(id);
    if (enetPeer == nullptr) {
        return std::nullopt;
    }
    return impl_->info(id, enetPeer);
}

} // namespace openmelee::transport
