#pragma once

/// @file enet_transport_host.hpp
/// @brief TransportHost served by an ENet host.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "openmelee/transport/transport_host.hpp"

namespace openmelee::transport {

/// Largest peer count an ENet host can allocate.
inline constexpr std::size_t kMaxPeerSlots = 4095;

/// Tunables of the ENet host.
struct HostConfig {
    /// Peer slots allocated by enet_host_create; further connects are refused.
    std::size_t maxPeers = 1024;

    /// A peer whose reliable traffic (pings included) stays unacknowledged
    /// this long is dropped.
    std::chrono::milliseconds peerTimeout{30000};

    /// Interval of the host's keepalive pings. Clients acknowledge them
    /// inside their own service call, so a quiet but live peer never times out.
    std::chrono::milliseconds pingInterval{500};
};

/// Production transport: an ENet host speaking the protocol of the netplay
/// client (reliable packets on channel 0).
///
/// ENet is not thread-safe. Every call, poll() included, must come from the
/// loop thread.
///
/// Example:
/// @code
///   EnetTransportHost host(HostConfig{});
///   if (auto r = host.listen("0.0.0.0", 43113); !r) { /* ListenFailed */ }
///   while (running) {
///       if (auto event = host.poll(std::chrono::milliseconds(1000))) { ... }
///   }
///   host.stop();
/// @endcode
class EnetTransportHost : public TransportHost {
public:
    explicit EnetTransportHost(HostConfig config = {});
    ~EnetTransportHost() override;

    EnetTransportHost(const EnetTransportHost&) = delete;
    EnetTransportHost& operator=(const EnetTransportHost&) = delete;

    /// Bind to @p address ("" or "0.0.0.0" for any) and @p port. Port 0
    /// picks an ephemeral port, see boundPort().
    /// @return AlreadyExists when already listening, ListenFailed otherwise.
    [[nodiscard]] foundation::GameResult<void> listen(const std::string& address,
                                                      uint16_t port);

    /// Destroy the host, dropping every peer. Safe to call more than once.
    void stop();

    [[nodiscard]] bool isListening() const noexcept;

    /// Port actually bound, 0 when not listening.
    [[nodiscard]] uint16_t boundPort() const noexcept;

    [[nodiscard]] const HostConfig& config() const noexcept;

    // ── TransportHost ───────────────────────────────────────────────────────

    std::optional<TransportEvent> poll(std::chrono::milliseconds timeout) override;

    [[nodiscard]] foundation::GameResult<void> send(
        PeerId peer, std::vector<uint8_t> payload, uint8_t channel = 0,
        Reliability reliability = Reliability::ReliableOrdered) override;

    [[nodiscard]] foundation::GameResult<void> disconnect(
        PeerId peer, std::chrono::milliseconds delay) override;

    [[nodiscard]] std::vector<PeerInfo> peers() const override;

    [[nodiscard]] std::optional<PeerInfo> peer(PeerId id) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace openmelee::transport
