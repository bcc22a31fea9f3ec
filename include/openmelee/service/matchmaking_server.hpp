#pragma once

/// @file matchmaking_server.hpp
/// @brief The matchmaking loop: transport events in, session descriptors out.

#include <functional>

#include "openmelee/service/game_session_builder.hpp"
#include "openmelee/service/grouping_engine.hpp"
#include "openmelee/service/matchmaking_types.hpp"
#include "openmelee/service/peer_ticket_registry.hpp"
#include "openmelee/transport/transport_host.hpp"

namespace openmelee::service {

/// Single-threaded matchmaking orchestrator.
///
/// Each iteration polls the transport for at most one event, applies it to
/// the registry, then re-runs grouping over every ticketed peer. Matched
/// peers receive a get-ticket-resp and lose their ticket, so the same ticket
/// can never be matched twice.
///
/// Example:
/// @code
///   EnetTransportHost host(hostConfig);
///   host.listen("0.0.0.0", 43113);
///   MatchmakingServer server(host, MatchmakingConfig{});
///   server.run([&] { return SignalHandler::shouldStop(); });
/// @endcode
class MatchmakingServer {
public:
    MatchmakingServer(transport::TransportHost& host, MatchmakingConfig config);

    /// Use a preconfigured builder (fixed seed or clock).
    MatchmakingServer(transport::TransportHost& host, MatchmakingConfig config,
                      GameSessionBuilder builder);

    MatchmakingServer(const MatchmakingServer&) = delete;
    MatchmakingServer& operator=(const MatchmakingServer&) = delete;

    /// One poll/handle/group/build/send iteration.
    void runOnce();

    /// Call runOnce() until @p shouldStop returns true.
    void run(const std::function<bool()>& shouldStop);

    [[nodiscard]] MatchmakingStats stats() const;

    [[nodiscard]] const PeerTicketRegistry& registry() const noexcept { return registry_; }

    [[nodiscard]] const MatchmakingConfig& config() const noexcept { return config_; }

private:
    void handleEvent(transport::TransportEvent event);
    void onConnect(const transport::ConnectEvent& event);
    void onDisconnect(const transport::DisconnectEvent& event);
    void onReceive(const transport::ReceiveEvent& event);

    /// Disconnect @p peer immediately, logging a failure.
    void dropPeer(PeerId peer);

    void matchReadyGroups();

    transport::TransportHost& host_;
    MatchmakingConfig config_;
    PeerTicketRegistry registry_;
    GroupingEngine grouping_;
    GameSessionBuilder builder_;
    MatchmakingStats stats_;
};

} // namespace openmelee::service
