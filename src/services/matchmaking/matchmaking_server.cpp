/// @file matchmaking_server.cpp
/// @brief MatchmakingServer implementation.

#include "openmelee/service/matchmaking_server.hpp"

#include <type_traits>

#include "openmelee/foundation/game_logger.hpp"
#include "openmelee/protocol/wire_codec.hpp"

namespace openmelee::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using protocol::OnlinePlayMode;

namespace {

void logPeer(LogLevel level, PeerId peer, std::string_view msg) {
    LogContext ctx;
    ctx.peerId = peer;
    GameLogger::instance().logWithContext(level, LogCategory::Matchmaking, msg, ctx);
}

} // namespace

MatchmakingServer::MatchmakingServer(transport::TransportHost& host,
                                     MatchmakingConfig config)
    : MatchmakingServer(host, config, GameSessionBuilder(config.latestVersion)) {}

MatchmakingServer::MatchmakingServer(transport::TransportHost& host,
                                     MatchmakingConfig config,
                                     GameSessionBuilder builder)
    : host_(host), config_(std::move(config)), builder_(std::move(builder)) {}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

void MatchmakingServer::runOnce() {
    if (auto event = host_.poll(config_.pollTimeout)) {
        handleEvent(std::move(*event));
    }
    matchReadyGroups();
}

void MatchmakingServer::run(const std::function<bool()>& shouldStop) {
    OPENMELEE_LOG_INFO(LogCategory::Matchmaking, "matchmaking loop started");
    while (!shouldStop()) {
        runOnce();
    }
    OPENMELEE_LOG_INFO(LogCategory::Matchmaking,
        "matchmaking loop stopped after " + std::to_string(stats_.matchesFormed) +
            " matches");
}

MatchmakingStats MatchmakingServer::stats() const {
    auto out = stats_;
    out.connectedPeers = registry_.size();
    out.pendingTickets = registry_.ticketedCount();
    return out;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void MatchmakingServer::handleEvent(transport::TransportEvent event) {
    std::visit([this](auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, transport::ConnectEvent>) {
            onConnect(ev);
        } else if constexpr (std::is_same_v<T, transport::DisconnectEvent>) {
            onDisconnect(ev);
        } else {
            onReceive(ev);
        }
    }, event);
}

void MatchmakingServer::onConnect(const transport::ConnectEvent& event) {
    registry_.addPeer(event.peer, event.address);
    logPeer(LogLevel::Debug, event.peer, "peer connected from " + event.address);
}

void MatchmakingServer::onDisconnect(const transport::DisconnectEvent& event) {
    registry_.removePeer(event.peer);
    logPeer(LogLevel::Debug, event.peer, "peer disconnected");
}

void MatchmakingServer::onReceive(const transport::ReceiveEvent& event) {
    auto decoded = protocol::decodeTicket(event.payload);
    if (!decoded) {
        ++stats_.malformedMessages;
        logPeer(LogLevel::Warning, event.peer,
                "rejecting message: " + decoded.error().describe());
        dropPeer(event.peer);
        return;
    }

    auto ticket = std::move(decoded).value();
    if (!registry_.contains(event.peer)) {
        auto info = host_.peer(event.peer);
        registry_.addPeer(event.peer, info ? info->address : std::string());
    }

    if (ticket.search.mode != OnlinePlayMode::Direct) {
        ++stats_.ticketsRejected;
        GameError rejected(ErrorCode::UnsupportedMode,
                           std::string(protocol::playModeName(ticket.search.mode)) +
                               " matchmaking is not implemented");
        logPeer(LogLevel::Info, event.peer, rejected.describe());
        registry_.clearTicket(event.peer);
        dropPeer(event.peer);
        return;
    }

    if (!ticket.search.targetConnectCode) {
        ++stats_.malformedMessages;
        GameError missing(ErrorCode::MissingTargetCode, "direct ticket without a target code");
        logPeer(LogLevel::Warning, event.peer, missing.describe());
        dropPeer(event.peer);
        return;
    }

    LogContext ctx;
    ctx.peerId = event.peer;
    ctx.extra["connect_code"] = ticket.user.connectCode;
    ctx.extra["target"] = *ticket.search.targetConnectCode;
    GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Matchmaking,
                                          "ticket accepted", ctx);

    registry_.setTicket(event.peer, std::move(ticket));
    ++stats_.ticketsAccepted;

    auto sent = host_.send(event.peer,
                           protocol::encode(protocol::CreateTicketResponse{}));
    if (!sent) {
        ++stats_.sendFailures;
        logPeer(LogLevel::Warning, event.peer,
                "ticket acknowledgement failed: " + sent.error().describe());
    }
}

void MatchmakingServer::dropPeer(PeerId peer) {
    auto result = host_.disconnect(peer, std::chrono::milliseconds(0));
    if (!result) {
        logPeer(LogLevel::Warning, peer, "disconnect failed: " + result.error().describe());
    }
}

// ---------------------------------------------------------------------------
// Grouping and session building
// ---------------------------------------------------------------------------

void MatchmakingServer::matchReadyGroups() {
    auto groups = grouping_.group(registry_.snapshot(), host_.peers());

    for (const auto& group : groups) {
        std::vector<MatchMember> members;
        members.reserve(group.members.size());
        for (auto id : group.members) {
            const auto* ticket = registry_.ticket(id);
            if (ticket == nullptr) {
                break;
            }
            members.push_back(MatchMember{*ticket, registry_.address(id).value_or("")});
        }
        if (members.size() != group.members.size()) {
            continue;
        }

        auto messages = builder_.build(group.mode, members);
        if (!messages) {
            OPENMELEE_LOG_ERROR(LogCategory::Matchmaking,
                "cannot build session: " + messages.error().describe());
            continue;
        }

        const auto& responses = messages.value();
        for (std::size_t i = 0; i < responses.size(); ++i) {
            auto sent = host_.send(group.members[i], protocol::encode(responses[i]));
            if (!sent) {
                ++stats_.sendFailures;
                logPeer(LogLevel::Warning, group.members[i],
                        "session descriptor not sent: " + sent.error().describe());
            }
        }
        for (auto id : group.members) {
            registry_.clearTicket(id);
        }
        ++stats_.matchesFormed;

        LogContext ctx;
        ctx.matchId = responses.front().matchId;
        ctx.extra["players"] = std::to_string(responses.size());
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Matchmaking,
                                              "match formed", ctx);
    }
}

} // namespace openmelee::service
