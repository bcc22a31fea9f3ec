#pragma once

/// @file game_session_builder.hpp
/// @brief Turns a matched group into one session descriptor per participant.

#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "openmelee/foundation/game_result.hpp"
#include "openmelee/service/matchmaking_types.hpp"

namespace openmelee::service {

/// Builds MatchSessions and renders them into GetTicketResponse messages.
///
/// Match ids have the form "mode.<mode>-<RFC 3339 UTC timestamp>-<n>" where
/// n counts sessions built by this instance, so ids never repeat within a
/// process even when two matches share a timestamp.
///
/// Controller ports are drawn without replacement from the mode's pool and
/// assigned by member position. The host port is drawn from the full pool
/// and a member is host iff its assigned port equals it.
class GameSessionBuilder {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /// @param seed  Seed of the port/host draw; tests pass a fixed value.
    /// @param clock Timestamp source for match ids; system_clock::now when empty.
    explicit GameSessionBuilder(std::string latestVersion = std::string(kLatestClientVersion),
                                uint32_t seed = std::random_device{}(),
                                ClockFn clock = {});

    /// Build the session for @p members.
    /// @return PreconditionViolation unless 1 <= members <= port pool size.
    [[nodiscard]] foundation::GameResult<MatchSession> buildSession(
        protocol::OnlinePlayMode mode, const std::vector<MatchMember>& members);

    /// One message per member, in member order.
    [[nodiscard]] std::vector<protocol::GetTicketResponse> render(
        const MatchSession& session) const;

    /// buildSession() followed by render().
    [[nodiscard]] foundation::GameResult<std::vector<protocol::GetTicketResponse>> build(
        protocol::OnlinePlayMode mode, const std::vector<MatchMember>& members);

    /// "2026-10-18T09:30:00.123456+00:00"
    [[nodiscard]] static std::string formatTimestamp(Clock::time_point tp);

private:
    std::string latestVersion_;
    std::mt19937 rng_;
    ClockFn clock_;
    uint64_t nextSequence_ = 1;
};

} // namespace openmelee::service
