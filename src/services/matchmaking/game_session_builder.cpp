/// @file game_session_builder.cpp
/// @brief GameSessionBuilder implementation.

#include "openmelee/service/game_session_builder.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace openmelee::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using protocol::ControllerPort;
using protocol::GetTicketResponse;
using protocol::OnlinePlayMode;
using protocol::Player;

GameSessionBuilder::GameSessionBuilder(std::string latestVersion, uint32_t seed,
                                       ClockFn clock)
    : latestVersion_(std::move(latestVersion)), rng_(seed), clock_(std::move(clock)) {}

std::string GameSessionBuilder::formatTimestamp(Clock::time_point tp) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(micros);
    auto fraction = micros - seconds;
    if (fraction.count() < 0) {
        fraction += std::chrono::seconds(1);
        seconds -= std::chrono::seconds(1);
    }

    const std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
        << std::setfill('0') << fraction.count() << "+00:00";
    return out.str();
}

GameResult<MatchSession> GameSessionBuilder::buildSession(
    OnlinePlayMode mode, const std::vector<MatchMember>& members) {
    auto pool = protocol::getPorts(mode);
    if (members.empty() || members.size() > pool.size()) {
        return GameResult<MatchSession>::err(
            GameError(ErrorCode::PreconditionViolation,
                      std::to_string(members.size()) + " members for a " +
                          std::string(protocol::playModeName(mode)) +
                          " session with " + std::to_string(pool.size()) + " ports"));
    }

    MatchSession session;
    session.mode = mode;
    session.stages = protocol::getAllowedStages(mode);

    const auto now = clock_ ? clock_() : Clock::now();
    session.matchId = "mode." + std::string(protocol::playModeName(mode)) + "-" +
                      formatTimestamp(now) + "-" + std::to_string(nextSequence_++);

    auto assigned = pool;
    std::shuffle(assigned.begin(), assigned.end(), rng_);

    std::uniform_int_distribution<std::size_t> hostPick(0, pool.size() - 1);
    session.hostPort = pool[hostPick(rng_)];

    session.players.reserve(members.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
        const auto& ticket = members[i].ticket;
        Player player;
        player.ipAddress = members[i].address;
        player.ipAddressLan = ticket.ipAddressLan;
        player.port = assigned[i];
        player.uid = ticket.user.uid;
        player.displayName = ticket.user.displayName;
        player.connectCode = ticket.user.connectCode;
        session.players.push_back(std::move(player));
    }
    return GameResult<MatchSession>::ok(std::move(session));
}

std::vector<GetTicketResponse> GameSessionBuilder::render(const MatchSession& session) const {
    std::vector<GetTicketResponse> messages;
    messages.reserve(session.players.size());

    for (std::size_t i = 0; i < session.players.size(); ++i) {
        GetTicketResponse response;
        response.latestVersion = latestVersion_;
        response.matchId = session.matchId;
        response.isHost = session.players[i].port == session.hostPort;
        response.isAssigned = true;
        response.players = session.players;
        response.players[i].isLocalPlayer = true;
        response.stages = session.stages;
        messages.push_back(std::move(response));
    }
    return messages;
}

GameResult<std::vector<GetTicketResponse>> GameSessionBuilder::build(
    OnlinePlayMode mode, const std::vector<MatchMember>& members) {
    auto session = buildSession(mode, members);
    if (!session) {
        return GameResult<std::vector<GetTicketResponse>>::err(session.error());
    }
    return GameResult<std::vector<GetTicketResponse>>::ok(render(session.value()));
}

} // namespace openmelee::service
