#pragma once

/// @file messages.hpp
/// @brief Matchmaking wire messages: the inbound ticket and the closed set
///        of outbound responses.
///
/// Field names on the wire are lower camel case ("ipAddressLan",
/// "displayName"); see wire_codec.hpp for the JSON mapping.

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "openmelee/protocol/melee_types.hpp"

namespace openmelee::protocol {

/// Tag values of the "type" field.
inline constexpr std::string_view kCreateTicketType = "create-ticket";
inline constexpr std::string_view kCreateTicketResponseType = "create-ticket-resp";
inline constexpr std::string_view kGetTicketResponseType = "get-ticket-resp";

/// Identity supplied by the client. Matchmaking trusts it as-is.
struct User {
    std::string uid;
    std::string playKey;
    std::string displayName;
    std::string connectCode;

    bool operator==(const User&) const = default;
};

/// The player's matchmaking intent.
struct Search {
    /// Opponent's connect code, NFKC-normalized. Only meaningful for Direct.
    std::optional<std::string> targetConnectCode;
    OnlinePlayMode mode = OnlinePlayMode::Direct;

    bool operator==(const Search&) const = default;
};

/// "create-ticket": a peer's current request. A newer ticket from the same
/// peer replaces the older one.
struct CreateTicket {
    std::string appVersion;
    std::string ipAddressLan;
    Search search;
    User user;

    bool operator==(const CreateTicket&) const = default;
};

/// One participant as seen by a particular recipient.
struct Player {
    bool isLocalPlayer = false;
    std::string ipAddress;     ///< "ip:port" observed by the transport
    std::string ipAddressLan;  ///< client-reported, unverified
    ControllerPort port = ControllerPort::One;
    std::string uid;
    std::string displayName;
    std::string connectCode;

    bool operator==(const Player&) const = default;
};

/// "create-ticket-resp": acknowledges ticket receipt.
struct CreateTicketResponse {
    bool operator==(const CreateTicketResponse&) const = default;
};

/// "get-ticket-resp": the session descriptor sent to each participant.
struct GetTicketResponse {
    std::string latestVersion;
    std::string matchId;
    bool isHost = false;
    bool isAssigned = false;
    std::vector<Player> players;
    std::vector<Stage> stages;

    bool operator==(const GetTicketResponse&) const = default;
};

/// Every message the server sends.
using MatchmakingMessage = std::variant<CreateTicketResponse, GetTicketResponse>;

} // namespace openmelee::protocol
