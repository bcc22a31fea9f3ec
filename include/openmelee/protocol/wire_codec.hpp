#pragma once

/// @file wire_codec.hpp
/// @brief JSON encoding of matchmaking messages (jsoncpp).
///
/// Inbound ticket:
/// @code
///   {"type": "create-ticket", "appVersion": "2.5.1",
///    "ipAddressLan": "192.168.1.20:51000",
///    "search": {"connectCode": [130, 115, ...], "mode": 2},
///    "user": {"uid": "...", "playKey": "...", "displayName": "...",
///             "connectCode": "TEST#001"}}
/// @endcode
///
/// "search.connectCode" is the Shift_JIS byte array of the target's code;
/// it is decoded and NFKC-normalized before it reaches the grouping key.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "openmelee/foundation/game_result.hpp"
#include "openmelee/protocol/messages.hpp"

namespace openmelee::protocol {

/// Decode a "create-ticket" payload.
///
/// Errors: InvalidJson for unparsable text, MalformedMessage for a wrong
/// tag, an unknown mode, a missing or mistyped field, TextEncodingFailed
/// when the target code cannot be converted.
[[nodiscard]] foundation::GameResult<CreateTicket>
decodeTicket(const uint8_t* data, std::size_t size);

[[nodiscard]] foundation::GameResult<CreateTicket>
decodeTicket(const std::vector<uint8_t>& payload);

/// Encode a ticket the way a client sends it (target as Shift_JIS bytes).
[[nodiscard]] foundation::GameResult<std::vector<uint8_t>>
encodeTicket(const CreateTicket& ticket);

/// Encode an outbound message as compact JSON.
[[nodiscard]] std::vector<uint8_t> encode(const MatchmakingMessage& message);

/// Decode an outbound message (client side and tests).
[[nodiscard]] foundation::GameResult<MatchmakingMessage>
decodeMessage(const std::vector<uint8_t>& payload);

} // namespace openmelee::protocol
