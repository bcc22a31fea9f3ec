/// @file wire_codec.cpp
/// @brief jsoncpp mapping for tickets and responses.

#include "openmelee/protocol/wire_codec.hpp"

#include <json/json.h>

#include <memory>
#include <string>
#include <type_traits>

#include "openmelee/protocol/text_encoding.hpp"

namespace openmelee::protocol {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

GameError malformed(std::string message) {
    return GameError(ErrorCode::MalformedMessage, std::move(message));
}

GameResult<Json::Value> parseObject(const char* begin, const char* end) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(begin, end, &root, &errors)) {
        return GameResult<Json::Value>::err(
            GameError(ErrorCode::InvalidJson, "invalid JSON: " + errors));
    }
    if (!root.isObject()) {
        return GameResult<Json::Value>::err(malformed("message is not a JSON object"));
    }
    return GameResult<Json::Value>::ok(std::move(root));
}

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::vector<uint8_t> toBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// -- Field readers ------------------------------------------------------------

GameResult<const Json::Value*> requireObject(const Json::Value& parent, const char* key) {
    const Json::Value& value = parent[key];
    if (!value.isObject()) {
        return GameResult<const Json::Value*>::err(
            malformed(std::string("field '") + key + "' must be an object"));
    }
    return GameResult<const Json::Value*>::ok(&value);
}

GameResult<std::string> requireString(const Json::Value& parent, const char* key) {
    const Json::Value& value = parent[key];
    if (!value.isString()) {
        return GameResult<std::string>::err(
            malformed(std::string("field '") + key + "' must be a string"));
    }
    return GameResult<std::string>::ok(value.asString());
}

GameResult<bool> requireBool(const Json::Value& parent, const char* key) {
    const Json::Value& value = parent[key];
    if (!value.isBool()) {
        return GameResult<bool>::err(
            malformed(std::string("field '") + key + "' must be a boolean"));
    }
    return GameResult<bool>::ok(value.asBool());
}

GameResult<int64_t> requireInteger(const Json::Value& parent, const char* key) {
    const Json::Value& value = parent[key];
    if (!value.isInt64()) {
        return GameResult<int64_t>::err(
            malformed(std::string("field '") + key + "' must be an integer"));
    }
    return GameResult<int64_t>::ok(value.asInt64());
}

GameResult<void> requireType(const Json::Value& root, std::string_view expected) {
    auto type = requireString(root, "type");
    if (!type) {
        return GameResult<void>::err(type.error());
    }
    if (type.value() != expected) {
        return GameResult<void>::err(
            malformed("unexpected message type '" + type.value() + "'"));
    }
    return GameResult<void>::ok();
}

/// Shift_JIS byte array -> normalized UTF-8 connect code.
GameResult<std::string> decodeLegacyCode(const Json::Value& array) {
    if (!array.isArray()) {
        return GameResult<std::string>::err(
            malformed("field 'connectCode' must be a byte array"));
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(array.size());
    for (const auto& element : array) {
        if (!element.isUInt() || element.asUInt() > 0xFF) {
            return GameResult<std::string>::err(
                malformed("field 'connectCode' contains a non-byte value"));
        }
        bytes.push_back(static_cast<uint8_t>(element.asUInt()));
    }

    auto decoded = decodeShiftJis(bytes);
    if (!decoded) {
        return decoded;
    }
    return normalizeNfkc(decoded.value());
}

GameResult<User> readUser(const Json::Value& obj) {
    User user;
    std::pair<const char*, std::string*> fields[] = {
        {"uid", &user.uid},
        {"playKey", &user.playKey},
        {"displayName", &user.displayName},
        {"connectCode", &user.connectCode},
    };
    for (auto& [key, target] : fields) {
        auto value = requireString(obj, key);
        if (!value) {
            return GameResult<User>::err(value.error());
        }
        *target = std::move(value).value();
    }
    return GameResult<User>::ok(std::move(user));
}

GameResult<Search> readSearch(const Json::Value& obj) {
    Search search;

    auto modeCode = requireInteger(obj, "mode");
    if (!modeCode) {
        return GameResult<Search>::err(modeCode.error());
    }
    auto mode = playModeFromCode(modeCode.value());
    if (!mode) {
        return GameResult<Search>::err(mode.error());
    }
    search.mode = mode.value();

    const Json::Value& code = obj["connectCode"];
    if (!code.isNull()) {
        auto target = decodeLegacyCode(code);
        if (!target) {
            return GameResult<Search>::err(target.error());
        }
        search.targetConnectCode = std::move(target).value();
    }
    return GameResult<Search>::ok(std::move(search));
}

GameResult<Player> readPlayer(const Json::Value& obj) {
    if (!obj.isObject()) {
        return GameResult<Player>::err(malformed("player entry must be an object"));
    }

    Player player;
    auto isLocal = requireBool(obj, "isLocalPlayer");
    if (!isLocal) {
        return GameResult<Player>::err(isLocal.error());
    }
    player.isLocalPlayer = isLocal.value();

    auto portCode = requireInteger(obj, "port");
    if (!portCode) {
        return GameResult<Player>::err(portCode.error());
    }
    auto port = controllerPortFromCode(portCode.value());
    if (!port) {
        return GameResult<Player>::err(port.error());
    }
    player.port = port.value();

    std::pair<const char*, std::string*> fields[] = {
        {"ipAddress", &player.ipAddress},
        {"ipAddressLan", &player.ipAddressLan},
        {"uid", &player.uid},
        {"displayName", &player.displayName},
        {"connectCode", &player.connectCode},
    };
    for (auto& [key, target] : fields) {
        auto value = requireString(obj, key);
        if (!value) {
            return GameResult<Player>::err(value.error());
        }
        *target = std::move(value).value();
    }
    return GameResult<Player>::ok(std::move(player));
}

GameResult<GetTicketResponse> readGetTicketResponse(const Json::Value& root) {
    GetTicketResponse response;

    auto latestVersion = requireString(root, "latestVersion");
    if (!latestVersion) {
        return GameResult<GetTicketResponse>::err(latestVersion.error());
    }
    response.latestVersion = std::move(latestVersion).value();

    auto matchId = requireString(root, "matchId");
    if (!matchId) {
        return GameResult<GetTicketResponse>::err(matchId.error());
    }
    response.matchId = std::move(matchId).value();

    auto isHost = requireBool(root, "isHost");
    if (!isHost) {
        return GameResult<GetTicketResponse>::err(isHost.error());
    }
    response.isHost = isHost.value();

    auto isAssigned = requireBool(root, "isAssigned");
    if (!isAssigned) {
        return GameResult<GetTicketResponse>::err(isAssigned.error());
    }
    response.isAssigned = isAssigned.value();

    const Json::Value& players = root["players"];
    if (!players.isArray()) {
        return GameResult<GetTicketResponse>::err(malformed("field 'players' must be an array"));
    }
    for (const auto& entry : players) {
        auto player = readPlayer(entry);
        if (!player) {
            return GameResult<GetTicketResponse>::err(player.error());
        }
        response.players.push_back(std::move(player).value());
    }

    const Json::Value& stages = root["stages"];
    if (!stages.isArray()) {
        return GameResult<GetTicketResponse>::err(malformed("field 'stages' must be an array"));
    }
    for (const auto& entry : stages) {
        if (!entry.isInt64()) {
            return GameResult<GetTicketResponse>::err(malformed("stage entries must be integers"));
        }
        auto stage = stageFromCode(entry.asInt64());
        if (!stage) {
            return GameResult<GetTicketResponse>::err(stage.error());
        }
        response.stages.push_back(stage.value());
    }

    return GameResult<GetTicketResponse>::ok(std::move(response));
}

// -- Writers ------------------------------------------------------------------

Json::Value toJson(const Player& player) {
    Json::Value obj(Json::objectValue);
    obj["isLocalPlayer"] = player.isLocalPlayer;
    obj["ipAddress"] = player.ipAddress;
    obj["ipAddressLan"] = player.ipAddressLan;
    obj["port"] = static_cast<Json::UInt>(player.port);
    obj["uid"] = player.uid;
    obj["displayName"] = player.displayName;
    obj["connectCode"] = player.connectCode;
    return obj;
}

Json::Value toJson(const CreateTicketResponse&) {
    Json::Value obj(Json::objectValue);
    obj["type"] = std::string(kCreateTicketResponseType);
    return obj;
}

Json::Value toJson(const GetTicketResponse& response) {
    Json::Value obj(Json::objectValue);
    obj["type"] = std::string(kGetTicketResponseType);
    obj["latestVersion"] = response.latestVersion;
    obj["matchId"] = response.matchId;
    obj["isHost"] = response.isHost;
    obj["isAssigned"] = response.isAssigned;

    Json::Value players(Json::arrayValue);
    for (const auto& player : response.players) {
        players.append(toJson(player));
    }
    obj["players"] = std::move(players);

    Json::Value stages(Json::arrayValue);
    for (auto stage : response.stages) {
        stages.append(static_cast<Json::UInt>(stage));
    }
    obj["stages"] = std::move(stages);
    return obj;
}

} // namespace

GameResult<CreateTicket> decodeTicket(const uint8_t* data, std::size_t size) {
    const auto* begin = reinterpret_cast<const char*>(data);
    auto root = parseObject(begin, begin + size);
    if (!root) {
        return GameResult<CreateTicket>::err(root.error());
    }
    const Json::Value& obj = root.value();

    auto tag = requireType(obj, kCreateTicketType);
    if (!tag) {
        return GameResult<CreateTicket>::err(tag.error());
    }

    CreateTicket ticket;

    auto appVersion = requireString(obj, "appVersion");
    if (!appVersion) {
        return GameResult<CreateTicket>::err(appVersion.error());
    }
    ticket.appVersion = std::move(appVersion).value();

    auto lan = requireString(obj, "ipAddressLan");
    if (!lan) {
        return GameResult<CreateTicket>::err(lan.error());
    }
    ticket.ipAddressLan = std::move(lan).value();

    auto searchObj = requireObject(obj, "search");
    if (!searchObj) {
        return GameResult<CreateTicket>::err(searchObj.error());
    }
    auto search = readSearch(*searchObj.value());
    if (!search) {
        return GameResult<CreateTicket>::err(search.error());
    }
    ticket.search = std::move(search).value();

    auto userObj = requireObject(obj, "user");
    if (!userObj) {
        return GameResult<CreateTicket>::err(userObj.error());
    }
    auto user = readUser(*userObj.value());
    if (!user) {
        return GameResult<CreateTicket>::err(user.error());
    }
    ticket.user = std::move(user).value();

    return GameResult<CreateTicket>::ok(std::move(ticket));
}

GameResult<CreateTicket> decodeTicket(const std::vector<uint8_t>& payload) {
    return decodeTicket(payload.data(), payload.size());
}

GameResult<std::vector<uint8_t>> encodeTicket(const CreateTicket& ticket) {
    Json::Value obj(Json::objectValue);
    obj["type"] = std::string(kCreateTicketType);
    obj["appVersion"] = ticket.appVersion;
    obj["ipAddressLan"] = ticket.ipAddressLan;

    Json::Value search(Json::objectValue);
    search["mode"] = static_cast<Json::UInt>(ticket.search.mode);
    if (ticket.search.targetConnectCode) {
        auto bytes = encodeShiftJis(*ticket.search.targetConnectCode);
        if (!bytes) {
            return GameResult<std::vector<uint8_t>>::err(bytes.error());
        }
        Json::Value array(Json::arrayValue);
        for (auto b : bytes.value()) {
            array.append(static_cast<Json::UInt>(b));
        }
        search["connectCode"] = std::move(array);
    }
    obj["search"] = std::move(search);

    Json::Value user(Json::objectValue);
    user["uid"] = ticket.user.uid;
    user["playKey"] = ticket.user.playKey;
    user["displayName"] = ticket.user.displayName;
    user["connectCode"] = ticket.user.connectCode;
    obj["user"] = std::move(user);

    return GameResult<std::vector<uint8_t>>::ok(toBytes(writeCompact(obj)));
}

std::vector<uint8_t> encode(const MatchmakingMessage& message) {
    auto json = std::visit([](const auto& msg) { return toJson(msg); }, message);
    return toBytes(writeCompact(json));
}

GameResult<MatchmakingMessage> decodeMessage(const std::vector<uint8_t>& payload) {
    const auto* begin = reinterpret_cast<const char*>(payload.data());
    auto root = parseObject(begin, begin + payload.size());
    if (!root) {
        return GameResult<MatchmakingMessage>::err(root.error());
    }

    auto type = requireString(root.value(), "type");
    if (!type) {
        return GameResult<MatchmakingMessage>::err(type.error());
    }

    if (type.value() == kCreateTicketResponseType) {
        return GameResult<MatchmakingMessage>::ok(CreateTicketResponse{});
    }
    if (type.value() == kGetTicketResponseType) {
        auto response = readGetTicketResponse(root.value());
        if (!response) {
            return GameResult<MatchmakingMessage>::err(response.error());
        }
        return GameResult<MatchmakingMessage>::ok(std::move(response).value());
    }
    return GameResult<MatchmakingMessage>::err(
        GameError(ErrorCode::UnknownMessageType,
                  "unknown message type '" + type.value() + "'"));
}

} // namespace openmelee::protocol
