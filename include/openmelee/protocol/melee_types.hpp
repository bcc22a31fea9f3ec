#pragma once

/// @file melee_types.hpp
/// @brief Play modes, controller ports and legal stages as transmitted
///        on the wire (numeric codes).

#include <cstdint>
#include <string_view>
#include <vector>

#include "openmelee/foundation/game_result.hpp"

namespace openmelee::protocol {

/// Matchmaking intent of a ticket. Wire code in parentheses.
enum class OnlinePlayMode : uint8_t {
    Ranked = 0,
    Unranked = 1,
    Direct = 2,
    Teams = 3
};

/// Physical controller slot assigned to a player.
enum class ControllerPort : uint8_t {
    One = 1,
    Two = 2,
    Three = 3,
    Four = 4
};

/// Legal stages, identified by the game's native stage ids.
enum class Stage : uint8_t {
    FountainOfDreams = 0x02,
    PokemonStadium = 0x03,
    YoshisStory = 0x08,
    DreamLand = 0x1C,
    Battlefield = 0x1F,
    FinalDestination = 0x20
};

/// Lower-case mode name used in match ids and logs ("direct", "teams", ...).
constexpr std::string_view playModeName(OnlinePlayMode mode) {
    switch (mode) {
        case OnlinePlayMode::Ranked:   return "ranked";
        case OnlinePlayMode::Unranked: return "unranked";
        case OnlinePlayMode::Direct:   return "direct";
        case OnlinePlayMode::Teams:    return "teams";
    }
    return "unknown";
}

/// Port pool for a mode: all four ports for Teams, One and Two otherwise.
[[nodiscard]] std::vector<ControllerPort> getPorts(OnlinePlayMode mode);

/// Stage pool for a mode. Fountain of Dreams is excluded from Teams.
[[nodiscard]] std::vector<Stage> getAllowedStages(OnlinePlayMode mode);

/// @name Wire code conversion
/// Unknown codes are reported as MalformedMessage.
/// @{
[[nodiscard]] foundation::GameResult<OnlinePlayMode> playModeFromCode(int64_t code);
[[nodiscard]] foundation::GameResult<ControllerPort> controllerPortFromCode(int64_t code);
[[nodiscard]] foundation::GameResult<Stage> stageFromCode(int64_t code);
/// @}

} // namespace openmelee::protocol
