/// @file melee_types.cpp
/// @brief Mode-dependent port and stage pools.

#include "openmelee/protocol/melee_types.hpp"

#include <string>

namespace openmelee::protocol {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

std::vector<ControllerPort> getPorts(OnlinePlayMode mode) {
    if (mode == OnlinePlayMode::Teams) {
        return {ControllerPort::One, ControllerPort::Two,
                ControllerPort::Three, ControllerPort::Four};
    }
    return {ControllerPort::One, ControllerPort::Two};
}

std::vector<Stage> getAllowedStages(OnlinePlayMode mode) {
    std::vector<Stage> stages = {
        Stage::PokemonStadium,
        Stage::YoshisStory,
        Stage::DreamLand,
        Stage::Battlefield,
        Stage::FinalDestination,
    };
    if (mode != OnlinePlayMode::Teams) {
        stages.push_back(Stage::FountainOfDreams);
    }
    return stages;
}

GameResult<OnlinePlayMode> playModeFromCode(int64_t code) {
    switch (code) {
        case 0: return GameResult<OnlinePlayMode>::ok(OnlinePlayMode::Ranked);
        case 1: return GameResult<OnlinePlayMode>::ok(OnlinePlayMode::Unranked);
        case 2: return GameResult<OnlinePlayMode>::ok(OnlinePlayMode::Direct);
        case 3: return GameResult<OnlinePlayMode>::ok(OnlinePlayMode::Teams);
        default: break;
    }
    return GameResult<OnlinePlayMode>::err(
        GameError(ErrorCode::MalformedMessage,
                  "unknown play mode " + std::to_string(code)));
}

GameResult<ControllerPort> controllerPortFromCode(int64_t code) {
    if (code < 1 || code > 4) {
        return GameResult<ControllerPort>::err(
            GameError(ErrorCode::MalformedMessage,
                      "unknown controller port " + std::to_string(code)));
    }
    return GameResult<ControllerPort>::ok(static_cast<ControllerPort>(code));
}

GameResult<Stage> stageFromCode(int64_t code) {
    for (auto stage : getAllowedStages(OnlinePlayMode::Direct)) {
        if (static_cast<int64_t>(stage) == code) {
            return GameResult<Stage>::ok(stage);
        }
    }
    return GameResult<Stage>::err(
        GameError(ErrorCode::MalformedMessage,
                  "unknown stage " + std::to_string(code)));
}

} // namespace openmelee::protocol
