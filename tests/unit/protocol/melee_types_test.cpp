#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "openmelee/protocol/melee_types.hpp"

using namespace openmelee::protocol;
using openmelee::foundation::ErrorCode;

TEST(MeleeTypesTest, ModeNames) {
    EXPECT_EQ(playModeName(OnlinePlayMode::Ranked), "ranked");
    EXPECT_EQ(playModeName(OnlinePlayMode::Unranked), "unranked");
    EXPECT_EQ(playModeName(OnlinePlayMode::Direct), "direct");
    EXPECT_EQ(playModeName(OnlinePlayMode::Teams), "teams");
}

TEST(MeleeTypesTest, PortPools) {
    EXPECT_EQ(getPorts(OnlinePlayMode::Direct),
              (std::vector<ControllerPort>{ControllerPort::One, ControllerPort::Two}));
    EXPECT_EQ(getPorts(OnlinePlayMode::Ranked).size(), 2u);
    EXPECT_EQ(getPorts(OnlinePlayMode::Teams).size(), 4u);
}

TEST(MeleeTypesTest, TeamsStagePoolExcludesFountain) {
    auto stages = getAllowedStages(OnlinePlayMode::Teams);
    EXPECT_EQ(stages.size(), 5u);
    EXPECT_EQ(std::count(stages.begin(), stages.end(), Stage::FountainOfDreams), 0);
}

TEST(MeleeTypesTest, OtherStagePoolsIncludeFountainOnce) {
    for (auto mode : {OnlinePlayMode::Ranked, OnlinePlayMode::Unranked, OnlinePlayMode::Direct}) {
        auto stages = getAllowedStages(mode);
        EXPECT_EQ(stages.size(), 6u);
        EXPECT_EQ(std::count(stages.begin(), stages.end(), Stage::FountainOfDreams), 1);
        std::set<Stage> unique(stages.begin(), stages.end());
        EXPECT_EQ(unique.size(), stages.size());
    }
}

TEST(MeleeTypesTest, ModeFromCode) {
    EXPECT_EQ(playModeFromCode(2).value(), OnlinePlayMode::Direct);
    EXPECT_EQ(playModeFromCode(3).value(), OnlinePlayMode::Teams);

    auto bad = playModeFromCode(4);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::MalformedMessage);
}

TEST(MeleeTypesTest, PortFromCode) {
    EXPECT_EQ(controllerPortFromCode(1).value(), ControllerPort::One);
    EXPECT_EQ(controllerPortFromCode(4).value(), ControllerPort::Four);
    EXPECT_TRUE(controllerPortFromCode(0).hasError());
    EXPECT_TRUE(controllerPortFromCode(5).hasError());
}

TEST(MeleeTypesTest, StageFromCode) {
    EXPECT_EQ(stageFromCode(0x1F).value(), Stage::Battlefield);
    EXPECT_EQ(stageFromCode(0x02).value(), Stage::FountainOfDreams);
    EXPECT_TRUE(stageFromCode(0x04).hasError());
}
