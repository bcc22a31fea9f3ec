#include <gtest/gtest.h>

#include <set>

#include "openmelee/service/game_session_builder.hpp"

#include "fake_transport.hpp"

using namespace openmelee::service;
using openmelee::foundation::ErrorCode;
using openmelee::protocol::ControllerPort;
using openmelee::protocol::OnlinePlayMode;
using openmelee::testing::directTicket;

namespace {

// 2026-10-18T09:30:00.123456Z
GameSessionBuilder::Clock::time_point fixedTime() {
    return GameSessionBuilder::Clock::time_point(
        std::chrono::seconds(1792315800) + std::chrono::microseconds(123456));
}

std::vector<MatchMember> pair() {
    auto a = directTicket("TEST#001", "TEST#002");
    a.ipAddressLan = "192.168.1.20:51000";
    auto b = directTicket("TEST#002", "TEST#001");
    b.ipAddressLan = "10.0.0.5:51000";
    return {MatchMember{a, "203.0.113.7:51000"}, MatchMember{b, "198.51.100.2:52000"}};
}

} // namespace

TEST(GameSessionBuilderTest, TimestampFormat) {
    EXPECT_EQ(GameSessionBuilder::formatTimestamp(fixedTime()),
              "2026-10-18T09:30:00.123456+00:00");
    EXPECT_EQ(GameSessionBuilder::formatTimestamp(GameSessionBuilder::Clock::time_point{}),
              "1970-01-01T00:00:00.000000+00:00");
}

TEST(GameSessionBuilderTest, TimestampFractionIsZeroPadded) {
    GameSessionBuilder::Clock::time_point tp(std::chrono::seconds(1792315800) +
                                             std::chrono::microseconds(42));
    EXPECT_EQ(GameSessionBuilder::formatTimestamp(tp), "2026-10-18T09:30:00.000042+00:00");
}

TEST(GameSessionBuilderTest, TimestampBeforeEpochBorrowsASecond) {
    GameSessionBuilder::Clock::time_point tp(std::chrono::microseconds(-1));
    EXPECT_EQ(GameSessionBuilder::formatTimestamp(tp), "1969-12-31T23:59:59.999999+00:00");
}

TEST(GameSessionBuilderTest, MatchIdEmbedsModeTimeAndSequence) {
    GameSessionBuilder builder("2.5.1", 7, fixedTime);

    auto first = builder.buildSession(OnlinePlayMode::Direct, pair());
    auto second = builder.buildSession(OnlinePlayMode::Direct, pair());
    ASSERT_TRUE(first.hasValue() && second.hasValue());

    EXPECT_EQ(first.value().matchId, "mode.direct-2026-10-18T09:30:00.123456+00:00-1");
    EXPECT_EQ(second.value().matchId, "mode.direct-2026-10-18T09:30:00.123456+00:00-2");
}

TEST(GameSessionBuilderTest, RendersOneMessagePerMember) {
    GameSessionBuilder builder("2.5.1", 7, fixedTime);
    auto messages = builder.build(OnlinePlayMode::Direct, pair());
    ASSERT_TRUE(messages.hasValue());

    const auto& out = messages.value();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].matchId, out[1].matchId);
    EXPECT_EQ(out[0].stages, out[1].stages);
    EXPECT_EQ(out[0].stages, openmelee::protocol::getAllowedStages(OnlinePlayMode::Direct));
    EXPECT_EQ(out[0].latestVersion, "2.5.1");
    EXPECT_TRUE(out[0].isAssigned);
    EXPECT_TRUE(out[1].isAssigned);
}

TEST(GameSessionBuilderTest, ExactlyOneHostForEverySeed) {
    for (uint32_t seed = 0; seed < 64; ++seed) {
        GameSessionBuilder builder("2.5.1", seed, fixedTime);
        auto messages = builder.build(OnlinePlayMode::Direct, pair());
        ASSERT_TRUE(messages.hasValue());
        const auto& out = messages.value();

        EXPECT_NE(out[0].isHost, out[1].isHost) << "seed " << seed;

        // Ports are distinct, drawn from {One, Two}, identical across recipients.
        EXPECT_EQ(out[0].players, [&] {
            auto players = out[1].players;
            players[0].isLocalPlayer = true;
            players[1].isLocalPlayer = false;
            return players;
        }());
        std::set<ControllerPort> ports{out[0].players[0].port, out[0].players[1].port};
        EXPECT_EQ(ports, (std::set<ControllerPort>{ControllerPort::One, ControllerPort::Two}));
    }
}

TEST(GameSessionBuilderTest, LocalPlayerFlagMarksRecipient) {
    GameSessionBuilder builder("2.5.1", 3, fixedTime);
    auto messages = builder.build(OnlinePlayMode::Direct, pair());
    ASSERT_TRUE(messages.hasValue());
    const auto& out = messages.value();

    for (std::size_t i = 0; i < out.size(); ++i) {
        int locals = 0;
        for (std::size_t j = 0; j < out[i].players.size(); ++j) {
            if (out[i].players[j].isLocalPlayer) {
                ++locals;
                EXPECT_EQ(j, i);
            }
        }
        EXPECT_EQ(locals, 1);
    }
}

TEST(GameSessionBuilderTest, PlayerFieldsComeFromTicketAndTransport) {
    GameSessionBuilder builder("2.5.1", 3, fixedTime);
    auto messages = builder.build(OnlinePlayMode::Direct, pair());
    ASSERT_TRUE(messages.hasValue());

    const auto& player = messages.value()[0].players[0];
    EXPECT_EQ(player.ipAddress, "203.0.113.7:51000");
    EXPECT_EQ(player.ipAddressLan, "192.168.1.20:51000");
    EXPECT_EQ(player.uid, "uid-TEST#001");
    EXPECT_EQ(player.displayName, "name-TEST#001");
    EXPECT_EQ(player.connectCode, "TEST#001");
}

TEST(GameSessionBuilderTest, SameSeedSameAssignment) {
    GameSessionBuilder a("2.5.1", 11, fixedTime);
    GameSessionBuilder b("2.5.1", 11, fixedTime);
    EXPECT_EQ(a.build(OnlinePlayMode::Direct, pair()).value(),
              b.build(OnlinePlayMode::Direct, pair()).value());
}

TEST(GameSessionBuilderTest, TeamsUsesFourPortsAndFiveStages) {
    GameSessionBuilder builder("2.5.1", 5, fixedTime);
    auto members = pair();
    members.push_back(members[0]);
    members.push_back(members[1]);

    auto session = builder.buildSession(OnlinePlayMode::Teams, members);
    ASSERT_TRUE(session.hasValue());
    EXPECT_EQ(session.value().stages.size(), 5u);

    std::set<ControllerPort> ports;
    for (const auto& player : session.value().players) {
        ports.insert(player.port);
    }
    EXPECT_EQ(ports.size(), 4u);
}

TEST(GameSessionBuilderTest, TooManyMembersViolatesPrecondition) {
    GameSessionBuilder builder("2.5.1", 5, fixedTime);
    auto members = pair();
    members.push_back(members[0]);

    auto result = builder.build(OnlinePlayMode::Direct, members);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PreconditionViolation);

    // A rejected build does not consume a match sequence number.
    auto ok = builder.buildSession(OnlinePlayMode::Direct, pair());
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value().matchId.substr(ok.value().matchId.size() - 2), "-1");
}

TEST(GameSessionBuilderTest, EmptyGroupViolatesPrecondition) {
    GameSessionBuilder builder;
    auto result = builder.build(OnlinePlayMode::Direct, {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PreconditionViolation);
}
