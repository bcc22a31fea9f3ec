/// @file matchmaking_integration_test.cpp
/// @brief Integration tests for MatchmakingServer on an EnetTransportHost
///        with loopback ENet clients submitting JSON tickets.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "openmelee/protocol/wire_codec.hpp"
#include "openmelee/service/matchmaking_server.hpp"
#include "openmelee/transport/enet_transport_host.hpp"

#include "unit/transport/enet_test_client.hpp"

using namespace openmelee::service;
using namespace openmelee::transport;
using namespace std::chrono_literals;
using openmelee::protocol::CreateTicket;
using openmelee::protocol::CreateTicketResponse;
using openmelee::protocol::GetTicketResponse;
using openmelee::protocol::MatchmakingMessage;
using openmelee::protocol::OnlinePlayMode;
using openmelee::testing::EnetTestClient;
using openmelee::testing::pumpUntil;

// =============================================================================
// Integration fixture: server loop over a loopback ENet host
// =============================================================================

class MatchmakingIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override { start(HostConfig{}); }

    void start(HostConfig config) {
        server_.reset();
        host_ = std::make_unique<EnetTransportHost>(config);
        ASSERT_TRUE(host_->listen("127.0.0.1", 0).hasValue());
        server_ = std::make_unique<MatchmakingServer>(
            *host_, MatchmakingConfig{1ms, "2.5.1"}, GameSessionBuilder("2.5.1", 1234));
    }

    std::unique_ptr<EnetTestClient> connectClient() {
        auto client = std::make_unique<EnetTestClient>();
        EXPECT_TRUE(client->connect(host_->boundPort()));
        clients_.push_back(client.get());
        EXPECT_TRUE(pump([&] { return client->connected(); }));
        return client;
    }

    bool pump(const std::function<bool()>& done, std::chrono::milliseconds limit = 3000ms) {
        return pumpUntil(
            [this] {
                server_->runOnce();
                for (auto* client : clients_) {
                    client->service();
                }
            },
            done, limit);
    }

    static std::vector<uint8_t> ticket(const std::string& own, const std::string& target,
                                       OnlinePlayMode mode = OnlinePlayMode::Direct) {
        CreateTicket t;
        t.appVersion = "2.5.1";
        t.ipAddressLan = "192.168.1.10:51000";
        t.search.mode = mode;
        t.search.targetConnectCode = target;
        t.user = openmelee::protocol::User{"uid-" + own, "key-" + own, own, own};
        auto encoded = openmelee::protocol::encodeTicket(t);
        EXPECT_TRUE(encoded.hasValue());
        return encoded.hasValue() ? encoded.value() : std::vector<uint8_t>{};
    }

    static std::vector<MatchmakingMessage> decoded(const EnetTestClient& client) {
        std::vector<MatchmakingMessage> out;
        for (const auto& payload : client.received()) {
            auto msg = openmelee::protocol::decodeMessage(payload);
            if (msg) {
                out.push_back(msg.value());
            }
        }
        return out;
    }

    std::unique_ptr<EnetTransportHost> host_;
    std::unique_ptr<MatchmakingServer> server_;
    std::vector<EnetTestClient*> clients_;
};

// =============================================================================
// Scenarios
// =============================================================================

TEST_F(MatchmakingIntegrationTest, TwoClientsAreMatched) {
    auto alice = connectClient();
    auto bob = connectClient();

    alice->sendReliable(ticket("TEST#001", "TEST#002"));
    bob->sendReliable(ticket("TEST#002", "TEST#001"));
    ASSERT_TRUE(pump([&] {
        return alice->received().size() >= 2 && bob->received().size() >= 2;
    }));

    auto toAlice = decoded(*alice);
    auto toBob = decoded(*bob);
    ASSERT_EQ(toAlice.size(), 2u);
    ASSERT_EQ(toBob.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<CreateTicketResponse>(toAlice[0]));
    ASSERT_TRUE(std::holds_alternative<GetTicketResponse>(toAlice[1]));
    ASSERT_TRUE(std::holds_alternative<GetTicketResponse>(toBob[1]));

    const auto& a = std::get<GetTicketResponse>(toAlice[1]);
    const auto& b = std::get<GetTicketResponse>(toBob[1]);
    EXPECT_EQ(a.matchId, b.matchId);
    EXPECT_NE(a.isHost, b.isHost);
    ASSERT_EQ(a.players.size(), 2u);
    EXPECT_EQ(a.players[0].ipAddress.rfind("127.0.0.1:", 0), 0u);
    EXPECT_NE(a.players[0].ipAddress, a.players[1].ipAddress);
    EXPECT_EQ(server_->stats().matchesFormed, 1u);
}

TEST_F(MatchmakingIntegrationTest, MalformedTicketClosesTheConnection) {
    auto client = connectClient();

    client->sendReliable({'{', '"', 't', 'y', 'p', 'e', '"'});
    ASSERT_TRUE(pump([&] { return client->disconnected(); }));
    ASSERT_TRUE(pump([&] { return server_->stats().connectedPeers == 0; }));

    EXPECT_TRUE(client->received().empty());
    EXPECT_EQ(server_->stats().malformedMessages, 1u);
}

TEST_F(MatchmakingIntegrationTest, UnsupportedModeClosesWithoutResponse) {
    auto client = connectClient();

    client->sendReliable(ticket("TEST#001", "TEST#002", OnlinePlayMode::Ranked));
    ASSERT_TRUE(pump([&] { return client->disconnected(); }));

    EXPECT_TRUE(client->received().empty());
    EXPECT_EQ(server_->stats().ticketsRejected, 1u);
}

TEST_F(MatchmakingIntegrationTest, ClientDisconnectForgetsItsTicket) {
    auto alice = connectClient();
    alice->sendReliable(ticket("TEST#001", "TEST#002"));
    ASSERT_TRUE(pump([&] { return server_->stats().pendingTickets == 1; }));

    alice->disconnect();
    ASSERT_TRUE(pump([&] { return server_->stats().connectedPeers == 0; }));

    auto bob = connectClient();
    bob->sendReliable(ticket("TEST#002", "TEST#001"));
    ASSERT_TRUE(pump([&] { return !bob->received().empty(); }));
    pump([] { return false; }, 100ms);

    auto toBob = decoded(*bob);
    ASSERT_EQ(toBob.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<CreateTicketResponse>(toBob[0]));
}

TEST_F(MatchmakingIntegrationTest, QuietTicketedPeerKeepsWaitingPastPeerTimeout) {
    HostConfig config;
    config.peerTimeout = 300ms;
    config.pingInterval = 50ms;
    start(config);

    auto alice = connectClient();
    alice->sendReliable(ticket("TEST#001", "TEST#002"));
    ASSERT_TRUE(pump([&] { return server_->stats().pendingTickets == 1; }));

    // Alice sends nothing more for several peer timeouts.
    pump([] { return false; }, 1200ms);
    EXPECT_FALSE(alice->disconnected());
    EXPECT_EQ(server_->stats().connectedPeers, 1u);
    EXPECT_EQ(server_->stats().pendingTickets, 1u);

    auto bob = connectClient();
    bob->sendReliable(ticket("TEST#002", "TEST#001"));
    ASSERT_TRUE(pump([&] { return server_->stats().matchesFormed == 1; }));
}
