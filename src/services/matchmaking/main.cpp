/// @file main.cpp
/// @brief Matchmaking service entry point.
///
/// Listens for tickets on an ENet host and pairs Direct-mode players by connect code.

#include <cstdlib>
#include <iostream>

#include "openmelee/foundation/config_manager.hpp"
#include "openmelee/foundation/game_logger.hpp"
#include "openmelee/service/matchmaking_server.hpp"
#include "openmelee/service/service_runner.hpp"
#include "openmelee/transport/enet_transport_host.hpp"
#include "openmelee/version.hpp"

int main(int argc, char* argv[]) {
    using openmelee::foundation::LogCategory;

    openmelee::service::SignalHandler signals;

    auto configPath = openmelee::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = openmelee::service::kDefaultConfigPath;
    }

    openmelee::foundation::ConfigManager config;
    auto loadResult = openmelee::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto address = openmelee::service::listenAddress(config);
    auto port = openmelee::service::listenPort(config);
    auto hostCfg = openmelee::service::buildHostConfig(config);
    auto matchCfg = openmelee::service::buildMatchmakingConfig(config);
    if (!address) {
        std::cerr << "Invalid config: " << address.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (!port) {
        std::cerr << "Invalid config: " << port.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (!hostCfg) {
        std::cerr << "Invalid config: " << hostCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (!matchCfg) {
        std::cerr << "Invalid config: " << matchCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }

    openmelee::transport::EnetTransportHost host(hostCfg.value());
    auto listenResult = host.listen(address.value(), port.value());
    if (!listenResult) {
        std::cerr << "Failed to start matchmaking server: "
                  << listenResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    openmelee::service::MatchmakingServer server(host, matchCfg.value());

    OPENMELEE_LOG_INFO(LogCategory::Core,
        "openmelee matchmaking " + std::string(openmelee::Version::string) +
            " started (address: " + address.value() +
            ", port: " + std::to_string(port.value()) +
            ", max_peers: " + std::to_string(hostCfg.value().maxPeers) + ")");

    server.run([&signals] { return signals.shutdownRequested(); });

    OPENMELEE_LOG_INFO(LogCategory::Core, "shutting down matchmaking server");
    host.stop();

    auto flushed = openmelee::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
