/// @file service_runner.cpp
/// @brief Implementation of the entry-point utilities.

#include "openmelee/service/service_runner.hpp"

#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>

namespace openmelee::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
    // Restore default handlers so that a second signal terminates immediately.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(ConfigManager& config,
                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("OPENMELEE_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Config mapping ----------------------------------------------------------

namespace {

GameError outOfRange(std::string_view key) {
    return GameError(ErrorCode::ConfigTypeMismatch,
                     "value out of range for key: " + std::string(key));
}

} // namespace

GameResult<std::string> listenAddress(const ConfigManager& config) {
    auto address = config.getOr<std::string>("server.address", kDefaultAddress);
    if (!address) {
        return GameResult<std::string>::err(address.error());
    }
    if (address.value().empty()) {
        return GameResult<std::string>::err(outOfRange("server.address"));
    }
    return address;
}

GameResult<uint16_t> listenPort(const ConfigManager& config) {
    auto port = config.getOr<int>("server.port", kDefaultPort);
    if (!port) {
        return GameResult<uint16_t>::err(port.error());
    }
    if (port.value() <= 0 || port.value() > 0xFFFF) {
        return GameResult<uint16_t>::err(outOfRange("server.port"));
    }
    return GameResult<uint16_t>::ok(static_cast<uint16_t>(port.value()));
}

GameResult<MatchmakingConfig> buildMatchmakingConfig(const ConfigManager& config) {
    MatchmakingConfig cfg;

    auto pollMs = config.getOr<int>("matchmaking.poll_timeout_ms",
                                    static_cast<int>(cfg.pollTimeout.count()));
    if (!pollMs) {
        return GameResult<MatchmakingConfig>::err(pollMs.error());
    }
    if (pollMs.value() < 0) {
        return GameResult<MatchmakingConfig>::err(outOfRange("matchmaking.poll_timeout_ms"));
    }
    cfg.pollTimeout = std::chrono::milliseconds(pollMs.value());

    auto version = config.getOr<std::string>("matchmaking.latest_version", cfg.latestVersion);
    if (!version) {
        return GameResult<MatchmakingConfig>::err(version.error());
    }
    cfg.latestVersion = std::move(version).value();

    return GameResult<MatchmakingConfig>::ok(std::move(cfg));
}

GameResult<transport::HostConfig> buildHostConfig(const ConfigManager& config) {
    transport::HostConfig cfg;

    auto maxPeers = config.getOr<unsigned int>(
        "server.max_peers", static_cast<unsigned int>(cfg.maxPeers));
    if (!maxPeers) {
        return GameResult<transport::HostConfig>::err(maxPeers.error());
    }
    if (maxPeers.value() == 0 || maxPeers.value() > transport::kMaxPeerSlots) {
        return GameResult<transport::HostConfig>::err(outOfRange("server.max_peers"));
    }
    cfg.maxPeers = maxPeers.value();

    auto timeoutMs = config.getOr<unsigned int>(
        "transport.peer_timeout_ms", static_cast<unsigned int>(cfg.peerTimeout.count()));
    if (!timeoutMs) {
        return GameResult<transport::HostConfig>::err(timeoutMs.error());
    }
    if (timeoutMs.value() == 0) {
        return GameResult<transport::HostConfig>::err(outOfRange("transport.peer_timeout_ms"));
    }
    cfg.peerTimeout = std::chrono::milliseconds(timeoutMs.value());

    auto pingMs = config.getOr<unsigned int>(
        "transport.ping_interval_ms", static_cast<unsigned int>(cfg.pingInterval.count()));
    if (!pingMs) {
        return GameResult<transport::HostConfig>::err(pingMs.error());
    }
    if (pingMs.value() == 0 || pingMs.value() >= timeoutMs.value()) {
        return GameResult<transport::HostConfig>::err(outOfRange("transport.ping_interval_ms"));
    }
    cfg.pingInterval = std::chrono::milliseconds(pingMs.value());

    return GameResult<transport::HostConfig>::ok(cfg);
}

} // namespace openmelee::service
