#pragma once

/// @file service_runner.hpp
/// @brief Process-level helpers for the matchmaking executable.
///
/// Provides signal handling, configuration loading, CLI argument parsing
/// and the mapping from configuration keys to component settings.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include "openmelee/foundation/config_manager.hpp"
#include "openmelee/foundation/game_result.hpp"
#include "openmelee/service/matchmaking_types.hpp"
#include "openmelee/transport/enet_transport_host.hpp"

namespace openmelee::service {

/// Default UDP port of the matchmaking server.
inline constexpr uint16_t kDefaultPort = 43113;

/// Default listen address (every interface).
inline constexpr const char* kDefaultAddress = "0.0.0.0";

/// Default configuration file.
inline constexpr const char* kDefaultConfigPath = "/etc/openmelee/matchmaking.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. OPENMELEE_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::GameResult<void>
loadConfig(foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// @name Config mapping
/// Absent keys keep their defaults; a key of the wrong type is an error.
/// @{
[[nodiscard]] foundation::GameResult<std::string>
listenAddress(const foundation::ConfigManager& config);

[[nodiscard]] foundation::GameResult<uint16_t>
listenPort(const foundation::ConfigManager& config);

[[nodiscard]] foundation::GameResult<MatchmakingConfig>
buildMatchmakingConfig(const foundation::ConfigManager& config);

[[nodiscard]] foundation::GameResult<transport::HostConfig>
buildHostConfig(const foundation::ConfigManager& config);
/// @}

} // namespace openmelee::service
