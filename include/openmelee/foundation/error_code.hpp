#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the matchmaking server.

#include <cstdint>
#include <string_view>

namespace openmelee::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    SendFailed = 0x0103,
    ListenFailed = 0x0104,
    SessionNotFound = 0x0105,
    PeerNotConnected = 0x0108,

    // Protocol (0x0200 - 0x02FF)
    InvalidJson = 0x0200,
    MalformedMessage = 0x0201,
    UnknownMessageType = 0x0202,
    TextEncodingFailed = 0x0203,

    // Matchmaking (0x0300 - 0x03FF)
    PreconditionViolation = 0x0300,
    UnsupportedMode = 0x0301,
    MissingTargetCode = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Protocol";
        case 0x0300: return "Matchmaking";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

} // namespace openmelee::foundation
