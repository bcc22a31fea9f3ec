#pragma once

/// @file game_error.hpp
/// @brief Server error type used with Result<T, GameError>.

#include <string>
#include <string_view>
#include <utility>

#include "openmelee/foundation/error_code.hpp"

namespace openmelee::foundation {

/// Error carrying a categorized code and a human-readable message.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// "Subsystem: message" form used in log lines.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        out += ": ";
        out += message_;
        return out;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace openmelee::foundation
