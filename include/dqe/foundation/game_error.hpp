#pragma once

/// @file game_error.hpp
/// @brief Error payload of GameResult.

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "dqe/foundation/error_code.hpp"

namespace dqe::foundation {

/// An ErrorCode and the text that goes with it.
///
/// Declined combat actions (codes in the Combat range) carry the exact
/// line the session appends to its log, e.g. "Not enough MP! Need 10 MP.".
/// Everything else carries a developer-facing description.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    [[nodiscard]] bool isDeclined() const noexcept { return isDeclinedAction(code_); }

    /// "Config 0x0300: <message>", for startup diagnostics.
    [[nodiscard]] std::string describe() const {
        char hex[12];
        std::snprintf(hex, sizeof(hex), "0x%04X", static_cast<unsigned>(code_));
        std::string text(subsystem());
        text.append(" ").append(hex);
        if (!message_.empty()) {
            text.append(": ").append(message_);
        }
        return text;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace dqe::foundation
