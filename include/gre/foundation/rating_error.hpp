#pragma once

/// @file rating_error.hpp
/// @brief Error value carried by RatingResult.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gre/foundation/error_code.hpp"
#include "gre/foundation/types.hpp"

namespace gre::foundation {

/// Error returned by rating, config and logger operations.
///
/// Holds the code, a human-readable message and, for errors about a
/// specific competitor (UnknownPlayer), the offending PlayerId.
class RatingError {
public:
    RatingError() = default;

    explicit RatingError(ErrorCode code)
        : code_(code) {}

    RatingError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RatingError(ErrorCode code, std::string message, PlayerId player)
        : code_(code), message_(std::move(message)), player_(player) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Subsystem derived from the code ("Rating", "Config", ...).
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Competitor the error refers to, if any.
    [[nodiscard]] std::optional<PlayerId> player() const noexcept { return player_; }

    /// "<Subsystem>/<CodeName>: <message>"
    [[nodiscard]] std::string toString() const {
        std::string text(subsystem());
        text += '/';
        text += errorCodeName(code_);
        if (!message_.empty()) {
            text += ": ";
            text += message_;
        }
        return text;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::optional<PlayerId> player_;
};

} // namespace gre::foundation
