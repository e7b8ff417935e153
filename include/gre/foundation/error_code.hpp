#pragma once

/// @file error_code.hpp
/// @brief Error codes reported by the rating library.

#include <cstdint>
#include <string_view>

namespace gre::foundation {

/// Error codes grouped by subsystem.
///
/// The high byte selects the subsystem (0x00 general, 0x01 rating,
/// 0x02 config, 0x03 logger), so errorSubsystem() needs no table.
enum class ErrorCode : uint32_t {
    // General
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // Rating
    UnknownPlayer = 0x0101,
    ConvergenceFailure = 0x0102,
    InvalidSettings = 0x0103,
    InvalidRating = 0x0104,

    // Config
    ConfigLoadFailed = 0x0200,
    ConfigKeyNotFound = 0x0201,
    ConfigTypeMismatch = 0x0202,

    // Logger
    LoggerFlushFailed = 0x0301,
};

/// Subsystem that owns `code`: "General", "Rating", "Config" or "Logger".
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) >> 8) {
        case 0x00: return "General";
        case 0x01: return "Rating";
        case 0x02: return "Config";
        case 0x03: return "Logger";
        default: return "Unknown";
    }
}

/// Enumerator name of `code`, for log lines and diagnostics.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:            return "Success";
        case ErrorCode::Unknown:            return "Unknown";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::UnknownPlayer:      return "UnknownPlayer";
        case ErrorCode::ConvergenceFailure: return "ConvergenceFailure";
        case ErrorCode::InvalidSettings:    return "InvalidSettings";
        case ErrorCode::InvalidRating:      return "InvalidRating";
        case ErrorCode::ConfigLoadFailed:   return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound:  return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::LoggerFlushFailed:  return "LoggerFlushFailed";
    }
    return "Unrecognized";
}

} // namespace gre::foundation
