#pragma once

/// @file rating_logger.hpp
/// @brief Category logger for the rating library, backed by kcenon common_system.
///
/// Messages are routed to the kcenon logger registered under
/// "gre.<Category>" (for example "gre.Engine"), or to the registry's
/// default logger when no category logger is registered.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gre/foundation/rating_result.hpp"
#include "gre/foundation/types.hpp"

namespace gre::foundation {

class ConfigManager;

/// Log severity, in increasing order. Off disables a category.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem a message comes from.
enum class LogCategory : uint8_t {
    Core      = 0,
    Algorithm = 1, ///< Failed Glicko-2 updates
    Engine    = 2, ///< Registrations and recorded results
    Config    = 3  ///< Configuration and settings loading
};

inline constexpr std::size_t kLogCategoryCount = 4;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Algorithm", "Engine", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration files.
/// Accepts the logLevelName() spellings in any case, plus "warn".
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Competitors and extra fields appended to a log line as
/// `{player_id=1, opponent_id=2, key=value}`.
///
/// Extra fields keep insertion order.
///
/// Example:
/// @code
///   auto ctx = LogContext::forPlayers(winner, loser).with("outcome", "Win");
///   logger.logWithContext(LogLevel::Debug, LogCategory::Engine,
///                         "result recorded", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<PlayerId> opponentId;
    std::vector<std::pair<std::string, std::string>> extra;

    /// Context naming one competitor and, if valid, its opponent.
    [[nodiscard]] static LogContext forPlayers(PlayerId player,
                                               PlayerId opponent = PlayerId{});

    /// Append an extra field and return *this for chaining.
    LogContext& with(std::string key, std::string value);
};

/// Category-filtered logger.
///
/// Each category has its own minimum level, readable without locking.
/// Default levels:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Algorithm | Info          |
/// | Engine    | Debug         |
/// | Config    | Info          |
///
/// instance() is shared by the GRE_LOG macros. It holds no rating
/// state, only logging levels.
class RatingLogger {
public:
    RatingLogger();
    ~RatingLogger();

    RatingLogger(const RatingLogger&) = delete;
    RatingLogger& operator=(const RatingLogger&) = delete;
    RatingLogger(RatingLogger&&) noexcept;
    RatingLogger& operator=(RatingLogger&&) noexcept;

    /// Emit `[Category] msg` if the category accepts `level`.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Emit `[Category] msg {context}` if the category accepts `level`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Off for categories outside LogCategory.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Apply category levels from `<prefix>.<category>` keys, where the
    /// category is lower case (`logging.engine: warning`). Absent keys
    /// leave the level unchanged. An unparsable level fails with
    /// ConfigTypeMismatch and changes nothing.
    RatingResult<void> configure(const ConfigManager& config,
                                 std::string_view prefix = "logging");

    /// Flush every logger a category currently routes to.
    RatingResult<void> flush();

    static RatingLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gre::foundation

/// @name GRE_LOG Macros
/// @brief Log through RatingLogger::instance().
///
/// Define GRE_MIN_LOG_LEVEL (0=Trace ... 6=Off) before including this
/// header to compile out calls below that level.
/// @{

#ifndef GRE_MIN_LOG_LEVEL
    #define GRE_MIN_LOG_LEVEL 0
#endif

#define GRE_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= GRE_MIN_LOG_LEVEL &&                       \
            ::gre::foundation::RatingLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::gre::foundation::RatingLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define GRE_LOG_DEBUG(cat, msg) \
    GRE_LOG(::gre::foundation::LogLevel::Debug, (cat), (msg))

#define GRE_LOG_INFO(cat, msg) \
    GRE_LOG(::gre::foundation::LogLevel::Info, (cat), (msg))

#define GRE_LOG_WARN(cat, msg) \
    GRE_LOG(::gre::foundation::LogLevel::Warning, (cat), (msg))

#define GRE_LOG_ERROR(cat, msg) \
    GRE_LOG(::gre::foundation::LogLevel::Error, (cat), (msg))

/// @}
