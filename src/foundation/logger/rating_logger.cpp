/// @file rating_logger.cpp
/// @brief RatingLogger on top of the kcenon logger registry.

#include "gre/foundation/rating_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

#include "gre/foundation/config_manager.hpp"

namespace gre::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Algorithm
    LogLevel::Debug,  // Engine
    LogLevel::Info    // Config
};

kci::log_level toKcenon(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

bool isValidCategory(LogCategory cat) {
    return static_cast<std::size_t>(cat) < kLogCategoryCount;
}

std::string lowerCase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// `[Category] msg {k=v, ...}`; the braces are omitted without context.
std::string render(LogCategory cat, std::string_view msg, const LogContext* ctx) {
    std::string line;
    line.reserve(msg.size() + 32);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    if (ctx == nullptr) {
        return line;
    }

    std::string fields;
    auto field = [&fields](std::string_view key, std::string_view value) {
        if (!fields.empty()) {
            fields += ", ";
        }
        fields += key;
        fields += '=';
        fields += value;
    };
    if (ctx->playerId && ctx->playerId->isValid()) {
        field("player_id", std::to_string(ctx->playerId->value()));
    }
    if (ctx->opponentId && ctx->opponentId->isValid()) {
        field("opponent_id", std::to_string(ctx->opponentId->value()));
    }
    for (const auto& [key, value] : ctx->extra) {
        field(key, value);
    }

    if (!fields.empty()) {
        line += " {";
        line += fields;
        line += '}';
    }
    return line;
}

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    auto lowered = lowerCase(name);
    if (lowered == "warn") {
        return LogLevel::Warning;
    }
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        if (lowered == lowerCase(logLevelName(level))) {
            return level;
        }
    }
    return std::nullopt;
}

// -- LogContext ---------------------------------------------------------------

LogContext LogContext::forPlayers(PlayerId player, PlayerId opponent) {
    LogContext ctx;
    ctx.playerId = player;
    if (opponent.isValid()) {
        ctx.opponentId = opponent;
    }
    return ctx;
}

LogContext& LogContext::with(std::string key, std::string value) {
    extra.emplace_back(std::move(key), std::move(value));
    return *this;
}

// -- Impl ---------------------------------------------------------------------

struct RatingLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> levels;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            levels[i].store(kDefaultLevels[i], std::memory_order_relaxed);
        }
    }

    /// Logger registered as "gre.<Category>", else the default logger.
    static std::shared_ptr<kci::ILogger> route(LogCategory cat) {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger("gre." + std::string(logCategoryName(cat)));
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, const std::string& line) const {
        route(cat)->log(toKcenon(level), line);
    }
};

RatingLogger::RatingLogger() : impl_(std::make_unique<Impl>()) {}

RatingLogger::~RatingLogger() = default;

RatingLogger::RatingLogger(RatingLogger&&) noexcept = default;
RatingLogger& RatingLogger::operator=(RatingLogger&&) noexcept = default;

// -- Output -------------------------------------------------------------------

void RatingLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, render(cat, msg, nullptr));
    }
}

void RatingLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, render(cat, msg, &ctx));
    }
}

RatingResult<void> RatingLogger::flush() {
    std::vector<std::shared_ptr<kci::ILogger>> targets;
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto target = Impl::route(static_cast<LogCategory>(i));
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            targets.push_back(std::move(target));
        }
    }

    bool failed = false;
    for (const auto& target : targets) {
        if (target->flush().is_err()) {
            failed = true;
        }
    }
    if (failed) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return RatingResult<void>::ok();
}

// -- Levels -------------------------------------------------------------------

void RatingLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (isValidCategory(cat)) {
        impl_->levels[static_cast<std::size_t>(cat)].store(minLevel, std::memory_order_release);
    }
}

LogLevel RatingLogger::getCategoryLevel(LogCategory cat) const {
    if (!isValidCategory(cat)) {
        return LogLevel::Off;
    }
    return impl_->levels[static_cast<std::size_t>(cat)].load(std::memory_order_acquire);
}

bool RatingLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto minLevel = getCategoryLevel(cat);
    return minLevel != LogLevel::Off
        && static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

RatingResult<void> RatingLogger::configure(const ConfigManager& config,
                                           std::string_view prefix) {
    std::array<std::optional<LogLevel>, kLogCategoryCount> parsed;

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto key = std::string(prefix) + "." + lowerCase(logCategoryName(cat));
        auto name = config.get<std::string>(key);
        if (!name) {
            if (name.error().code() == ErrorCode::ConfigKeyNotFound) {
                continue;
            }
            return RatingResult<void>::err(name.error());
        }
        parsed[i] = parseLogLevel(name.value());
        if (!parsed[i]) {
            return RatingResult<void>::err(
                RatingError(ErrorCode::ConfigTypeMismatch,
                            "unknown log level '" + name.value() + "' for key: " + key));
        }
    }

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        if (parsed[i]) {
            setCategoryLevel(static_cast<LogCategory>(i), *parsed[i]);
        }
    }
    return RatingResult<void>::ok();
}

RatingLogger& RatingLogger::instance() {
    static RatingLogger logger;
    return logger;
}

} // namespace gre::foundation
