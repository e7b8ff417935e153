/// @file settings_loader.cpp
/// @brief loadSettings() implementation.

#include "gre/rating/settings_loader.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include "gre/foundation/rating_logger.hpp"

namespace gre::rating {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RatingResult;

namespace {

/// Read `key`, falling back to `fallback` only when the key is absent.
template <typename T>
RatingResult<T> readOr(const ConfigManager& config, const std::string& key, T fallback) {
    auto value = config.get<T>(key);
    if (value.hasError() && value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return RatingResult<T>::ok(fallback);
    }
    return value;
}

}  // namespace

RatingResult<Settings> loadSettings(const ConfigManager& config, std::string_view prefix) {
    const std::string base = std::string(prefix) + ".";
    const auto defaults = Settings::defaults();

    auto tau = readOr(config, base + "tau", defaults.tau());
    if (!tau) {
        return RatingResult<Settings>::err(tau.error());
    }
    auto tolerance = readOr(config, base + "convergence_tolerance",
                            defaults.convergenceTolerance());
    if (!tolerance) {
        return RatingResult<Settings>::err(tolerance.error());
    }
    auto maxIterations = readOr(config, base + "max_iterations", defaults.maxIterations());
    if (!maxIterations) {
        return RatingResult<Settings>::err(maxIterations.error());
    }
    auto rating = readOr(config, base + "default_rating", defaults.defaultRating());
    if (!rating) {
        return RatingResult<Settings>::err(rating.error());
    }
    auto deviation = readOr(config, base + "default_deviation", defaults.defaultDeviation());
    if (!deviation) {
        return RatingResult<Settings>::err(deviation.error());
    }
    auto volatility = readOr(config, base + "default_volatility", defaults.defaultVolatility());
    if (!volatility) {
        return RatingResult<Settings>::err(volatility.error());
    }
    auto periodSeconds = readOr(config, base + "period_seconds",
                                defaults.ratingPeriodDuration().count());
    if (!periodSeconds) {
        return RatingResult<Settings>::err(periodSeconds.error());
    }

    auto settings = Settings::create(
        tau.value(), tolerance.value(), deviation.value(), volatility.value(),
        rating.value(), std::chrono::duration<double>(periodSeconds.value()),
        maxIterations.value());
    if (!settings) {
        GRE_LOG_ERROR(LogCategory::Config, settings.error().toString());
        return settings;
    }

    GRE_LOG_INFO(LogCategory::Config,
                 "rating settings loaded: tau=" + std::to_string(tau.value())
                     + " period_seconds=" + std::to_string(periodSeconds.value()));
    return settings;
}

}  // namespace gre::rating
