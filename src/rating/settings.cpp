/// @file settings.cpp
/// @brief Settings validation.

#include "gre/rating/settings.hpp"

#include <cmath>
#include <string>

namespace gre::rating {

using foundation::ErrorCode;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

RatingResult<Settings> rejectSettings(const std::string& why) {
    return RatingResult<Settings>::err(
        RatingError(ErrorCode::InvalidSettings, "invalid settings: " + why));
}

bool isPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

/// The volatility solve works on log(sigma^2), so sigma^2 must not
/// underflow to zero or a subnormal.
bool isUsableVolatility(double sigma) {
    return isPositive(sigma) && std::isnormal(sigma * sigma);
}

}  // namespace

Settings Settings::defaults() {
    return Settings{};
}

RatingResult<Settings> Settings::create(
    double tau,
    double convergenceTolerance,
    double defaultDeviation,
    double defaultVolatility,
    double defaultRating,
    Duration ratingPeriodDuration,
    uint32_t maxIterations) {
    if (!isPositive(tau)) {
        return rejectSettings("tau must be positive, got " + std::to_string(tau));
    }
    if (!isPositive(convergenceTolerance)) {
        return rejectSettings("convergence tolerance must be positive");
    }
    if (!std::isfinite(defaultDeviation) || defaultDeviation < 0.0) {
        return rejectSettings("default deviation must be non-negative, got "
                              + std::to_string(defaultDeviation));
    }
    if (!isUsableVolatility(defaultVolatility)) {
        return rejectSettings("default volatility must be positive, got "
                              + std::to_string(defaultVolatility));
    }
    if (!std::isfinite(defaultRating)) {
        return rejectSettings("default rating must be finite");
    }
    if (!isPositive(ratingPeriodDuration.count())) {
        return rejectSettings("rating period duration must be positive");
    }
    if (maxIterations == 0) {
        return rejectSettings("iteration cap must be at least 1");
    }

    Settings settings;
    settings.tau_ = tau;
    settings.convergenceTolerance_ = convergenceTolerance;
    settings.defaultRating_ = defaultRating;
    settings.defaultDeviation_ = defaultDeviation;
    settings.defaultVolatility_ = defaultVolatility;
    settings.ratingPeriodDuration_ = ratingPeriodDuration;
    settings.maxIterations_ = maxIterations;
    return RatingResult<Settings>::ok(settings);
}

RatingResult<Settings> Settings::withTau(double tau) const {
    return create(tau, convergenceTolerance_, defaultDeviation_, defaultVolatility_,
                  defaultRating_, ratingPeriodDuration_, maxIterations_);
}

RatingResult<Settings> Settings::withRatingPeriod(Duration ratingPeriodDuration) const {
    return create(tau_, convergenceTolerance_, defaultDeviation_, defaultVolatility_,
                  defaultRating_, ratingPeriodDuration, maxIterations_);
}

RatingResult<void> validateRating(const PublicRating& rating) {
    if (!std::isfinite(rating.rating)) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::InvalidRating, "rating must be finite"));
    }
    if (!std::isfinite(rating.deviation) || rating.deviation < 0.0) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::InvalidRating,
                        "deviation must be non-negative, got "
                            + std::to_string(rating.deviation)));
    }
    if (!isUsableVolatility(rating.volatility)) {
        return RatingResult<void>::err(
            RatingError(ErrorCode::InvalidRating,
                        "volatility must be positive, got "
                            + std::to_string(rating.volatility)));
    }
    return RatingResult<void>::ok();
}

}  // namespace gre::rating
