#pragma once

/// @file settings.hpp
/// @brief Validated tuning parameters for a Glicko-2 rating pool.

#include <chrono>
#include <cstdint>

#include "gre/foundation/rating_result.hpp"
#include "gre/rating/rating_types.hpp"

namespace gre::rating {

/// Immutable Glicko-2 parameters.
///
/// Settings are passed explicitly to every computation so independent
/// rating pools with different tuning can coexist in one process.
/// Instances only come from defaults() or create(), so every Settings
/// value in circulation has already been validated.
///
/// Example:
/// @code
///   auto settings = Settings::create(0.5, 1e-6, 350.0, 0.06, 1500.0,
///                                    std::chrono::hours{24});
///   if (!settings) {
///       return settings.error();
///   }
///   RatingEngine engine(settings.value());
/// @endcode
class Settings {
public:
    using Duration = std::chrono::duration<double>;

    static constexpr double kDefaultTau = 0.75;
    static constexpr double kDefaultConvergenceTolerance = 0.000001;
    static constexpr double kDefaultRating = 1500.0;
    static constexpr double kDefaultDeviation = 350.0;
    static constexpr double kDefaultVolatility = 0.06;
    static constexpr uint32_t kDefaultMaxIterations = 10000;
    static constexpr std::chrono::hours kDefaultRatingPeriod{24};

    /// Settings recommended by Glickman's paper, with a one-day period.
    [[nodiscard]] static Settings defaults();

    /// Build validated settings.
    ///
    /// Rejects with InvalidSettings: non-positive or non-finite tau,
    /// tolerance, volatility, or period; negative or non-finite
    /// deviation; non-finite default rating; zero iteration cap; a
    /// volatility whose square is not a normal double.
    [[nodiscard]] static foundation::RatingResult<Settings> create(
        double tau,
        double convergenceTolerance,
        double defaultDeviation,
        double defaultVolatility,
        double defaultRating = kDefaultRating,
        Duration ratingPeriodDuration = kDefaultRatingPeriod,
        uint32_t maxIterations = kDefaultMaxIterations);

    /// Copy of these settings with a different tau, re-validated.
    [[nodiscard]] foundation::RatingResult<Settings> withTau(double tau) const;

    /// Copy of these settings with a different period length, re-validated.
    [[nodiscard]] foundation::RatingResult<Settings> withRatingPeriod(
        Duration ratingPeriodDuration) const;

    [[nodiscard]] double tau() const noexcept { return tau_; }
    [[nodiscard]] double convergenceTolerance() const noexcept { return convergenceTolerance_; }
    [[nodiscard]] double defaultRating() const noexcept { return defaultRating_; }
    [[nodiscard]] double defaultDeviation() const noexcept { return defaultDeviation_; }
    [[nodiscard]] double defaultVolatility() const noexcept { return defaultVolatility_; }
    [[nodiscard]] Duration ratingPeriodDuration() const noexcept { return ratingPeriodDuration_; }
    [[nodiscard]] uint32_t maxIterations() const noexcept { return maxIterations_; }

    /// Starting rating for players registered without one.
    [[nodiscard]] PublicRating defaultPublicRating() const noexcept {
        return PublicRating{defaultRating_, defaultDeviation_, defaultVolatility_};
    }

    bool operator==(const Settings&) const = default;

private:
    Settings() = default;

    double tau_ = kDefaultTau;
    double convergenceTolerance_ = kDefaultConvergenceTolerance;
    double defaultRating_ = kDefaultRating;
    double defaultDeviation_ = kDefaultDeviation;
    double defaultVolatility_ = kDefaultVolatility;
    Duration ratingPeriodDuration_ = kDefaultRatingPeriod;
    uint32_t maxIterations_ = kDefaultMaxIterations;
};

/// Check a public rating against the data-model invariants:
/// finite values, deviation >= 0, volatility > 0 with a normal square.
[[nodiscard]] foundation::RatingResult<void> validateRating(const PublicRating& rating);

}  // namespace gre::rating
