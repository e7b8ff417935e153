#pragma once

/// @file glicko2_calculator.hpp
/// @brief Glicko-2 rating calculations with fractional rating periods.
///
/// Implements the algorithm from Glickman's "Example of the Glicko-2
/// system", generalized so the pre-rating-period deviation is grown by
/// an arbitrary, possibly fractional, number of elapsed periods.

#include <span>
#include <vector>

#include "gre/foundation/rating_result.hpp"
#include "gre/rating/rating_types.hpp"
#include "gre/rating/settings.hpp"
#include "gre/rating/timed_rating.hpp"

namespace gre::rating {

/// Static utility class for Glicko-2 rating calculations.
///
/// All members are pure functions of their arguments and safe to call
/// concurrently. Everything operates on the internal scale except
/// ratePublic(), which converts at the boundary.
///
/// Example:
/// @code
///   std::vector<InternalGame> games = {
///       {toInternal(PublicRating{1400.0, 30.0, 0.06}), 1.0},
///   };
///   auto updated = Glicko2Calculator::rate(
///       toInternal(PublicRating{1500.0, 200.0, 0.06}), games, 1.0, settings);
/// @endcode
class Glicko2Calculator {
public:
    Glicko2Calculator() = delete;

    /// Rate a player against a batch of games.
    ///
    /// @param current         Player's rating before the games.
    /// @param games           Games the player took part in; may be empty.
    /// @param elapsedPeriods  Rating periods since `current` was computed (>= 0).
    /// @param settings        Pool parameters.
    /// If every expected score is exactly 0 or 1 the variance is
    /// infinite; sigma is then kept and phi' equals phi*.
    ///
    /// @return Updated rating, or ConvergenceFailure if the volatility
    ///         solver exceeds settings.maxIterations().
    [[nodiscard]] static foundation::RatingResult<InternalRating> rate(
        const InternalRating& current,
        std::span<const InternalGame> games,
        double elapsedPeriods,
        const Settings& settings);

    /// Close one full rating period (rate() with elapsedPeriods = 1).
    [[nodiscard]] static foundation::RatingResult<InternalRating> closeRatingPeriod(
        const InternalRating& current,
        std::span<const InternalGame> games,
        const Settings& settings);

    /// rate() for callers working on the public scale.
    [[nodiscard]] static foundation::RatingResult<PublicRating> ratePublic(
        const PublicRating& current,
        const std::vector<PublicGame>& games,
        double elapsedPeriods,
        const Settings& settings);

    /// Rate a single game played at `at` between two timed ratings.
    ///
    /// The opponent is decayed to `at` before use and is not modified.
    /// The returned rating is stamped with `at`, or with
    /// player.lastUpdated if `at` is earlier.
    [[nodiscard]] static foundation::RatingResult<TimedRating> rateGame(
        const TimedRating& player,
        const TimedRating& opponent,
        double score,
        TimePoint at,
        const Settings& settings);

    // -- Individual algorithm steps -------------------------------------------

    /// g(phi) = 1 / sqrt(1 + 3 phi^2 / pi^2)
    [[nodiscard]] static double gFactor(double phi);

    /// E = 1 / (1 + exp(-g(phi_j) (mu - mu_j)))
    [[nodiscard]] static double expectedScore(double mu, double opponentMu, double opponentPhi);

    /// v = 1 / sum(g^2 E (1 - E)). Requires a non-empty game list.
    /// +inf when every E is exactly 0 or 1.
    [[nodiscard]] static double estimatedVariance(
        const InternalRating& player, std::span<const InternalGame> games);

    /// sum(g (s - E)), the raw score surprise shared by delta and mu'.
    [[nodiscard]] static double scoreDeviationSum(
        const InternalRating& player, std::span<const InternalGame> games);

    /// delta = v * sum(g (s - E))
    [[nodiscard]] static double estimatedImprovement(
        const InternalRating& player, std::span<const InternalGame> games, double variance);

    /// Solve for sigma' with the Illinois algorithm (Glickman step 5).
    /// InvalidArgument if sigma^2 underflows, the variance is not finite,
    /// or the initial bracket evaluates to a non-finite value.
    [[nodiscard]] static foundation::RatingResult<double> newVolatility(
        const InternalRating& player, double improvement, double variance,
        const Settings& settings);

    /// phi* = sqrt(phi^2 + sigma^2 * elapsedPeriods)
    [[nodiscard]] static double preRatingPeriodDeviation(
        double phi, double sigma, double elapsedPeriods);

    /// phi' = 1 / sqrt(1 / phi*^2 + 1 / v)
    [[nodiscard]] static double newDeviation(double preRatingPeriodDeviation, double variance);

    /// mu' = mu + phi'^2 * sum(g (s - E))
    [[nodiscard]] static double newRating(
        const InternalRating& player, std::span<const InternalGame> games, double newDeviation);
};

}  // namespace gre::rating
