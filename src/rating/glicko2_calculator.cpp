/// @file glicko2_calculator.cpp
/// @brief Glicko2Calculator implementation.

#include "gre/rating/glicko2_calculator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

#include "gre/rating/scale_conversion.hpp"

namespace gre::rating {

using foundation::ErrorCode;
using foundation::RatingError;
using foundation::RatingResult;

namespace {

constexpr double kPiSquared = std::numbers::pi * std::numbers::pi;

RatingResult<double> convergenceFailure(const Settings& settings) {
    std::string message =
        "volatility iteration exceeded " + std::to_string(settings.maxIterations())
        + " iterations (tolerance " + std::to_string(settings.convergenceTolerance()) + ")";
    return RatingResult<double>::err(
        RatingError(ErrorCode::ConvergenceFailure, std::move(message)));
}

}  // namespace

// -- Whole-update entry points ------------------------------------------------

RatingResult<InternalRating> Glicko2Calculator::rate(
    const InternalRating& current,
    std::span<const InternalGame> games,
    double elapsedPeriods,
    const Settings& settings) {
    if (!std::isfinite(elapsedPeriods) || elapsedPeriods < 0.0) {
        return RatingResult<InternalRating>::err(
            RatingError(ErrorCode::InvalidArgument,
                        "elapsed periods must be non-negative, got "
                            + std::to_string(elapsedPeriods)));
    }

    // Step 1: an idle player only accumulates uncertainty.
    if (games.empty()) {
        return RatingResult<InternalRating>::ok(InternalRating{
            current.mu,
            preRatingPeriodDeviation(current.phi, current.sigma, elapsedPeriods),
            current.sigma});
    }

    // Steps 3-4.
    double variance = estimatedVariance(current, games);

    // Every expected score saturated at exactly 0 or 1: the games say
    // nothing about volatility, and phi' reduces to phi*.
    if (std::isinf(variance)) {
        double phi = preRatingPeriodDeviation(current.phi, current.sigma, elapsedPeriods);
        return RatingResult<InternalRating>::ok(
            InternalRating{newRating(current, games, phi), phi, current.sigma});
    }
    double improvement = estimatedImprovement(current, games, variance);

    // Step 5.
    auto volatility = newVolatility(current, improvement, variance, settings);
    if (!volatility) {
        return RatingResult<InternalRating>::err(volatility.error());
    }
    double sigma = volatility.value();

    // Steps 6-8.
    double phiStar = preRatingPeriodDeviation(current.phi, sigma, elapsedPeriods);
    double phi = newDeviation(phiStar, variance);
    double mu = newRating(current, games, phi);

    return RatingResult<InternalRating>::ok(InternalRating{mu, phi, sigma});
}

RatingResult<InternalRating> Glicko2Calculator::closeRatingPeriod(
    const InternalRating& current,
    std::span<const InternalGame> games,
    const Settings& settings) {
    return rate(current, games, 1.0, settings);
}

RatingResult<PublicRating> Glicko2Calculator::ratePublic(
    const PublicRating& current,
    const std::vector<PublicGame>& games,
    double elapsedPeriods,
    const Settings& settings) {
    std::vector<InternalGame> internalGames;
    internalGames.reserve(games.size());
    for (const auto& game : games) {
        internalGames.push_back(toInternal(game));
    }

    auto updated = rate(toInternal(current), internalGames, elapsedPeriods, settings);
    if (!updated) {
        return RatingResult<PublicRating>::err(updated.error());
    }
    return RatingResult<PublicRating>::ok(toPublic(updated.value()));
}

RatingResult<TimedRating> Glicko2Calculator::rateGame(
    const TimedRating& player,
    const TimedRating& opponent,
    double score,
    TimePoint at,
    const Settings& settings) {
    auto period = settings.ratingPeriodDuration();
    std::array<InternalGame, 1> games{InternalGame{opponent.ratingAt(at, period), score}};

    auto updated = rate(player.rating, games, player.elapsedPeriods(at, period), settings);
    if (!updated) {
        return RatingResult<TimedRating>::err(updated.error());
    }
    return RatingResult<TimedRating>::ok(
        TimedRating{updated.value(), std::max(at, player.lastUpdated)});
}

// -- Individual steps ---------------------------------------------------------

double Glicko2Calculator::gFactor(double phi) {
    return 1.0 / std::sqrt(1.0 + 3.0 * phi * phi / kPiSquared);
}

double Glicko2Calculator::expectedScore(double mu, double opponentMu, double opponentPhi) {
    return 1.0 / (1.0 + std::exp(-gFactor(opponentPhi) * (mu - opponentMu)));
}

double Glicko2Calculator::estimatedVariance(
    const InternalRating& player, std::span<const InternalGame> games) {
    double sum = 0.0;
    for (const auto& game : games) {
        double g = gFactor(game.opponent.phi);
        double e = expectedScore(player.mu, game.opponent.mu, game.opponent.phi);
        sum += g * g * e * (1.0 - e);
    }
    return 1.0 / sum;
}

double Glicko2Calculator::scoreDeviationSum(
    const InternalRating& player, std::span<const InternalGame> games) {
    double sum = 0.0;
    for (const auto& game : games) {
        double g = gFactor(game.opponent.phi);
        double e = expectedScore(player.mu, game.opponent.mu, game.opponent.phi);
        sum += g * (game.score - e);
    }
    return sum;
}

double Glicko2Calculator::estimatedImprovement(
    const InternalRating& player, std::span<const InternalGame> games, double variance) {
    return variance * scoreDeviationSum(player, games);
}

RatingResult<double> Glicko2Calculator::newVolatility(
    const InternalRating& player, double improvement, double variance,
    const Settings& settings) {
    const double phiSq = player.phi * player.phi;
    const double deltaSq = improvement * improvement;
    const double tau = settings.tau();
    const double tauSq = tau * tau;
    const double a = std::log(player.sigma * player.sigma);
    if (!std::isfinite(a) || !std::isfinite(variance) || variance <= 0.0) {
        return RatingResult<double>::err(
            RatingError(ErrorCode::InvalidArgument,
                        "volatility solve needs sigma^2 > 0 and a finite variance"));
    }

    auto f = [&](double x) {
        double ex = std::exp(x);
        double denom = phiSq + variance + ex;
        return ex * (deltaSq - phiSq - variance - ex) / (2.0 * denom * denom)
               - (x - a) / tauSq;
    };

    // Bracket widening and Illinois steps share one iteration budget.
    uint32_t iterations = 0;

    double lower = a;
    double upper = 0.0;
    if (deltaSq > phiSq + variance) {
        upper = std::log(deltaSq - phiSq - variance);
    } else {
        double k = 1.0;
        while (f(a - k * tau) < 0.0) {
            if (++iterations >= settings.maxIterations()) {
                return convergenceFailure(settings);
            }
            k += 1.0;
        }
        upper = a - k * tau;
    }

    double fLower = f(lower);
    double fUpper = f(upper);
    if (!std::isfinite(fLower) || !std::isfinite(fUpper)) {
        return RatingResult<double>::err(
            RatingError(ErrorCode::InvalidArgument,
                        "volatility bracket is not finite"));
    }

    while (std::abs(upper - lower) > settings.convergenceTolerance()) {
        if (iterations >= settings.maxIterations()) {
            return convergenceFailure(settings);
        }
        double c = lower + (lower - upper) * fLower / (fUpper - fLower);
        double fc = f(c);
        if (fc * fUpper <= 0.0) {
            lower = upper;
            fLower = fUpper;
        } else {
            fLower /= 2.0;
        }
        upper = c;
        fUpper = fc;
        ++iterations;
    }

    return RatingResult<double>::ok(std::exp(lower / 2.0));
}

double Glicko2Calculator::preRatingPeriodDeviation(
    double phi, double sigma, double elapsedPeriods) {
    return std::sqrt(phi * phi + sigma * sigma * elapsedPeriods);
}

double Glicko2Calculator::newDeviation(double preRatingPeriodDeviation, double variance) {
    return 1.0 / std::sqrt(
        1.0 / (preRatingPeriodDeviation * preRatingPeriodDeviation) + 1.0 / variance);
}

double Glicko2Calculator::newRating(
    const InternalRating& player, std::span<const InternalGame> games, double newDeviation) {
    return player.mu + newDeviation * newDeviation * scoreDeviationSum(player, games);
}

}  // namespace gre::rating
