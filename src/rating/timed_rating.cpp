/// @file timed_rating.cpp
/// @brief TimedRating idle-decay derivation.

#include "gre/rating/timed_rating.hpp"

#include "gre/rating/glicko2_calculator.hpp"

namespace gre::rating {

double TimedRating::elapsedPeriods(
    TimePoint at, std::chrono::duration<double> periodDuration) const {
    if (at <= lastUpdated) {
        return 0.0;
    }
    std::chrono::duration<double> idle = at - lastUpdated;
    return idle / periodDuration;
}

InternalRating TimedRating::ratingAt(
    TimePoint at, std::chrono::duration<double> periodDuration) const {
    return InternalRating{
        rating.mu,
        Glicko2Calculator::preRatingPeriodDeviation(
            rating.phi, rating.sigma, elapsedPeriods(at, periodDuration)),
        rating.sigma};
}

}  // namespace gre::rating
