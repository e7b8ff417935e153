#pragma once

/// @file timed_rating.hpp
/// @brief An internal rating stamped with the instant it was last updated.

#include <chrono>

#include "gre/rating/rating_types.hpp"

namespace gre::rating {

/// Internal rating plus the instant it was last committed.
///
/// Idle decay is never stored: ratingAt() derives the deviation a player
/// has at a later instant from the committed value, so "last committed"
/// and "currently displayed" can never drift apart.
struct TimedRating {
    InternalRating rating;
    TimePoint lastUpdated;

    /// Fractional rating periods between lastUpdated and `at`.
    /// Instants before lastUpdated count as zero elapsed time.
    [[nodiscard]] double elapsedPeriods(
        TimePoint at, std::chrono::duration<double> periodDuration) const;

    /// The rating as of `at`, with idle deviation growth applied.
    /// Mu and sigma are unchanged.
    [[nodiscard]] InternalRating ratingAt(
        TimePoint at, std::chrono::duration<double> periodDuration) const;
};

}  // namespace gre::rating
