#pragma once

/// @file scale_conversion.hpp
/// @brief Conversion between the public Glicko scale and the internal
///        Glicko-2 scale (Glickman, steps 2 and 8).

#include "gre/rating/rating_types.hpp"

namespace gre::rating {

/// Factor between the public and internal scales.
inline constexpr double kRatingScale = 173.7178;

/// Public rating that maps to mu = 0.
inline constexpr double kRatingOrigin = 1500.0;

/// mu = (r - 1500) / 173.7178, phi = RD / 173.7178.
[[nodiscard]] constexpr InternalRating toInternal(const PublicRating& rating) noexcept {
    return InternalRating{(rating.rating - kRatingOrigin) / kRatingScale,
                          rating.deviation / kRatingScale,
                          rating.volatility};
}

/// r = 173.7178 * mu + 1500, RD = 173.7178 * phi.
[[nodiscard]] constexpr PublicRating toPublic(const InternalRating& rating) noexcept {
    return PublicRating{rating.mu * kRatingScale + kRatingOrigin,
                        rating.phi * kRatingScale,
                        rating.sigma};
}

[[nodiscard]] constexpr InternalGame toInternal(const PublicGame& game) noexcept {
    return InternalGame{toInternal(game.opponent), game.score};
}

[[nodiscard]] constexpr PublicGame toPublic(const InternalGame& game) noexcept {
    return PublicGame{toPublic(game.opponent), game.score};
}

}  // namespace gre::rating
