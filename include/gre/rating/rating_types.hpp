#pragma once

/// @file rating_types.hpp
/// @brief Value types for Glicko-2 ratings on the public and internal scales.
///
/// PublicRating and InternalRating are deliberately distinct types with
/// no implicit conversion between them; see scale_conversion.hpp.

#include <chrono>
#include <cstdint>
#include <string_view>

#include "gre/foundation/types.hpp"

namespace gre::rating {

using foundation::PlayerId;

/// Clock the engine measures idle time with.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Rating on the public (Glicko) scale, centered near 1500.
struct PublicRating {
    double rating = 1500.0;     ///< Skill estimate.
    double deviation = 350.0;   ///< Uncertainty (confidence half-width).
    double volatility = 0.06;   ///< Expected fluctuation rate.

    bool operator==(const PublicRating&) const = default;
};

/// Rating on the internal Glicko-2 scale, centered at 0.
struct InternalRating {
    double mu = 0.0;     ///< Scaled rating.
    double phi = 0.0;    ///< Scaled deviation.
    double sigma = 0.06; ///< Volatility (identical on both scales).

    bool operator==(const InternalRating&) const = default;
};

/// One game from the rated player's point of view, internal scale.
struct InternalGame {
    InternalRating opponent;
    double score = 0.5;  ///< 1.0 = win, 0.5 = draw, 0.0 = loss.
};

/// One game from the rated player's point of view, public scale.
struct PublicGame {
    PublicRating opponent;
    double score = 0.5;
};

/// Outcome of a match, seen from the first player passed to the engine.
enum class MatchOutcome : uint8_t {
    Win,
    Loss,
    Draw
};

/// Score the first player earns for the given outcome.
constexpr double scoreOf(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Win:  return 1.0;
        case MatchOutcome::Loss: return 0.0;
        case MatchOutcome::Draw: return 0.5;
    }
    return 0.5;
}

/// The same outcome seen from the opponent's side.
constexpr MatchOutcome invert(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Win:  return MatchOutcome::Loss;
        case MatchOutcome::Loss: return MatchOutcome::Win;
        case MatchOutcome::Draw: return MatchOutcome::Draw;
    }
    return MatchOutcome::Draw;
}

constexpr std::string_view matchOutcomeName(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::Win:  return "Win";
        case MatchOutcome::Loss: return "Loss";
        case MatchOutcome::Draw: return "Draw";
    }
    return "Unknown";
}

}  // namespace gre::rating
