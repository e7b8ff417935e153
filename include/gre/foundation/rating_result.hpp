#pragma once

/// @file rating_result.hpp
/// @brief RatingResult<T> type alias for rating-engine error handling.

#include "gre/core/result.hpp"
#include "gre/foundation/rating_error.hpp"

namespace gre::foundation {

/// Result type specialized with RatingError.
///
/// Every calculator, engine, and configuration method that can fail
/// returns RatingResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   RatingResult<double> periodsOf(double seconds, double periodSeconds) {
///       if (periodSeconds <= 0.0) {
///           return RatingResult<double>::err(
///               RatingError(ErrorCode::InvalidArgument, "non-positive period"));
///       }
///       return RatingResult<double>::ok(seconds / periodSeconds);
///   }
/// @endcode
template <typename T>
using RatingResult = gre::Result<T, RatingError>;

}  // namespace gre::foundation
