#pragma once

/// @file gre.hpp
/// @brief Aggregate header for the Glicko-2 rating engine.

#include "gre/core/result.hpp"
#include "gre/version.hpp"

#include "gre/foundation/error_code.hpp"
#include "gre/foundation/rating_error.hpp"
#include "gre/foundation/rating_result.hpp"
#include "gre/foundation/types.hpp"

#include "gre/rating/glicko2_calculator.hpp"
#include "gre/rating/rating_engine.hpp"
#include "gre/rating/rating_types.hpp"
#include "gre/rating/scale_conversion.hpp"
#include "gre/rating/settings.hpp"
#include "gre/rating/timed_rating.hpp"
