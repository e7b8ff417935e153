#pragma once

/// @file settings_loader.hpp
/// @brief Build rating Settings from a ConfigManager.

#include <string_view>

#include "gre/foundation/config_manager.hpp"
#include "gre/foundation/rating_result.hpp"
#include "gre/rating/settings.hpp"

namespace gre::rating {

/// Read Settings from the keys under `prefix`:
///
/// | Key                               | Type     | Default  |
/// |-----------------------------------|----------|----------|
/// | `<prefix>.tau`                    | double   | 0.75     |
/// | `<prefix>.convergence_tolerance`  | double   | 1e-6     |
/// | `<prefix>.max_iterations`         | uint32   | 10000    |
/// | `<prefix>.default_rating`         | double   | 1500     |
/// | `<prefix>.default_deviation`      | double   | 350      |
/// | `<prefix>.default_volatility`     | double   | 0.06     |
/// | `<prefix>.period_seconds`         | double   | 86400    |
///
/// Missing keys take their defaults. A present key of the wrong type
/// fails with ConfigTypeMismatch; out-of-range values fail with
/// InvalidSettings.
[[nodiscard]] foundation::RatingResult<Settings> loadSettings(
    const foundation::ConfigManager& config, std::string_view prefix = "rating");

}  // namespace gre::rating
