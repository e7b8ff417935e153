#pragma once

/// @file rating_engine.hpp
/// @brief Continuous-time Glicko-2 rating pool.
///
/// RatingEngine keeps one TimedRating per registered competitor and
/// treats every recorded result as its own minimal rating period. The
/// number of elapsed periods is the fractional wall-clock time since a
/// competitor's last update divided by Settings::ratingPeriodDuration(),
/// so deviation keeps growing while a competitor is idle without any
/// background period-closing job.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "gre/foundation/rating_logger.hpp"
#include "gre/foundation/rating_result.hpp"
#include "gre/rating/rating_types.hpp"
#include "gre/rating/settings.hpp"
#include "gre/rating/timed_rating.hpp"

namespace gre::rating {

/// Source of "now" for an engine. Tests inject a manual clock.
using TimeSource = std::function<TimePoint()>;

/// Thread-safe continuous-time rating pool.
///
/// Every public member serializes on one mutex guarding the whole
/// competitor map, so concurrent results touching the same competitor
/// never lose an update. Each `...At` member takes the instant
/// explicitly; the others read the engine's TimeSource once per call.
///
/// Log lines are collected while the mutex is held and emitted after it
/// is released, so a registered kcenon logger may call back into the
/// engine.
///
/// Usage:
/// @code
///   RatingEngine engine(Settings::defaults());
///   auto alice = engine.registerPlayer().value();
///   auto bob = engine.registerPlayer(PublicRating{1700.0, 80.0, 0.06}).value();
///   engine.registerResult(alice, bob, MatchOutcome::Win);
///   auto rating = engine.playerRating(alice);
/// @endcode
class RatingEngine {
public:
    /// Engine measuring time with std::chrono::steady_clock.
    explicit RatingEngine(Settings settings);

    /// Engine reading "now" from the given time source.
    RatingEngine(Settings settings, TimeSource timeSource);

    RatingEngine(const RatingEngine&) = delete;
    RatingEngine& operator=(const RatingEngine&) = delete;

    // -- Registration ---------------------------------------------------------

    /// Register a competitor with the settings' default starting rating.
    [[nodiscard]] foundation::RatingResult<PlayerId> registerPlayer();

    /// Register a competitor with the given starting rating.
    /// Fails with InvalidRating if `starting` breaks the rating invariants.
    [[nodiscard]] foundation::RatingResult<PlayerId> registerPlayer(
        const PublicRating& starting);

    [[nodiscard]] foundation::RatingResult<PlayerId> registerPlayerAt(
        const PublicRating& starting, TimePoint at);

    // -- Results --------------------------------------------------------------

    /// Record a match between two competitors.
    ///
    /// `outcome` is seen from `first`. Both sides are rated against the
    /// other's pre-match rating decayed to the match instant, then both
    /// are committed together. On any error nothing is committed.
    ///
    /// @return UnknownPlayer, InvalidArgument (first == second), or
    ///         ConvergenceFailure on failure.
    [[nodiscard]] foundation::RatingResult<void> registerResult(
        PlayerId first, PlayerId second, MatchOutcome outcome);

    [[nodiscard]] foundation::RatingResult<void> registerResultAt(
        PlayerId first, PlayerId second, MatchOutcome outcome, TimePoint at);

    // -- Queries --------------------------------------------------------------

    /// Current public rating including idle decay. Does not modify state.
    [[nodiscard]] foundation::RatingResult<PublicRating> playerRating(PlayerId id) const;

    [[nodiscard]] foundation::RatingResult<PublicRating> playerRatingAt(
        PlayerId id, TimePoint at) const;

    /// Rating as last committed, without idle decay.
    [[nodiscard]] foundation::RatingResult<PublicRating> lastCommittedRating(PlayerId id) const;

    /// Instant of the competitor's last committed update.
    [[nodiscard]] foundation::RatingResult<TimePoint> lastUpdate(PlayerId id) const;

    /// Fractional rating periods since the competitor's last update.
    [[nodiscard]] foundation::RatingResult<double> elapsedPeriods(PlayerId id) const;

    [[nodiscard]] foundation::RatingResult<double> elapsedPeriodsAt(
        PlayerId id, TimePoint at) const;

    /// Whether `id` belongs to this engine.
    [[nodiscard]] bool contains(PlayerId id) const;

    /// All registered ids in ascending order.
    [[nodiscard]] std::vector<PlayerId> playerIds() const;

    [[nodiscard]] std::size_t playerCount() const;

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
    /// Engine log line held until mutex_ is released.
    struct PendingLog {
        foundation::LogLevel level;
        foundation::LogCategory category;
        std::string message;
        PlayerId player;
        PlayerId opponent;
    };
    using PendingLogs = std::vector<PendingLog>;

    static void emitLogs(const PendingLogs& logs);

    // The *Locked members expect mutex_ to be held by the caller, which
    // also reads the time source under the same lock. They append to
    // `logs` instead of logging.

    [[nodiscard]] foundation::RatingResult<PlayerId> registerPlayerLocked(
        const PublicRating& starting, TimePoint at, PendingLogs& logs);

    [[nodiscard]] foundation::RatingResult<void> registerResultLocked(
        PlayerId first, PlayerId second, MatchOutcome outcome, TimePoint at,
        PendingLogs& logs);

    [[nodiscard]] foundation::RatingResult<PublicRating> playerRatingLocked(
        PlayerId id, TimePoint at, PendingLogs& logs) const;

    [[nodiscard]] foundation::RatingResult<double> elapsedPeriodsLocked(
        PlayerId id, TimePoint at, PendingLogs& logs) const;

    /// Look up a record or produce UnknownPlayer.
    [[nodiscard]] foundation::RatingResult<TimedRating> findRecord(
        PlayerId id, PendingLogs& logs) const;

    /// Allocate the next competitor id.
    [[nodiscard]] PlayerId nextPlayerId();

    const Settings settings_;
    const TimeSource timeSource_;
    std::unordered_map<PlayerId, TimedRating> players_;
    uint64_t nextPlayerId_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace gre::rating
