/// @file rating_engine.cpp
/// @brief RatingEngine implementation.

#include "gre/rating/rating_engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "gre/foundation/rating_logger.hpp"
#include "gre/rating/glicko2_calculator.hpp"
#include "gre/rating/scale_conversion.hpp"

namespace gre::rating {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RatingError;
using foundation::RatingLogger;
using foundation::RatingResult;

namespace {

void logPlayerEvent(LogLevel level, LogCategory cat, std::string_view msg,
                    PlayerId player, PlayerId opponent) {
    auto& logger = RatingLogger::instance();
    if (logger.isEnabled(level, cat)) {
        logger.logWithContext(level, cat, msg, LogContext::forPlayers(player, opponent));
    }
}

}  // namespace

RatingEngine::RatingEngine(Settings settings)
    : RatingEngine(std::move(settings), [] { return Clock::now(); }) {}

RatingEngine::RatingEngine(Settings settings, TimeSource timeSource)
    : settings_(std::move(settings)), timeSource_(std::move(timeSource)) {}

void RatingEngine::emitLogs(const PendingLogs& logs) {
    for (const auto& entry : logs) {
        logPlayerEvent(entry.level, entry.category, entry.message, entry.player,
                       entry.opponent);
    }
}

// -- Registration -------------------------------------------------------------

RatingResult<PlayerId> RatingEngine::registerPlayer() {
    return registerPlayer(settings_.defaultPublicRating());
}

RatingResult<PlayerId> RatingEngine::registerPlayer(const PublicRating& starting) {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto id = registerPlayerLocked(starting, timeSource_(), logs);
    lock.unlock();
    emitLogs(logs);
    return id;
}

RatingResult<PlayerId> RatingEngine::registerPlayerAt(
    const PublicRating& starting, TimePoint at) {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto id = registerPlayerLocked(starting, at, logs);
    lock.unlock();
    emitLogs(logs);
    return id;
}

RatingResult<PlayerId> RatingEngine::registerPlayerLocked(
    const PublicRating& starting, TimePoint at, PendingLogs& logs) {
    auto valid = validateRating(starting);
    if (!valid) {
        logs.push_back({LogLevel::Warning, LogCategory::Engine,
                        "registration rejected: " + valid.error().toString(),
                        PlayerId{}, PlayerId{}});
        return RatingResult<PlayerId>::err(valid.error());
    }

    auto id = nextPlayerId();
    players_.emplace(id, TimedRating{toInternal(starting), at});

    logs.push_back({LogLevel::Debug, LogCategory::Engine, "player registered", id, PlayerId{}});
    return RatingResult<PlayerId>::ok(id);
}

// -- Results ------------------------------------------------------------------

RatingResult<void> RatingEngine::registerResult(
    PlayerId first, PlayerId second, MatchOutcome outcome) {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto recorded = registerResultLocked(first, second, outcome, timeSource_(), logs);
    lock.unlock();
    emitLogs(logs);
    return recorded;
}

RatingResult<void> RatingEngine::registerResultAt(
    PlayerId first, PlayerId second, MatchOutcome outcome, TimePoint at) {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto recorded = registerResultLocked(first, second, outcome, at, logs);
    lock.unlock();
    emitLogs(logs);
    return recorded;
}

RatingResult<void> RatingEngine::registerResultLocked(
    PlayerId first, PlayerId second, MatchOutcome outcome, TimePoint at,
    PendingLogs& logs) {
    if (first == second) {
        logs.push_back({LogLevel::Warning, LogCategory::Engine,
                        "rejected result against self", first, PlayerId{}});
        return RatingResult<void>::err(
            RatingError(ErrorCode::InvalidArgument,
                        "player " + std::to_string(first.value())
                            + " cannot play against themselves"));
    }

    auto firstRecord = findRecord(first, logs);
    if (!firstRecord) {
        return RatingResult<void>::err(firstRecord.error());
    }
    auto secondRecord = findRecord(second, logs);
    if (!secondRecord) {
        return RatingResult<void>::err(secondRecord.error());
    }

    // Both sides are computed from pre-match state before anything is
    // committed, so neither update feeds the other.
    auto firstUpdated = Glicko2Calculator::rateGame(
        firstRecord.value(), secondRecord.value(), scoreOf(outcome), at, settings_);
    if (!firstUpdated) {
        logs.push_back({LogLevel::Error, LogCategory::Algorithm,
                        "rating update failed: " + firstUpdated.error().toString(),
                        first, second});
        return RatingResult<void>::err(firstUpdated.error());
    }
    auto secondUpdated = Glicko2Calculator::rateGame(
        secondRecord.value(), firstRecord.value(), scoreOf(invert(outcome)), at, settings_);
    if (!secondUpdated) {
        logs.push_back({LogLevel::Error, LogCategory::Algorithm,
                        "rating update failed: " + secondUpdated.error().toString(),
                        second, first});
        return RatingResult<void>::err(secondUpdated.error());
    }

    players_[first] = firstUpdated.value();
    players_[second] = secondUpdated.value();

    logs.push_back({LogLevel::Debug, LogCategory::Engine,
                    "result recorded: " + std::string(matchOutcomeName(outcome)),
                    first, second});
    return RatingResult<void>::ok();
}

// -- Queries ------------------------------------------------------------------

RatingResult<PublicRating> RatingEngine::playerRating(PlayerId id) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto rating = playerRatingLocked(id, timeSource_(), logs);
    lock.unlock();
    emitLogs(logs);
    return rating;
}

RatingResult<PublicRating> RatingEngine::playerRatingAt(PlayerId id, TimePoint at) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto rating = playerRatingLocked(id, at, logs);
    lock.unlock();
    emitLogs(logs);
    return rating;
}

RatingResult<PublicRating> RatingEngine::playerRatingLocked(
    PlayerId id, TimePoint at, PendingLogs& logs) const {
    auto record = findRecord(id, logs);
    if (!record) {
        return RatingResult<PublicRating>::err(record.error());
    }
    auto& timed = record.value();
    auto decayed = Glicko2Calculator::rate(
        timed.rating, {}, timed.elapsedPeriods(at, settings_.ratingPeriodDuration()),
        settings_);
    if (!decayed) {
        return RatingResult<PublicRating>::err(decayed.error());
    }
    return RatingResult<PublicRating>::ok(toPublic(decayed.value()));
}

RatingResult<PublicRating> RatingEngine::lastCommittedRating(PlayerId id) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto record = findRecord(id, logs);
    lock.unlock();
    emitLogs(logs);
    if (!record) {
        return RatingResult<PublicRating>::err(record.error());
    }
    return RatingResult<PublicRating>::ok(toPublic(record.value().rating));
}

RatingResult<TimePoint> RatingEngine::lastUpdate(PlayerId id) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto record = findRecord(id, logs);
    lock.unlock();
    emitLogs(logs);
    if (!record) {
        return RatingResult<TimePoint>::err(record.error());
    }
    return RatingResult<TimePoint>::ok(record.value().lastUpdated);
}

RatingResult<double> RatingEngine::elapsedPeriods(PlayerId id) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto elapsed = elapsedPeriodsLocked(id, timeSource_(), logs);
    lock.unlock();
    emitLogs(logs);
    return elapsed;
}

RatingResult<double> RatingEngine::elapsedPeriodsAt(PlayerId id, TimePoint at) const {
    PendingLogs logs;
    std::unique_lock lock(mutex_);
    auto elapsed = elapsedPeriodsLocked(id, at, logs);
    lock.unlock();
    emitLogs(logs);
    return elapsed;
}

RatingResult<double> RatingEngine::elapsedPeriodsLocked(
    PlayerId id, TimePoint at, PendingLogs& logs) const {
    auto record = findRecord(id, logs);
    if (!record) {
        return RatingResult<double>::err(record.error());
    }
    return RatingResult<double>::ok(
        record.value().elapsedPeriods(at, settings_.ratingPeriodDuration()));
}

bool RatingEngine::contains(PlayerId id) const {
    std::lock_guard lock(mutex_);
    return players_.contains(id);
}

std::vector<PlayerId> RatingEngine::playerIds() const {
    std::vector<PlayerId> ids;
    {
        std::lock_guard lock(mutex_);
        ids.reserve(players_.size());
        for (const auto& [id, record] : players_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t RatingEngine::playerCount() const {
    std::lock_guard lock(mutex_);
    return players_.size();
}

// -- Internals ----------------------------------------------------------------

RatingResult<TimedRating> RatingEngine::findRecord(PlayerId id, PendingLogs& logs) const {
    auto it = players_.find(id);
    if (it == players_.end()) {
        logs.push_back({LogLevel::Warning, LogCategory::Engine, "unknown player", id, PlayerId{}});
        return RatingResult<TimedRating>::err(
            RatingError(ErrorCode::UnknownPlayer,
                        "unknown player: " + std::to_string(id.value()), id));
    }
    return RatingResult<TimedRating>::ok(it->second);
}

PlayerId RatingEngine::nextPlayerId() {
    return PlayerId(nextPlayerId_++);
}

}  // namespace gre::rating
