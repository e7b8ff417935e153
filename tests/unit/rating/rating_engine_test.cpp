/// @file rating_engine_test.cpp
/// @brief Unit tests for RatingEngine.

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>
#include <vector>

#include "gre/rating/glicko2_calculator.hpp"
#include "gre/rating/rating_engine.hpp"
#include "gre/rating/scale_conversion.hpp"

using namespace gre::rating;
using namespace std::chrono_literals;
using gre::foundation::ErrorCode;

/// Engine on a manually advanced clock with one-second rating periods.
class RatingEngineTest : public ::testing::Test {
protected:
    void advance(std::chrono::nanoseconds step) { now_ += step; }

    PlayerId add(const PublicRating& rating) {
        auto id = engine_.registerPlayer(rating);
        EXPECT_TRUE(id.hasValue());
        return id.value();
    }

    TimePoint t0_ = TimePoint{} + 1h;
    TimePoint now_ = t0_;
    Settings settings_ = Settings::defaults().withRatingPeriod(1s).value();
    RatingEngine engine_{settings_, [this] { return now_; }};
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(RatingEngineTest, IdsAreAscendingFromOne) {
    auto a = engine_.registerPlayer();
    auto b = engine_.registerPlayer();
    auto c = engine_.registerPlayer(PublicRating{1800.0, 50.0, 0.05});
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    ASSERT_TRUE(c.hasValue());

    EXPECT_EQ(a.value(), PlayerId(1));
    EXPECT_EQ(b.value(), PlayerId(2));
    EXPECT_EQ(c.value(), PlayerId(3));
    EXPECT_EQ(engine_.playerCount(), 3u);
    EXPECT_EQ(engine_.playerIds(), (std::vector<PlayerId>{PlayerId(1), PlayerId(2), PlayerId(3)}));
}

TEST_F(RatingEngineTest, InvalidStartingRatingDoesNotConsumeId) {
    auto bad = engine_.registerPlayer(PublicRating{1500.0, -10.0, 0.06});
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidRating);
    EXPECT_EQ(engine_.playerCount(), 0u);

    auto good = engine_.registerPlayer();
    ASSERT_TRUE(good.hasValue());
    EXPECT_EQ(good.value(), PlayerId(1));
}

TEST_F(RatingEngineTest, VolatilityWithUnderflowingSquareIsRejected) {
    auto tiny = engine_.registerPlayer(PublicRating{1500.0, 200.0, 1e-200});
    ASSERT_TRUE(tiny.hasError());
    EXPECT_EQ(tiny.error().code(), ErrorCode::InvalidRating);
    EXPECT_EQ(engine_.playerCount(), 0u);
}

TEST_F(RatingEngineTest, DefaultRegistrationUsesSettings) {
    auto id = add(settings_.defaultPublicRating());
    auto rating = engine_.playerRating(id);
    ASSERT_TRUE(rating.hasValue());
    EXPECT_NEAR(rating.value().rating, 1500.0, 1e-9);
    EXPECT_NEAR(rating.value().deviation, 350.0, 1e-9);
    EXPECT_DOUBLE_EQ(rating.value().volatility, 0.06);
}

TEST_F(RatingEngineTest, RegisterPlayerAtStampsInstant) {
    auto at = t0_ + 42s;
    auto id = engine_.registerPlayerAt(PublicRating{}, at);
    ASSERT_TRUE(id.hasValue());
    EXPECT_EQ(engine_.lastUpdate(id.value()).value(), at);
}

// ============================================================================
// Idle decay
// ============================================================================

TEST_F(RatingEngineTest, QueryAtRegistrationReturnsStartingRating) {
    PublicRating starting{1620.0, 120.0, 0.07};
    auto id = add(starting);

    auto rating = engine_.playerRating(id);
    ASSERT_TRUE(rating.hasValue());
    EXPECT_NEAR(rating.value().rating, 1620.0, 1e-9);
    EXPECT_NEAR(rating.value().deviation, 120.0, 1e-9);
    EXPECT_DOUBLE_EQ(rating.value().volatility, 0.07);
}

TEST_F(RatingEngineTest, QuarterPeriodDecay) {
    PublicRating starting{1500.0, 100.0, 0.06};
    auto id = add(starting);
    advance(250ms);

    auto internal = toInternal(starting);
    double expectedPhi = std::sqrt(internal.phi * internal.phi + 0.06 * 0.06 * 0.25);

    auto rating = engine_.playerRating(id);
    ASSERT_TRUE(rating.hasValue());
    EXPECT_NEAR(rating.value().deviation, expectedPhi * kRatingScale, 1e-9);
    EXPECT_NEAR(rating.value().rating, 1500.0, 1e-9);
    EXPECT_DOUBLE_EQ(engine_.elapsedPeriods(id).value(), 0.25);
}

TEST_F(RatingEngineTest, QueriesDoNotCommitDecay) {
    PublicRating starting{1500.0, 100.0, 0.06};
    auto id = add(starting);

    advance(10s);
    auto first = engine_.playerRating(id).value();
    auto second = engine_.playerRating(id).value();
    EXPECT_EQ(first, second);
    EXPECT_GT(first.deviation, 100.0);

    auto committed = engine_.lastCommittedRating(id);
    ASSERT_TRUE(committed.hasValue());
    EXPECT_NEAR(committed.value().deviation, 100.0, 1e-9);
    EXPECT_EQ(engine_.lastUpdate(id).value(), t0_);
}

TEST_F(RatingEngineTest, QueriedPlayerRatesLikeUnqueriedPlayer) {
    TimePoint clock = t0_;
    RatingEngine other(settings_, [&clock] { return clock; });

    auto a = add(PublicRating{1500.0, 200.0, 0.06});
    auto b = add(PublicRating{1400.0, 30.0, 0.06});
    auto otherA = other.registerPlayer(PublicRating{1500.0, 200.0, 0.06}).value();
    auto otherB = other.registerPlayer(PublicRating{1400.0, 30.0, 0.06}).value();

    for (int i = 0; i < 5; ++i) {
        advance(1s);
        ASSERT_TRUE(engine_.playerRating(a).hasValue());
        ASSERT_TRUE(engine_.playerRating(b).hasValue());
    }
    clock += 5s;

    ASSERT_TRUE(engine_.registerResult(a, b, MatchOutcome::Win).hasValue());
    ASSERT_TRUE(other.registerResult(otherA, otherB, MatchOutcome::Win).hasValue());

    EXPECT_EQ(engine_.lastCommittedRating(a).value(), other.lastCommittedRating(otherA).value());
    EXPECT_EQ(engine_.lastCommittedRating(b).value(), other.lastCommittedRating(otherB).value());
}

TEST_F(RatingEngineTest, PlayerRatingAtExplicitInstant) {
    auto id = add(PublicRating{1500.0, 100.0, 0.06});
    auto early = engine_.playerRatingAt(id, t0_ + 1s).value();
    auto late = engine_.playerRatingAt(id, t0_ + 100s).value();
    auto before = engine_.playerRatingAt(id, t0_ - 100s).value();

    EXPECT_GT(late.deviation, early.deviation);
    EXPECT_NEAR(before.deviation, 100.0, 1e-9);
}

// ============================================================================
// Results
// ============================================================================

TEST_F(RatingEngineTest, SingleGameMatchesCalculator) {
    PublicRating startA{1500.0, 200.0, 0.06};
    PublicRating startB{1400.0, 30.0, 0.06};
    auto a = add(startA);
    auto b = add(startB);
    advance(1s);

    ASSERT_TRUE(engine_.registerResult(a, b, MatchOutcome::Win).hasValue());

    auto internalA = toInternal(startA);
    auto internalB = toInternal(startB);
    InternalRating decayedB{
        internalB.mu,
        Glicko2Calculator::preRatingPeriodDeviation(internalB.phi, internalB.sigma, 1.0),
        internalB.sigma};
    std::array<InternalGame, 1> games{InternalGame{decayedB, 1.0}};
    auto expected = Glicko2Calculator::rate(internalA, games, 1.0, settings_);
    ASSERT_TRUE(expected.hasValue());

    auto actual = engine_.lastCommittedRating(a);
    ASSERT_TRUE(actual.hasValue());
    auto expectedPublic = toPublic(expected.value());
    EXPECT_NEAR(actual.value().rating, expectedPublic.rating, 1e-9);
    EXPECT_NEAR(actual.value().deviation, expectedPublic.deviation, 1e-9);
    EXPECT_NEAR(actual.value().volatility, expectedPublic.volatility, 1e-12);
    EXPECT_EQ(engine_.lastUpdate(a).value(), now_);
    EXPECT_EQ(engine_.lastUpdate(b).value(), now_);
}

TEST_F(RatingEngineTest, WinnerRisesLoserFalls) {
    auto a = add(PublicRating{});
    auto b = add(PublicRating{});
    advance(1s);

    ASSERT_TRUE(engine_.registerResult(a, b, MatchOutcome::Win).hasValue());

    auto ra = engine_.playerRating(a).value();
    auto rb = engine_.playerRating(b).value();
    EXPECT_GT(ra.rating, 1500.0);
    EXPECT_LT(rb.rating, 1500.0);
    EXPECT_NEAR(ra.rating - 1500.0, 1500.0 - rb.rating, 1e-9);
    EXPECT_LT(ra.deviation, 350.0);
    EXPECT_LT(rb.deviation, 350.0);
}

TEST_F(RatingEngineTest, LossIsWinForOpponent) {
    TimePoint clock = t0_;
    RatingEngine other(settings_, [&clock] { return clock; });

    auto a = add(PublicRating{1600.0, 90.0, 0.06});
    auto b = add(PublicRating{1450.0, 150.0, 0.06});
    auto otherA = other.registerPlayer(PublicRating{1600.0, 90.0, 0.06}).value();
    auto otherB = other.registerPlayer(PublicRating{1450.0, 150.0, 0.06}).value();
    advance(3s);
    clock += 3s;

    ASSERT_TRUE(engine_.registerResult(a, b, MatchOutcome::Loss).hasValue());
    ASSERT_TRUE(other.registerResult(otherB, otherA, MatchOutcome::Win).hasValue());

    EXPECT_EQ(engine_.lastCommittedRating(a).value(), other.lastCommittedRating(otherA).value());
    EXPECT_EQ(engine_.lastCommittedRating(b).value(), other.lastCommittedRating(otherB).value());
}

TEST_F(RatingEngineTest, DrawPullsRatingsTogether) {
    auto strong = add(PublicRating{1700.0, 100.0, 0.06});
    auto weak = add(PublicRating{1300.0, 100.0, 0.06});
    advance(1s);

    ASSERT_TRUE(engine_.registerResult(strong, weak, MatchOutcome::Draw).hasValue());

    EXPECT_LT(engine_.playerRating(strong).value().rating, 1700.0);
    EXPECT_GT(engine_.playerRating(weak).value().rating, 1300.0);
}

TEST_F(RatingEngineTest, UnknownPlayerLeavesStateUntouched) {
    auto a = add(PublicRating{});
    advance(1s);

    auto result = engine_.registerResult(a, PlayerId(99), MatchOutcome::Win);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownPlayer);

    auto reversed = engine_.registerResult(PlayerId(99), a, MatchOutcome::Loss);
    ASSERT_TRUE(reversed.hasError());
    EXPECT_EQ(reversed.error().code(), ErrorCode::UnknownPlayer);

    EXPECT_EQ(engine_.lastUpdate(a).value(), t0_);
    EXPECT_EQ(engine_.lastCommittedRating(a).value().rating, toPublic(toInternal(PublicRating{})).rating);
}

TEST_F(RatingEngineTest, UnknownPlayerQueries) {
    auto ghost = PlayerId(7);
    EXPECT_FALSE(engine_.contains(ghost));
    EXPECT_EQ(engine_.playerRating(ghost).error().code(), ErrorCode::UnknownPlayer);
    EXPECT_EQ(engine_.lastCommittedRating(ghost).error().code(), ErrorCode::UnknownPlayer);
    EXPECT_EQ(engine_.lastUpdate(ghost).error().code(), ErrorCode::UnknownPlayer);
    EXPECT_EQ(engine_.elapsedPeriods(ghost).error().code(), ErrorCode::UnknownPlayer);
}

TEST_F(RatingEngineTest, SelfPlayRejected) {
    auto a = add(PublicRating{});
    advance(1s);

    auto result = engine_.registerResult(a, a, MatchOutcome::Draw);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(engine_.lastUpdate(a).value(), t0_);
}

TEST_F(RatingEngineTest, EarlierInstantKeepsLastUpdate) {
    auto a = add(PublicRating{});
    auto b = add(PublicRating{});

    ASSERT_TRUE(engine_.registerResultAt(a, b, MatchOutcome::Win, t0_ - 10s).hasValue());
    EXPECT_EQ(engine_.lastUpdate(a).value(), t0_);
    EXPECT_EQ(engine_.lastUpdate(b).value(), t0_);
    EXPECT_GT(engine_.lastCommittedRating(a).value().rating, 1500.0);
}

TEST_F(RatingEngineTest, ElapsedPeriodsAndMembership) {
    auto a = add(PublicRating{});
    advance(2500ms);
    auto b = add(PublicRating{});

    EXPECT_TRUE(engine_.contains(a));
    EXPECT_TRUE(engine_.contains(b));
    EXPECT_DOUBLE_EQ(engine_.elapsedPeriods(a).value(), 2.5);
    EXPECT_DOUBLE_EQ(engine_.elapsedPeriods(b).value(), 0.0);
    EXPECT_DOUBLE_EQ(engine_.elapsedPeriodsAt(a, t0_ + 10s).value(), 10.0);
    EXPECT_EQ(engine_.playerIds(), (std::vector<PlayerId>{a, b}));
}

// ============================================================================
// Convergence failure
// ============================================================================

TEST(RatingEngineConvergenceTest, FailureCommitsNothing) {
    auto settings = Settings::create(0.5, 1e-12, 350.0, 0.06, 1500.0, 1s, 1).value();
    TimePoint now = TimePoint{} + 1h;
    RatingEngine engine(settings, [&now] { return now; });

    auto a = engine.registerPlayer().value();
    auto b = engine.registerPlayer().value();
    now += 1s;

    auto result = engine.registerResult(a, b, MatchOutcome::Win);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConvergenceFailure);

    EXPECT_EQ(engine.lastUpdate(a).value(), TimePoint{} + 1h);
    EXPECT_EQ(engine.lastUpdate(b).value(), TimePoint{} + 1h);
    EXPECT_NEAR(engine.lastCommittedRating(a).value().rating, 1500.0, 1e-9);
    EXPECT_NEAR(engine.lastCommittedRating(b).value().deviation, 350.0, 1e-9);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(RatingEngineConcurrencyTest, ConcurrentResultsForOnePairAreSerialized) {
    auto settings = Settings::defaults().withRatingPeriod(1s).value();
    const TimePoint fixed = TimePoint{} + 1h;

    RatingEngine concurrent(settings, [fixed] { return fixed; });
    RatingEngine sequential(settings, [fixed] { return fixed; });

    auto a = concurrent.registerPlayer().value();
    auto b = concurrent.registerPlayer().value();
    auto sa = sequential.registerPlayer().value();
    auto sb = sequential.registerPlayer().value();

    constexpr int kThreads = 8;
    constexpr int kGamesPerThread = 25;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&concurrent, a, b] {
            for (int i = 0; i < kGamesPerThread; ++i) {
                EXPECT_TRUE(concurrent.registerResult(a, b, MatchOutcome::Draw).hasValue());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kThreads * kGamesPerThread; ++i) {
        ASSERT_TRUE(sequential.registerResult(sa, sb, MatchOutcome::Draw).hasValue());
    }

    EXPECT_EQ(concurrent.lastCommittedRating(a).value(), sequential.lastCommittedRating(sa).value());
    EXPECT_EQ(concurrent.lastCommittedRating(b).value(), sequential.lastCommittedRating(sb).value());
}

TEST(RatingEngineConcurrencyTest, DisjointPairsProgressIndependently) {
    auto settings = Settings::defaults().withRatingPeriod(1s).value();
    const TimePoint fixed = TimePoint{} + 1h;

    RatingEngine concurrent(settings, [fixed] { return fixed; });
    RatingEngine reference(settings, [fixed] { return fixed; });

    constexpr int kPairs = 4;
    constexpr int kGames = 40;

    std::vector<std::pair<PlayerId, PlayerId>> pairs;
    for (int p = 0; p < kPairs; ++p) {
        auto first = concurrent.registerPlayer().value();
        auto second = concurrent.registerPlayer().value();
        pairs.emplace_back(first, second);
        ASSERT_TRUE(reference.registerPlayer().hasValue());
        ASSERT_TRUE(reference.registerPlayer().hasValue());
    }

    std::vector<std::thread> threads;
    threads.reserve(kPairs);
    for (const auto& [first, second] : pairs) {
        threads.emplace_back([&concurrent, first, second] {
            for (int i = 0; i < kGames; ++i) {
                auto outcome = (i % 3 == 0) ? MatchOutcome::Loss : MatchOutcome::Win;
                EXPECT_TRUE(concurrent.registerResult(first, second, outcome).hasValue());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& [first, second] : pairs) {
        for (int i = 0; i < kGames; ++i) {
            auto outcome = (i % 3 == 0) ? MatchOutcome::Loss : MatchOutcome::Win;
            ASSERT_TRUE(reference.registerResult(first, second, outcome).hasValue());
        }
    }

    for (const auto& [first, second] : pairs) {
        EXPECT_EQ(concurrent.lastCommittedRating(first).value(),
                  reference.lastCommittedRating(first).value());
        EXPECT_EQ(concurrent.lastCommittedRating(second).value(),
                  reference.lastCommittedRating(second).value());
    }
}

// ============================================================================
// Independent pools
// ============================================================================

TEST(RatingEnginePoolTest, EnginesDoNotShareState) {
    TimePoint now = TimePoint{} + 1h;
    RatingEngine blitz(Settings::defaults().withTau(0.3).value(), [&now] { return now; });
    RatingEngine classical(Settings::defaults().withTau(1.2).value(), [&now] { return now; });

    auto b1 = blitz.registerPlayer().value();
    auto b2 = blitz.registerPlayer().value();
    auto c1 = classical.registerPlayer().value();

    EXPECT_EQ(b1, PlayerId(1));
    EXPECT_EQ(c1, PlayerId(1));
    EXPECT_DOUBLE_EQ(blitz.settings().tau(), 0.3);
    EXPECT_DOUBLE_EQ(classical.settings().tau(), 1.2);

    ASSERT_TRUE(blitz.registerResult(b1, b2, MatchOutcome::Win).hasValue());
    EXPECT_GT(blitz.lastCommittedRating(b1).value().rating, 1500.0);
    EXPECT_NEAR(classical.lastCommittedRating(c1).value().rating, 1500.0, 1e-9);
    EXPECT_EQ(classical.playerCount(), 1u);
    EXPECT_FALSE(classical.contains(b2));
}

TEST(RatingEngineClockTest, SteadyClockEngine) {
    RatingEngine engine(Settings::defaults());
    auto a = engine.registerPlayer().value();
    auto b = engine.registerPlayer().value();

    ASSERT_TRUE(engine.registerResult(a, b, MatchOutcome::Draw).hasValue());
    auto rating = engine.playerRating(a);
    ASSERT_TRUE(rating.hasValue());
    EXPECT_GE(engine.elapsedPeriods(a).value(), 0.0);
    EXPECT_LT(rating.value().deviation, 350.0);
}
