// signal_engine_test.cpp — signal transforms, weighted scoring, entries and
// score summaries

#include <gtest/gtest.h>

#include "signals/signal_engine.hpp"
#include "signals/signal_table.hpp"
#include "signals/weight_map.hpp"
#include "test_bar_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using namespace test_helpers;

namespace {

// Table of `n` bars with every column zero.
SignalTable blank_table(size_t n) {
    SignalTable t;
    for (auto& col : t.columns) col.assign(n, 0.0);
    t.timestamps.resize(n);
    for (size_t i = 0; i < n; ++i) t.timestamps[i] = daily_ts(static_cast<int>(i));
    return t;
}

double mean_confidence(const std::vector<ScoreRecord>& s, size_t from, size_t to) {
    double sum = 0.0;
    for (size_t i = from; i < to; ++i) sum += s[i].confidence;
    return sum / static_cast<double>(to - from);
}

}  // namespace

// ===========================================================================
// Scoring arithmetic on hand-built tables
// ===========================================================================

class ScoringTest : public ::testing::Test {
protected:
    WeightMap weights_ = WeightMap()
        .with_weight(SignalId::EMA_ALIGNMENT, 5)
        .with_weight(SignalId::RSI_POSITION, 3);
    ScoringConfig cfg_;
};

TEST_F(ScoringTest, BlendOfStrengthAndDirection) {
    SignalTable t = blank_table(1);
    t[SignalId::EMA_ALIGNMENT][0] = 1.0;
    t[SignalId::RSI_POSITION][0] = -0.5;

    auto s = signal_scoring::score(t, weights_, cfg_);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_DOUBLE_EQ(s[0].bull_score, 5.0);
    EXPECT_DOUBLE_EQ(s[0].bear_score, 1.5);
    EXPECT_DOUBLE_EQ(s[0].active_weight, 8.0);
    EXPECT_NEAR(s[0].raw_strength, 81.25, 1e-9);
    EXPECT_NEAR(s[0].directional_conf, 3.5 / 6.5 * 100.0, 1e-9);
    EXPECT_NEAR(s[0].confidence, 0.6 * 81.25 + 0.4 * (3.5 / 6.5 * 100.0), 1e-9);
    EXPECT_EQ(s[0].direction, direction::BULL);
}

TEST_F(ScoringTest, NanSignalCountsAsInactive) {
    SignalTable t = blank_table(1);
    t[SignalId::EMA_ALIGNMENT][0] = indicators::NaN;
    t[SignalId::RSI_POSITION][0] = indicators::NaN;

    auto s = signal_scoring::score(t, weights_, cfg_);
    EXPECT_DOUBLE_EQ(s[0].bull_score, 0.0);
    EXPECT_DOUBLE_EQ(s[0].active_weight, 0.0);
    EXPECT_DOUBLE_EQ(s[0].confidence, 0.0);
    EXPECT_EQ(s[0].direction, direction::NEUTRAL);
}

TEST_F(ScoringTest, TinyValueBelowEpsilonIsNotActive) {
    SignalTable t = blank_table(1);
    t[SignalId::EMA_ALIGNMENT][0] = 1.0;
    t[SignalId::RSI_POSITION][0] = -0.005;

    auto s = signal_scoring::score(t, weights_, cfg_);
    EXPECT_DOUBLE_EQ(s[0].active_weight, 5.0);
    EXPECT_NEAR(s[0].bear_score, 0.015, 1e-12);
}

TEST_F(ScoringTest, BalancedSignalsAreNeutral) {
    SignalTable t = blank_table(1);
    t[SignalId::EMA_ALIGNMENT][0] = 0.3;   // 1.5 bull
    t[SignalId::RSI_POSITION][0] = -0.5;   // 1.5 bear

    auto s = signal_scoring::score(t, weights_, cfg_);
    EXPECT_EQ(s[0].direction, direction::NEUTRAL);
    EXPECT_DOUBLE_EQ(s[0].directional_conf, 0.0);
}

TEST_F(ScoringTest, ConfidenceStaysWithinBounds) {
    SignalTable t = blank_table(3);
    t[SignalId::EMA_ALIGNMENT] = {1.0, -1.0, 0.0};
    t[SignalId::RSI_POSITION] = {1.0, -1.0, 0.0};
    auto s = signal_scoring::score(t, weights_, cfg_);
    EXPECT_DOUBLE_EQ(s[0].confidence, 100.0);
    EXPECT_DOUBLE_EQ(s[1].confidence, 100.0);
    EXPECT_EQ(s[1].direction, direction::BEAR);
    EXPECT_DOUBLE_EQ(s[2].confidence, 0.0);
}

TEST_F(ScoringTest, UnweightedColumnIgnored) {
    SignalTable t = blank_table(1);
    t[SignalId::EMA_ALIGNMENT][0] = 1.0;
    t[SignalId::MACD_HISTOGRAM][0] = -1.0;  // weight 0 in this map
    auto s = signal_scoring::score(t, weights_, cfg_);
    EXPECT_DOUBLE_EQ(s[0].bear_score, 0.0);
    EXPECT_DOUBLE_EQ(s[0].active_weight, 5.0);
}

// ===========================================================================
// Entries and summaries
// ===========================================================================

TEST(EntryTest, ThresholdIsInclusive) {
    std::vector<ScoreRecord> s(4);
    s[0].confidence = 65.0; s[0].direction = direction::BULL;
    s[1].confidence = 64.9; s[1].direction = direction::BULL;
    s[2].confidence = 90.0; s[2].direction = direction::BEAR;
    s[3].confidence = 90.0; s[3].direction = direction::NEUTRAL;

    EntryMasks m = signal_scoring::generate_entries(s, 65.0);
    EXPECT_TRUE(m.long_entries[0]);
    EXPECT_FALSE(m.long_entries[1]);
    EXPECT_TRUE(m.short_entries[2]);
    EXPECT_FALSE(m.long_entries[3]);
    EXPECT_FALSE(m.short_entries[3]);
}

TEST(SummaryTest, HistogramAndCounts) {
    std::vector<ScoreRecord> s(5);
    double conf[] = {0.0, 30.0, 55.0, 65.0, 100.0};
    for (size_t i = 0; i < 5; ++i) s[i].confidence = conf[i];
    s[2].direction = direction::BULL;
    s[3].direction = direction::BULL;
    s[4].direction = direction::BEAR;

    SignalTable t = blank_table(5);
    t[SignalId::EMA_ALIGNMENT][2] = 1.0;
    WeightMap w = WeightMap().with_weight(SignalId::EMA_ALIGNMENT, 5)
                             .with_weight(SignalId::RSI_POSITION, 3);

    ScoreSummary sum = signal_scoring::summarize_scores(s, t, w);
    EXPECT_EQ(sum.bars, 5u);
    EXPECT_DOUBLE_EQ(sum.min_confidence, 0.0);
    EXPECT_DOUBLE_EQ(sum.median_confidence, 55.0);
    EXPECT_DOUBLE_EQ(sum.max_confidence, 100.0);
    EXPECT_DOUBLE_EQ(sum.mean_confidence, 50.0);
    EXPECT_EQ(sum.bull_count, 2);
    EXPECT_EQ(sum.bear_count, 1);
    EXPECT_EQ(sum.neutral_count, 2);
    EXPECT_EQ(sum.histogram[0], 2);  // 0 and 30 in [0, 30]
    EXPECT_EQ(sum.histogram[2], 1);  // 55 in (50, 60]
    EXPECT_EQ(sum.histogram[3], 1);  // 65 in (60, 65]
    EXPECT_EQ(sum.histogram[6], 1);  // 100 in (80, 100]
    EXPECT_EQ(sum.weighted_signals, 2);
    EXPECT_EQ(sum.active_signals, 1);
}

// ===========================================================================
// SignalEngine on synthetic bars
// ===========================================================================

class SignalEngineTest : public ::testing::Test {
protected:
    SignalEngine engine_;
};

TEST_F(SignalEngineTest, InvalidConfigThrows) {
    ScoringConfig bad;
    bad.threshold = 120.0;
    EXPECT_THROW(SignalEngine(WeightMap::defaults(), bad), std::invalid_argument);
    ScoringConfig neg;
    neg.direction_blend = -0.1;
    EXPECT_THROW(SignalEngine(WeightMap::defaults(), neg), std::invalid_argument);
}

TEST_F(SignalEngineTest, TableAlignedWithBars) {
    auto bars = make_random_walk(120);
    SignalTable t = engine_.compute_all_signals(bars);
    ASSERT_EQ(t.size(), bars.size());
    for (const auto& col : t.columns) EXPECT_EQ(col.size(), bars.size());
    EXPECT_EQ(t.timestamps.front(), bars.front().timestamp);
    EXPECT_EQ(t.raw.close.size(), bars.size());
}

TEST_F(SignalEngineTest, SignalsWithoutBarDerivationAreZero) {
    auto bars = make_random_walk(120);
    SignalTable t = engine_.compute_all_signals(bars);
    for (SignalId id : {SignalId::INSIDER_CONGRESS, SignalId::GEX_POSITIONING,
                        SignalId::NEWS_SENTIMENT, SignalId::FLOW_HORIZON}) {
        for (double v : t[id]) EXPECT_DOUBLE_EQ(v, 0.0) << signals::signal_name(id);
    }
}

TEST_F(SignalEngineTest, SignalValuesBoundedAndNeverInfinite) {
    auto bars = make_random_walk(300, 11);
    SignalTable t = engine_.compute_all_signals(bars);
    for (SignalId id : signals::all_signals()) {
        for (double v : t[id]) {
            if (std::isnan(v)) continue;
            EXPECT_LE(std::abs(v), 1.0) << signals::signal_name(id);
        }
    }
}

TEST_F(SignalEngineTest, RisingTrendResolvesBull) {
    auto bars = make_trend_series(260, 100.0, 0.5);
    SignalTable t = engine_.compute_all_signals(bars);
    auto scores = engine_.score(t);

    for (size_t i = 210; i < 260; ++i) {
        EXPECT_DOUBLE_EQ(t[SignalId::EMA_ALIGNMENT][i], 1.0) << i;
        EXPECT_DOUBLE_EQ(t[SignalId::MULTI_TF_CONFLUENCE][i], 1.0) << i;
        EXPECT_GT(t[SignalId::BOLLINGER_POSITION][i], 0.0) << i;
        EXPECT_EQ(scores[i].direction, direction::BULL) << i;
    }
}

TEST_F(SignalEngineTest, CleanTrendMoreConfidentThanNoise) {
    auto trend = make_trend_series(260, 100.0, 0.5);
    auto noise = make_noisy_series(260, 100.0, 2.0, 1234);

    auto trend_scores = engine_.score_bars(trend);
    auto noise_scores = engine_.score_bars(noise);
    EXPECT_GT(mean_confidence(trend_scores, 210, 260),
              mean_confidence(noise_scores, 210, 260));
}

TEST_F(SignalEngineTest, FeedVwapUsedWhenEveryBarHasOne) {
    auto bars = make_trend_series(80, 100.0, 0.5);
    SignalTable cumulative = engine_.compute_all_signals(bars);
    for (auto& b : bars) b.vwap = b.close;
    SignalTable feed = engine_.compute_all_signals(bars);
    // close == vwap leaves no deviation
    EXPECT_DOUBLE_EQ(feed[SignalId::VWAP_DEVIATION][60], 0.0);
    EXPECT_GT(cumulative[SignalId::VWAP_DEVIATION][60], 0.0);
}

TEST_F(SignalEngineTest, EngineEntriesUseConfiguredThreshold) {
    ScoringConfig cfg;
    cfg.threshold = 0.0;
    SignalEngine loose(WeightMap::defaults(), cfg);
    auto bars = make_trend_series(260, 100.0, 0.5);
    auto scores = loose.score_bars(bars);
    EntryMasks m = loose.generate_entries(scores);
    EXPECT_TRUE(m.long_entries[250]);
    EXPECT_FALSE(m.short_entries[250]);
}

// ===========================================================================
// Order independence and zero weights
// ===========================================================================

class ScoreInvarianceTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_ = SignalEngine().compute_all_signals(make_random_walk(300, 3));
    }
    SignalTable table_;
};

TEST_F(ScoreInvarianceTest, ProcessingOrderDoesNotChangeSums) {
    WeightMap w = WeightMap::defaults();
    ScoringConfig cfg;
    auto order = w.weighted_signals();
    auto base = signal_scoring::score(table_, w, cfg, order);

    std::vector<SignalId> reversed(order.rbegin(), order.rend());
    std::vector<SignalId> shuffled = order;
    std::mt19937 rng(99);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    for (const auto& other : {reversed, shuffled}) {
        auto s = signal_scoring::score(table_, w, cfg, other);
        ASSERT_EQ(s.size(), base.size());
        for (size_t i = 0; i < s.size(); ++i) {
            EXPECT_NEAR(s[i].bull_score, base[i].bull_score, 1e-9);
            EXPECT_NEAR(s[i].bear_score, base[i].bear_score, 1e-9);
            EXPECT_NEAR(s[i].confidence, base[i].confidence, 1e-9);
            EXPECT_EQ(s[i].direction == base[i].direction ||
                      std::abs(s[i].net_score) < 1e-9, true);
        }
    }
}

TEST_F(ScoreInvarianceTest, RepeatedSignalInOrderThrows) {
    WeightMap w = WeightMap::defaults();
    auto order = w.weighted_signals();
    ASSERT_FALSE(order.empty());
    order.push_back(order.front());
    EXPECT_THROW(signal_scoring::score(table_, w, ScoringConfig{}, order),
                 std::invalid_argument);

    // A repeated zero-weight signal is rejected as well.
    WeightMap silent = w.with_weight(SignalId::RSI_POSITION, 0);
    std::vector<SignalId> zeros = {SignalId::RSI_POSITION, SignalId::RSI_POSITION};
    EXPECT_THROW(signal_scoring::score(table_, silent, ScoringConfig{}, zeros),
                 std::invalid_argument);
}

TEST_F(ScoreInvarianceTest, ScoringIsIdempotent) {
    WeightMap w = WeightMap::defaults();
    auto a = signal_scoring::score(table_, w);
    auto b = signal_scoring::score(table_, w);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].confidence, b[i].confidence);
    }
}

TEST_F(ScoreInvarianceTest, ZeroWeightRemovesSignalContribution) {
    const SignalId id = SignalId::MULTI_TF_CONFLUENCE;
    WeightMap with = WeightMap::defaults();
    WeightMap without = with.with_weight(id, 0);
    const double w = with[id];
    ScoringConfig cfg;

    auto a = signal_scoring::score(table_, with, cfg);
    auto b = signal_scoring::score(table_, without, cfg);
    const auto& col = table_[id];
    for (size_t i = 0; i < a.size(); ++i) {
        double v = std::isnan(col[i]) ? 0.0 : col[i];
        EXPECT_NEAR(a[i].bull_score - b[i].bull_score, std::max(v, 0.0) * w, 1e-9) << i;
        EXPECT_NEAR(a[i].bear_score - b[i].bear_score, std::max(-v, 0.0) * w, 1e-9) << i;
        double active = std::abs(v) > cfg.active_epsilon ? w : 0.0;
        EXPECT_NEAR(a[i].active_weight - b[i].active_weight, active, 1e-9) << i;
    }
}

TEST_F(ScoreInvarianceTest, ZeroWeightMatchesScoringWithoutTheColumn) {
    const SignalId id = SignalId::EMA_ALIGNMENT;
    WeightMap without = WeightMap::defaults().with_weight(id, 0);
    SignalTable scrubbed = table_;
    scrubbed[id].assign(scrubbed.size(), 0.0);

    auto a = signal_scoring::score(table_, without);
    auto b = signal_scoring::score(scrubbed, WeightMap::defaults());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_NEAR(a[i].bull_score, b[i].bull_score, 1e-9);
        EXPECT_NEAR(a[i].bear_score, b[i].bear_score, 1e-9);
        EXPECT_NEAR(a[i].active_weight, b[i].active_weight, 1e-9);
    }
}
