// universe_runner_test.cpp — multi-ticker runs and per-ticker failure isolation

#include <gtest/gtest.h>

#include "backtest/universe_runner.hpp"
#include "test_bar_helpers.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace test_helpers;

namespace {

// Loader over a fixed map; "BROKEN" reports malformed rows and anything
// unknown behaves like a missing file.
BarLoader make_fixture_loader(std::map<std::string, std::vector<Bar>> data) {
    return [data = std::move(data)](const std::string& ticker) {
        if (ticker == "BROKEN") {
            throw std::invalid_argument("line 7: expected at least 6 fields");
        }
        auto it = data.find(ticker);
        if (it == data.end()) {
            throw std::runtime_error("Cannot open bar file: " + ticker + ".csv");
        }
        return it->second;
    };
}

}  // namespace

class UniverseRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::map<std::string, std::vector<Bar>> data;
        data["UP"] = make_trend_series(260, 100.0, 0.5);
        data["UP2"] = make_trend_series(260, 50.0, 0.2);
        data["TINY"] = make_trend_series(30);
        runner_ = std::make_unique<UniverseRunner>(
            OutcomeValidator(ValidatorConfig::for_mode(TradingMode::SWING)),
            make_fixture_loader(std::move(data)));
    }

    std::unique_ptr<UniverseRunner> runner_;
};

TEST_F(UniverseRunnerTest, FailuresAreIsolatedPerTicker) {
    UniverseResult res = runner_->run({"UP", "BROKEN", "MISSING", "TINY", "UP2"});

    ASSERT_EQ(res.per_ticker.size(), 5u);
    EXPECT_EQ(res.per_ticker[0].ticker, "UP");
    EXPECT_FALSE(res.per_ticker[0].skipped);
    EXPECT_EQ(res.per_ticker[1].skip_kind, SkipKind::MALFORMED_DATA);
    EXPECT_EQ(res.per_ticker[2].skip_kind, SkipKind::ERROR);
    EXPECT_EQ(res.per_ticker[3].skip_kind, SkipKind::INSUFFICIENT_DATA);
    EXPECT_FALSE(res.per_ticker[4].skipped);

    ASSERT_EQ(res.errors.size(), 2u);
    EXPECT_EQ(res.errors[0].ticker, "BROKEN");
    EXPECT_EQ(res.errors[0].kind, SkipKind::MALFORMED_DATA);
    EXPECT_NE(res.errors[0].message.find("line 7"), std::string::npos);
    EXPECT_EQ(res.errors[1].ticker, "MISSING");
    EXPECT_EQ(res.errors[1].kind, SkipKind::ERROR);
    EXPECT_EQ(res.per_ticker[2].skip_reason, res.errors[1].message);
}

TEST_F(UniverseRunnerTest, AggregateCoversOnlyPredictingTickers) {
    UniverseResult res = runner_->run({"UP", "BROKEN", "TINY", "UP2"});
    const UniverseAggregate& agg = res.aggregate;
    EXPECT_EQ(agg.mode, TradingMode::SWING);
    EXPECT_EQ(agg.tickers_tested, 2);
    EXPECT_EQ(agg.tickers_excluded, 2);
    EXPECT_EQ(agg.total_predictions,
              res.per_ticker[0].report.predictions + res.per_ticker[3].report.predictions);

    UniverseResult clean = runner_->run({"UP", "UP2"});
    ASSERT_EQ(clean.aggregate.horizons.size(), agg.horizons.size());
    for (size_t h = 0; h < agg.horizons.size(); ++h) {
        EXPECT_DOUBLE_EQ(clean.aggregate.horizons[h].accuracy, agg.horizons[h].accuracy);
    }
}

TEST_F(UniverseRunnerTest, ReportsKeepInputOrder) {
    UniverseResult res = runner_->run({"UP2", "UP"});
    auto reports = res.reports();
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].ticker, "UP2");
    EXPECT_EQ(reports[1].ticker, "UP");
}

TEST_F(UniverseRunnerTest, RepeatedTickerRunsOnce) {
    UniverseResult res = runner_->run({"UP", "UP2", "UP", "BROKEN", "BROKEN"});
    ASSERT_EQ(res.per_ticker.size(), 3u);
    EXPECT_EQ(res.per_ticker[0].ticker, "UP");
    EXPECT_EQ(res.per_ticker[1].ticker, "UP2");
    EXPECT_EQ(res.per_ticker[2].ticker, "BROKEN");
    EXPECT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.aggregate.tickers_tested, 2);

    UniverseResult once = runner_->run({"UP", "UP2"});
    EXPECT_EQ(res.aggregate.total_predictions, once.aggregate.total_predictions);

    SetupUniverseResult setups = runner_->run_setups({"TINY", "TINY"});
    EXPECT_EQ(setups.per_ticker.size(), 1u);
}

TEST(UniverseTickersTest, UniqueTickersKeepsFirstOccurrence) {
    EXPECT_EQ(unique_tickers({"B", "A", "B", "C", "A"}),
              (std::vector<std::string>{"B", "A", "C"}));
    EXPECT_TRUE(unique_tickers({}).empty());
}

TEST_F(UniverseRunnerTest, EmptyUniverse) {
    UniverseResult res = runner_->run({});
    EXPECT_TRUE(res.per_ticker.empty());
    EXPECT_EQ(res.aggregate.tickers_tested, 0);
    EXPECT_EQ(res.aggregate.mode, TradingMode::SWING);
}

TEST_F(UniverseRunnerTest, SetupRunRecordsFailures) {
    SetupUniverseResult res = runner_->run_setups({"UP", "BROKEN", "TINY"});
    ASSERT_EQ(res.per_ticker.size(), 3u);
    EXPECT_EQ(res.per_ticker[0].skip_reason, "No setups detected");
    EXPECT_EQ(res.per_ticker[1].skip_kind, SkipKind::MALFORMED_DATA);
    EXPECT_EQ(res.per_ticker[2].skip_kind, SkipKind::INSUFFICIENT_DATA);
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.report.total, 0);
    EXPECT_EQ(res.report.labels.size(), 4u);
}

TEST(UniverseRunnerCompareTest, ZeroWeightRunLosesNothingItNeverPredicted) {
    BarLoader loader = make_fixture_loader({{"UP", make_trend_series(260, 100.0, 0.5)}});
    ValidatorConfig cfg = ValidatorConfig::for_mode(TradingMode::SWING);
    UniverseRunner full(OutcomeValidator(cfg), loader);
    UniverseRunner silent(OutcomeValidator(cfg, WeightMap()), loader);

    UniverseResult a = full.run({"UP"});
    UniverseResult b = silent.run({"UP"});
    EXPECT_EQ(b.per_ticker[0].skip_kind, SkipKind::NO_QUALIFYING_PREDICTIONS);

    ComparisonReport cmp = accuracy_report::compare_results(a.reports(), b.reports());
    EXPECT_TRUE(cmp.tickers.empty());
    EXPECT_EQ(cmp.wins_a + cmp.wins_b + cmp.ties, 0);
}
