// report_io_test.cpp — JSON serialization of reports and universe save files

#include <gtest/gtest.h>

#include "backtest/report_io.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Prediction sample_prediction(session::Session s = session::Session::NONE) {
    Prediction p;
    p.bar_index = 12;
    p.timestamp = 1641220200000000000ULL;
    p.entry_price = 101.25;
    p.direction = direction::BEAR;
    p.confidence = 71.5;
    p.bull_score = 1.5;
    p.bear_score = 6.0;
    p.session = s;
    for (int i = 0; i < 4; ++i) {
        HorizonOutcome o;
        o.change_pct = -0.5;
        o.correct = true;
        o.dir_move = 0.5;
        p.outcomes.push_back(o);
    }
    p.excursion = {1.25, -0.25};
    return p;
}

}  // namespace

TEST(ReportIoTest, EscapesQuotesBackslashesAndControls) {
    EXPECT_EQ(report_io::json_escape("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(report_io::quoted("x"), "\"x\"");
}

TEST(ReportIoTest, EscapesRemainingControlCharacters) {
    EXPECT_EQ(report_io::json_escape("a\rb\x01" "c\b\f"), "a\\rb\\u0001c\\b\\f");
    EXPECT_EQ(report_io::json_escape(std::string("x\0y", 3)), "x\\u0000y");
    EXPECT_EQ(report_io::json_escape("\x1f"), "\\u001f");
    EXPECT_EQ(report_io::json_escape("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(ReportIoTest, NonFiniteNumbersBecomeNull) {
    EXPECT_EQ(report_io::number(std::numeric_limits<double>::quiet_NaN()), "null");
    EXPECT_EQ(report_io::number(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(report_io::number(0.875), "0.875");
    EXPECT_EQ(report_io::number(65.0), "65");
}

TEST(ReportIoTest, PredictionOutcomesKeyedByLabel) {
    std::vector<std::string> labels = {"1d", "2d", "3d", "5d"};
    std::string json = report_io::to_json(sample_prediction(), labels);
    EXPECT_TRUE(contains(json, "\"direction\":\"BEAR\""));
    EXPECT_TRUE(contains(json, "\"3d\":{\"change_pct\":-0.5,\"correct\":true,\"dir_move\":0.5}"));
    EXPECT_TRUE(contains(json, "\"mfe\":1.25"));
    EXPECT_FALSE(contains(json, "\"session\""));

    std::string intraday = report_io::to_json(sample_prediction(session::Session::MIDDAY), labels);
    EXPECT_TRUE(contains(intraday, "\"session\":\"MIDDAY\""));
}

TEST(ReportIoTest, ReportIncludesPredictionsOnRequest) {
    ValidatorConfig cfg = ValidatorConfig::for_mode(TradingMode::SWING);
    AccuracyReport r = accuracy_report::compile("MSFT", {sample_prediction()}, cfg);

    std::string full = report_io::to_json(r);
    EXPECT_TRUE(contains(full, "\"ticker\":\"MSFT\""));
    EXPECT_TRUE(contains(full, "\"mode\":\"swing\""));
    EXPECT_TRUE(contains(full, "\"total_predictions\":1"));
    EXPECT_TRUE(contains(full, "\"predictions\":["));
    EXPECT_TRUE(contains(full, "\"range\":\"70-75\""));
    // no bull calls, so bull accuracy is undefined
    EXPECT_TRUE(contains(full, "\"bull_accuracy\":null"));
    EXPECT_FALSE(contains(full, "\"sessions\""));

    std::string brief = report_io::to_json(r, false);
    EXPECT_FALSE(contains(brief, "\"predictions\":["));
}

TEST(ReportIoTest, SetupReportListsRankingWithReferenceLabel) {
    SetupOutcome o;
    o.setup.setup = SetupId::VWAP_REJECTION;
    o.setup.direction = direction::BEAR;
    o.outcomes.resize(4);
    o.outcomes[2].correct = true;
    SetupReport rep = accuracy_report::compile_setup_report(
        {o}, HorizonConfig::for_mode(TradingMode::SWING));

    std::string json = report_io::to_json(rep);
    EXPECT_TRUE(contains(json, "\"ranked_by\":\"3d\""));
    EXPECT_TRUE(contains(json, "\"setup\":\"VWAP_REJECTION\""));
    EXPECT_TRUE(contains(json, "\"direction\":\"BEAR\""));
    EXPECT_TRUE(contains(json, "\"3d\":1"));
}

TEST(ReportIoTest, UniverseSaveFileOmitsPredictionLists) {
    ValidatorConfig cfg = ValidatorConfig::for_mode(TradingMode::DAY);
    UniverseResult u;
    TickerResult ok;
    ok.ticker = "SPY";
    ok.report = accuracy_report::compile("SPY", {sample_prediction(session::Session::POWER_HOUR)}, cfg);
    TickerResult bad;
    bad.ticker = "BAD\"T";
    bad.skipped = true;
    bad.skip_kind = SkipKind::MALFORMED_DATA;
    bad.skip_reason = "line 3: bad number";
    bad.report = accuracy_report::compile(bad.ticker, {}, cfg);
    u.per_ticker = {ok, bad};
    u.errors.push_back({bad.ticker, SkipKind::MALFORMED_DATA, bad.skip_reason});
    u.aggregate = accuracy_report::aggregate(u.reports());

    std::string json = report_io::to_json(u);
    EXPECT_TRUE(contains(json, "\"aggregate\":{\"mode\":\"day\""));
    EXPECT_TRUE(contains(json, "\"tickers_excluded\":1"));
    EXPECT_TRUE(contains(json, "\"SPY\":{\"ticker\":\"SPY\""));
    EXPECT_TRUE(contains(json, "\"sessions\":[{\"session\":\"POWER_HOUR\""));
    EXPECT_FALSE(contains(json, "\"predictions\":["));
    EXPECT_TRUE(contains(json, "\"BAD\\\"T\":{\"total_predictions\":0,"
                               "\"skip_kind\":\"malformed_data\",\"error\":\"line 3: bad number\"}"));
    EXPECT_TRUE(contains(json, "\"errors\":[{\"ticker\":\"BAD\\\"T\",\"kind\":\"malformed_data\""));
}

TEST(ReportIoTest, ComparisonWinnerLabels) {
    ComparisonReport c;
    c.reference_label = "1hr";
    TickerComparison t;
    t.ticker = "QQQ";
    t.winner = -1;
    c.tickers.push_back(t);
    std::string json = report_io::to_json(c);
    EXPECT_TRUE(contains(json, "\"reference_horizon\":\"1hr\""));
    EXPECT_TRUE(contains(json, "\"winner\":\"A\""));
}

TEST(ReportIoTest, SaveWritesFileAndReportsFailure) {
    std::string path = (std::filesystem::temp_directory_path() / "report_io_test.json").string();
    report_io::save(path, "{\"ok\":true}");
    std::ifstream in(path);
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::remove(path.c_str());
    EXPECT_EQ(body, "{\"ok\":true}\n");

    EXPECT_THROW(report_io::save("/nonexistent-dir/x/report.json", "{}"), std::runtime_error);
}
