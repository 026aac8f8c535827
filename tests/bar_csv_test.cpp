// bar_csv_test.cpp — CSV bar loading and timestamp parsing

#include <gtest/gtest.h>

#include "bars/bar_csv.hpp"
#include "time_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

// ===========================================================================
// parse_timestamp
// ===========================================================================

TEST(BarCsvTimestampTest, EpochSecondsMillisAndNanos) {
    const uint64_t secs = 1641220200ULL;  // 2022-01-03 09:30 ET
    const uint64_t ns = secs * time_utils::NS_PER_SEC;
    EXPECT_EQ(bar_csv::parse_timestamp("1641220200"), ns);
    EXPECT_EQ(bar_csv::parse_timestamp("1641220200000"), ns);
    EXPECT_EQ(bar_csv::parse_timestamp(std::to_string(ns)), ns);
}

TEST(BarCsvTimestampTest, WallClockIsEastern) {
    uint64_t ts = bar_csv::parse_timestamp("2022-01-03 09:30:00");
    EXPECT_EQ(ts, time_utils::REF_MIDNIGHT_ET_NS + 9 * time_utils::NS_PER_HOUR +
                      30 * time_utils::NS_PER_MIN);
    EXPECT_EQ(time_utils::minute_of_day_et(ts), 570);
}

TEST(BarCsvTimestampTest, TSeparatorAndMissingSeconds) {
    EXPECT_EQ(bar_csv::parse_timestamp("2022-01-03T09:30:00"),
              bar_csv::parse_timestamp("2022-01-03 09:30:00"));
    EXPECT_EQ(bar_csv::parse_timestamp("2022-01-03 09:30"),
              bar_csv::parse_timestamp("2022-01-03 09:30:00"));
}

TEST(BarCsvTimestampTest, DateOnlyIsMidnight) {
    EXPECT_EQ(bar_csv::parse_timestamp("2022-01-03"), time_utils::REF_MIDNIGHT_ET_NS);
}

TEST(BarCsvTimestampTest, GarbageThrows) {
    EXPECT_THROW(bar_csv::parse_timestamp("yesterday"), std::invalid_argument);
    EXPECT_THROW(bar_csv::parse_timestamp("2022-13-01"), std::invalid_argument);
}

// ===========================================================================
// parse_bars
// ===========================================================================

TEST(BarCsvParseTest, HeaderDetectedAndSkipped) {
    std::istringstream in(
        "timestamp,open,high,low,close,volume\n"
        "2022-01-03,100,101,99,100.5,1000\n"
        "2022-01-04,100.5,102,100,101.5,1200\n");
    auto bars = bar_csv::parse_bars(in);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[1].close, 101.5);
    EXPECT_DOUBLE_EQ(bars[1].volume, 1200.0);
    EXPECT_FALSE(bars[0].has_vwap());
}

TEST(BarCsvParseTest, NoHeaderAndOptionalVwap) {
    std::istringstream in(
        "2022-01-03 09:30,100,101,99,100.5,1000,100.2\r\n"
        "\n"
        "2022-01-03 09:35,100.5,102,100,101.5,1200,\n");
    auto bars = bar_csv::parse_bars(in);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_TRUE(bars[0].has_vwap());
    EXPECT_DOUBLE_EQ(bars[0].vwap, 100.2);
    EXPECT_FALSE(bars[1].has_vwap());
}

TEST(BarCsvParseTest, ShortRowThrowsWithLineNumber) {
    std::istringstream in(
        "timestamp,open,high,low,close,volume\n"
        "2022-01-03,100,101,99,100.5\n");
    try {
        bar_csv::parse_bars(in);
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }
}

TEST(BarCsvParseTest, BadNumberThrows) {
    std::istringstream in("2022-01-03,100,abc,99,100.5,1000\n");
    EXPECT_THROW(bar_csv::parse_bars(in), std::invalid_argument);
}

// ===========================================================================
// load_bars
// ===========================================================================

class BarCsvFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "bar_csv_test_input.csv").string();
        std::ofstream out(path_);
        out << "timestamp,open,high,low,close,volume\n"
            << "2022-01-04,101,102,100,101.5,900\n"
            << "2022-01-03,100,101,99,100.5,1000\n";
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::string path_;
};

TEST_F(BarCsvFileTest, LoadsRowsInFileOrder) {
    auto bars = bar_csv::load_bars(path_);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_GT(bars[0].timestamp, bars[1].timestamp);
}

TEST_F(BarCsvFileTest, MissingFileThrows) {
    EXPECT_THROW(bar_csv::load_bars(path_ + ".missing"), std::runtime_error);
}
