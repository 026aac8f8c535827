// session_test.cpp — ET wall-clock helpers and intraday session buckets

#include <gtest/gtest.h>

#include "backtest/horizon_config.hpp"
#include "backtest/session.hpp"
#include "time_utils.hpp"

#include <stdexcept>

// ===========================================================================
// time_utils
// ===========================================================================

TEST(TimeUtilsTest, MinuteOfDayFromReferenceMidnight) {
    uint64_t t = time_utils::REF_MIDNIGHT_ET_NS + 10 * time_utils::NS_PER_HOUR +
                 15 * time_utils::NS_PER_MIN + 30 * time_utils::NS_PER_SEC;
    EXPECT_EQ(time_utils::minute_of_day_et(t), 615);
}

TEST(TimeUtilsTest, WallClockMatchesReferenceEpoch) {
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2022, 1, 3), time_utils::REF_MIDNIGHT_ET_NS);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2022, 1, 4) - time_utils::REF_MIDNIGHT_ET_NS,
              time_utils::NS_PER_DAY);
}

TEST(TimeUtilsTest, DaysFromCivil) {
    static_assert(time_utils::days_from_civil(1970, 1, 1) == 0);
    EXPECT_EQ(time_utils::days_from_civil(2000, 3, 1), 11017);
}

TEST(TimeUtilsTest, SummerTimestampsUseDaylightOffset) {
    // 2024-07-15 13:30 UTC is 09:30 EDT
    uint64_t t = 1721050200ULL * time_utils::NS_PER_SEC;
    EXPECT_EQ(time_utils::minute_of_day_et(t), 570);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2024, 7, 15, 9, 30), t);
}

TEST(TimeUtilsTest, WinterTimestampsUseStandardOffset) {
    // 2024-12-16 14:30 UTC is 09:30 EST
    uint64_t t = time_utils::et_wall_clock_to_ns(2024, 12, 16, 9, 30);
    EXPECT_EQ(t, 1734359400ULL * time_utils::NS_PER_SEC);
    EXPECT_EQ(time_utils::minute_of_day_et(t), 570);
}

TEST(TimeUtilsTest, DaylightSavingStartsSecondSundayOfMarch) {
    EXPECT_EQ(time_utils::weekday_from_days(time_utils::days_from_civil(2024, 3, 10)), 0);
    EXPECT_EQ(time_utils::nth_sunday(2024, 3, 2), time_utils::days_from_civil(2024, 3, 10));
    // 2024-03-10 07:00 UTC
    const int64_t switch_utc = 1710054000LL;
    EXPECT_EQ(time_utils::et_offset_at_utc(switch_utc - 1), time_utils::EST_OFFSET_SEC);
    EXPECT_EQ(time_utils::et_offset_at_utc(switch_utc), time_utils::EDT_OFFSET_SEC);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2024, 3, 10, 3, 0),
              static_cast<uint64_t>(switch_utc) * time_utils::NS_PER_SEC);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2024, 3, 10, 0, 0),
              1710046800ULL * time_utils::NS_PER_SEC);
}

TEST(TimeUtilsTest, DaylightSavingEndsFirstSundayOfNovember) {
    EXPECT_EQ(time_utils::nth_sunday(2024, 11, 1), time_utils::days_from_civil(2024, 11, 3));
    // 2024-11-03 06:00 UTC
    const int64_t switch_utc = 1730613600LL;
    EXPECT_EQ(time_utils::et_offset_at_utc(switch_utc - 1), time_utils::EDT_OFFSET_SEC);
    EXPECT_EQ(time_utils::et_offset_at_utc(switch_utc), time_utils::EST_OFFSET_SEC);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2024, 11, 3, 1, 59),
              1730613540ULL * time_utils::NS_PER_SEC);
    EXPECT_EQ(time_utils::et_wall_clock_to_ns(2024, 11, 3, 2, 0),
              1730617200ULL * time_utils::NS_PER_SEC);
    EXPECT_EQ(time_utils::minute_of_day_et(1730617200ULL * time_utils::NS_PER_SEC), 120);
}

TEST(TimeUtilsTest, YearFromDaysAcrossNewYear) {
    EXPECT_EQ(time_utils::year_from_days(time_utils::days_from_civil(2024, 12, 31)), 2024);
    EXPECT_EQ(time_utils::year_from_days(time_utils::days_from_civil(2025, 1, 1)), 2025);
    EXPECT_EQ(time_utils::year_from_days(time_utils::days_from_civil(2024, 2, 29)), 2024);
}

// ===========================================================================
// session::classify
// ===========================================================================

class SessionClassifyTest : public ::testing::Test {
protected:
    SessionCuts cuts_;
};

TEST_F(SessionClassifyTest, BoundariesAreExclusiveUpperBounds) {
    using session::Session;
    EXPECT_EQ(session::classify(9 * 60, cuts_), Session::OPEN_RUSH);
    EXPECT_EQ(session::classify(9 * 60 + 20, cuts_), Session::OPEN_RUSH);
    EXPECT_EQ(session::classify(9 * 60 + 21, cuts_), Session::POWER_OPEN);
    EXPECT_EQ(session::classify(10 * 60, cuts_), Session::POWER_OPEN);
    EXPECT_EQ(session::classify(10 * 60 + 1, cuts_), Session::MIDDAY);
    EXPECT_EQ(session::classify(15 * 60, cuts_), Session::MIDDAY);
    EXPECT_EQ(session::classify(15 * 60 + 1, cuts_), Session::POWER_HOUR);
    EXPECT_EQ(session::classify(16 * 60 + 15, cuts_), Session::POWER_HOUR);
    EXPECT_EQ(session::classify(16 * 60 + 16, cuts_), Session::AFTER_HOURS);
}

TEST_F(SessionClassifyTest, TimestampUsesEasternWallClock) {
    uint64_t t = time_utils::et_wall_clock_to_ns(2022, 3, 1, 15, 30, 0);
    EXPECT_EQ(session::classify_timestamp(t, cuts_), session::Session::POWER_HOUR);
}

TEST_F(SessionClassifyTest, SummerTimestampUsesEasternDaylightClock) {
    using session::Session;
    EXPECT_EQ(session::classify_timestamp(time_utils::et_wall_clock_to_ns(2024, 7, 15, 15, 30),
                                          cuts_),
              Session::POWER_HOUR);
    // 2024-07-15 13:45 UTC is 09:45 EDT
    EXPECT_EQ(session::classify_timestamp(1721051100ULL * time_utils::NS_PER_SEC, cuts_),
              Session::POWER_OPEN);
    // 2024-07-15 20:30 UTC is 16:30 EDT
    EXPECT_EQ(session::classify_timestamp(1721075400ULL * time_utils::NS_PER_SEC, cuts_),
              Session::AFTER_HOURS);
}

TEST_F(SessionClassifyTest, NamesRoundTrip) {
    for (auto s : session::ALL) {
        EXPECT_EQ(session::from_name(session::name(s)), s);
    }
    EXPECT_EQ(session::from_name(""), session::Session::NONE);
    EXPECT_THROW(session::from_name("LUNCH"), std::invalid_argument);
}
