#include <gtest/gtest.h>

#include "../source/core/DateUtils.h"

TEST(DateUtilsTest, ParsesEightDigitDates) {
    EXPECT_EQ(parse_date_input("25102025"), 25102025);
    EXPECT_EQ(parse_date_input("01012025"), 1012025);
    EXPECT_EQ(parse_date_input("  03012025 \n"), 3012025);
}

TEST(DateUtilsTest, RejectsWrongLength) {
    EXPECT_THROW(parse_date_input("3101225"), ValidationError);
    EXPECT_THROW(parse_date_input("250120251"), ValidationError);
    EXPECT_THROW(parse_date_input(""), ValidationError);
}

TEST(DateUtilsTest, RejectsNonDigits) {
    EXPECT_THROW(parse_date_input("2510202a"), ValidationError);
    EXPECT_THROW(parse_date_input("25-10-25"), ValidationError);
}

TEST(DateUtilsTest, RejectsImpossibleCalendarDates) {
    EXPECT_THROW(parse_date_input("31022025"), ValidationError);
    EXPECT_THROW(parse_date_input("00012025"), ValidationError);
    EXPECT_THROW(parse_date_input("01132025"), ValidationError);
    EXPECT_THROW(parse_date_input("29022023"), ValidationError);
    EXPECT_EQ(parse_date_input("29022024"), 29022024);
    EXPECT_THROW(parse_date_input("29021900"), ValidationError);
    EXPECT_EQ(parse_date_input("29022000"), 29022000);
}

TEST(DateUtilsTest, DecodeSplitsFields) {
    auto date = decode_date(25102025);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->day, 25);
    EXPECT_EQ(date->month, 10);
    EXPECT_EQ(date->year, 2025);

    EXPECT_FALSE(decode_date(0).has_value());
    EXPECT_FALSE(decode_date(-1012025).has_value());
    EXPECT_FALSE(decode_date(1010000).has_value());
}

TEST(DateUtilsTest, ElapsedDaysCountBothEnds) {
    EXPECT_EQ(elapsed_days_inclusive(1012025, 3012025), 3);
    EXPECT_EQ(elapsed_days_inclusive(1012025, 1012025), 1);
    EXPECT_EQ(elapsed_days_inclusive(31122024, 1012025), 2);
    EXPECT_EQ(elapsed_days_inclusive(28022024, 1032024), 3);
    EXPECT_EQ(elapsed_days_inclusive(1012025, 1012026), 366);
}

TEST(DateUtilsTest, ElapsedDaysReversedIsBelowOne) {
    auto days = elapsed_days_inclusive(3012025, 1012025);
    ASSERT_TRUE(days.has_value());
    EXPECT_LT(*days, 1);
}

TEST(DateUtilsTest, ElapsedDaysUndefinedForInvalidDates) {
    EXPECT_FALSE(elapsed_days_inclusive(32012025, 3012025).has_value());
    EXPECT_FALSE(elapsed_days_inclusive(1012025, 0).has_value());
}

TEST(DateUtilsTest, DaysFromCivilEpoch) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1970, 1, 2), 1);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
}

TEST(DateUtilsTest, DisplayFormat) {
    EXPECT_EQ(format_date_display(1012025), "01-01-2025");
    EXPECT_EQ(format_date_display(25102025), "25-10-2025");
    EXPECT_EQ(format_date_display(0), "N/A");
    EXPECT_EQ(format_date_display(32012025), "Invalid Date");
}
