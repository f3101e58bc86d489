#include <gtest/gtest.h>

#include <chrono>
#include <ctime>

#include "rem/core/date_components.hpp"
#include "test_helpers.hpp"

using namespace rem::core;
using rem::ErrorCode;

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute) {
  std::tm tm = {};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

}  // namespace

class DateComponentsTest : public ::testing::Test {
 protected:
  // 2024-03-10 09:30 local
  std::chrono::system_clock::time_point now_ = localTime(2024, 3, 10, 9, 30);
};

TEST_F(DateComponentsTest, DateOnlyResolvesToLocalMidnight) {
  DateComponents components{2024, 5, 17};
  EXPECT_EQ(components.date(), localTime(2024, 5, 17, 0, 0));
  EXPECT_FALSE(components.hasTime());
}

TEST_F(DateComponentsTest, DateWithTimeResolves) {
  DateComponents components{2024, 5, 17, 14, 45, std::nullopt};
  EXPECT_EQ(components.date(), localTime(2024, 5, 17, 14, 45));
}

TEST_F(DateComponentsTest, FromTimePointRoundTripsWholeSeconds) {
  auto time = std::chrono::system_clock::from_time_t(1718000000);
  auto components = DateComponents::fromTimePoint(time);
  EXPECT_EQ(components.date(), time);

  auto date_only = DateComponents::fromTimePoint(time, false);
  EXPECT_FALSE(date_only.hour.has_value());
}

TEST_F(DateComponentsTest, ParseToday) {
  auto result = DateComponents::parse("today", now_);
  ASSERT_OK(result);
  EXPECT_EQ(*result, (DateComponents{2024, 3, 10}));
}

TEST_F(DateComponentsTest, ParseTomorrowIsCaseInsensitive) {
  auto result = DateComponents::parse("Tomorrow", now_);
  ASSERT_OK(result);
  EXPECT_EQ(*result, (DateComponents{2024, 3, 11}));
}

TEST_F(DateComponentsTest, ParseIsoDate) {
  auto result = DateComponents::parse("2024-12-24", now_);
  ASSERT_OK(result);
  EXPECT_EQ(*result, (DateComponents{2024, 12, 24}));
}

TEST_F(DateComponentsTest, ParseIsoDateTime) {
  auto spaced = DateComponents::parse("2024-12-24 18:05", now_);
  ASSERT_OK(spaced);
  EXPECT_EQ(spaced->hour.value_or(-1), 18);
  EXPECT_EQ(spaced->minute.value_or(-1), 5);
  EXPECT_FALSE(spaced->second.has_value());

  auto with_t = DateComponents::parse("2024-12-24T18:05:30", now_);
  ASSERT_OK(with_t);
  EXPECT_EQ(with_t->second.value_or(-1), 30);
}

TEST_F(DateComponentsTest, ParseRelativeHours) {
  auto result = DateComponents::parse("in 2 hours", now_);
  ASSERT_OK(result);
  EXPECT_EQ(result->date(), localTime(2024, 3, 10, 11, 30));
}

TEST_F(DateComponentsTest, ParseRelativeDaysDropsTime) {
  auto result = DateComponents::parse("in 3 days", now_);
  ASSERT_OK(result);
  EXPECT_EQ(*result, (DateComponents{2024, 3, 13}));
}

TEST_F(DateComponentsTest, ParseRejectsGarbage) {
  EXPECT_ERROR(DateComponents::parse("next blue moon", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("2024-13-01", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("2023-02-29", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("2024-01-01 25:00", now_), ErrorCode::kParseError);
}

TEST_F(DateComponentsTest, ParseRejectsRelativeDatesTooFarOut) {
  EXPECT_ERROR(DateComponents::parse("in 100000000 days", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("in 12782641 weeks", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("in 99999999999 hours", now_), ErrorCode::kParseError);
  EXPECT_ERROR(DateComponents::parse("in 99999999999999999999999 minutes", now_),
               ErrorCode::kParseError);
}

TEST_F(DateComponentsTest, ParseAcceptsLargeButReasonableRelativeDates) {
  auto result = DateComponents::parse("in 520 weeks", now_);
  ASSERT_OK(result);
  EXPECT_GE(result->year, 2033);
  EXPECT_FALSE(result->hasTime());
}

TEST_F(DateComponentsTest, ValidateRejectsYearsOutsideCalendarRange) {
  EXPECT_ERROR((DateComponents{0, 1, 1}).validate(), ErrorCode::kValidationError);
  EXPECT_ERROR((DateComponents{10000, 1, 1}).validate(), ErrorCode::kValidationError);
  EXPECT_OK((DateComponents{9999, 12, 31}).validate());
}

TEST_F(DateComponentsTest, SecondBeforeEpochResolves) {
  // mktime reports this instant as -1, which must not be taken as failure
  auto before_epoch = std::chrono::system_clock::from_time_t(-1);
  auto components = DateComponents::fromTimePoint(before_epoch);
  EXPECT_EQ(components.date(), before_epoch);
}

TEST_F(DateComponentsTest, LeapDayIsValid) {
  EXPECT_OK(DateComponents::parse("2024-02-29", now_));
}

TEST_F(DateComponentsTest, ValidateRejectsMinuteWithoutHour) {
  DateComponents components{2024, 1, 1, std::nullopt, 30, std::nullopt};
  EXPECT_ERROR(components.validate(), ErrorCode::kValidationError);
}

TEST_F(DateComponentsTest, ToString) {
  EXPECT_EQ((DateComponents{2024, 3, 5}).toString(), "2024-03-05");
  EXPECT_EQ((DateComponents{2024, 3, 5, 7, 8, std::nullopt}).toString(), "2024-03-05T07:08:00");
}
