// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <string>

#include "LogQueryKit/query/Clock.hpp"
#include "LogQueryKit/query/TimeExpression.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace LogQueryKit::query;

// =============================================================================
// Fixture: frozen clock at 2024-03-15T10:30:00Z, process time zone pinned
// =============================================================================

class TimeExpressionTest : public ::testing::Test
{
  protected:
	static constexpr int64_t now = 1710498600;			  // 2024-03-15T10:30:00Z
	static constexpr int64_t utc_midnight = 1710460800;	  // 2024-03-15T00:00:00Z
	static constexpr int64_t default_value = 1234567890;

	void SetUp() override
	{
		const char *tz = std::getenv("TZ");
		if (tz != nullptr) {
			saved_tz = tz;
			had_tz = true;
		}
		set_timezone("UTC0");
	}

	void TearDown() override
	{
		if (had_tz)
			setenv("TZ", saved_tz.c_str(), 1);
		else
			unsetenv("TZ");
		tzset();
	}

	static void set_timezone(const char *tz)
	{
		setenv("TZ", tz, 1);
		tzset();
	}

	TimeResult evaluate(const std::string &text) const
	{
		return parser.evaluate(text, default_value);
	}

	const FixedClock clock{now};
	const TimeExpressionParser parser{clock};

  private:
	std::string saved_tz;
	bool had_tz = false;
};

// =============================================================================
// Absent and numeric input
// =============================================================================

TEST_F(TimeExpressionTest, Absent_ReturnsDefault)
{
	const auto result = parser.evaluate(std::monostate{}, default_value);
	EXPECT_TRUE(result.fell_back());
	EXPECT_EQ(result.grammar, TimeGrammar::None);
	EXPECT_EQ(result.seconds, default_value);
}

TEST_F(TimeExpressionTest, Numeric_ReturnedVerbatim)
{
	const auto result = parser.evaluate(int64_t{1702656000}, default_value);
	EXPECT_FALSE(result.fell_back());
	EXPECT_EQ(result.grammar, TimeGrammar::Numeric);
	EXPECT_EQ(result.seconds, 1702656000);
}

TEST_F(TimeExpressionTest, Numeric_NegativeReturnedVerbatim)
{
	EXPECT_EQ(parser.parse(int64_t{-42}, default_value), -42);
}

TEST_F(TimeExpressionTest, EmptyString_ReturnsDefault)
{
	EXPECT_TRUE(evaluate("").fell_back());
	EXPECT_TRUE(evaluate("   ").fell_back());
	EXPECT_EQ(evaluate("\t").seconds, default_value);
}

// =============================================================================
// Simple relative: 30s, 15m, 2h, 7d
// =============================================================================

TEST_F(TimeExpressionTest, Relative_Seconds)
{
	const auto result = evaluate("30s");
	EXPECT_EQ(result.grammar, TimeGrammar::Relative);
	EXPECT_EQ(result.seconds, now - 30);
}

TEST_F(TimeExpressionTest, Relative_Minutes)
{
	EXPECT_EQ(evaluate("15m").seconds, now - 15 * 60);
}

TEST_F(TimeExpressionTest, Relative_Hours)
{
	EXPECT_EQ(evaluate("2h").seconds, now - 2 * 3600);
}

TEST_F(TimeExpressionTest, Relative_Days)
{
	EXPECT_EQ(evaluate("7d").seconds, now - 7 * 86400);
}

TEST_F(TimeExpressionTest, Relative_Zero)
{
	EXPECT_EQ(evaluate("0s").seconds, now);
}

TEST_F(TimeExpressionTest, Relative_SurroundingWhitespaceIgnored)
{
	EXPECT_EQ(evaluate("  2h \n").seconds, now - 7200);
}

TEST_F(TimeExpressionTest, Relative_IndependentOfTimeZone)
{
	set_timezone("ABC+5");
	EXPECT_EQ(evaluate("1d").seconds, now - 86400);
}

TEST_F(TimeExpressionTest, Relative_UppercaseUnitNotAccepted)
{
	EXPECT_TRUE(evaluate("2H").fell_back());
}

TEST_F(TimeExpressionTest, Relative_UnknownUnitFallsBack)
{
	EXPECT_TRUE(evaluate("3w").fell_back());
	EXPECT_TRUE(evaluate("5y").fell_back());
}

TEST_F(TimeExpressionTest, Relative_OverflowFallsBack)
{
	EXPECT_TRUE(evaluate("99999999999999999999d").fell_back());
	EXPECT_TRUE(evaluate("9223372036854775807d").fell_back());
}

// =============================================================================
// Relative with clock time: 3d@11:45:23, 2h@10:30
// =============================================================================

TEST_F(TimeExpressionTest, RelativeAtClock_DaysWithSeconds)
{
	const auto result = evaluate("3d@11:45:23");
	EXPECT_EQ(result.grammar, TimeGrammar::RelativeAtClock);
	EXPECT_EQ(result.seconds, utc_midnight - 3 * 86400 + 11 * 3600 + 45 * 60 + 23);
}

TEST_F(TimeExpressionTest, RelativeAtClock_DaysSpaceSeparatorWithoutSeconds)
{
	EXPECT_EQ(evaluate("3d 11:45").seconds, utc_midnight - 3 * 86400 + 11 * 3600 + 45 * 60);
}

TEST_F(TimeExpressionTest, RelativeAtClock_DifferenceBetweenClockTimes)
{
	const int64_t first = evaluate("3d@11:45:23").seconds;
	const int64_t second = evaluate("3d@12:55:34").seconds;
	EXPECT_EQ(second - first, 1 * 3600 + 10 * 60 + 11);

	const int64_t midnight = utc_midnight - 3 * 86400;
	EXPECT_GE(first, midnight);
	EXPECT_LT(first, midnight + 86400);
	EXPECT_GE(second, midnight);
	EXPECT_LT(second, midnight + 86400);
}

TEST_F(TimeExpressionTest, RelativeAtClock_ZeroDaysIsToday)
{
	EXPECT_EQ(evaluate("0d@08:00").seconds, utc_midnight + 8 * 3600);
}

TEST_F(TimeExpressionTest, RelativeAtClock_SingleDigitHour)
{
	EXPECT_EQ(evaluate("1d@7:05").seconds, utc_midnight - 86400 + 7 * 3600 + 5 * 60);
}

TEST_F(TimeExpressionTest, RelativeAtClock_DaysUseLocalMidnight)
{
	// UTC-5: now is 2024-03-15T05:30 local
	set_timezone("ABC+5");
	const int64_t local_midnight = utc_midnight + 5 * 3600;
	EXPECT_EQ(evaluate("3d@11:45:23").seconds,
			  local_midnight - 3 * 86400 + 11 * 3600 + 45 * 60 + 23);
}

TEST_F(TimeExpressionTest, RelativeAtClock_DaysLocalMidnightAcrossDateLine)
{
	// UTC+11: now is 2024-03-15T21:30 local, still the same local day
	set_timezone("ABC-11");
	const int64_t local_midnight = utc_midnight - 11 * 3600;
	EXPECT_EQ(evaluate("1d@00:00").seconds, local_midnight - 86400);
}

TEST_F(TimeExpressionTest, RelativeAtClock_HoursKeepShiftedHour)
{
	// now - 2h = 08:30:00, only minute and second are replaced
	const auto result = evaluate("2h@10:30:15");
	EXPECT_EQ(result.grammar, TimeGrammar::RelativeAtClock);
	EXPECT_EQ(result.seconds, utc_midnight + 8 * 3600 + 30 * 60 + 15);
}

TEST_F(TimeExpressionTest, RelativeAtClock_HoursIgnoreGivenHour)
{
	EXPECT_EQ(evaluate("2h@05:07").seconds, utc_midnight + 8 * 3600 + 7 * 60);
	EXPECT_EQ(evaluate("2h@23:07").seconds, utc_midnight + 8 * 3600 + 7 * 60);
}

TEST_F(TimeExpressionTest, RelativeAtClock_HoursCrossingMidnight)
{
	// now - 12h = 2024-03-14T22:30:00
	EXPECT_EQ(evaluate("12h@00:00").seconds, utc_midnight - 2 * 3600);
}

TEST_F(TimeExpressionTest, RelativeAtClock_MinutesUnitNotAccepted)
{
	EXPECT_TRUE(evaluate("3m@11:45").fell_back());
}

TEST_F(TimeExpressionTest, RelativeAtClock_MalformedClockFallsBack)
{
	EXPECT_TRUE(evaluate("3d@1145").fell_back());
	EXPECT_TRUE(evaluate("3d@11:4").fell_back());
	EXPECT_TRUE(evaluate("3d@111:45").fell_back());
}

// =============================================================================
// Keywords with clock time: today@09:30, yesterday 14:00
// =============================================================================

TEST_F(TimeExpressionTest, KeywordAtClock_Today)
{
	const auto result = evaluate("today@09:30");
	EXPECT_EQ(result.grammar, TimeGrammar::KeywordAtClock);
	EXPECT_EQ(result.seconds, utc_midnight + 9 * 3600 + 30 * 60);
}

TEST_F(TimeExpressionTest, KeywordAtClock_YesterdayWithSeconds)
{
	EXPECT_EQ(evaluate("yesterday 14:00:59").seconds, utc_midnight - 86400 + 14 * 3600 + 59);
}

TEST_F(TimeExpressionTest, KeywordAtClock_CaseInsensitive)
{
	EXPECT_EQ(evaluate("YESTERDAY@14:00").seconds, utc_midnight - 86400 + 14 * 3600);
	EXPECT_EQ(evaluate("Today@00:00").seconds, utc_midnight);
}

TEST_F(TimeExpressionTest, KeywordAtClock_LocalTimeZone)
{
	set_timezone("ABC+5");
	EXPECT_EQ(evaluate("today@00:00").seconds, utc_midnight + 5 * 3600);
}

TEST_F(TimeExpressionTest, KeywordAtClock_UnknownKeywordFallsBack)
{
	EXPECT_TRUE(evaluate("tomorrow@09:30").fell_back());
	EXPECT_TRUE(evaluate("today").fell_back());
}

// =============================================================================
// Absolute timestamps
// =============================================================================

TEST_F(TimeExpressionTest, Absolute_IsoUtc)
{
	const auto result = evaluate("2024-01-15T11:45:23Z");
	EXPECT_EQ(result.grammar, TimeGrammar::Absolute);
	EXPECT_EQ(result.seconds, 1705319123);
}

TEST_F(TimeExpressionTest, Absolute_FractionIsFloored)
{
	EXPECT_EQ(evaluate("2024-01-15T11:45:23.987Z").seconds, 1705319123);
}

TEST_F(TimeExpressionTest, Absolute_PositiveOffset)
{
	EXPECT_EQ(evaluate("2024-01-15T11:45:23+02:00").seconds, 1705319123 - 2 * 3600);
}

TEST_F(TimeExpressionTest, Absolute_NegativeOffsetWithoutColon)
{
	EXPECT_EQ(evaluate("2024-01-15T11:45:23-0530").seconds, 1705319123 + 5 * 3600 + 30 * 60);
}

TEST_F(TimeExpressionTest, Absolute_DateOnlyIsUtcMidnight)
{
	EXPECT_EQ(evaluate("2024-01-15").seconds, 1705276800);
	set_timezone("ABC+5");
	EXPECT_EQ(evaluate("2024-01-15").seconds, 1705276800);
}

TEST_F(TimeExpressionTest, Absolute_DateTimeWithoutOffsetIsLocal)
{
	EXPECT_EQ(evaluate("2024-01-15 11:45").seconds, 1705319100);
	set_timezone("ABC+5");
	EXPECT_EQ(evaluate("2024-01-15T11:45").seconds, 1705319100 + 5 * 3600);
}

TEST_F(TimeExpressionTest, Absolute_YearMonthIsUtcMidnight)
{
	const auto result = evaluate("2024-01");
	EXPECT_EQ(result.grammar, TimeGrammar::Absolute);
	EXPECT_EQ(result.seconds, 1704067200);
	EXPECT_EQ(evaluate("2024-03").seconds, 1709251200);

	set_timezone("ABC+5");
	EXPECT_EQ(evaluate("2024-01").seconds, 1704067200);
	EXPECT_TRUE(evaluate("2024-13").fell_back());
	EXPECT_TRUE(evaluate("2024-01T10:00").fell_back());
}

TEST_F(TimeExpressionTest, Absolute_LeapDay)
{
	EXPECT_EQ(evaluate("2024-02-29T00:00:00Z").seconds, 1709164800);
}

TEST_F(TimeExpressionTest, Absolute_BeforeEpoch)
{
	EXPECT_EQ(evaluate("1969-12-31T23:59:59Z").seconds, -1);
}

TEST_F(TimeExpressionTest, Absolute_InvalidCalendarDateFallsBack)
{
	EXPECT_TRUE(evaluate("2023-02-29").fell_back());
	EXPECT_TRUE(evaluate("2024-13-01").fell_back());
	EXPECT_TRUE(evaluate("2024-04-31T10:00:00Z").fell_back());
	EXPECT_TRUE(evaluate("2024-01-15T10:60:00Z").fell_back());
	EXPECT_TRUE(evaluate("2024-01-15T10:00:00+25:00").fell_back());
}

// =============================================================================
// Epoch strings
// =============================================================================

TEST_F(TimeExpressionTest, EpochString_Parsed)
{
	const auto result = evaluate("1702656000");
	EXPECT_EQ(result.grammar, TimeGrammar::EpochString);
	EXPECT_EQ(result.seconds, 1702656000);
}

TEST_F(TimeExpressionTest, EpochString_Negative)
{
	EXPECT_EQ(evaluate("-100").seconds, -100);
}

TEST_F(TimeExpressionTest, EpochString_FourDigitsAreAYear)
{
	const auto year = evaluate("2024");
	EXPECT_EQ(year.grammar, TimeGrammar::Absolute);
	EXPECT_EQ(year.seconds, 1704067200);

	const auto short_epoch = evaluate("202");
	EXPECT_EQ(short_epoch.grammar, TimeGrammar::EpochString);
	EXPECT_EQ(short_epoch.seconds, 202);
	EXPECT_EQ(evaluate("20240").seconds, 20240);
}

TEST_F(TimeExpressionTest, EpochString_OutOfRangeFallsBack)
{
	EXPECT_TRUE(evaluate("99999999999999999999").fell_back());
}

// =============================================================================
// Fallback
// =============================================================================

TEST_F(TimeExpressionTest, Fallback_GarbageReturnsDefault)
{
	for (const char *text : {"garbage", "now", "last week", "2h ago", "12:30", "1.5h"}) {
		const auto result = evaluate(text);
		EXPECT_TRUE(result.fell_back()) << text;
		EXPECT_EQ(result.seconds, default_value) << text;
	}
}

TEST_F(TimeExpressionTest, Fallback_GrammarName)
{
	EXPECT_EQ(to_string(evaluate("garbage").grammar), "default");
	EXPECT_EQ(to_string(evaluate("2h").grammar), "relative");
	EXPECT_EQ(to_string(evaluate("3d@11:45").grammar), "relative-at-clock");
	EXPECT_EQ(to_string(evaluate("today@11:45").grammar), "keyword-at-clock");
	EXPECT_EQ(to_string(evaluate("2024-01-15").grammar), "absolute");
	EXPECT_EQ(to_string(evaluate("1702656000").grammar), "epoch");
}

TEST_F(TimeExpressionTest, ParseTime_FreeFunction)
{
	EXPECT_EQ(parse_time(std::string("1h"), default_value, clock), now - 3600);
	EXPECT_EQ(parse_time(std::monostate{}, default_value, clock), default_value);
}

TEST(SystemClockTest, NowIsCurrentTime)
{
	const SystemClock clock;
	const int64_t before = static_cast<int64_t>(std::time(nullptr));
	const int64_t value = clock.now();
	const int64_t after = static_cast<int64_t>(std::time(nullptr));
	EXPECT_GE(value, before);
	EXPECT_LE(value, after);
}
