// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_TIME_EXPRESSION_HEADER
#define QUERY_LIBRARY_TIME_EXPRESSION_HEADER

#include <cstdint>
#include <string_view>

#include "Clock.hpp"
#include "Common.hpp"

namespace LogQueryKit::query {

	/**
	 * TimeExpressionParser - turns loosely written time expressions into epoch seconds
	 *
	 * Grammars, tried in this order (first match wins):
	 *
	 * Relative to now:
	 *   - 30s, 15m, 2h, 7d      - N seconds/minutes/hours/days ago
	 *
	 * Relative with clock time (local time zone):
	 *   - 3d@11:45:23, 3d 11:45 - local midnight 3 days ago, then 11:45:23
	 *   - 2h@10:30:15            - 2 hours ago with minute and second set to 30:15,
	 *                              the hour of "2 hours ago" is kept
	 *
	 * Keywords with clock time (local time zone, case-insensitive):
	 *   - today@09:30, yesterday 14:00:00
	 *
	 * Absolute:
	 *   - ISO 8601: "2024-01-15T11:45:23Z", "2024-01-15T11:45:23.5+02:00"
	 *   - date only (UTC midnight): "2024-01-15", "2024-01", "2024" (a four-digit string is a year)
	 *   - date-time without offset (local time): "2024-01-15 11:45"
	 *   - epoch seconds: "1702656000", any digit string that is not four digits long
	 *
	 * Anything else resolves to the caller's default. Nothing throws.
	 */

	enum class TimeGrammar {
		None,			 // fell back to the default
		Numeric,		 // numeric input passed through
		Relative,		 // 2h
		RelativeAtClock, // 3d@11:45:23
		KeywordAtClock,	 // yesterday@14:00
		Absolute,		 // ISO 8601
		EpochString,	 // "1702656000"
	};

	LQK_EXPORT std::string_view to_string(TimeGrammar grammar) noexcept;

	struct LQK_EXPORT TimeResult {
		enum class Source { Parsed, FellBack };

		Source source = Source::FellBack;
		TimeGrammar grammar = TimeGrammar::None;
		int64_t seconds = 0;

		[[nodiscard]] bool fell_back() const noexcept { return source == Source::FellBack; }
	};

	class LQK_EXPORT TimeExpressionParser {
	  public:
		explicit TimeExpressionParser(const Clock &clock) noexcept : m_clock(clock) {}

		// Resolve input, reporting which grammar matched or that default_value was used
		[[nodiscard]] TimeResult evaluate(const ExpressionInput &input, int64_t default_value) const;

		[[nodiscard]] int64_t parse(const ExpressionInput &input, int64_t default_value) const;

	  private:
		const Clock &m_clock;
	};

	LQK_EXPORT int64_t parse_time(const ExpressionInput &input, int64_t default_value,
								  const Clock &clock);

} // namespace LogQueryKit::query

#endif
