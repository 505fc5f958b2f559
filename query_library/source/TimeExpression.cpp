// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/TimeExpression.hpp"
#include "Calendar.hpp"
#include "Parsing.hpp"

#include <boost/regex.hpp>
#include <ctime>
#include <limits>
#include <optional>
#include <string>

namespace LogQueryKit::query {

	namespace {

		const boost::regex simple_relative_regex{R"(^(\d+)([smhd])$)"};
		const boost::regex relative_at_clock_regex{
			R"(^(\d+)([dh])[@ ](\d{1,2}):(\d{2})(?::(\d{2}))?$)"};
		const boost::regex keyword_at_clock_regex{
			R"(^(today|yesterday)[@ ](\d{1,2}):(\d{2})(?::(\d{2}))?$)",
			boost::regex::perl | boost::regex::icase};
		// YYYY, YYYY-MM and YYYY-MM-DD, a time of day (and offset) only after a full date
		const boost::regex iso_datetime_regex{
			R"(^(\d{4})(?:-(\d{2})(?:-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?(Z|[+-]\d{2}:?\d{2})?)?)?)?$)",
			boost::regex::perl | boost::regex::icase};
		const boost::regex epoch_regex{R"(^[+-]?\d+$)"};

		// keeps tm_mday/tm_hour arithmetic far away from int overflow
		constexpr int64_t max_calendar_offset = std::numeric_limits<int>::max() / 2;

		struct ClockTime {
			int hour = 0;
			int minute = 0;
			int second = 0;
		};

		ClockTime clock_time(const boost::smatch &m, size_t first_group) {
			ClockTime t;
			t.hour = static_cast<int>(source::parse_int64(m[first_group].str()).value_or(0));
			t.minute = static_cast<int>(source::parse_int64(m[first_group + 1].str()).value_or(0));
			if (m[first_group + 2].matched)
				t.second = static_cast<int>(source::parse_int64(m[first_group + 2].str()).value_or(0));
			return t;
		}

		std::optional<std::tm> local_tm(int64_t epoch_seconds) {
			const std::time_t t = static_cast<std::time_t>(epoch_seconds);
			std::tm tm{};
			if (localtime_r(&t, &tm) == nullptr)
				return std::nullopt;
			return tm;
		}

		// mktime normalizes out of range fields (e.g. tm_mday = -2) in local time
		std::optional<int64_t> local_epoch(std::tm tm) {
			tm.tm_isdst = -1;
			const std::time_t t = std::mktime(&tm);
			if (t == static_cast<std::time_t>(-1))
				return std::nullopt;
			return static_cast<int64_t>(t);
		}

		std::optional<int64_t> local_day_at(int64_t now, int64_t days_ago, const ClockTime &at) {
			auto tm = local_tm(now);
			if (!tm)
				return std::nullopt;
			tm->tm_mday -= static_cast<int>(days_ago);
			tm->tm_hour = at.hour;
			tm->tm_min = at.minute;
			tm->tm_sec = at.second;
			return local_epoch(*tm);
		}

		std::optional<int64_t> match_relative(const std::string &text, int64_t now) {
			boost::smatch m;
			if (!boost::regex_match(text, m, simple_relative_regex))
				return std::nullopt;
			const auto value = source::parse_int64(m[1].str());
			if (!value)
				return std::nullopt;

			int64_t unit = 1;
			switch (m[2].str()[0]) {
			case 'm':
				unit = SECONDS_PER_MINUTE;
				break;
			case 'h':
				unit = SECONDS_PER_HOUR;
				break;
			case 'd':
				unit = SECONDS_PER_DAY;
				break;
			default:
				break;
			}
			if (*value > std::numeric_limits<int64_t>::max() / unit)
				return std::nullopt;
			return now - *value * unit;
		}

		std::optional<int64_t> match_relative_at_clock(const std::string &text, int64_t now) {
			boost::smatch m;
			if (!boost::regex_match(text, m, relative_at_clock_regex))
				return std::nullopt;
			const auto value = source::parse_int64(m[1].str());
			if (!value || *value > max_calendar_offset)
				return std::nullopt;
			const ClockTime at = clock_time(m, 3);

			if (m[2].str() == "d")
				return local_day_at(now, *value, at);

			// hour unit: step back N hours, then replace minute and second only
			auto tm = local_tm(now);
			if (!tm)
				return std::nullopt;
			tm->tm_hour -= static_cast<int>(*value);
			tm->tm_min = at.minute;
			tm->tm_sec = at.second;
			return local_epoch(*tm);
		}

		std::optional<int64_t> match_keyword_at_clock(const std::string &text, int64_t now) {
			boost::smatch m;
			if (!boost::regex_match(text, m, keyword_at_clock_regex))
				return std::nullopt;
			const int64_t days_ago = source::to_lower(m[1].str()) == "yesterday" ? 1 : 0;
			return local_day_at(now, days_ago, clock_time(m, 2));
		}

		std::optional<int64_t> utc_offset_seconds(const std::string &zone) {
			if (zone == "Z" || zone == "z")
				return 0;
			// [+-]HH:MM or [+-]HHMM
			const int64_t sign = zone[0] == '-' ? -1 : 1;
			const std::string digits = zone.size() == 6 ? zone.substr(1, 2) + zone.substr(4, 2)
														: zone.substr(1);
			const auto hours = source::parse_int64(digits.substr(0, 2));
			const auto minutes = source::parse_int64(digits.substr(2, 2));
			if (!hours || !minutes || *hours > 23 || *minutes > 59)
				return std::nullopt;
			return sign * (*hours * SECONDS_PER_HOUR + *minutes * SECONDS_PER_MINUTE);
		}

		std::optional<int64_t> match_absolute(const std::string &text) {
			boost::smatch m;
			if (!boost::regex_match(text, m, iso_datetime_regex))
				return std::nullopt;

			const int64_t year = source::parse_int64(m[1].str()).value_or(0);
			const int64_t month = m[2].matched ? source::parse_int64(m[2].str()).value_or(0) : 1;
			const int64_t day = m[3].matched ? source::parse_int64(m[3].str()).value_or(0) : 1;
			if (month < 1 || month > 12)
				return std::nullopt;
			if (day < 1 || day > source::days_in_month(year, static_cast<uint32_t>(month)))
				return std::nullopt;

			const int64_t days = source::days_from_civil(year, static_cast<uint32_t>(month),
														 static_cast<uint32_t>(day));
			// date-only forms are UTC midnight
			if (!m[4].matched)
				return days * SECONDS_PER_DAY;

			const int64_t hour = source::parse_int64(m[4].str()).value_or(0);
			const int64_t minute = source::parse_int64(m[5].str()).value_or(0);
			const int64_t second =
				m[6].matched ? source::parse_int64(m[6].str()).value_or(0) : 0;
			if (minute > 59 || second > 59)
				return std::nullopt;
			if (hour > 24 || (hour == 24 && (minute != 0 || second != 0)))
				return std::nullopt;

			// fractional seconds never change floor(ms / 1000) and are dropped
			if (m[7].matched) {
				const auto offset = utc_offset_seconds(m[7].str());
				if (!offset)
					return std::nullopt;
				return days * SECONDS_PER_DAY + hour * SECONDS_PER_HOUR +
					   minute * SECONDS_PER_MINUTE + second - *offset;
			}

			// date-time forms without offset are local time
			std::tm tm{};
			tm.tm_year = static_cast<int>(year - 1900);
			tm.tm_mon = static_cast<int>(month - 1);
			tm.tm_mday = static_cast<int>(day);
			tm.tm_hour = static_cast<int>(hour);
			tm.tm_min = static_cast<int>(minute);
			tm.tm_sec = static_cast<int>(second);
			return local_epoch(tm);
		}

		std::optional<int64_t> match_epoch(const std::string &text) {
			if (!boost::regex_match(text, epoch_regex))
				return std::nullopt;
			return source::parse_int64(text);
		}

		TimeResult parsed(TimeGrammar grammar, int64_t seconds) {
			return TimeResult{TimeResult::Source::Parsed, grammar, seconds};
		}

	} // namespace

	std::string_view to_string(TimeGrammar grammar) noexcept {
		switch (grammar) {
		case TimeGrammar::None:
			return "default";
		case TimeGrammar::Numeric:
			return "numeric";
		case TimeGrammar::Relative:
			return "relative";
		case TimeGrammar::RelativeAtClock:
			return "relative-at-clock";
		case TimeGrammar::KeywordAtClock:
			return "keyword-at-clock";
		case TimeGrammar::Absolute:
			return "absolute";
		case TimeGrammar::EpochString:
			return "epoch";
		}
		return "unknown";
	}

	TimeResult TimeExpressionParser::evaluate(const ExpressionInput &input,
											  int64_t default_value) const {
		const TimeResult fallback{TimeResult::Source::FellBack, TimeGrammar::None, default_value};

		if (std::holds_alternative<std::monostate>(input))
			return fallback;
		if (const auto *number = std::get_if<int64_t>(&input))
			return parsed(TimeGrammar::Numeric, *number);

		const std::string text = source::trim(std::get<std::string>(input));
		if (text.empty())
			return fallback;

		const int64_t now = m_clock.now();
		if (const auto value = match_relative(text, now))
			return parsed(TimeGrammar::Relative, *value);
		if (const auto value = match_relative_at_clock(text, now))
			return parsed(TimeGrammar::RelativeAtClock, *value);
		if (const auto value = match_keyword_at_clock(text, now))
			return parsed(TimeGrammar::KeywordAtClock, *value);
		if (const auto value = match_absolute(text))
			return parsed(TimeGrammar::Absolute, *value);
		if (const auto value = match_epoch(text))
			return parsed(TimeGrammar::EpochString, *value);

		return fallback;
	}

	int64_t TimeExpressionParser::parse(const ExpressionInput &input, int64_t default_value) const {
		return evaluate(input, default_value).seconds;
	}

	int64_t parse_time(const ExpressionInput &input, int64_t default_value, const Clock &clock) {
		return TimeExpressionParser{clock}.parse(input, default_value);
	}

} // namespace LogQueryKit::query
