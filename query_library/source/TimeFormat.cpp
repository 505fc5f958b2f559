// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/TimeFormat.hpp"
#include "Calendar.hpp"

#include <array>
#include <cstdio>

namespace LogQueryKit::query {

	std::string TimeFormat::iso8601(int64_t epoch_seconds) {
		int64_t days = epoch_seconds / SECONDS_PER_DAY;
		int64_t secs = epoch_seconds % SECONDS_PER_DAY;
		if (secs < 0) {
			secs += SECONDS_PER_DAY;
			days -= 1;
		}

		const source::CivilDate date = source::civil_from_days(days);
		const int hour = static_cast<int>(secs / SECONDS_PER_HOUR);
		const int minute = static_cast<int>((secs % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
		const int second = static_cast<int>(secs % SECONDS_PER_MINUTE);

		std::array<char, 48> buf{};
		if (date.year >= 0 && date.year <= 9999) {
			std::snprintf(buf.data(), buf.size(), "%04lld-%02u-%02uT%02d:%02d:%02d.000Z",
						  static_cast<long long>(date.year), date.month, date.day, hour, minute,
						  second);
		} else {
			// expanded years carry a sign and six digits
			std::snprintf(buf.data(), buf.size(), "%c%06lld-%02u-%02uT%02d:%02d:%02d.000Z",
						  date.year < 0 ? '-' : '+',
						  static_cast<long long>(date.year < 0 ? -date.year : date.year),
						  date.month, date.day, hour, minute, second);
		}
		return std::string(buf.data());
	}

	std::string TimeFormat::duration_ns(int64_t ns) {
		std::array<char, 48> buf{};
		const double value = static_cast<double>(ns);
		if (ns < 1'000LL)
			std::snprintf(buf.data(), buf.size(), "%lldns", static_cast<long long>(ns));
		else if (ns < 1'000'000LL)
			std::snprintf(buf.data(), buf.size(), "%.1fµs", value / 1e3);
		else if (ns < 1'000'000'000LL)
			std::snprintf(buf.data(), buf.size(), "%.1fms", value / 1e6);
		else if (ns < 60'000'000'000LL)
			std::snprintf(buf.data(), buf.size(), "%.2fs", value / 1e9);
		else
			std::snprintf(buf.data(), buf.size(), "%.2fm", value / 6e10);
		return std::string(buf.data());
	}

} // namespace LogQueryKit::query
