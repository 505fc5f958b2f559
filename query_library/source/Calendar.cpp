// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "Calendar.hpp"

namespace LogQueryKit::query::source {

	int64_t days_from_civil(int64_t year, uint32_t month, uint32_t day) noexcept {
		// Shift epoch from 1970-01-01 to 0000-03-01 (eliminates leap year special case)
		year -= month <= 2 ? 1 : 0;
		const int64_t era = (year >= 0 ? year : year - 399) / 400;
		const uint32_t yoe = static_cast<uint32_t>(year - era * 400);		   // [0, 399]
		const uint32_t mp = month > 2 ? month - 3 : month + 9;				   // [0, 11]
		const uint32_t doy = (153 * mp + 2) / 5 + day - 1;					   // [0, 365]
		const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;			   // [0, 146096]
		return era * 146097 + static_cast<int64_t>(doe) - 719468;
	}

	CivilDate civil_from_days(int64_t days) noexcept {
		days += 719468;

		const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
		const uint32_t doe = static_cast<uint32_t>(days - era * 146097); // day of era [0, 146096]
		const uint32_t yoe =
			(doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // year of era [0, 399]
		const int64_t y = static_cast<int64_t>(yoe) + era * 400;
		const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100); // day of year [0, 365]
		const uint32_t mp = (5 * doy + 2) / 153;					  // month [0, 11]

		CivilDate date;
		date.day = doy - (153 * mp + 2) / 5 + 1;
		date.month = mp < 10 ? mp + 3 : mp - 9;
		date.year = y + (date.month <= 2 ? 1 : 0);
		return date;
	}

	bool is_leap_year(int64_t year) noexcept {
		return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
	}

	uint32_t days_in_month(int64_t year, uint32_t month) noexcept {
		switch (month) {
		case 2:
			return is_leap_year(year) ? 29 : 28;
		case 4:
		case 6:
		case 9:
		case 11:
			return 30;
		default:
			return 31;
		}
	}

} // namespace LogQueryKit::query::source
