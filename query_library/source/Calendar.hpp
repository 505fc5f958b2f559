// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <cstdint>

namespace LogQueryKit::query::source {

	struct CivilDate {
		int64_t year;
		uint32_t month; // [1, 12]
		uint32_t day;	// [1, 31]
	};

	// Proleptic Gregorian calendar conversions based on Howard Hinnant's date algorithms:
	// http://howardhinnant.github.io/date_algorithms.html
	int64_t days_from_civil(int64_t year, uint32_t month, uint32_t day) noexcept;
	CivilDate civil_from_days(int64_t days) noexcept;

	bool is_leap_year(int64_t year) noexcept;
	uint32_t days_in_month(int64_t year, uint32_t month) noexcept;

} // namespace LogQueryKit::query::source
