// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_TIME_RANGE_HEADER
#define QUERY_LIBRARY_TIME_RANGE_HEADER

#include <cstdint>

#include "Common.hpp"

namespace LogQueryKit::query {

	constexpr int64_t DEFAULT_MIN_SPAN_SECONDS = 60;

	struct LQK_EXPORT TimeRange {
		int64_t from = 0; // epoch seconds, inclusive
		int64_t to = 0;	  // epoch seconds

		[[nodiscard]] int64_t span() const noexcept { return to - from; }
		bool operator==(const TimeRange &) const = default;
	};

	/**
	 * @brief Normalize a (from, to) pair into a well-formed range
	 *
	 * Reversed bounds are swapped. A range narrower than min_span_seconds is
	 * widened by moving `to`. A min_span_seconds below 1 is treated as 1, so the
	 * result always satisfies from < to.
	 */
	LQK_EXPORT TimeRange ensure_valid_range(int64_t from, int64_t to,
											int64_t min_span_seconds = DEFAULT_MIN_SPAN_SECONDS) noexcept;

} // namespace LogQueryKit::query

#endif
