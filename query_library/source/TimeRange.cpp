// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/TimeRange.hpp"

#include <limits>
#include <utility>

namespace LogQueryKit::query {

	TimeRange ensure_valid_range(int64_t from, int64_t to, int64_t min_span_seconds) noexcept {
		if (from > to)
			std::swap(from, to);

		const int64_t min_span = min_span_seconds < 1 ? 1 : min_span_seconds;
		if (from > std::numeric_limits<int64_t>::max() - min_span)
			from = std::numeric_limits<int64_t>::max() - min_span;

		// unsigned difference is exact for from <= to even across the whole int64 range
		const uint64_t span = static_cast<uint64_t>(to) - static_cast<uint64_t>(from);
		if (to < from || span < static_cast<uint64_t>(min_span))
			to = from + min_span;

		return TimeRange{from, to};
	}

} // namespace LogQueryKit::query
