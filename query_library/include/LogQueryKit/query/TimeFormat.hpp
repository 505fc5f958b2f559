// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_TIME_FORMAT_HEADER
#define QUERY_LIBRARY_TIME_FORMAT_HEADER

#include <cstdint>
#include <string>

#include "Common.hpp"

namespace LogQueryKit::query {

	/**
	 * @brief Rendering of epoch seconds and nanosecond durations
	 */
	class LQK_EXPORT TimeFormat final {
		TimeFormat() = delete;

	  public:
		/**
		 * @brief Convert epoch seconds to an ISO 8601 UTC string
		 * @param epoch_seconds Seconds since 1970-01-01T00:00:00Z, may be negative
		 * @return Formatted string "YYYY-MM-DDTHH:MM:SS.000Z"
		 */
		static std::string iso8601(int64_t epoch_seconds);

		/**
		 * @brief Convert nanoseconds to a short human readable duration
		 * @return e.g. "850ns", "12.5µs", "500.0ms", "1.50s", "2.25m"
		 */
		static std::string duration_ns(int64_t ns);
	};

} // namespace LogQueryKit::query

#endif
