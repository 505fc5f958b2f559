// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_DURATION_HEADER
#define QUERY_LIBRARY_DURATION_HEADER

#include <cstdint>
#include <optional>
#include <string_view>

#include "Common.hpp"

namespace LogQueryKit::query {

	constexpr int64_t NS_PER_US = 1'000LL;
	constexpr int64_t NS_PER_MS = 1'000'000LL;
	constexpr int64_t NS_PER_SEC = 1'000'000'000LL;
	constexpr int64_t NS_PER_MIN = 60LL * NS_PER_SEC;
	constexpr int64_t NS_PER_HOUR = 3600LL * NS_PER_SEC;
	constexpr int64_t NS_PER_DAY = 86400LL * NS_PER_SEC;
	constexpr int64_t NS_PER_WEEK = 7LL * NS_PER_DAY;

	/**
	 * @brief Parse a human duration into nanoseconds
	 *
	 * Accepts "<number>[unit]" where number may carry a fraction ("1.5s") and unit
	 * is one of ns, us, µs, ms, s, m, h, d, w (case-insensitive, default ns).
	 * A string that does not fit that shape is tried as a plain integer of
	 * nanoseconds. Numeric input is returned as is.
	 *
	 * @return nanoseconds, or nullopt for absent or unparseable input
	 */
	LQK_EXPORT std::optional<int64_t> parse_duration_ns(const ExpressionInput &input);

	// Nanoseconds per unit suffix as accepted by parse_duration_ns, nullopt for unknown suffixes
	LQK_EXPORT std::optional<int64_t> duration_unit_ns(std::string_view unit) noexcept;

} // namespace LogQueryKit::query

#endif
