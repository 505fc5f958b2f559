// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_COMMON_HEADER
#define QUERY_LIBRARY_COMMON_HEADER

#if defined(__GNUC__) || defined(__clang__)
	#define LQK_EXPORT __attribute__((visibility("default")))
#else
	#define LQK_EXPORT
#endif

#include <cstdint>
#include <string>
#include <variant>

namespace LogQueryKit::query {

	/**
	 * @brief Raw value handed in by a caller for a time or duration expression
	 *
	 * std::monostate means the caller did not supply the value at all,
	 * int64_t is an already numeric value and std::string still has to be parsed.
	 */
	using ExpressionInput = std::variant<std::monostate, int64_t, std::string>;

	constexpr int64_t SECONDS_PER_MINUTE = 60;
	constexpr int64_t SECONDS_PER_HOUR = 3600;
	constexpr int64_t SECONDS_PER_DAY = 86400;

} // namespace LogQueryKit::query

#endif
