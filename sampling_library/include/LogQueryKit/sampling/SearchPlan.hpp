// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef SAMPLING_LIBRARY_SEARCH_PLAN_HEADER
#define SAMPLING_LIBRARY_SEARCH_PLAN_HEADER

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "LogQueryKit/query/Clock.hpp"
#include "LogQueryKit/query/Common.hpp"
#include "LogQueryKit/query/QueryCompositor.hpp"
#include "LogQueryKit/query/TimeRange.hpp"
#include "SampleMode.hpp"

namespace LogQueryKit::sampling {

	using query::Clock;
	using query::ExpressionInput;
	using query::TimeRange;

	// spread and diverse sampling request this many times the wanted records
	constexpr size_t OVERSAMPLE_FACTOR = 4;

	struct LQK_EXPORT Limits {
		size_t default_limit = 25;
		size_t max_log_lines = 100;
		int64_t default_time_range_hours = 24;
	};

	struct LQK_EXPORT SearchRequest {
		query::LogFilters filters;
		ExpressionInput from;
		ExpressionInput to;
		std::optional<size_t> limit;
		std::optional<SampleMode> mode;
	};

	/**
	 * @brief Everything a caller needs to issue one log search and sample its result
	 *
	 * fetch_limit is what to request from the backend, requested_limit is what to
	 * pass to the sampler afterwards.
	 */
	struct LQK_EXPORT SearchPlan {
		std::string query;
		TimeRange range;
		std::string from_iso;
		std::string to_iso;
		bool from_defaulted = false;
		bool to_defaulted = false;
		size_t requested_limit = 0;
		size_t fetch_limit = 0;
		SampleMode mode = SampleMode::First;
	};

	struct LQK_EXPORT AggregateRequest {
		std::string query; // empty means every record
		ExpressionInput from;
		ExpressionInput to;
	};

	struct LQK_EXPORT AggregatePlan {
		std::string query;
		TimeRange range;
		std::string from_iso;
		std::string to_iso;
	};

	// [now - default_time_range_hours, now], negative hours count as 0, clamped at the earliest time
	LQK_EXPORT TimeRange default_range(const Limits &limits, const Clock &clock);

	// min(requested * (first ? 1 : OVERSAMPLE_FACTOR), max_log_lines) without wrapping
	LQK_EXPORT size_t fetch_limit(size_t requested_limit, SampleMode mode,
								  const Limits &limits) noexcept;

	LQK_EXPORT SearchPlan plan_search(const SearchRequest &request, const Limits &limits,
									  const Clock &clock);

	LQK_EXPORT AggregatePlan plan_aggregate(const AggregateRequest &request, const Limits &limits,
											const Clock &clock);

} // namespace LogQueryKit::sampling

#endif
