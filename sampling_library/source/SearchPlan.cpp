// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/sampling/SearchPlan.hpp"
#include "LogQueryKit/query/TimeExpression.hpp"
#include "LogQueryKit/query/TimeFormat.hpp"

#include <algorithm>
#include <limits>

namespace LogQueryKit::sampling {

	using query::TimeExpressionParser;
	using query::TimeFormat;

	namespace {

		struct ResolvedRange {
			TimeRange range;
			bool from_defaulted;
			bool to_defaulted;
		};

		ResolvedRange resolve_range(const ExpressionInput &from, const ExpressionInput &to,
									const Limits &limits, const Clock &clock) {
			const TimeRange defaults = default_range(limits, clock);
			const TimeExpressionParser parser{clock};
			const auto from_result = parser.evaluate(from, defaults.from);
			const auto to_result = parser.evaluate(to, defaults.to);
			return {query::ensure_valid_range(from_result.seconds, to_result.seconds),
					from_result.fell_back(), to_result.fell_back()};
		}

	} // namespace

	TimeRange default_range(const Limits &limits, const Clock &clock) {
		constexpr int64_t max_hours = std::numeric_limits<int64_t>::max() / query::SECONDS_PER_HOUR;
		const int64_t hours = std::clamp<int64_t>(limits.default_time_range_hours, 0, max_hours);
		const int64_t span = hours * query::SECONDS_PER_HOUR;

		const int64_t now = clock.now();
		// saturate instead of wrapping below the smallest representable time
		if (now < std::numeric_limits<int64_t>::min() + span)
			return TimeRange{std::numeric_limits<int64_t>::min(), now};
		return TimeRange{now - span, now};
	}

	size_t fetch_limit(size_t requested_limit, SampleMode mode, const Limits &limits) noexcept {
		const size_t factor = mode == SampleMode::First ? 1 : OVERSAMPLE_FACTOR;
		if (requested_limit > limits.max_log_lines / factor)
			return limits.max_log_lines;
		return std::min(requested_limit * factor, limits.max_log_lines);
	}

	SearchPlan plan_search(const SearchRequest &request, const Limits &limits, const Clock &clock) {
		const ResolvedRange resolved = resolve_range(request.from, request.to, limits, clock);

		SearchPlan plan;
		plan.query = query::build_log_query(request.filters);
		plan.range = resolved.range;
		plan.from_iso = TimeFormat::iso8601(resolved.range.from);
		plan.to_iso = TimeFormat::iso8601(resolved.range.to);
		plan.from_defaulted = resolved.from_defaulted;
		plan.to_defaulted = resolved.to_defaulted;
		plan.requested_limit = request.limit.value_or(limits.default_limit);
		plan.mode = request.mode.value_or(SampleMode::First);
		plan.fetch_limit = fetch_limit(plan.requested_limit, plan.mode, limits);
		return plan;
	}

	AggregatePlan plan_aggregate(const AggregateRequest &request, const Limits &limits,
								 const Clock &clock) {
		const ResolvedRange resolved = resolve_range(request.from, request.to, limits, clock);

		AggregatePlan plan;
		plan.query = request.query.empty() ? std::string(query::WILDCARD_QUERY) : request.query;
		plan.range = resolved.range;
		plan.from_iso = TimeFormat::iso8601(resolved.range.from);
		plan.to_iso = TimeFormat::iso8601(resolved.range.to);
		return plan;
	}

} // namespace LogQueryKit::sampling
