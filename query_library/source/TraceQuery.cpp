// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/TraceQuery.hpp"
#include "Clauses.hpp"
#include "LogQueryKit/query/Duration.hpp"
#include "LogQueryKit/query/QueryCompositor.hpp"
#include "Parsing.hpp"

#include <initializer_list>
#include <string>

namespace LogQueryKit::query {

	static constexpr std::string_view http_status_field = "@http.status_code:";

	std::string build_http_status_filter(std::string_view http_status) {
		const std::string status = source::to_lower(http_status);
		const std::string field(http_status_field);

		// 5xx -> [500 TO 599]
		if (status.size() == 3 && status.ends_with("xx") && status[0] >= '0' && status[0] <= '9') {
			const int base = (status[0] - '0') * 100;
			return field + "[" + std::to_string(base) + " TO " + std::to_string(base + 99) + "]";
		}

		// longer prefixes first so ">=" is not read as ">"
		for (const std::string_view op : {">=", "<=", ">", "<"}) {
			if (status.starts_with(op))
				return field + std::string(op) + status.substr(op.size());
		}

		return field + std::string(http_status);
	}

	std::string build_trace_query(const TraceFilters &filters) {
		source::Clauses clauses;
		const auto add_field = [&clauses](std::string_view field, const std::string &value) {
			if (!value.empty())
				clauses.add(std::string(field) + ":" + value);
		};

		clauses.add(filters.query);
		add_field("service", filters.service);
		add_field("operation_name", filters.operation);
		add_field("resource_name", filters.resource);
		add_field("status", filters.status);
		add_field("env", filters.env);

		// unparseable durations are dropped rather than reported
		if (!filters.min_duration.empty()) {
			if (const auto ns = parse_duration_ns(filters.min_duration))
				clauses.add("@duration:>=" + std::to_string(*ns));
		}
		if (!filters.max_duration.empty()) {
			if (const auto ns = parse_duration_ns(filters.max_duration))
				clauses.add("@duration:<=" + std::to_string(*ns));
		}

		if (!filters.http_status.empty())
			clauses.add(build_http_status_filter(filters.http_status));

		if (!filters.error_type.empty())
			clauses.add("error.type:*" + escape_phrase(filters.error_type) + "*");
		if (!filters.error_message.empty())
			clauses.add("error.message:*" + escape_phrase(filters.error_message) + "*");

		return clauses.str();
	}

} // namespace LogQueryKit::query
