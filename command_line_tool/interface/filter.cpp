// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/filter.hpp"
#include "commands/interface.hpp"
#include <CLI/App.hpp>

namespace LogQueryKit::cmd::interface
{

void add_log_filter_options(CLI::App *command, query::LogFilters &filters)
{
	command->add_option("--query", filters.query, "Free text query, passed through verbatim")
		->type_name("QUERY");
	command->add_option("--keyword", filters.keyword, "Match this exact phrase in the message")
		->type_name("TEXT");
	command->add_option("--pattern", filters.pattern, "Match the message against this regex")
		->type_name("REGEX");
	command->add_option("--service", filters.service, "Filter by service name")
		->type_name("NAME");
	command->add_option("--host", filters.host, "Filter by host name")->type_name("NAME");
	command->add_option("--status", filters.status, "Filter by log status (error, warn, info, ...)")
		->type_name("STATUS");
}

void add_trace_filter_options(CLI::App *command, query::TraceFilters &filters)
{
	command->add_option("--query", filters.query, "Free text query, passed through verbatim")
		->type_name("QUERY");
	command->add_option("--service", filters.service, "Filter by service name")
		->type_name("NAME");
	command->add_option("--operation", filters.operation, "Filter by operation name")
		->type_name("NAME");
	command->add_option("--resource", filters.resource, "Filter by resource name")
		->type_name("NAME");
	command->add_option("--status", filters.status, "Filter by span status")
		->check(CLI::IsMember({"ok", "error"}))
		->type_name("STATUS");
	command->add_option("--env", filters.env, "Filter by environment")->type_name("ENV");
	command
		->add_option("--min-duration", filters.min_duration,
					 "Only spans lasting at least this long.\n"
					 "Formats: 500ms, 1.5s, 2m, 250us, 1000000 (ns)")
		->check(validator::DurationExpression{})
		->type_name("DURATION");
	command
		->add_option("--max-duration", filters.max_duration,
					 "Only spans lasting at most this long.\n"
					 "(same formats as --min-duration)")
		->check(validator::DurationExpression{})
		->type_name("DURATION");
	command
		->add_option("--http-status", filters.http_status,
					 "Filter by http status code.\n"
					 "Formats: 404, 5xx, >=500, <300")
		->check(validator::HttpStatusFilter{})
		->type_name("STATUS");
	command->add_option("--error-type", filters.error_type, "Spans whose error type contains this")
		->type_name("TEXT");
	command
		->add_option("--error-message", filters.error_message,
					 "Spans whose error message contains this")
		->type_name("TEXT");
}

void add_time_range_options(CLI::App *command, std::string &from_str, std::string &to_str)
{
	command
		->add_option("--from", from_str,
					 "Start of the time range (default: now minus --default-hours).\n"
					 "Formats:\n"
					 "  30s, 15m, 2h, 7d       - relative to now\n"
					 "  3d@11:45:23, 2h 10:30  - relative with clock time\n"
					 "  today@09:30, yesterday@14:00\n"
					 "  1702656000             - Unix timestamp\n"
					 "  2024-01-15T11:45:23Z   - ISO 8601")
		->type_name("TIME");

	command
		->add_option("--to", to_str,
					 "End of the time range (default: now).\n"
					 "(same formats as --from)")
		->type_name("TIME");
}

query::ExpressionInput to_expression_input(const std::string &option_value)
{
	if (option_value.empty())
		return std::monostate{};
	return option_value;
}

} // namespace LogQueryKit::cmd::interface
