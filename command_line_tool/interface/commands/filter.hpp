// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef _lqk_cmd_filter_HEADER__
#define _lqk_cmd_filter_HEADER__

#include <CLI/App.hpp>
#include <string>

#include "LogQueryKit/query/Common.hpp"
#include "LogQueryKit/query/QueryCompositor.hpp"
#include "LogQueryKit/query/TraceQuery.hpp"

namespace LogQueryKit::cmd::interface
{

/**
 * @brief Add log search filter options to a command
 *
 * Adds the options feeding query::build_log_query:
 * - --query: free text query, passed through verbatim
 * - --keyword: exact phrase
 * - --pattern: regex on the message
 * - --service, --host, --status: field equalities
 *
 * @param command The CLI command to add the filter options to
 * @param filters Filters filled in by the parser
 */
void add_log_filter_options(CLI::App *command, query::LogFilters &filters);

/**
 * @brief Add APM span filter options to a command
 *
 * Adds the options feeding query::build_trace_query. Durations and http status
 * filters are validated while parsing.
 *
 * @param command The CLI command to add the filter options to
 * @param filters Filters filled in by the parser
 */
void add_trace_filter_options(CLI::App *command, query::TraceFilters &filters);

/**
 * @brief Add --from/--to time expression options to a command
 *
 * @param command The CLI command to add the options to
 * @param from_str Reference to a string that will store the --from expression
 * @param to_str Reference to a string that will store the --to expression
 */
void add_time_range_options(CLI::App *command, std::string &from_str, std::string &to_str);

// An option left empty was not given
query::ExpressionInput to_expression_input(const std::string &option_value);

} // namespace LogQueryKit::cmd::interface

#endif // _lqk_cmd_filter_HEADER__
