// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_TRACE_QUERY_HEADER
#define QUERY_LIBRARY_TRACE_QUERY_HEADER

#include <string>
#include <string_view>

#include "Common.hpp"

namespace LogQueryKit::query {

	/**
	 * @brief Filters offered for APM span searches
	 *
	 * Clause order: query, service, operation, resource, status, env,
	 * min_duration, max_duration, http_status, error_type, error_message.
	 * Empty strings are not emitted.
	 */
	struct LQK_EXPORT TraceFilters {
		std::string query;
		std::string service;
		std::string operation;	   // operation_name:
		std::string resource;	   // resource_name:
		std::string status;		   // ok | error
		std::string env;
		std::string min_duration;  // "500ms" -> @duration:>=500000000
		std::string max_duration;  // "2s"    -> @duration:<=2000000000
		std::string http_status;   // 5xx, >=500, <300, 404
		std::string error_type;	   // error.type:*value*
		std::string error_message; // error.message:*value*
	};

	/**
	 * @brief Translate an HTTP status expression into a status code clause
	 *
	 * "5xx" -> @http.status_code:[500 TO 599]
	 * ">=500", ">500", "<=399", "<400" -> comparison clause
	 * anything else -> @http.status_code:<value>
	 */
	LQK_EXPORT std::string build_http_status_filter(std::string_view http_status);

	LQK_EXPORT std::string build_trace_query(const TraceFilters &filters);

} // namespace LogQueryKit::query

#endif
