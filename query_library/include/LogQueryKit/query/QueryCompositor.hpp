// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_QUERY_COMPOSITOR_HEADER
#define QUERY_LIBRARY_QUERY_COMPOSITOR_HEADER

#include <string>
#include <string_view>
#include <vector>

#include "Common.hpp"

namespace LogQueryKit::query {

	// Query matching every record
	constexpr std::string_view WILDCARD_QUERY = "*";

	struct LQK_EXPORT FieldFilter {
		std::string field;
		std::string value;
	};

	/**
	 * @brief Independent filter dimensions merged into one backend query
	 *
	 * Empty strings mean "dimension not requested". Clauses are emitted in the
	 * order query, keyword, pattern, fields (in the order they were added).
	 */
	struct LQK_EXPORT FilterSet {
		std::string query;				 // free text, passed through verbatim
		std::string keyword;			 // exact phrase: "keyword"
		std::string pattern;			 // regex on the message: @message:~"pattern"
		std::vector<FieldFilter> fields; // field:value, not escaped

		// Append field:value unless value is empty
		FilterSet &where(std::string field, std::string value);

		[[nodiscard]] bool empty() const noexcept;
	};

	/**
	 * @brief Filters offered for log searches
	 *
	 * Field equalities are emitted as service, host, status in that order.
	 */
	struct LQK_EXPORT LogFilters {
		std::string query;
		std::string keyword;
		std::string pattern;
		std::string service;
		std::string host;
		std::string status;

		[[nodiscard]] FilterSet to_filter_set() const;
	};

	// Escape double quotes for use inside a quoted phrase: a"b -> a\"b
	LQK_EXPORT std::string escape_phrase(std::string_view text);

	// Space separated clauses, or WILDCARD_QUERY when no dimension is set
	LQK_EXPORT std::string build_query(const FilterSet &filters);

	LQK_EXPORT std::string build_log_query(const LogFilters &filters);

} // namespace LogQueryKit::query

#endif
