// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/QueryCompositor.hpp"
#include "Clauses.hpp"

#include <algorithm>
#include <utility>

namespace LogQueryKit::query {

	FilterSet &FilterSet::where(std::string field, std::string value) {
		if (!value.empty())
			fields.push_back(FieldFilter{std::move(field), std::move(value)});
		return *this;
	}

	bool FilterSet::empty() const noexcept {
		const bool no_fields = std::none_of(fields.begin(), fields.end(),
											[](const FieldFilter &f) { return !f.value.empty(); });
		return query.empty() && keyword.empty() && pattern.empty() && no_fields;
	}

	FilterSet LogFilters::to_filter_set() const {
		FilterSet set;
		set.query = query;
		set.keyword = keyword;
		set.pattern = pattern;
		set.where("service", service).where("host", host).where("status", status);
		return set;
	}

	std::string escape_phrase(std::string_view text) {
		std::string out;
		out.reserve(text.size());
		for (const char c : text) {
			if (c == '"')
				out += '\\';
			out += c;
		}
		return out;
	}

	std::string build_query(const FilterSet &filters) {
		source::Clauses clauses;
		clauses.add(filters.query);
		if (!filters.keyword.empty())
			clauses.add("\"" + escape_phrase(filters.keyword) + "\"");
		if (!filters.pattern.empty())
			clauses.add("@message:~\"" + escape_phrase(filters.pattern) + "\"");
		for (const auto &f : filters.fields) {
			if (!f.value.empty())
				clauses.add(f.field + ":" + f.value);
		}
		return clauses.str();
	}

	std::string build_log_query(const LogFilters &filters) {
		return build_query(filters.to_filter_set());
	}

} // namespace LogQueryKit::query
