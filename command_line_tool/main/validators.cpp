// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/interface.hpp"
#include "LogQueryKit/query/Duration.hpp"
#include "LogQueryKit/sampling/SampleMode.hpp"
#include <boost/regex.hpp>
#include <string>

using namespace std::string_literals;

namespace LogQueryKit::cmd::interface::validator
{

SampleModeName::SampleModeName(void) : CLI::Validator("MODE")
{
	func_ = [](const std::string &name) {
		if (sampling::parse_sample_mode(name))
			return ""s;
		return "sample mode must be one of first, spread, diverse"s;
	};
}

// 404, 5xx, >=500, <300
HttpStatusFilter::HttpStatusFilter(void) : CLI::Validator("STATUS")
{
	static const boost::regex status_filter{R"(^(?:\d[xX]{2}|(?:>=|<=|>|<)?\d{3})$)"};
	func_ = [](const std::string &status) {
		if (boost::regex_match(status, status_filter))
			return ""s;
		return "invalid http status filter '"s + status + "', expected e.g. 404, 5xx, >=500";
	};
}

DurationExpression::DurationExpression(void) : CLI::Validator("DURATION")
{
	func_ = [](const std::string &duration) {
		if (query::parse_duration_ns(duration))
			return ""s;
		return "invalid duration '"s + duration + "', expected e.g. 500ms, 1.5s, 2m";
	};
}

} // namespace LogQueryKit::cmd::interface::validator
