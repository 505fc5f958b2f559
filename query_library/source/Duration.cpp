// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/Duration.hpp"
#include "Parsing.hpp"

#include <boost/regex.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace LogQueryKit::query {

	// "\xC2\xB5" is the UTF-8 encoding of the micro sign
	static const boost::regex duration_regex{
		"^(\\d+(?:\\.\\d+)?)(ns|\xC2\xB5s|us|ms|s|m|h|d|w)?$"};

	std::optional<int64_t> duration_unit_ns(std::string_view unit) noexcept {
		if (unit.empty() || unit == "ns")
			return 1LL;
		if (unit == "us" || unit == "\xC2\xB5s")
			return NS_PER_US;
		if (unit == "ms")
			return NS_PER_MS;
		if (unit == "s")
			return NS_PER_SEC;
		if (unit == "m")
			return NS_PER_MIN;
		if (unit == "h")
			return NS_PER_HOUR;
		if (unit == "d")
			return NS_PER_DAY;
		if (unit == "w")
			return NS_PER_WEEK;
		return std::nullopt;
	}

	std::optional<int64_t> parse_duration_ns(const ExpressionInput &input) {
		if (std::holds_alternative<std::monostate>(input))
			return std::nullopt;
		if (const auto *number = std::get_if<int64_t>(&input))
			return *number;

		const std::string text = source::to_lower(source::trim(std::get<std::string>(input)));

		boost::smatch m;
		if (!boost::regex_match(text, m, duration_regex)) {
			// plain integer of nanoseconds, e.g. "+1500"
			const auto raw = source::parse_int64(text);
			if (!raw || *raw < 0)
				return std::nullopt;
			return raw;
		}

		const auto multiplier = duration_unit_ns(m[2].matched ? m[2].str() : std::string{});
		if (!multiplier)
			return std::nullopt;

		double value = 0.0;
		try {
			value = std::stod(m[1].str());
		} catch (const std::out_of_range &) {
			return std::nullopt;
		}

		const double ns = std::floor(value * static_cast<double>(*multiplier));
		// 2^63 is the first double that no longer fits into int64_t
		if (!std::isfinite(ns) || ns >= 9223372036854775808.0)
			return std::nullopt;
		return static_cast<int64_t>(ns);
	}

} // namespace LogQueryKit::query
