// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "Parsing.hpp"

#include <charconv>
#include <system_error>

namespace LogQueryKit::query::source {

	static constexpr std::string_view whitespace = " \t\r\n\v\f";

	std::string trim(std::string_view input) {
		const auto first = input.find_first_not_of(whitespace);
		if (first == std::string_view::npos)
			return {};
		const auto last = input.find_last_not_of(whitespace);
		return std::string(input.substr(first, last - first + 1));
	}

	std::string to_lower(std::string_view input) {
		std::string out(input);
		for (char &c : out) {
			if (c >= 'A' && c <= 'Z')
				c = static_cast<char>(c - 'A' + 'a');
		}
		return out;
	}

	std::optional<int64_t> parse_int64(std::string_view input) noexcept {
		if (!input.empty() && input.front() == '+')
			input.remove_prefix(1);
		if (input.empty())
			return std::nullopt;

		int64_t value = 0;
		const char *const last = input.data() + input.size();
		const auto [ptr, ec] = std::from_chars(input.data(), last, value);
		if (ec != std::errc{} || ptr != last)
			return std::nullopt;
		return value;
	}

} // namespace LogQueryKit::query::source
