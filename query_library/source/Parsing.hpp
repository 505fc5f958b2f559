// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace LogQueryKit::query::source {

	// Strip leading and trailing whitespace (space, \t, \r, \n, \v, \f)
	std::string trim(std::string_view input);

	// ASCII-only lower casing, bytes >= 0x80 are left untouched so UTF-8 survives
	std::string to_lower(std::string_view input);

	// Whole-string decimal integer with optional sign, nullopt on junk or overflow
	std::optional<int64_t> parse_int64(std::string_view input) noexcept;

} // namespace LogQueryKit::query::source
