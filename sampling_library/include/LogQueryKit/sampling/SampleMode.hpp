// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef SAMPLING_LIBRARY_SAMPLE_MODE_HEADER
#define SAMPLING_LIBRARY_SAMPLE_MODE_HEADER

#include <optional>
#include <string_view>

#include "LogQueryKit/query/Common.hpp"

namespace LogQueryKit::sampling {

	enum class SampleMode {
		First,	 // chronological truncation
		Spread,	 // evenly spaced indices
		Diverse, // one record per message pattern
	};

	// "first", "spread" or "diverse"; anything else is nullopt
	LQK_EXPORT std::optional<SampleMode> parse_sample_mode(std::string_view name) noexcept;

	LQK_EXPORT std::string_view to_string(SampleMode mode) noexcept;

} // namespace LogQueryKit::sampling

#endif
