// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/sampling/Sampler.hpp"
#include "LogQueryKit/sampling/SampleMode.hpp"

#include <numeric>

namespace LogQueryKit::sampling {

	std::optional<SampleMode> parse_sample_mode(std::string_view name) noexcept {
		if (name == "first")
			return SampleMode::First;
		if (name == "spread")
			return SampleMode::Spread;
		if (name == "diverse")
			return SampleMode::Diverse;
		return std::nullopt;
	}

	std::string_view to_string(SampleMode mode) noexcept {
		switch (mode) {
		case SampleMode::First:
			return "first";
		case SampleMode::Spread:
			return "spread";
		case SampleMode::Diverse:
			return "diverse";
		}
		return "first";
	}

	std::vector<size_t> spread_indices(size_t count, size_t limit) {
		std::vector<size_t> indices;
		if (count <= limit) {
			indices.resize(count);
			std::iota(indices.begin(), indices.end(), size_t{0});
			return indices;
		}

		// floor(i * count / limit) split into quotient and remainder, i * count would overflow
		const size_t quotient = count / limit;
		const size_t remainder = count % limit;
		indices.reserve(limit);
		for (size_t i = 0; i < limit; ++i)
			indices.push_back(i * quotient + (i * remainder) / limit);
		return indices;
	}

} // namespace LogQueryKit::sampling
