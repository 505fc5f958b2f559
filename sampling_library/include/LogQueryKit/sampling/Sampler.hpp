// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef SAMPLING_LIBRARY_SAMPLER_HEADER
#define SAMPLING_LIBRARY_SAMPLER_HEADER

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "LogQueryKit/query/Common.hpp"
#include "PatternNormalizer.hpp"
#include "SampleMode.hpp"

namespace LogQueryKit::sampling {

	template <typename T>
	concept MessageRecord = requires(const T &record) {
		{ record.message } -> std::convertible_to<std::string_view>;
	};

	template <typename Record> struct SampleResult {
		std::vector<Record> samples;
		std::optional<size_t> distinct_patterns; // only set by diverse sampling
	};

	/**
	 * @brief Evenly spaced indices into a collection of `count` elements
	 *
	 * For count > limit this yields floor(i * count / limit) for i in [0, limit):
	 * always starting at 0, never guaranteed to reach count - 1.
	 * For count <= limit every index is returned.
	 */
	LQK_EXPORT std::vector<size_t> spread_indices(size_t count, size_t limit);

	template <MessageRecord Record>
	SampleResult<Record> sample_first(const std::vector<Record> &records, size_t limit) {
		const size_t n = records.size() < limit ? records.size() : limit;
		return {std::vector<Record>(records.begin(), records.begin() + n), std::nullopt};
	}

	template <MessageRecord Record>
	SampleResult<Record> sample_spread(const std::vector<Record> &records, size_t limit) {
		SampleResult<Record> result;
		const auto indices = spread_indices(records.size(), limit);
		result.samples.reserve(indices.size());
		for (const size_t i : indices)
			result.samples.push_back(records[i]);
		return result;
	}

	/**
	 * @brief Keep the first record of every distinct message pattern
	 *
	 * Scanning stops as soon as `limit` patterns were collected, so
	 * distinct_patterns never exceeds limit.
	 */
	template <MessageRecord Record>
	SampleResult<Record> sample_diverse(const std::vector<Record> &records, size_t limit,
										const PatternNormalizer &normalizer) {
		SampleResult<Record> result;
		std::unordered_set<std::string> seen;
		if (limit > 0) {
			for (const auto &record : records) {
				if (!seen.insert(normalizer.normalize(record.message)).second)
					continue;
				result.samples.push_back(record);
				if (seen.size() >= limit)
					break;
			}
		}
		result.distinct_patterns = seen.size();
		return result;
	}

	template <MessageRecord Record>
	SampleResult<Record> select(const std::vector<Record> &records, size_t limit, SampleMode mode,
								const PatternNormalizer &normalizer = PatternNormalizer::standard()) {
		switch (mode) {
		case SampleMode::Spread:
			return sample_spread(records, limit);
		case SampleMode::Diverse:
			return sample_diverse(records, limit, normalizer);
		case SampleMode::First:
		default:
			return sample_first(records, limit);
		}
	}

} // namespace LogQueryKit::sampling

#endif
