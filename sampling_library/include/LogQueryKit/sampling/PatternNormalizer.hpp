// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef SAMPLING_LIBRARY_PATTERN_NORMALIZER_HEADER
#define SAMPLING_LIBRARY_PATTERN_NORMALIZER_HEADER

#include <boost/regex.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "LogQueryKit/query/Common.hpp"

namespace LogQueryKit::sampling {

	/**
	 * @brief One substitution step of message normalization
	 *
	 * Every non-overlapping match of `match` is replaced by the literal `replacement`.
	 */
	struct LQK_EXPORT PatternRule {
		std::string name;
		boost::regex match;
		std::string replacement;

		[[nodiscard]] std::string apply(const std::string &text) const;
	};

	using PatternRuleCollection = std::vector<PatternRule>;

	/**
	 * @brief Maps a log message onto a canonical pattern used as a dedup key
	 *
	 * Rules are applied in table order, each over the whole string, then the
	 * result is cut to max_length characters (UTF-8 code points).
	 *
	 * Standard rules:
	 *   uuid  - 8-4-4-4-12 hex groups           -> {UUID}
	 *   hex   - hex word of 16 or more digits    -> {HEX}
	 *   id    - hex word of 8 to 15 digits       -> {ID}
	 *   ts    - 2024-01-15T11:45:23[.123Z]       -> {TS}
	 *   ip    - dotted quad                      -> {IP}
	 *   num   - decimal word of 4 or more digits -> {N}
	 */
	class LQK_EXPORT PatternNormalizer {
	  public:
		static constexpr size_t DEFAULT_MAX_LENGTH = 200;

		explicit PatternNormalizer(PatternRuleCollection rules,
								   size_t max_length = DEFAULT_MAX_LENGTH);

		static PatternRuleCollection standard_rules();
		static const PatternNormalizer &standard();

		[[nodiscard]] std::string normalize(std::string_view message) const;

		[[nodiscard]] const PatternRuleCollection &rules() const noexcept { return m_rules; }
		[[nodiscard]] size_t max_length() const noexcept { return m_max_length; }

	  private:
		PatternRuleCollection m_rules;
		size_t m_max_length;
	};

	LQK_EXPORT std::string normalize_to_pattern(std::string_view message);

	// First max_chars code points of a UTF-8 string, never splitting a sequence
	LQK_EXPORT std::string truncate_utf8(std::string_view text, size_t max_chars);

} // namespace LogQueryKit::sampling

#endif
