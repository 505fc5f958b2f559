// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/sampling/PatternNormalizer.hpp"

#include <utility>

namespace LogQueryKit::sampling {

	std::string PatternRule::apply(const std::string &text) const {
		return boost::regex_replace(text, match, replacement,
									boost::regex_constants::format_literal);
	}

	PatternNormalizer::PatternNormalizer(PatternRuleCollection rules, size_t max_length)
		: m_rules(std::move(rules)), m_max_length(max_length) {}

	PatternRuleCollection PatternNormalizer::standard_rules() {
		const boost::regex::flag_type icase = boost::regex::perl | boost::regex::icase;

		// order matters: numbers come last so they cannot eat parts of ids, stamps or addresses
		PatternRuleCollection rules;
		rules.push_back({"uuid",
						 boost::regex{"[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}",
									  icase},
						 "{UUID}"});
		rules.push_back({"hex", boost::regex{R"(\b[0-9a-f]{16,}\b)", icase}, "{HEX}"});
		rules.push_back({"id", boost::regex{R"(\b[0-9a-f]{8,15}\b)", icase}, "{ID}"});
		rules.push_back(
			{"ts", boost::regex{R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}[.\dZ]*)"}, "{TS}"});
		rules.push_back(
			{"ip", boost::regex{R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)"}, "{IP}"});
		rules.push_back({"num", boost::regex{R"(\b\d{4,}\b)"}, "{N}"});
		return rules;
	}

	const PatternNormalizer &PatternNormalizer::standard() {
		static const PatternNormalizer normalizer{standard_rules()};
		return normalizer;
	}

	std::string PatternNormalizer::normalize(std::string_view message) const {
		std::string pattern(message);
		for (const auto &rule : m_rules)
			pattern = rule.apply(pattern);
		return truncate_utf8(pattern, m_max_length);
	}

	std::string normalize_to_pattern(std::string_view message) {
		return PatternNormalizer::standard().normalize(message);
	}

	std::string truncate_utf8(std::string_view text, size_t max_chars) {
		size_t chars = 0;
		for (size_t i = 0; i < text.size(); ++i) {
			// continuation bytes 10xxxxxx belong to the previous code point
			if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80)
				continue;
			if (chars == max_chars)
				return std::string(text.substr(0, i));
			++chars;
		}
		return std::string(text);
	}

} // namespace LogQueryKit::sampling
