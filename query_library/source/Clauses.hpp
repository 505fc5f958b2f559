// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "LogQueryKit/query/QueryCompositor.hpp"

namespace LogQueryKit::query::source {

	// Collects query clauses, dropping empty ones, and joins them with single spaces
	class Clauses final {
	  public:
		void add(std::string clause) {
			if (!clause.empty())
				m_parts.push_back(std::move(clause));
		}

		[[nodiscard]] std::string str() const {
			if (m_parts.empty())
				return std::string(WILDCARD_QUERY);
			std::string out;
			for (const auto &part : m_parts) {
				if (!out.empty())
					out += ' ';
				out += part;
			}
			return out;
		}

	  private:
		std::vector<std::string> m_parts;
	};

} // namespace LogQueryKit::query::source
