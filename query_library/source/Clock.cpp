// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/Clock.hpp"

#include <chrono>

namespace LogQueryKit::query {

	int64_t SystemClock::now() const {
		const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
		return std::chrono::floor<std::chrono::seconds>(since_epoch).count();
	}

} // namespace LogQueryKit::query
