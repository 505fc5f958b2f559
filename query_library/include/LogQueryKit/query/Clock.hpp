// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef QUERY_LIBRARY_CLOCK_HEADER
#define QUERY_LIBRARY_CLOCK_HEADER

#include <cstdint>

#include "Common.hpp"

namespace LogQueryKit::query {

	/**
	 * @brief Source of the current time in epoch seconds
	 *
	 * Everything that needs "now" receives a Clock instead of reading the
	 * system time itself, so tests can freeze time.
	 */
	class LQK_EXPORT Clock {
	  public:
		virtual ~Clock() = default;
		virtual int64_t now() const = 0;
	};

	class LQK_EXPORT SystemClock final : public Clock {
	  public:
		int64_t now() const override;
	};

	class LQK_EXPORT FixedClock final : public Clock {
	  public:
		explicit FixedClock(int64_t epoch_seconds) noexcept : m_now(epoch_seconds) {}
		int64_t now() const override { return m_now; }

	  private:
		int64_t m_now;
	};

} // namespace LogQueryKit::query

#endif
