// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/interface.hpp"
#include <memory>

namespace LogQueryKit::cmd::interface
{

namespace
{
struct Settings {
	sampling::Limits limits{};
	Verbosity verbosity{Verbosity::normal};
	std::unique_ptr<query::FixedClock> frozen_clock{};
};
} // namespace

static Settings g_settings{};
static const query::SystemClock g_system_clock{};

const sampling::Limits &get_limits(void)
{
	return g_settings.limits;
}

void set_default_limit(size_t limit)
{
	g_settings.limits.default_limit = limit;
}

void set_max_log_lines(size_t lines)
{
	g_settings.limits.max_log_lines = lines;
}

void set_default_time_range_hours(int64_t hours)
{
	g_settings.limits.default_time_range_hours = hours;
}

const query::Clock &get_clock(void)
{
	if (g_settings.frozen_clock)
		return *g_settings.frozen_clock;
	return g_system_clock;
}

void set_frozen_now(int64_t epoch_seconds)
{
	g_settings.frozen_clock = std::make_unique<query::FixedClock>(epoch_seconds);
}

void reset_configuration(void)
{
	g_settings = Settings{};
}

Verbosity get_verbosity(void)
{
	return g_settings.verbosity;
}

void set_verbosity(Verbosity level)
{
	g_settings.verbosity = level;
}

} // namespace LogQueryKit::cmd::interface
