// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef _lqk_cmd_interface_HEADER__
#define _lqk_cmd_interface_HEADER__

#include "CLI/App.hpp"		  // IWYU pragma: export
#include "CLI/Config.hpp"	  // IWYU pragma: export
#include "CLI/Formatter.hpp"  // IWYU pragma: export
#include "CLI/Validators.hpp" // IWYU pragma: export
#if __has_include("CLI/ExtraValidators.hpp")
#include "CLI/ExtraValidators.hpp" // IWYU pragma: export
#endif
#include <CLI/Error.hpp>  // IWYU pragma: export
#include <CLI/Option.hpp> // IWYU pragma: export

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

#include "LogQueryKit/query/Clock.hpp"
#include "LogQueryKit/sampling/SearchPlan.hpp"

typedef void (*init_fn)(void);
#define COMMAND_INIT(func) \
	__attribute__((retain, used, section("lqk_cmdinit"))) static init_fn _init_##func##_ptr = func

namespace LogQueryKit::cmd::interface
{
using MainAppHandle = std::pair<CLI::App &, std::unique_lock<std::mutex>>;
MainAppHandle acquireMainApp(void);

// ============================================================================
// Configuration
// Priority: command line option > LQK_* environment variable > built-in default
// ============================================================================

const sampling::Limits &get_limits(void);
void set_default_limit(size_t limit);
void set_max_log_lines(size_t lines);
void set_default_time_range_hours(int64_t hours);

// system clock unless --now / LQK_NOW froze it
const query::Clock &get_clock(void);
void set_frozen_now(int64_t epoch_seconds);

enum class Verbosity { quiet, normal, verbose };

Verbosity get_verbosity(void);
void set_verbosity(Verbosity level);

inline bool is_verbose(void)
{
	return get_verbosity() == Verbosity::verbose;
}

inline bool is_quiet(void)
{
	return get_verbosity() == Verbosity::quiet;
}

// back to built-in limits, system clock and normal verbosity
void reset_configuration(void);

// diagnostics are written to stderr, results to stdout or the --output file
template <typename... Args> void log_line(Args &&...args)
{
	(std::cerr << ... << std::forward<Args>(args)) << std::endl;
}

template <typename... Args> void log_info(Args &&...args) // hidden in quiet mode
{
	if (!is_quiet())
		log_line(std::forward<Args>(args)...);
}

template <typename... Args> void log_verbose(Args &&...args) // only in verbose mode
{
	if (is_verbose())
		log_line(std::forward<Args>(args)...);
}

template <typename... Args> void log_error(Args &&...args)
{
	log_line("error: ", std::forward<Args>(args)...);
}

// ============================================================================
// Interrupt handling
// ============================================================================

bool is_interrupted(void);
void reset_interrupt(void);
void install_signal_handlers(void);

const std::string &get_current_output_file(void);
void set_current_output_file(const std::string &path);
void clear_current_output_file(void);

// the file named by -o/--output is removed if the command is interrupted while it is open
class OutputFileGuard
{
  public:
	explicit OutputFileGuard(const std::string &output_path)
	{
		if (output_path != "-")
			set_current_output_file(output_path);
	}
	~OutputFileGuard() { clear_current_output_file(); }

	OutputFileGuard(const OutputFileGuard &) = delete;
	OutputFileGuard &operator=(const OutputFileGuard &) = delete;
};

namespace validator
{
struct SampleModeName : public CLI::Validator {
	SampleModeName(void);
};

struct HttpStatusFilter : public CLI::Validator {
	HttpStatusFilter(void);
};

struct DurationExpression : public CLI::Validator {
	DurationExpression(void);
};

} // namespace validator

} // namespace LogQueryKit::cmd::interface

#endif
