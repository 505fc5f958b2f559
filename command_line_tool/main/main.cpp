// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/version.gen.h"
#include "commands/interface.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;
using namespace LogQueryKit::cmd::interface;

static void set_quiet(void)
{
	set_verbosity(Verbosity::quiet);
}

static void set_verbose(void)
{
	set_verbosity(Verbosity::verbose);
}

static void print_version(void)
{
	std::cout << "Log Query Kit " LQK_VERSION_STR << std::endl;
}

static std::unique_ptr<CLI::App> createMainApp(void)
{
	auto app = std::make_unique<CLI::App>();
	app->name("lqk");
	app->description("Log Query Kit - time expressions, search queries and log sampling "
					 "for log and trace backends");

	auto *const quiet = app->add_flag_callback(
		"--quiet,-q", set_quiet, "Quiet mode: only show error messages, hide info and progress");

	auto *const verbose = app->add_flag_callback(
		"--verbose,-v", set_verbose, "Verbose mode: show detailed progress and info messages");

	quiet->excludes(verbose);

	app->add_option_function("--default-limit"s,
							 std::function<void(const size_t &)>(set_default_limit),
							 "Records returned when no --limit is given (default: 25)")
		->envname("LQK_DEFAULT_LIMIT")
		->check(CLI::NonNegativeNumber)
		->type_name("N");

	app->add_option_function("--max-log-lines"s,
							 std::function<void(const size_t &)>(set_max_log_lines),
							 "Upper bound for records fetched by one search (default: 100)")
		->envname("LQK_MAX_LOG_LINES")
		->check(CLI::NonNegativeNumber)
		->type_name("N");

	app->add_option_function("--default-hours"s,
							 std::function<void(const int64_t &)>(set_default_time_range_hours),
							 "Width of the default time range in hours (default: 24)")
		->envname("LQK_DEFAULT_TIME_RANGE_HOURS")
		->check(CLI::NonNegativeNumber)
		->type_name("HOURS");

	app->add_option_function("--now"s, std::function<void(const int64_t &)>(set_frozen_now),
							 "Use this epoch second as the current time")
		->envname("LQK_NOW")
		->type_name("SECONDS");

	auto *const version =
		app->add_flag_callback("-V,--version", print_version, "Print version information and exit");

	version->excludes(quiet);
	version->excludes(verbose);

	app->require_subcommand(0, 1);

	return app;
}

LogQueryKit::cmd::interface::MainAppHandle LogQueryKit::cmd::interface::acquireMainApp(void)
{
	static auto mainApp = createMainApp();
	static std::mutex mainAppLock{};
	return {*mainApp, std::unique_lock{mainAppLock}};
}

void call_all_init_functions(void)
{
	extern init_fn __start_lqk_cmdinit;
	extern init_fn __stop_lqk_cmdinit;
	for (init_fn *p = &__start_lqk_cmdinit; p < &__stop_lqk_cmdinit; p++) {
		(*p)();
	}
}

int main(int argc, const char **argv)
{
	install_signal_handlers();
	call_all_init_functions();
	auto [app, lock] = acquireMainApp();
	if (argc == 1) {
		std::cout << app.help() << std::endl;
		return 0;
	}
	CLI11_PARSE(app, argc, argv)
}
