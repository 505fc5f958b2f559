// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/interface.hpp"
#include <atomic>
#include <csignal>
#include <initializer_list>
#include <unistd.h>

namespace LogQueryKit::cmd::interface
{

static std::atomic<bool> g_interrupted{false};
static std::string g_output_path{};

// first SIGINT/SIGTERM stops reading input, a second one kills the process
static void on_interrupt(int /*signum*/)
{
	g_interrupted.store(true, std::memory_order_release);

	// drop the partially written result file
	if (!g_output_path.empty())
		::unlink(g_output_path.c_str());
}

bool is_interrupted(void)
{
	return g_interrupted.load(std::memory_order_acquire);
}

void reset_interrupt(void)
{
	g_interrupted.store(false, std::memory_order_release);
}

void install_signal_handlers(void)
{
	struct sigaction action {};
	action.sa_handler = on_interrupt;
	sigemptyset(&action.sa_mask);
	action.sa_flags = SA_RESETHAND;
	for (const int signum : {SIGINT, SIGTERM}) {
		if (sigaction(signum, &action, nullptr) != 0)
			log_verbose("could not install handler for signal ", signum);
	}
}

const std::string &get_current_output_file(void)
{
	return g_output_path;
}

void set_current_output_file(const std::string &path)
{
	g_output_path = path;
}

void clear_current_output_file(void)
{
	g_output_path.clear();
}

} // namespace LogQueryKit::cmd::interface
