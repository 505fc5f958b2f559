// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/QueryCompositor.hpp"
#include "LogQueryKit/query/TraceQuery.hpp"
#include "commands/filter.hpp"
#include "commands/interface.hpp"
#include <cstdio>
#include <functional>
#include <memory>
#include <string>

using namespace LogQueryKit::cmd::interface;

class LogQueryCommand
{
  public:
	static void AddCommand(CLI::App &parent)
	{
		auto cmd = std::make_shared<LogQueryCommand>();

		cmd->sub = parent.add_subcommand("query", "Compose a log search query");
		cmd->sub->description("Merge free text, phrase, regex and field filters into one query.\n"
							  "Prints * when no filter is given.");

		add_log_filter_options(cmd->sub, cmd->filters);

		cmd->sub->callback(std::bind(&LogQueryCommand::run, std::move(cmd)));
	}

  protected:
	CLI::App *sub;
	LogQueryKit::query::LogFilters filters{};

	static void run(std::shared_ptr<LogQueryCommand> cmd)
	{
		const std::string query = LogQueryKit::query::build_log_query(cmd->filters);
		printf("%s\n", query.c_str());
	}
};

class TraceQueryCommand
{
  public:
	static void AddCommand(CLI::App &parent)
	{
		auto cmd = std::make_shared<TraceQueryCommand>();

		cmd->sub = parent.add_subcommand("trace-query", "Compose an APM span search query");
		cmd->sub->alias("tquery");
		cmd->sub->description(
			"Merge service, operation, duration, http status and error filters into one query.\n"
			"Prints * when no filter is given.");

		add_trace_filter_options(cmd->sub, cmd->filters);

		cmd->sub->callback(std::bind(&TraceQueryCommand::run, std::move(cmd)));
	}

  protected:
	CLI::App *sub;
	LogQueryKit::query::TraceFilters filters{};

	static void run(std::shared_ptr<TraceQueryCommand> cmd)
	{
		const std::string query = LogQueryKit::query::build_trace_query(cmd->filters);
		printf("%s\n", query.c_str());
	}
};

static void init_function() noexcept
{
	auto [app, lock] = LogQueryKit::cmd::interface::acquireMainApp();
	LogQueryCommand::AddCommand(app);
	TraceQueryCommand::AddCommand(app);
}
COMMAND_INIT(init_function);
