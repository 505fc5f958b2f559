// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/query/Duration.hpp"
#include "LogQueryKit/query/TimeExpression.hpp"
#include "LogQueryKit/query/TimeFormat.hpp"
#include "LogQueryKit/query/TimeRange.hpp"
#include "LogQueryKit/sampling/SearchPlan.hpp"
#include "commands/filter.hpp"
#include "commands/interface.hpp"
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

using namespace LogQueryKit::cmd::interface;
using namespace LogQueryKit::query;

static void print_seconds(int64_t seconds, bool iso)
{
	if (iso)
		printf("%s\n", TimeFormat::iso8601(seconds).c_str());
	else
		printf("%ld\n", static_cast<long>(seconds));
}

static void add_time_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("time", "Resolve a time expression to epoch seconds");
	command->description("Resolve a relative, clock or absolute time expression to epoch seconds.\n"
						 "Expressions that match no grammar resolve to the default.");

	static std::string expression{};
	command->add_option("expression", expression, "Time expression, e.g. 2h, 3d@11:45, 2024-01-15")
		->required()
		->type_name("EXPR");

	static std::optional<int64_t> default_value{};
	command
		->add_option("-d,--default", default_value,
					 "Epoch seconds to use when the expression does not parse (default: now)")
		->type_name("SECONDS");

	static bool iso = false;
	command->add_flag("--iso", iso, "Print ISO 8601 instead of epoch seconds");

	command->callback([&]() {
		const Clock &clock = get_clock();
		const TimeExpressionParser parser{clock};
		const TimeResult result = parser.evaluate(expression, default_value.value_or(clock.now()));

		if (result.fell_back())
			log_verbose("'", expression, "' matched no grammar, using the default");
		else
			log_verbose("'", expression, "' parsed as ", to_string(result.grammar));

		print_seconds(result.seconds, iso);
	});
}

static void add_range_command(CLI::App &app)
{
	CLI::App *const command = app.add_subcommand("range", "Resolve and validate a time range");
	command->description("Resolve --from and --to and normalize them into a range:\n"
						 "reversed bounds are swapped, short ranges are widened to --min-span.");

	static std::string from_str{};
	static std::string to_str{};
	add_time_range_options(command, from_str, to_str);

	static int64_t min_span = DEFAULT_MIN_SPAN_SECONDS;
	command->add_option("--min-span", min_span, "Minimum width of the range in seconds")
		->capture_default_str()
		->type_name("SECONDS");

	static bool iso = false;
	command->add_flag("--iso", iso, "Print ISO 8601 instead of epoch seconds");

	command->callback([&]() {
		const Clock &clock = get_clock();
		const TimeRange defaults = LogQueryKit::sampling::default_range(get_limits(), clock);
		const TimeExpressionParser parser{clock};
		const TimeResult from = parser.evaluate(to_expression_input(from_str), defaults.from);
		const TimeResult to = parser.evaluate(to_expression_input(to_str), defaults.to);
		const TimeRange range = ensure_valid_range(from.seconds, to.seconds, min_span);

		if (range.from != from.seconds || range.to != to.seconds)
			log_verbose("range adjusted from [", from.seconds, ", ", to.seconds, "]");

		if (iso)
			printf("%s %s\n", TimeFormat::iso8601(range.from).c_str(),
				   TimeFormat::iso8601(range.to).c_str());
		else
			printf("%ld %ld\n", static_cast<long>(range.from), static_cast<long>(range.to));
	});
}

static void add_duration_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("duration", "Convert a duration expression to nanoseconds");
	command->description("Convert a duration such as 500ms, 1.5s or 2m to nanoseconds.\n"
						 "Exits with 1 if the duration cannot be parsed.");

	static std::string expression{};
	command->add_option("expression", expression, "Duration expression")
		->required()
		->type_name("DURATION");

	static bool human = false;
	command->add_flag("-H,--human", human, "Print a short human readable duration");

	command->callback([&]() {
		const auto ns = parse_duration_ns(expression);
		if (!ns) {
			log_error("invalid duration: '", expression, "'");
			throw CLI::RuntimeError(1);
		}
		if (human)
			printf("%s\n", TimeFormat::duration_ns(*ns).c_str());
		else
			printf("%ld\n", static_cast<long>(*ns));
	});
}

static void init_function() noexcept
{
	auto [app, lock] = LogQueryKit::cmd::interface::acquireMainApp();
	add_time_command(app);
	add_range_command(app);
	add_duration_command(app);
}
COMMAND_INIT(init_function);
