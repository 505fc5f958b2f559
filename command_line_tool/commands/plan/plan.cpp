// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/sampling/SampleMode.hpp"
#include "LogQueryKit/sampling/SearchPlan.hpp"
#include "commands/filter.hpp"
#include "commands/interface.hpp"
#include "commands/output.hpp"
#include <cstddef>
#include <optional>
#include <rapidjson/document.h>
#include <string>

using namespace LogQueryKit::cmd::interface;
using namespace LogQueryKit::sampling;

static void add_range_members(rapidjson::Value &obj, const TimeRange &range,
							  const std::string &from_iso, const std::string &to_iso,
							  rapidjson::Document::AllocatorType &allocator)
{
	rapidjson::Value from;
	from.SetString(from_iso.c_str(), allocator);
	obj.AddMember("from", from, allocator);

	rapidjson::Value to;
	to.SetString(to_iso.c_str(), allocator);
	obj.AddMember("to", to, allocator);

	obj.AddMember("from_epoch", rapidjson::Value(static_cast<int64_t>(range.from)), allocator);
	obj.AddMember("to_epoch", rapidjson::Value(static_cast<int64_t>(range.to)), allocator);
}

static void print_search_plan(Output &out, const SearchPlan &plan, bool pretty)
{
	rapidjson::Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	rapidjson::Value query;
	query.SetString(plan.query.c_str(), allocator);
	doc.AddMember("query", query, allocator);

	add_range_members(doc, plan.range, plan.from_iso, plan.to_iso, allocator);
	doc.AddMember("from_defaulted", rapidjson::Value(plan.from_defaulted), allocator);
	doc.AddMember("to_defaulted", rapidjson::Value(plan.to_defaulted), allocator);

	doc.AddMember("limit", rapidjson::Value(static_cast<uint64_t>(plan.requested_limit)),
				  allocator);
	doc.AddMember("fetch_limit", rapidjson::Value(static_cast<uint64_t>(plan.fetch_limit)),
				  allocator);

	const auto mode = to_string(plan.mode);
	rapidjson::Value sample;
	sample.SetString(mode.data(), static_cast<rapidjson::SizeType>(mode.size()), allocator);
	doc.AddMember("sample", sample, allocator);

	out.write_json(doc, pretty);
}

static void print_aggregate_plan(Output &out, const AggregatePlan &plan, bool pretty)
{
	rapidjson::Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	rapidjson::Value query;
	query.SetString(plan.query.c_str(), allocator);
	doc.AddMember("query", query, allocator);

	add_range_members(doc, plan.range, plan.from_iso, plan.to_iso, allocator);

	out.write_json(doc, pretty);
}

static void add_plan_command(CLI::App &app)
{
	CLI::App *const command = app.add_subcommand("plan", "Plan a log search as JSON");
	command->description(
		"Resolve the time range, compose the query and compute how many records\n"
		"to fetch for the requested sampling mode. Spread and diverse sampling\n"
		"fetch up to 4 times the limit, capped by --max-log-lines.");

	static LogQueryKit::query::LogFilters filters{};
	add_log_filter_options(command, filters);

	static std::string from_str{};
	static std::string to_str{};
	add_time_range_options(command, from_str, to_str);

	static std::optional<size_t> limit{};
	command
		->add_option("-l,--limit", limit, "Number of records wanted (default: --default-limit)")
		->check(CLI::NonNegativeNumber)
		->type_name("N");

	static std::string sample_str{};
	command
		->add_option("-s,--sample", sample_str,
					 "Sampling mode: first, spread or diverse (default: first)")
		->check(validator::SampleModeName{})
		->type_name("MODE");

	static bool aggregate = false;
	command->add_flag("-a,--aggregate", aggregate,
					  "Plan an aggregation instead: only --query and the time range apply");

	static bool pretty = false;
	command->add_flag("-p,--pretty", pretty, "Pretty print the JSON");

	static std::string output_path{};
	command->add_option("-o,--output", output_path, "Write to this file instead of stdout")
		->type_name("FILE");

	command->callback([&]() {
		auto out = create_output(output_path);
		if (!out)
			throw CLI::RuntimeError("Failed to open output file: " + output_path, 1);

		if (aggregate) {
			AggregateRequest request;
			request.query = filters.query;
			request.from = to_expression_input(from_str);
			request.to = to_expression_input(to_str);
			print_aggregate_plan(*out, plan_aggregate(request, get_limits(), get_clock()), pretty);
			return;
		}

		SearchRequest request;
		request.filters = filters;
		request.from = to_expression_input(from_str);
		request.to = to_expression_input(to_str);
		request.limit = limit;
		if (!sample_str.empty())
			request.mode = parse_sample_mode(sample_str);

		const SearchPlan plan = plan_search(request, get_limits(), get_clock());
		if (plan.from_defaulted)
			log_verbose("--from not given or not parsed, using ", plan.from_iso);
		if (plan.to_defaulted)
			log_verbose("--to not given or not parsed, using ", plan.to_iso);
		print_search_plan(*out, plan, pretty);
	});
}

static void init_function() noexcept
{
	auto [app, lock] = LogQueryKit::cmd::interface::acquireMainApp();
	add_plan_command(app);
}
COMMAND_INIT(init_function);
