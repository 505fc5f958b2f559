// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "LogQueryKit/sampling/SampleMode.hpp"
#include "LogQueryKit/sampling/Sampler.hpp"
#include "LogQueryKit/sampling/SearchPlan.hpp"
#include "commands/interface.hpp"
#include "commands/output.hpp"
#include "commands/records.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>

namespace rj = rapidjson;

using namespace LogQueryKit::cmd::interface;
using namespace LogQueryKit::sampling;

class SampleCommand
{
  public:
	static void AddCommand(CLI::App &parent)
	{
		auto cmd = std::make_shared<SampleCommand>();

		cmd->sub = parent.add_subcommand("sample", "Sample JSON lines log records");
		cmd->sub->description(
			"Read log records (one JSON object per line) from stdin or a file and keep\n"
			"at most --limit of them.\n"
			"  first   - the first records in input order\n"
			"  spread  - records at evenly spaced positions\n"
			"  diverse - the first record of every distinct message pattern\n\n"
			"JSON format: {\"id\": \"\", \"timestamp\": \"\", \"service\": \"\", \"host\": \"\", "
			"\"status\": \"\", \"message\": \"\", \"tags\": [], \"attributes\": {}}\n"
			"Only as many records as a search would fetch are considered, see --all.");

		cmd->sub
			->add_option("input_file", cmd->input_file,
						 "Input file path. Reads from stdin if not specified (use - for stdin)")
			->type_name("FILE");

		cmd->sub
			->add_option("-l,--limit", cmd->limit,
						 "Number of records to keep (default: --default-limit)")
			->check(CLI::NonNegativeNumber)
			->type_name("N");

		cmd->sub
			->add_option("-s,--sample", cmd->sample_str,
						 "Sampling mode: first, spread or diverse")
			->capture_default_str()
			->check(validator::SampleModeName{})
			->type_name("MODE");

		cmd->sub->add_flag("-c,--compact", cmd->compact,
						   "Strip custom attributes. Keeps id, timestamp, service, host, status,\n"
						   "message (truncated), trace and span ids, kubernetes tags, error info");

		cmd->sub->add_flag("--all", cmd->all,
						   "Sample every input record instead of only the fetch limit");

		cmd->sub->add_flag("-p,--pretty", cmd->pretty, "Pretty print the JSON");

		cmd->sub
			->add_option("-o,--output", cmd->output_path, "Write to this file instead of stdout")
			->type_name("FILE");

		cmd->sub->callback(std::bind(&SampleCommand::run, std::move(cmd)));
	}

  protected:
	CLI::App *sub;
	std::string input_file{};
	std::optional<size_t> limit{};
	std::string sample_str{"first"};
	bool compact{false};
	bool all{false};
	bool pretty{false};
	std::string output_path{};

	static LogRecordCollection read_input(const SampleCommand &cmd)
	{
		size_t skipped = 0;
		LogRecordCollection records;
		if (cmd.input_file.empty() || cmd.input_file == "-") {
			records = read_records(std::cin, skipped);
		} else {
			std::ifstream infile(cmd.input_file);
			if (!infile.is_open()) {
				throw CLI::RuntimeError("Failed to open input file: " + cmd.input_file, 1);
			}
			records = read_records(infile, skipped);
		}
		if (skipped > 0)
			log_info("Skipped ", skipped, " malformed lines");
		return records;
	}

	static void write_result(const SampleCommand &cmd, Output &out,
							 const SampleResult<LogRecord> &result, SampleMode mode,
							 size_t fetched)
	{
		rj::Document doc;
		doc.SetObject();
		auto &allocator = doc.GetAllocator();

		rj::Value logs;
		logs.SetArray();
		for (const auto &record : result.samples) {
			if (cmd.compact)
				logs.PushBack(to_json(to_compact(record), allocator), allocator);
			else
				logs.PushBack(to_json(record, allocator), allocator);
		}
		doc.AddMember("logs", logs, allocator);

		rj::Value meta;
		meta.SetObject();
		meta.AddMember("count", rj::Value(static_cast<uint64_t>(result.samples.size())),
					   allocator);
		meta.AddMember("compact", rj::Value(cmd.compact), allocator);
		const auto mode_name = to_string(mode);
		rj::Value sample;
		sample.SetString(mode_name.data(), static_cast<rj::SizeType>(mode_name.size()),
						 allocator);
		meta.AddMember("sample", sample, allocator);
		if (mode != SampleMode::First)
			meta.AddMember("fetched", rj::Value(static_cast<uint64_t>(fetched)), allocator);
		if (result.distinct_patterns)
			meta.AddMember("distinctPatterns",
						   rj::Value(static_cast<uint64_t>(*result.distinct_patterns)), allocator);
		doc.AddMember("meta", meta, allocator);

		out.write_json(doc, cmd.pretty);
		out.flush();
	}

	static void run(std::shared_ptr<SampleCommand> cmd)
	{
		const Limits &limits = get_limits();
		const SampleMode mode = parse_sample_mode(cmd->sample_str).value_or(SampleMode::First);
		const size_t requested = cmd->limit.value_or(limits.default_limit);

		LogRecordCollection records = read_input(*cmd);
		if (is_interrupted()) {
			log_info("Interrupted after ", records.size(), " records");
			return;
		}

		if (!cmd->all) {
			const size_t fetch = fetch_limit(requested, mode, limits);
			if (records.size() > fetch) {
				log_verbose("Considering the first ", fetch, " of ", records.size(), " records");
				records.resize(fetch);
			}
		}

		const auto result = LogQueryKit::sampling::select(records, requested, mode);
		log_verbose("Kept ", result.samples.size(), " of ", records.size(), " records (",
					to_string(mode), ")");

		const OutputFileGuard guard{cmd->output_path};
		auto out = create_output(cmd->output_path);
		if (!out)
			throw CLI::RuntimeError("Failed to open output file: " + cmd->output_path, 1);
		write_result(*cmd, *out, result, mode, records.size());
	}
};

static void init_function() noexcept
{
	auto [app, lock] = LogQueryKit::cmd::interface::acquireMainApp();
	SampleCommand::AddCommand(app);
}
COMMAND_INIT(init_function);
