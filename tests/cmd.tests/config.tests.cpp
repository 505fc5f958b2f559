// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <variant>

#include "commands/filter.hpp"
#include "commands/interface.hpp"
#include "commands/output.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace LogQueryKit::cmd::interface;
namespace fs = std::filesystem;

// =============================================================================
// Configuration
// =============================================================================

class ConfigTest : public ::testing::Test
{
  protected:
	void TearDown() override
	{
		reset_configuration();
		set_verbosity(Verbosity::normal);
	}
};

TEST_F(ConfigTest, BuiltInDefaults)
{
	reset_configuration();
	EXPECT_EQ(get_limits().default_limit, 25u);
	EXPECT_EQ(get_limits().max_log_lines, 100u);
	EXPECT_EQ(get_limits().default_time_range_hours, 24);
}

TEST_F(ConfigTest, SettersOverrideDefaults)
{
	set_default_limit(10);
	set_max_log_lines(1000);
	set_default_time_range_hours(6);
	EXPECT_EQ(get_limits().default_limit, 10u);
	EXPECT_EQ(get_limits().max_log_lines, 1000u);
	EXPECT_EQ(get_limits().default_time_range_hours, 6);

	reset_configuration();
	EXPECT_EQ(get_limits().default_limit, 25u);
}

TEST_F(ConfigTest, FrozenClock)
{
	set_frozen_now(1710498600);
	EXPECT_EQ(get_clock().now(), 1710498600);

	set_frozen_now(42);
	EXPECT_EQ(get_clock().now(), 42);

	reset_configuration();
	EXPECT_GT(get_clock().now(), 1700000000);
}

TEST_F(ConfigTest, Verbosity)
{
	set_verbosity(Verbosity::quiet);
	EXPECT_TRUE(is_quiet());
	EXPECT_FALSE(is_verbose());

	set_verbosity(Verbosity::verbose);
	EXPECT_FALSE(is_quiet());
	EXPECT_TRUE(is_verbose());
}

TEST_F(ConfigTest, OutputFileGuard)
{
	{
		OutputFileGuard guard{"/tmp/result.json"};
		EXPECT_EQ(get_current_output_file(), "/tmp/result.json");
	}
	EXPECT_EQ(get_current_output_file(), "");
}

// =============================================================================
// Validators
// =============================================================================

class ValidatorTest : public ::testing::Test
{
};

TEST_F(ValidatorTest, SampleModeName)
{
	const validator::SampleModeName check;
	EXPECT_EQ(check("first"), "");
	EXPECT_EQ(check("spread"), "");
	EXPECT_EQ(check("diverse"), "");
	EXPECT_NE(check("random"), "");
	EXPECT_NE(check("FIRST"), "");
}

TEST_F(ValidatorTest, HttpStatusFilter)
{
	const validator::HttpStatusFilter check;
	for (const char *valid : {"404", "5xx", "2XX", ">=500", "<=399", ">400", "<300"})
		EXPECT_EQ(check(valid), "") << valid;
	for (const char *invalid : {"", "5x", "40", "4044", "=>500", "abc", "5xx "})
		EXPECT_NE(check(invalid), "") << invalid;
}

TEST_F(ValidatorTest, DurationExpression)
{
	const validator::DurationExpression check;
	for (const char *valid : {"500ms", "1.5s", "2m", "250us", "1000000", "1h"})
		EXPECT_EQ(check(valid), "") << valid;
	for (const char *invalid : {"", "fast", "-1s", "1.5.2s"})
		EXPECT_NE(check(invalid), "") << invalid;
}

// =============================================================================
// Filter options
// =============================================================================

class FilterOptionsTest : public ::testing::Test
{
  protected:
	CLI::App app{"filter options"};
};

TEST_F(FilterOptionsTest, LogFilters)
{
	LogQueryKit::query::LogFilters filters;
	add_log_filter_options(&app, filters);
	app.parse(R"(--keyword "connection reset" --service web --status error)");

	EXPECT_EQ(filters.keyword, "connection reset");
	EXPECT_EQ(filters.service, "web");
	EXPECT_EQ(filters.status, "error");
	EXPECT_EQ(filters.host, "");
	EXPECT_EQ(LogQueryKit::query::build_log_query(filters),
			  "\"connection reset\" service:web status:error");
}

TEST_F(FilterOptionsTest, TraceFilters)
{
	LogQueryKit::query::TraceFilters filters;
	add_trace_filter_options(&app, filters);
	app.parse("--service api --min-duration 500ms --http-status 5xx --status error");

	EXPECT_EQ(filters.service, "api");
	EXPECT_EQ(filters.min_duration, "500ms");
	EXPECT_EQ(filters.http_status, "5xx");
	EXPECT_EQ(filters.status, "error");
}

TEST_F(FilterOptionsTest, TraceFiltersRejectInvalidValues)
{
	LogQueryKit::query::TraceFilters filters;
	add_trace_filter_options(&app, filters);
	EXPECT_THROW(app.parse("--http-status 5x"), CLI::ValidationError);

	app.clear();
	EXPECT_THROW(app.parse("--min-duration soon"), CLI::ValidationError);

	app.clear();
	EXPECT_THROW(app.parse("--status maybe"), CLI::ValidationError);
}

TEST_F(FilterOptionsTest, TimeRange)
{
	std::string from, to;
	add_time_range_options(&app, from, to);
	app.parse("--from 2h");

	EXPECT_EQ(from, "2h");
	EXPECT_EQ(to, "");
	EXPECT_EQ(std::get<std::string>(to_expression_input(from)), "2h");
	EXPECT_TRUE(std::holds_alternative<std::monostate>(to_expression_input(to)));
}

// =============================================================================
// Output
// =============================================================================

class OutputTest : public ::testing::Test
{
  protected:
	fs::path path;

	void SetUp() override
	{
		path = fs::temp_directory_path() / ("lqk_output_test_" + std::to_string(getpid()) + ".json");
	}

	void TearDown() override
	{
		std::error_code ec;
		fs::remove(path, ec);
	}

	std::string read_back(void) const
	{
		std::ifstream in(path);
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}
};

TEST_F(OutputTest, StdoutForEmptyOrDash)
{
	for (const char *target : {"", "-"}) {
		auto output = create_output(target);
		ASSERT_NE(output, nullptr);
		EXPECT_TRUE(output->is_stdout());
	}
}

TEST_F(OutputTest, WritesFile)
{
	{
		auto output = create_output(path.string());
		ASSERT_NE(output, nullptr);
		EXPECT_FALSE(output->is_stdout());
		output->write_line("first line");

		rapidjson::Document doc;
		doc.SetObject();
		doc.AddMember("count", 3, doc.GetAllocator());
		output->write_json(doc, false);
	}
	EXPECT_EQ(read_back(), "first line\n{\"count\":3}\n");
}

TEST_F(OutputTest, UnopenablePath)
{
	EXPECT_EQ(create_output("/nonexistent-directory/out.json"), nullptr);
}
