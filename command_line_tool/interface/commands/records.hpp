// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef _lqk_cmd_records_HEADER__
#define _lqk_cmd_records_HEADER__

#include <cstddef>
#include <istream>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <vector>

#include "LogQueryKit/sampling/LogRecord.hpp"

namespace LogQueryKit::cmd::interface
{

using sampling::LogRecord;
using sampling::LogRecordCollection;

constexpr size_t COMPACT_MESSAGE_CHARS = 500;
constexpr size_t COMPACT_ERROR_MESSAGE_CHARS = 200;

/**
 * @brief Parse one JSON record object
 *
 * JSON format: {"id": "", "timestamp": "", "service": "", "host": "", "status": "",
 * "message": "", "tags": ["k:v"], "attributes": {}}
 * Every key is optional. An integer timestamp is taken as epoch seconds and
 * rendered as ISO 8601. Top level "dd.trace_id" / "dd.span_id" keys are kept in
 * the attributes unless the attributes already carry a trace / span id.
 *
 * @throws std::runtime_error if the value is not a JSON object
 */
LogRecord parse_record(const rapidjson::Value &json);

// @throws std::runtime_error on malformed JSON
LogRecord parse_record_line(const std::string &line);

/**
 * @brief Read JSON lines records until end of input or interrupt
 *
 * Blank lines are ignored. Malformed lines are logged and skipped.
 *
 * @param input Stream with one JSON object per line
 * @param skipped [out] number of skipped lines
 */
LogRecordCollection read_records(std::istream &input, size_t &skipped);

struct ErrorSummary {
	std::string type;
	std::string message;

	bool operator==(const ErrorSummary &) const = default;
};

/**
 * @brief Record reduced to the fields needed for an investigation
 *
 * Custom attributes are dropped except for trace correlation ids and error details.
 */
struct CompactRecord {
	std::string id;
	std::string timestamp;
	std::string service;
	std::string host;
	std::string status;
	std::string message; // at most COMPACT_MESSAGE_CHARS characters plus "..."
	std::string trace_id;
	std::string span_id;
	std::string pod_name;	   // from pod_name:<value> tag
	std::string kube_namespace; // from kube_namespace:<value> tag
	std::string container;	   // from kube_container_name:<value> tag
	std::optional<ErrorSummary> error;
};

CompactRecord to_compact(const LogRecord &record);

// value of the first "<prefix>:<value>" tag, empty if there is none
std::string find_tag_value(const std::vector<std::string> &tags, std::string_view prefix);

// text cut to max_chars characters with "..." appended, unchanged if it already fits
std::string truncate_with_ellipsis(std::string_view text, size_t max_chars);

rapidjson::Value to_json(const LogRecord &record, rapidjson::Document::AllocatorType &allocator);
rapidjson::Value to_json(const CompactRecord &record,
						 rapidjson::Document::AllocatorType &allocator);

std::string to_json_string(const rapidjson::Value &value);

} // namespace LogQueryKit::cmd::interface

#endif // _lqk_cmd_records_HEADER__
