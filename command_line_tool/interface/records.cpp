// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/records.hpp"
#include "commands/interface.hpp"
#include "LogQueryKit/query/TimeFormat.hpp"
#include "LogQueryKit/sampling/PatternNormalizer.hpp"
#include <initializer_list>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace rj = rapidjson;

using namespace std::string_literals;

namespace LogQueryKit::cmd::interface
{

static std::string string_member(const rj::Value &j, const char *name)
{
	if (j.HasMember(name) && j[name].IsString())
		return std::string(j[name].GetString(), j[name].GetStringLength());
	return "";
}

// ids are strings, some producers write them as numbers
static std::optional<std::string> scalar_string(const rj::Value &v)
{
	if (v.IsString())
		return std::string(v.GetString(), v.GetStringLength());
	if (v.IsUint64())
		return std::to_string(v.GetUint64());
	if (v.IsInt64())
		return std::to_string(v.GetInt64());
	return std::nullopt;
}

static void add_string(rj::Value &object, const char *name, std::string_view value,
					   rj::Document::AllocatorType &allocator)
{
	rj::Value v;
	v.SetString(value.data(), static_cast<rj::SizeType>(value.size()), allocator);
	object.AddMember(rj::StringRef(name), v, allocator);
}

static void keep_top_level_id(const rj::Value &j, rj::Document &attributes, const char *name,
							  const char *alias)
{
	if (!j.HasMember(name) || !scalar_string(j[name]).has_value())
		return;
	if (attributes.HasMember(name) || attributes.HasMember(alias))
		return;
	auto &allocator = attributes.GetAllocator();
	rj::Value key(name, allocator);
	rj::Value value(j[name], allocator);
	attributes.AddMember(key, value, allocator);
}

LogRecord parse_record(const rj::Value &j)
{
	if (!j.IsObject())
		throw std::runtime_error("record is not a JSON object");

	LogRecord record;
	if (j.HasMember("id")) {
		if (auto id = scalar_string(j["id"]))
			record.id = std::move(*id);
	}

	if (j.HasMember("timestamp") && j["timestamp"].IsInt64())
		record.timestamp = query::TimeFormat::iso8601(j["timestamp"].GetInt64());
	else
		record.timestamp = string_member(j, "timestamp");

	record.service = string_member(j, "service");
	record.host = string_member(j, "host");
	record.status = string_member(j, "status");
	record.message = string_member(j, "message");

	if (j.HasMember("tags") && j["tags"].IsArray()) {
		for (const auto &tag : j["tags"].GetArray()) {
			if (tag.IsString())
				record.tags.emplace_back(tag.GetString(), tag.GetStringLength());
		}
	}

	rj::Document attributes;
	attributes.SetObject();
	if (j.HasMember("attributes") && j["attributes"].IsObject())
		attributes.CopyFrom(j["attributes"], attributes.GetAllocator());
	keep_top_level_id(j, attributes, "dd.trace_id", "trace_id");
	keep_top_level_id(j, attributes, "dd.span_id", "span_id");
	record.attributes = to_json_string(attributes);

	return record;
}

LogRecord parse_record_line(const std::string &line)
{
	rj::Document doc;
	doc.Parse(line.c_str(), line.size());
	if (doc.HasParseError()) {
		throw std::runtime_error("JSON parse error: "s + rj::GetParseError_En(doc.GetParseError()) +
								 " at offset " + std::to_string(doc.GetErrorOffset()));
	}
	return parse_record(doc);
}

LogRecordCollection read_records(std::istream &input, size_t &skipped)
{
	LogRecordCollection records;
	skipped = 0;

	std::string line;
	size_t line_number = 0;
	while (!is_interrupted() && std::getline(input, line)) {
		++line_number;
		if (line.find_first_not_of(" \t\r") == std::string::npos)
			continue;
		try {
			records.push_back(parse_record_line(line));
		} catch (const std::runtime_error &e) {
			log_error("Skipping line ", line_number, ": ", e.what());
			++skipped;
		}
	}

	log_verbose("Read ", records.size(), " records from ", line_number, " lines");
	return records;
}

std::string find_tag_value(const std::vector<std::string> &tags, std::string_view prefix)
{
	for (const auto &tag : tags) {
		if (tag.size() > prefix.size() && tag.starts_with(prefix) && tag[prefix.size()] == ':')
			return tag.substr(prefix.size() + 1);
	}
	return "";
}

std::string truncate_with_ellipsis(std::string_view text, size_t max_chars)
{
	std::string truncated = sampling::truncate_utf8(text, max_chars);
	if (truncated.size() < text.size())
		truncated += "...";
	return truncated;
}

CompactRecord to_compact(const LogRecord &record)
{
	rj::Document attributes;
	attributes.Parse(record.attributes.c_str(), record.attributes.size());
	const bool has_attributes = !attributes.HasParseError() && attributes.IsObject();

	// first of the keys that is present wins
	const auto lookup = [&](std::initializer_list<const char *> keys) -> std::string {
		if (!has_attributes)
			return "";
		for (const char *key : keys) {
			if (!attributes.HasMember(key))
				continue;
			if (auto value = scalar_string(attributes[key]))
				return *value;
		}
		return "";
	};

	CompactRecord compact;
	compact.id = record.id;
	compact.timestamp = record.timestamp;
	compact.service = record.service;
	compact.host = record.host;
	compact.status = record.status;
	compact.message = truncate_with_ellipsis(record.message, COMPACT_MESSAGE_CHARS);
	compact.trace_id = lookup({"dd.trace_id", "trace_id"});
	compact.span_id = lookup({"dd.span_id", "span_id"});
	compact.pod_name = find_tag_value(record.tags, "pod_name");
	compact.kube_namespace = find_tag_value(record.tags, "kube_namespace");
	compact.container = find_tag_value(record.tags, "kube_container_name");

	const std::string error_type = lookup({"error.type", "error.kind"});
	const std::string error_message = lookup({"error.message", "error.msg"});
	if (!error_type.empty() || !error_message.empty()) {
		compact.error = ErrorSummary{
			error_type, truncate_with_ellipsis(error_message, COMPACT_ERROR_MESSAGE_CHARS)};
	}

	return compact;
}

rj::Value to_json(const LogRecord &record, rj::Document::AllocatorType &allocator)
{
	rj::Value obj;
	obj.SetObject();

	add_string(obj, "id", record.id, allocator);
	add_string(obj, "timestamp", record.timestamp, allocator);
	add_string(obj, "service", record.service, allocator);
	add_string(obj, "host", record.host, allocator);
	add_string(obj, "status", record.status, allocator);
	add_string(obj, "message", record.message, allocator);

	rj::Value tags;
	tags.SetArray();
	for (const auto &tag : record.tags) {
		rj::Value v;
		v.SetString(tag.data(), static_cast<rj::SizeType>(tag.size()), allocator);
		tags.PushBack(v, allocator);
	}
	obj.AddMember("tags", tags, allocator);

	rj::Document parsed;
	parsed.Parse(record.attributes.c_str(), record.attributes.size());
	rj::Value attributes;
	if (!parsed.HasParseError() && parsed.IsObject())
		attributes.CopyFrom(parsed, allocator);
	else
		attributes.SetObject();
	obj.AddMember("attributes", attributes, allocator);

	return obj;
}

rj::Value to_json(const CompactRecord &record, rj::Document::AllocatorType &allocator)
{
	rj::Value obj;
	obj.SetObject();

	add_string(obj, "id", record.id, allocator);
	add_string(obj, "timestamp", record.timestamp, allocator);
	add_string(obj, "service", record.service, allocator);
	add_string(obj, "host", record.host, allocator);
	add_string(obj, "status", record.status, allocator);
	add_string(obj, "message", record.message, allocator);
	add_string(obj, "traceId", record.trace_id, allocator);
	add_string(obj, "spanId", record.span_id, allocator);

	// kubernetes fields only when tagged
	if (!record.pod_name.empty())
		add_string(obj, "podName", record.pod_name, allocator);
	if (!record.kube_namespace.empty())
		add_string(obj, "namespace", record.kube_namespace, allocator);
	if (!record.container.empty())
		add_string(obj, "container", record.container, allocator);

	if (record.error) {
		rj::Value error;
		error.SetObject();
		add_string(error, "type", record.error->type, allocator);
		add_string(error, "message", record.error->message, allocator);
		obj.AddMember("error", error, allocator);
	}

	return obj;
}

std::string to_json_string(const rj::Value &value)
{
	rj::StringBuffer buffer;
	rj::Writer<rj::StringBuffer> writer(buffer);
	value.Accept(writer);
	return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace LogQueryKit::cmd::interface
