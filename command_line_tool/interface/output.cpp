// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/output.hpp"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace LogQueryKit::cmd::interface
{

void Output::write_json(const rapidjson::Value &value, bool pretty)
{
	rapidjson::StringBuffer buffer;
	if (pretty) {
		rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
		value.Accept(writer);
	} else {
		rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
		value.Accept(writer);
	}
	write_line({buffer.GetString(), buffer.GetSize()});
}

FileOutput::~FileOutput()
{
	if (m_is_stdout)
		std::fflush(m_file);
	else
		std::fclose(m_file);
}

void FileOutput::write_line(std::string_view line)
{
	std::fwrite(line.data(), 1, line.size(), m_file);
	std::fputc('\n', m_file);
}

void FileOutput::flush()
{
	std::fflush(m_file);
}

std::unique_ptr<Output> create_output(const std::string &path)
{
	if (path.empty() || path == "-")
		return std::make_unique<FileOutput>(stdout, true);

	FILE *const file = std::fopen(path.c_str(), "w");
	if (file == nullptr)
		return nullptr;
	return std::make_unique<FileOutput>(file, false);
}

} // namespace LogQueryKit::cmd::interface
