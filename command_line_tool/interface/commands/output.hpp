// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef LQK_CMD_OUTPUT_HPP
#define LQK_CMD_OUTPUT_HPP

#include <cstdio>
#include <memory>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

namespace LogQueryKit::cmd::interface
{

/**
 * @brief Destination of a command result
 *
 * Results are written as whole lines to stdout or to the file
 * selected with -o/--output.
 */
class Output
{
  public:
	virtual ~Output() = default;
	virtual void write_line(std::string_view line) = 0;
	virtual void flush() = 0;
	virtual bool is_stdout() const = 0;

	// one JSON document per line unless pretty printed
	void write_json(const rapidjson::Value &value, bool pretty);
};

/**
 * @brief Output to a FILE*, closed on destruction unless it is stdout
 */
class FileOutput : public Output
{
  public:
	FileOutput(FILE *file, bool is_stdout) : m_file(file), m_is_stdout(is_stdout) {}
	~FileOutput() override;

	FileOutput(const FileOutput &) = delete;
	FileOutput &operator=(const FileOutput &) = delete;

	void write_line(std::string_view line) override;
	void flush() override;
	bool is_stdout() const override { return m_is_stdout; }

  private:
	FILE *m_file;
	bool m_is_stdout;
};

/**
 * @brief Open the result destination
 *
 * @param path Output path ("" or "-" for stdout), an existing file is truncated
 * @return Output instance, or nullptr if the file could not be opened
 */
std::unique_ptr<Output> create_output(const std::string &path);

} // namespace LogQueryKit::cmd::interface

#endif // LQK_CMD_OUTPUT_HPP
