// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef SAMPLING_LIBRARY_LOG_RECORD_HEADER
#define SAMPLING_LIBRARY_LOG_RECORD_HEADER

#include <string>
#include <vector>

#include "LogQueryKit/query/Common.hpp"

namespace LogQueryKit::sampling {

	/**
	 * @brief One already fetched log line
	 *
	 * Only `message` is interpreted (by diverse sampling). `attributes` holds the
	 * backend's custom attributes as serialized JSON and is carried untouched.
	 */
	struct LQK_EXPORT LogRecord {
		std::string id;
		std::string timestamp;
		std::string service;
		std::string host;
		std::string status;
		std::string message;
		std::vector<std::string> tags;
		std::string attributes;

		bool operator==(const LogRecord &) const = default;
	};

	using LogRecordCollection = std::vector<LogRecord>;

} // namespace LogQueryKit::sampling

#endif
