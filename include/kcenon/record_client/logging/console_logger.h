// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file console_logger.h
 * @brief Console ILogger for record_client and the null-safe logging helpers
 *
 * The pool, the registry and the bulk engine all take an optional
 * kcenon::common::interfaces::ILogger. console_logger is the one the
 * configuration builds (see client_config::create_logger()); callers with
 * their own logging stack inject theirs instead.
 *
 * Each line names the client instance it came from, so several pools in
 * one process can share a terminal:
 * @code
 *   2025-06-01T09:14:07.412Z WARN  migrate-east | Throttle recorded for svc-a@org (retry after 30000ms)
 * @endcode
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace record_client::logging
{

/**
 * @class console_logger
 * @brief Line-oriented logger tagged with a client instance name
 *
 * Without a sink, warning and above go to stderr and the rest to stdout.
 * With a sink every line goes there.
 *
 * Thread Safety:
 * - Lines are written whole under one mutex
 * - The level may change while other threads log
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	/**
	 * @param min_level Lowest level written
	 * @param instance Tag printed on every line
	 * @param sink Optional stream receiving every line (not owned)
	 */
	explicit console_logger(
		kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info,
		std::string instance = "record_client",
		std::ostream* sink = nullptr);

	~console_logger() override = default;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

	const std::string& instance() const { return instance_; }

	/// Lines written since construction
	uint64_t lines_written() const { return lines_written_.load(); }

private:
	void emit(kcenon::common::interfaces::log_level level,
			  std::string_view message,
			  std::string_view file,
			  int line);

	std::ostream& stream_for(kcenon::common::interfaces::log_level level) const;

	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	std::string instance_;
	std::ostream* sink_;
	std::atomic<uint64_t> lines_written_{ 0 };
	std::mutex write_mutex_;
};

/**
 * @brief Build a console logger behind the ILogger interface
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	kcenon::common::interfaces::log_level min_level
	= kcenon::common::interfaces::log_level::info,
	std::string instance = "record_client",
	std::ostream* sink = nullptr);

/**
 * @brief Parse a configuration level name
 * @param name One of "debug", "info", "warn" (or "warning"), "error"
 * @return Matching level, or std::nullopt for unknown names
 */
std::optional<kcenon::common::interfaces::log_level> parse_log_level(std::string_view name);

/**
 * @brief Short upper-case name used in log lines ("DEBUG", "INFO", "WARN", ...)
 */
std::string_view level_tag(kcenon::common::interfaces::log_level level);

/**
 * @brief Log through an optional logger
 *
 * Does nothing when @p logger is null or the level is disabled.
 */
void log_message(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
				 kcenon::common::interfaces::log_level level,
				 const std::string& message);

} // namespace record_client::logging
