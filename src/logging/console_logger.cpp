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

#include <kcenon/record_client/logging/console_logger.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace record_client::logging
{

using kcenon::common::interfaces::log_level;

namespace
{

// UTC, millisecond precision: 2025-06-01T09:14:07.412Z
std::string utc_timestamp()
{
	const auto now = std::chrono::system_clock::now();
	const auto seconds = std::chrono::system_clock::to_time_t(now);
	const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
							now.time_since_epoch())
							.count()
						% 1000;

	std::tm utc{};
#ifdef _WIN32
	gmtime_s(&utc, &seconds);
#else
	gmtime_r(&seconds, &utc);
#endif

	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
				  utc.tm_sec, static_cast<int>(millis));
	return buffer;
}

std::string_view base_name(std::string_view path)
{
	auto pos = path.find_last_of("/\\");
	return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace

console_logger::console_logger(log_level min_level, std::string instance, std::ostream* sink)
	: min_level_(min_level)
	, instance_(instance.empty() ? std::string("record_client") : std::move(instance))
	, sink_(sink)
{
}

kcenon::common::VoidResult console_logger::log(log_level level, const std::string& message)
{
	if (is_enabled(level))
	{
		emit(level, message, {}, 0);
	}
	return kcenon::common::ok();
}

kcenon::common::VoidResult console_logger::log(log_level level,
											   std::string_view message,
											   const kcenon::common::source_location& loc)
{
	if (is_enabled(level))
	{
		emit(level, message, loc.file_name(), static_cast<int>(loc.line()));
	}
	return kcenon::common::ok();
}

kcenon::common::VoidResult console_logger::log(const kcenon::common::interfaces::log_entry& entry)
{
	if (is_enabled(entry.level))
	{
		emit(entry.level, entry.message, entry.file, entry.line);
	}
	return kcenon::common::ok();
}

bool console_logger::is_enabled(log_level level) const
{
	return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

kcenon::common::VoidResult console_logger::set_level(log_level level)
{
	min_level_.store(level);
	return kcenon::common::ok();
}

log_level console_logger::get_level() const
{
	return min_level_.load();
}

kcenon::common::VoidResult console_logger::flush()
{
	std::lock_guard<std::mutex> lock(write_mutex_);
	if (sink_)
	{
		sink_->flush();
	}
	else
	{
		std::cout.flush();
		std::cerr.flush();
	}
	return kcenon::common::ok();
}

std::ostream& console_logger::stream_for(log_level level) const
{
	if (sink_)
	{
		return *sink_;
	}
	return level >= log_level::warning ? std::cerr : std::cout;
}

void console_logger::emit(log_level level,
						  std::string_view message,
						  std::string_view file,
						  int line)
{
	std::string text = utc_timestamp();
	text += ' ';

	auto tag = level_tag(level);
	text.append(tag);
	text.append(tag.size() < 5 ? 5 - tag.size() : 0, ' ');
	text += ' ';
	text += instance_;
	text += " | ";
	text.append(message);

	if (!file.empty())
	{
		text += " (";
		text.append(base_name(file));
		text += ':';
		text += std::to_string(line);
		text += ')';
	}
	text += '\n';

	std::lock_guard<std::mutex> lock(write_mutex_);
	stream_for(level) << text;
	lines_written_.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	log_level min_level, std::string instance, std::ostream* sink)
{
	return std::make_shared<console_logger>(min_level, std::move(instance), sink);
}

std::optional<log_level> parse_log_level(std::string_view name)
{
	if (name == "debug")
		return log_level::debug;
	if (name == "info")
		return log_level::info;
	if (name == "warn" || name == "warning")
		return log_level::warning;
	if (name == "error")
		return log_level::error;
	return std::nullopt;
}

std::string_view level_tag(log_level level)
{
	if (level == log_level::debug)
		return "DEBUG";
	if (level == log_level::info)
		return "INFO";
	if (level == log_level::warning)
		return "WARN";
	if (level == log_level::error)
		return "ERROR";
	return level < log_level::debug ? "TRACE" : "CRIT";
}

void log_message(const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger,
				 log_level level,
				 const std::string& message)
{
	if (!logger || !logger->is_enabled(level))
	{
		return;
	}

	[[maybe_unused]] auto result = logger->log(level, message);
}

} // namespace record_client::logging
