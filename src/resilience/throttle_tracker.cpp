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

#include <kcenon/record_client/resilience/throttle_tracker.h>

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/logging/console_logger.h>

#include <algorithm>
#include <mutex>

namespace record_client::resilience
{

using kcenon::common::interfaces::log_level;

kcenon::common::VoidResult throttle_tracker::record_throttle(
	const std::string& name, std::chrono::milliseconds retry_after)
{
	if (name.empty())
	{
		return make_error(error_code::validation_failure,
						  "Throttle recorded without a connection name",
						  "throttle_tracker");
	}

	if (retry_after.count() < 0)
	{
		retry_after = std::chrono::milliseconds(0);
	}

	auto now = clock::now();
	auto expiry = now + retry_after;
	clock::time_point effective;

	{
		std::unique_lock<std::shared_mutex> lock(entries_mutex_);
		prune_expired_locked(now);

		auto& stored = expiries_[name];
		stored = std::max(stored, expiry);
		effective = stored;
	}

	total_events_.fetch_add(1, std::memory_order_relaxed);
	total_backoff_ms_.fetch_add(retry_after.count(), std::memory_order_relaxed);

	auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(effective - now);
	logging::log_message(get_logger(), log_level::warning,
						 "Connection " + name + " throttled, retry after "
							 + std::to_string(retry_after.count()) + "ms, expires in "
							 + std::to_string(remaining.count()) + "ms");

	return kcenon::common::ok();
}

bool throttle_tracker::is_throttled(const std::string& name) const
{
	return expiry_of(name).has_value();
}

std::optional<throttle_tracker::clock::time_point> throttle_tracker::expiry_of(
	const std::string& name) const
{
	if (name.empty())
	{
		return std::nullopt;
	}

	std::shared_lock<std::shared_mutex> lock(entries_mutex_);

	auto it = expiries_.find(name);
	if (it == expiries_.end() || it->second <= clock::now())
	{
		return std::nullopt;
	}

	return it->second;
}

void throttle_tracker::clear(const std::string& name)
{
	size_t removed = 0;
	{
		std::unique_lock<std::shared_mutex> lock(entries_mutex_);
		removed = expiries_.erase(name);
	}

	if (removed > 0)
	{
		logging::log_message(get_logger(), log_level::info, "Throttle cleared for " + name);
	}
}

std::chrono::milliseconds throttle_tracker::shortest_expiry() const
{
	std::shared_lock<std::shared_mutex> lock(entries_mutex_);

	auto now = clock::now();
	std::optional<clock::time_point> earliest;
	for (const auto& [name, expiry] : expiries_)
	{
		if (expiry > now && (!earliest || expiry < *earliest))
		{
			earliest = expiry;
		}
	}

	if (!earliest)
	{
		return std::chrono::milliseconds(0);
	}

	// Round up so a wait of this length always reaches the expiry
	auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*earliest - now);
	return std::max(remaining, std::chrono::milliseconds(1));
}

size_t throttle_tracker::throttled_count() const
{
	std::shared_lock<std::shared_mutex> lock(entries_mutex_);

	auto now = clock::now();
	return static_cast<size_t>(std::count_if(expiries_.begin(), expiries_.end(),
											 [now](const auto& entry)
											 { return entry.second > now; }));
}

std::vector<std::string> throttle_tracker::throttled_names() const
{
	std::shared_lock<std::shared_mutex> lock(entries_mutex_);

	auto now = clock::now();
	std::vector<std::string> names;
	for (const auto& [name, expiry] : expiries_)
	{
		if (expiry > now)
		{
			names.push_back(name);
		}
	}

	std::sort(names.begin(), names.end());
	return names;
}

size_t throttle_tracker::cleanup()
{
	std::unique_lock<std::shared_mutex> lock(entries_mutex_);
	return prune_expired_locked(clock::now());
}

uint64_t throttle_tracker::total_events() const noexcept
{
	return total_events_.load(std::memory_order_relaxed);
}

std::chrono::milliseconds throttle_tracker::total_backoff_time() const noexcept
{
	return std::chrono::milliseconds(total_backoff_ms_.load(std::memory_order_relaxed));
}

void throttle_tracker::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

std::shared_ptr<kcenon::common::interfaces::ILogger> throttle_tracker::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

size_t throttle_tracker::prune_expired_locked(clock::time_point now)
{
	size_t removed = 0;
	for (auto it = expiries_.begin(); it != expiries_.end();)
	{
		if (it->second <= now)
		{
			it = expiries_.erase(it);
			++removed;
		}
		else
		{
			++it;
		}
	}
	return removed;
}

} // namespace record_client::resilience
