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
 * @file throttle_tracker.h
 * @brief Per-connection rate-limit state
 *
 * Maps a connection source name to the time its service protection
 * throttle expires. Shared by the pool, every pooled client and the
 * bulk engine's pre-flight guard.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace record_client::resilience
{

/**
 * @class throttle_tracker
 * @brief Tracks throttle expiry per connection name
 *
 * Entries are only ever extended. A record_throttle() whose expiry falls
 * before the stored one leaves the stored expiry in place, so a stale
 * response cannot shorten an active throttle.
 *
 * Expired entries read as not throttled and are removed on the next write
 * or cleanup() call.
 *
 * Thread Safety:
 * - Reads take a shared lock, writes an exclusive lock
 * - Counters are atomic
 *
 * @code
 * auto tracker = std::make_shared<throttle_tracker>();
 * tracker->record_throttle("app-user@org", std::chrono::seconds(30));
 * if (tracker->is_throttled("app-user@org")) { ... }
 * @endcode
 */
class throttle_tracker
{
public:
	using clock = std::chrono::steady_clock;

	throttle_tracker() = default;
	~throttle_tracker() = default;

	throttle_tracker(const throttle_tracker&) = delete;
	throttle_tracker& operator=(const throttle_tracker&) = delete;

	/**
	 * @brief Record a throttle for a connection
	 * @param name Connection source name
	 * @param retry_after Delay the service asked for
	 * @return Error if the name is empty
	 */
	kcenon::common::VoidResult record_throttle(const std::string& name,
											   std::chrono::milliseconds retry_after);

	/**
	 * @brief Check whether a connection is currently throttled
	 */
	[[nodiscard]] bool is_throttled(const std::string& name) const;

	/**
	 * @brief Get the active throttle expiry for a connection
	 * @return Expiry, or std::nullopt when not throttled
	 */
	[[nodiscard]] std::optional<clock::time_point> expiry_of(const std::string& name) const;

	/**
	 * @brief Remove the throttle for a connection
	 */
	void clear(const std::string& name);

	/**
	 * @brief Time until the earliest active throttle expires
	 * @return Zero when nothing is throttled
	 */
	[[nodiscard]] std::chrono::milliseconds shortest_expiry() const;

	/**
	 * @brief Number of connections currently throttled
	 */
	[[nodiscard]] size_t throttled_count() const;

	/**
	 * @brief Names of connections currently throttled
	 */
	[[nodiscard]] std::vector<std::string> throttled_names() const;

	/**
	 * @brief Remove expired entries
	 * @return Number of entries removed
	 */
	size_t cleanup();

	/**
	 * @brief Total throttle events recorded
	 */
	[[nodiscard]] uint64_t total_events() const noexcept;

	/**
	 * @brief Sum of all retry-after delays recorded
	 */
	[[nodiscard]] std::chrono::milliseconds total_backoff_time() const noexcept;

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;

private:
	size_t prune_expired_locked(clock::time_point now);

	mutable std::shared_mutex entries_mutex_;
	std::unordered_map<std::string, clock::time_point> expiries_;

	std::atomic<uint64_t> total_events_{ 0 };
	std::atomic<int64_t> total_backoff_ms_{ 0 };

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace record_client::resilience
