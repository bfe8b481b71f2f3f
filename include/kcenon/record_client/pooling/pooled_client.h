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
 * @file pooled_client.h
 * @brief Checked-out client handed out by connection_pool::acquire
 *
 * A pooled_client wraps one cloned service_handle. Every call through it
 * records rate-limit faults on the shared throttle_tracker before the fault
 * is returned; the decorator itself never retries.
 *
 * The client refers back to its pool through a weak_ptr. That reference is
 * a relation, not ownership: a client outliving its pool is simply
 * disposed on release.
 */

#pragma once

#include <kcenon/record_client/core/record_service.h>
#include <kcenon/record_client/resilience/throttle_tracker.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <kcenon/common/patterns/result.h>

namespace record_client::pooling
{

class connection_pool;

/// Fallback throttle duration when the service gives no retry-after
inline constexpr std::chrono::seconds default_retry_after{ 30 };

/**
 * @struct pooled_connection
 * @brief One cloned handle plus its bookkeeping
 *
 * Lives in a source's idle queue while not checked out.
 */
struct pooled_connection
{
	using clock = std::chrono::steady_clock;

	std::string connection_id;   ///< "<source>#<n>", process unique
	std::string source_name;     ///< Owning source for the whole lifetime
	std::unique_ptr<service_handle> handle;
	std::string default_caller_id; ///< Caller id restored on release
	clock::time_point created_at;
	clock::time_point last_used_at;
};

/**
 * @class pooled_client
 * @brief Move-only checkout of a pooled connection
 *
 * Thread Safety:
 * - A checkout is used by one thread at a time
 * - mark_invalid() and release() may race with each other safely
 *
 * @code
 * auto client = pool->acquire().value();
 * auto response = client->execute(request);
 * if (response.is_err() && has_code(response.error(), error_code::connection_failure))
 * {
 *     client->mark_invalid("connection dropped");
 * }
 * client->release();
 * @endcode
 */
class pooled_client
{
public:
	using clock = std::chrono::steady_clock;

	/**
	 * @brief Wrap a pooled connection
	 * @param connection Connection checked out of the pool
	 * @param tracker Throttle state updated on rate-limit faults
	 * @param pool Pool the connection returns to
	 * @param holds_capacity Whether the checkout holds an admission slot
	 */
	pooled_client(std::unique_ptr<pooled_connection> connection,
				  std::shared_ptr<resilience::throttle_tracker> tracker,
				  std::weak_ptr<connection_pool> pool,
				  bool holds_capacity);

	~pooled_client();

	pooled_client(const pooled_client&) = delete;
	pooled_client& operator=(const pooled_client&) = delete;
	pooled_client(pooled_client&&) = delete;
	pooled_client& operator=(pooled_client&&) = delete;

	[[nodiscard]] const std::string& connection_id() const noexcept { return connection_id_; }
	[[nodiscard]] const std::string& source_name() const noexcept { return source_name_; }
	[[nodiscard]] clock::time_point created_at() const noexcept { return created_at_; }
	[[nodiscard]] clock::time_point last_used_at() const;

	/**
	 * @brief Execute a request on the wrapped handle
	 * @param request Request to send
	 * @return Response on success or partial success, otherwise an error
	 *         classified by resilience::classify()
	 *
	 * A rate-limit fault records a throttle for source_name() (using the
	 * service's retry-after, or default_retry_after) and returns
	 * error_code::rate_limited.
	 */
	kcenon::common::Result<service_response> execute(const service_request& request);

	/**
	 * @brief Flag the client so it is disposed instead of re-queued
	 *
	 * One-way: later calls keep the first reason.
	 */
	void mark_invalid(const std::string& reason);

	[[nodiscard]] bool is_invalid() const noexcept;
	[[nodiscard]] std::string invalid_reason() const;

	[[nodiscard]] bool is_ready() const;
	[[nodiscard]] uint32_t recommended_parallelism() const;
	[[nodiscard]] std::string caller_id() const;

	/**
	 * @brief Return the client to its pool
	 *
	 * Idempotent. Also called by the destructor.
	 */
	void release();

	[[nodiscard]] bool is_released() const noexcept;

private:
	friend class connection_pool;

	void set_caller_id(const std::string& caller_id);

	std::string connection_id_;
	std::string source_name_;
	clock::time_point created_at_;

	mutable std::mutex state_mutex_;
	std::unique_ptr<pooled_connection> connection_;
	std::string invalid_reason_;

	std::atomic<bool> invalid_{ false };
	std::atomic<bool> released_{ false };

	std::shared_ptr<resilience::throttle_tracker> tracker_;
	std::weak_ptr<connection_pool> pool_;
	bool holds_capacity_;
};

} // namespace record_client::pooling
