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
 * @file capacity_semaphore.h
 * @brief FIFO counting semaphore used for admission control
 *
 * Waiters are admitted strictly in arrival order. A waiter that arrives
 * while others are queued never overtakes them, even when a permit is free.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

#include <kcenon/thread/core/cancellation_token.h>

namespace record_client::pooling
{

/**
 * @enum acquire_status
 * @brief Outcome of capacity_semaphore::acquire
 */
enum class acquire_status : uint8_t
{
	acquired = 0,  ///< Permit taken
	timeout = 1,   ///< Deadline passed while queued
	cancelled = 2, ///< Cancellation token fired while queued
	closed = 3,    ///< Semaphore closed
};

constexpr const char* to_string(acquire_status status) noexcept
{
	switch (status)
	{
	case acquire_status::acquired:
		return "acquired";
	case acquire_status::timeout:
		return "timeout";
	case acquire_status::cancelled:
		return "cancelled";
	case acquire_status::closed:
		return "closed";
	default:
		return "unknown";
	}
}

/**
 * @class capacity_semaphore
 * @brief Counting semaphore with FIFO fairness, timeout and cancellation
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class capacity_semaphore
{
public:
	/**
	 * @brief Construct with an initial permit count
	 */
	explicit capacity_semaphore(size_t initial);

	~capacity_semaphore() = default;

	capacity_semaphore(const capacity_semaphore&) = delete;
	capacity_semaphore& operator=(const capacity_semaphore&) = delete;
	capacity_semaphore(capacity_semaphore&&) = delete;
	capacity_semaphore& operator=(capacity_semaphore&&) = delete;

	/**
	 * @brief Take one permit
	 * @param timeout Maximum time to wait
	 * @param token Cancellation observed while queued
	 * @return acquire_status::acquired when a permit was taken
	 */
	acquire_status acquire(std::chrono::milliseconds timeout,
						   const kcenon::thread::cancellation_token& token);

	/**
	 * @brief Take one permit without a cancellation token
	 */
	acquire_status acquire(std::chrono::milliseconds timeout);

	/**
	 * @brief Take one permit only if available right now and nobody is queued
	 */
	[[nodiscard]] bool try_acquire();

	/**
	 * @brief Return permits
	 * @param count Number of permits to add
	 */
	void release(size_t count = 1);

	/**
	 * @brief Currently free permits
	 */
	[[nodiscard]] size_t available() const;

	/**
	 * @brief Callers currently queued
	 */
	[[nodiscard]] size_t waiting() const;

	/**
	 * @brief Close the semaphore and wake all waiters
	 *
	 * Queued and later acquire() calls return acquire_status::closed.
	 */
	void close();

	[[nodiscard]] bool is_closed() const;

private:
	void remove_waiter_locked(uint64_t ticket);

	mutable std::mutex mutex_;
	std::condition_variable condition_;
	size_t available_;
	std::deque<uint64_t> waiters_;
	uint64_t next_ticket_{ 0 };
	bool closed_{ false };
};

} // namespace record_client::pooling
