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
 * @file batch_parallelism_coordinator.h
 * @brief Pool-wide bound on in-flight bulk batches
 *
 * Every bulk run that shares a pool shares one coordinator, so concurrent
 * runs cannot together exceed the parallelism the service recommends.
 */

#pragma once

#include <kcenon/record_client/pooling/capacity_semaphore.h>
#include <kcenon/record_client/pooling/connection_pool.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

namespace record_client::bulk
{

class batch_parallelism_coordinator;

/**
 * @class batch_slot
 * @brief One admitted batch; returns its slot exactly once
 */
class batch_slot
{
public:
	explicit batch_slot(std::shared_ptr<pooling::capacity_semaphore> semaphore);

	~batch_slot();

	batch_slot(const batch_slot&) = delete;
	batch_slot& operator=(const batch_slot&) = delete;
	batch_slot(batch_slot&&) = delete;
	batch_slot& operator=(batch_slot&&) = delete;

	/**
	 * @brief Return the slot; later calls are no-ops
	 */
	void release();

	[[nodiscard]] bool is_released() const noexcept;

private:
	std::shared_ptr<pooling::capacity_semaphore> semaphore_;
	std::atomic<bool> released_{ false };
};

/**
 * @class batch_parallelism_coordinator
 * @brief Semaphore sized from the pool's recommended parallelism
 *
 * Capacity starts at max(1, pool->total_recommended_parallelism()) and only
 * grows: each acquire first adds slots when the live recommendation has
 * risen since the last check.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class batch_parallelism_coordinator
{
public:
	/**
	 * @brief Construct for a pool
	 * @param pool Pool whose recommended parallelism sizes the coordinator
	 * @param acquire_timeout Maximum wait for a slot
	 */
	explicit batch_parallelism_coordinator(
		std::shared_ptr<pooling::connection_pool> pool,
		std::chrono::milliseconds acquire_timeout = std::chrono::seconds(120));

	~batch_parallelism_coordinator();

	batch_parallelism_coordinator(const batch_parallelism_coordinator&) = delete;
	batch_parallelism_coordinator& operator=(const batch_parallelism_coordinator&) = delete;

	/**
	 * @brief Wait for a batch slot
	 * @return Slot, or coordinator_exhausted, operation_cancelled or pool_shutdown
	 */
	kcenon::common::Result<std::unique_ptr<batch_slot>> acquire(
		const kcenon::thread::cancellation_token& token);

	kcenon::common::Result<std::unique_ptr<batch_slot>> acquire();

	/**
	 * @brief Total slots, grown as the pool's recommendation grows
	 */
	[[nodiscard]] size_t current_capacity() const;

	/**
	 * @brief Slots free right now
	 */
	[[nodiscard]] size_t available_slots() const;

	/**
	 * @brief Refuse new acquisitions and wake all waiters
	 */
	void shutdown();

private:
	void expand_if_needed();

	std::shared_ptr<pooling::connection_pool> pool_;
	std::chrono::milliseconds acquire_timeout_;
	std::shared_ptr<pooling::capacity_semaphore> semaphore_;

	mutable std::mutex capacity_mutex_;
	size_t capacity_;
};

} // namespace record_client::bulk
