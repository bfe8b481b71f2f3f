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
 * @file pool_metrics.h
 * @brief Performance metrics for connection pools
 *
 * Provides tracking of connection pool performance including acquisition
 * latency, throttle waits, evictions and failure counts.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace record_client::pooling
{

/**
 * @struct pool_metrics
 * @brief Performance metrics for connection pools
 *
 * Tracks key performance indicators for pooled client management:
 * - Acquisition latency and outcome
 * - Time spent waiting for throttles to expire
 * - Active client peak
 * - Validation evictions and failure counters
 */
struct pool_metrics
{
	// Acquisition statistics
	std::atomic<uint64_t> total_acquisitions{ 0 };
	std::atomic<uint64_t> successful_acquisitions{ 0 };
	std::atomic<uint64_t> failed_acquisitions{ 0 };
	std::atomic<uint64_t> timeouts{ 0 };

	// Timing statistics (microseconds)
	std::atomic<uint64_t> total_wait_time_us{ 0 };
	std::atomic<uint64_t> max_wait_time_us{ 0 };
	std::atomic<uint64_t> throttle_wait_time_us{ 0 };

	// Current state
	std::atomic<uint64_t> current_active{ 0 };
	std::atomic<uint64_t> peak_active{ 0 };

	// Validation and failure statistics
	std::atomic<uint64_t> validation_passes{ 0 };
	std::atomic<uint64_t> evicted_connections{ 0 };
	std::atomic<uint64_t> invalid_connections{ 0 };
	std::atomic<uint64_t> auth_failures{ 0 };
	std::atomic<uint64_t> connection_failures{ 0 };

	/**
	 * @brief Record a connection acquisition
	 * @param wait_time_us Wait time in microseconds
	 * @param success Whether acquisition was successful
	 */
	void record_acquisition(uint64_t wait_time_us, bool success)
	{
		total_acquisitions.fetch_add(1, std::memory_order_relaxed);

		if (success)
		{
			successful_acquisitions.fetch_add(1, std::memory_order_relaxed);
			total_wait_time_us.fetch_add(wait_time_us, std::memory_order_relaxed);

			uint64_t current_max = max_wait_time_us.load(std::memory_order_relaxed);
			while (wait_time_us > current_max
				   && !max_wait_time_us.compare_exchange_weak(
					   current_max, wait_time_us, std::memory_order_relaxed))
			{
			}
		}
		else
		{
			failed_acquisitions.fetch_add(1, std::memory_order_relaxed);
		}
	}

	/**
	 * @brief Record an admission timeout
	 */
	void record_timeout()
	{
		timeouts.fetch_add(1, std::memory_order_relaxed);
	}

	/**
	 * @brief Record time spent in the throttle wait
	 */
	void record_throttle_wait(uint64_t wait_time_us)
	{
		throttle_wait_time_us.fetch_add(wait_time_us, std::memory_order_relaxed);
	}

	/**
	 * @brief Update current active client count
	 * @param delta Change in active clients (+1 for acquire, -1 for release)
	 */
	void update_active(int delta)
	{
		uint64_t new_active
			= current_active.fetch_add(delta, std::memory_order_relaxed) + delta;

		uint64_t current_peak = peak_active.load(std::memory_order_relaxed);
		while (new_active > current_peak
			   && !peak_active.compare_exchange_weak(
				   current_peak, new_active, std::memory_order_relaxed))
		{
		}
	}

	/**
	 * @brief Record a validation pass
	 * @param evicted Number of idle clients evicted by the pass
	 */
	void record_validation(uint64_t evicted = 0)
	{
		validation_passes.fetch_add(1, std::memory_order_relaxed);
		if (evicted > 0)
		{
			evicted_connections.fetch_add(evicted, std::memory_order_relaxed);
		}
	}

	/**
	 * @brief Calculate average acquisition wait time
	 * @return Average wait time in microseconds
	 */
	[[nodiscard]] double average_wait_time_us() const
	{
		uint64_t successful = successful_acquisitions.load(std::memory_order_relaxed);
		if (successful == 0)
			return 0.0;

		uint64_t total_wait = total_wait_time_us.load(std::memory_order_relaxed);
		return static_cast<double>(total_wait) / static_cast<double>(successful);
	}

	/**
	 * @brief Calculate acquisition success rate
	 * @return Success rate as percentage (0.0 - 100.0)
	 */
	[[nodiscard]] double success_rate() const
	{
		uint64_t total = total_acquisitions.load(std::memory_order_relaxed);
		if (total == 0)
			return 100.0;

		uint64_t successful = successful_acquisitions.load(std::memory_order_relaxed);
		return (static_cast<double>(successful) / static_cast<double>(total)) * 100.0;
	}
};

} // namespace record_client::pooling
