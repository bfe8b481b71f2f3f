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
 * @file progress_tracker.h
 * @brief Thread-safe progress accounting for bulk runs
 *
 * Tracks succeeded and failed counts against a total and derives two rates:
 * - overall rate: processed records over total elapsed time
 * - instant rate: processed records over a rolling window (default 30 s)
 *
 * The estimated remaining time follows the instant rate so it reacts to
 * throttling and recovery quickly.
 *
 * ## Usage Example
 * @code
 * progress_tracker tracker(records.size());
 * auto snapshot = tracker.record_progress(batch_succeeded, batch_failed);
 * std::cout << snapshot.processed << "/" << snapshot.total
 *           << " (" << snapshot.percent_complete << "%)";
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace record_client::progress
{

/**
 * @struct progress_snapshot
 * @brief Immutable view of a run's progress
 */
struct progress_snapshot
{
	uint64_t succeeded = 0;
	uint64_t failed = 0;
	uint64_t total = 0;
	uint64_t processed = 0;
	uint64_t remaining = 0;
	double percent_complete = 0.0; ///< 0..100
	std::chrono::milliseconds elapsed{ 0 };
	double overall_rate = 0.0; ///< Records per second since start
	double instant_rate = 0.0; ///< Records per second over the rolling window
	std::optional<std::chrono::milliseconds> estimated_remaining; ///< Unset when unknown
};

/**
 * @class progress_tracker
 * @brief Counts and rates for one bulk run
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class progress_tracker
{
public:
	using clock = std::chrono::steady_clock;

	/// Samples kept for the instant rate at most
	static constexpr size_t max_samples = 1000;

	explicit progress_tracker(uint64_t total,
							  std::chrono::milliseconds rolling_window = std::chrono::seconds(30));

	progress_tracker(const progress_tracker&) = delete;
	progress_tracker& operator=(const progress_tracker&) = delete;

	/**
	 * @brief Add a completed batch's counts
	 * @return Snapshot that includes exactly this update
	 */
	progress_snapshot record_progress(uint64_t succeeded, uint64_t failed = 0);

	[[nodiscard]] progress_snapshot snapshot() const;

	/**
	 * @brief Zero the counts and restart the clock
	 */
	void reset();

	[[nodiscard]] uint64_t total() const noexcept { return total_; }

private:
	struct sample
	{
		clock::duration at;
		uint64_t processed;
	};

	progress_snapshot snapshot_locked(clock::duration now) const;
	double instant_rate_locked(clock::duration now, uint64_t processed) const;
	void prune_locked(clock::duration now);

	static double overall_rate(clock::duration elapsed, uint64_t processed);

	const uint64_t total_;
	const std::chrono::milliseconds rolling_window_;

	std::atomic<uint64_t> succeeded_{ 0 };
	std::atomic<uint64_t> failed_{ 0 };

	mutable std::mutex samples_mutex_;
	std::deque<sample> samples_;
	clock::time_point started_at_;
};

} // namespace record_client::progress
