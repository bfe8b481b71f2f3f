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
 * @file progress_tracker_test.cpp
 * @brief Unit tests for progress tracking and dispatch
 *
 * Tests cover:
 * - Count accumulation and percent complete
 * - Overall and instant rates
 * - Estimated remaining time and its cap
 * - Reset
 * - Ordered, non-blocking delivery through progress_dispatcher
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <kcenon/record_client/progress/progress_dispatcher.h>
#include <kcenon/record_client/progress/progress_tracker.h>

using namespace record_client::progress;
using namespace std::chrono_literals;

// ============================================================================
// Progress Tracker Tests
// ============================================================================

TEST(ProgressTrackerTest, InitialSnapshot)
{
	progress_tracker tracker(100);
	auto snapshot = tracker.snapshot();

	EXPECT_EQ(snapshot.total, 100u);
	EXPECT_EQ(snapshot.processed, 0u);
	EXPECT_EQ(snapshot.remaining, 100u);
	EXPECT_DOUBLE_EQ(snapshot.percent_complete, 0.0);
	EXPECT_DOUBLE_EQ(snapshot.overall_rate, 0.0);
	EXPECT_FALSE(snapshot.estimated_remaining.has_value());
}

TEST(ProgressTrackerTest, CountsAccumulate)
{
	progress_tracker tracker(250);
	tracker.record_progress(100);
	tracker.record_progress(98, 2);

	auto snapshot = tracker.snapshot();
	EXPECT_EQ(snapshot.succeeded, 198u);
	EXPECT_EQ(snapshot.failed, 2u);
	EXPECT_EQ(snapshot.processed, 200u);
	EXPECT_EQ(snapshot.remaining, 50u);
	EXPECT_DOUBLE_EQ(snapshot.percent_complete, 80.0);
}

TEST(ProgressTrackerTest, EmptyRunIsComplete)
{
	progress_tracker tracker(0);
	EXPECT_DOUBLE_EQ(tracker.snapshot().percent_complete, 100.0);
}

TEST(ProgressTrackerTest, RatesNeedMeasurableElapsedTime)
{
	progress_tracker tracker(1000);
	tracker.record_progress(10);

	// Well under 100ms since start
	EXPECT_DOUBLE_EQ(tracker.snapshot().overall_rate, 0.0);
}

TEST(ProgressTrackerTest, RatesAndEstimate)
{
	progress_tracker tracker(1000);

	std::this_thread::sleep_for(150ms);
	tracker.record_progress(100);
	std::this_thread::sleep_for(150ms);
	tracker.record_progress(100);

	auto snapshot = tracker.snapshot();
	EXPECT_GT(snapshot.overall_rate, 0.0);
	EXPECT_LT(snapshot.overall_rate, 200.0 / 0.29);
	EXPECT_GT(snapshot.instant_rate, 0.0);
	EXPECT_GE(snapshot.elapsed, 300ms);

	ASSERT_TRUE(snapshot.estimated_remaining.has_value());
	// 800 remaining at roughly 660 records/s
	EXPECT_GT(*snapshot.estimated_remaining, 500ms);
	EXPECT_LT(*snapshot.estimated_remaining, 5s);
}

TEST(ProgressTrackerTest, EstimateIsUnsetBeyondSevenDays)
{
	progress_tracker tracker(1'000'000'000'000ULL);

	std::this_thread::sleep_for(150ms);
	tracker.record_progress(1);

	// ~7 records/s against a trillion records
	EXPECT_FALSE(tracker.snapshot().estimated_remaining.has_value());
}

TEST(ProgressTrackerTest, InstantRateFollowsRollingWindow)
{
	progress_tracker tracker(10000, 200ms);

	tracker.record_progress(5000);
	std::this_thread::sleep_for(300ms);
	tracker.record_progress(10);
	std::this_thread::sleep_for(150ms);
	tracker.record_progress(10);

	auto snapshot = tracker.snapshot();
	// The initial burst has left the window
	EXPECT_LT(snapshot.instant_rate, snapshot.overall_rate);
}

TEST(ProgressTrackerTest, RecordProgressReturnsItsOwnSnapshot)
{
	progress_tracker tracker(100);

	auto first = tracker.record_progress(30);
	auto second = tracker.record_progress(10, 5);

	EXPECT_EQ(first.processed, 30u);
	EXPECT_EQ(second.processed, 45u);
	EXPECT_EQ(second.failed, 5u);
	EXPECT_EQ(second.remaining, 55u);
}

TEST(ProgressTrackerTest, ResetClearsCounts)
{
	progress_tracker tracker(10);
	tracker.record_progress(5, 1);
	tracker.reset();

	auto snapshot = tracker.snapshot();
	EXPECT_EQ(snapshot.processed, 0u);
	EXPECT_EQ(snapshot.remaining, 10u);
}

TEST(ProgressTrackerTest, ConcurrentRecording)
{
	progress_tracker tracker(8000);
	std::vector<std::thread> threads;
	for (int t = 0; t < 8; ++t)
	{
		threads.emplace_back(
			[&tracker]
			{
				for (int i = 0; i < 1000; ++i)
				{
					tracker.record_progress(1);
				}
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(tracker.snapshot().processed, 8000u);
}

// ============================================================================
// Progress Dispatcher Tests
// ============================================================================

TEST(ProgressDispatcherTest, DeliversInPostOrder)
{
	std::mutex mutex;
	std::vector<uint64_t> seen;

	{
		progress_dispatcher dispatcher(
			[&](const progress_snapshot& snapshot)
			{
				std::lock_guard<std::mutex> lock(mutex);
				seen.push_back(snapshot.processed);
			});

		for (uint64_t i = 1; i <= 5; ++i)
		{
			progress_snapshot snapshot;
			snapshot.processed = i;
			dispatcher.post(snapshot);
		}
	}

	EXPECT_EQ(seen, (std::vector<uint64_t>{ 1, 2, 3, 4, 5 }));
}

TEST(ProgressDispatcherTest, SlowSinkDoesNotBlockPost)
{
	std::atomic<int> delivered{ 0 };
	progress_dispatcher dispatcher(
		[&](const progress_snapshot&)
		{
			std::this_thread::sleep_for(100ms);
			delivered.fetch_add(1);
		});

	auto start = std::chrono::steady_clock::now();
	for (int i = 0; i < 5; ++i)
	{
		dispatcher.post(progress_snapshot{});
	}
	EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

	dispatcher.close();
	EXPECT_EQ(delivered.load(), 5);
	EXPECT_EQ(dispatcher.delivered(), 5u);
}

TEST(ProgressDispatcherTest, ThrowingSinkDoesNotStopDelivery)
{
	std::atomic<int> calls{ 0 };
	progress_dispatcher dispatcher(
		[&](const progress_snapshot&)
		{
			if (calls.fetch_add(1) == 0)
			{
				throw std::runtime_error("sink failure");
			}
		});

	dispatcher.post(progress_snapshot{});
	dispatcher.post(progress_snapshot{});
	dispatcher.close();

	EXPECT_EQ(calls.load(), 2);
}

TEST(ProgressDispatcherTest, NonStandardThrowDoesNotHangClose)
{
	std::atomic<int> calls{ 0 };
	progress_dispatcher dispatcher(
		[&](const progress_snapshot&)
		{
			if (calls.fetch_add(1) == 0)
			{
				throw 42;
			}
		});

	dispatcher.post(progress_snapshot{});
	dispatcher.post(progress_snapshot{});

	auto closing = std::async(std::launch::async, [&dispatcher] { dispatcher.close(); });
	ASSERT_EQ(closing.wait_for(std::chrono::seconds(5)), std::future_status::ready);

	EXPECT_EQ(calls.load(), 2);
	EXPECT_EQ(dispatcher.delivered(), 2u);
}

TEST(ProgressDispatcherTest, PostAfterCloseIsIgnored)
{
	std::atomic<int> calls{ 0 };
	progress_dispatcher dispatcher([&](const progress_snapshot&) { calls.fetch_add(1); });
	dispatcher.close();

	dispatcher.post(progress_snapshot{});
	EXPECT_EQ(dispatcher.delivered(), 0u);
	EXPECT_EQ(calls.load(), 0);
}
