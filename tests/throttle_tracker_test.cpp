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
 * @file throttle_tracker_test.cpp
 * @brief Unit tests for throttle_tracker
 *
 * Tests cover:
 * - Recording and expiry
 * - Monotonic extension of an existing throttle
 * - Clearing and cleanup
 * - Shortest expiry across sources
 * - Event and backoff counters
 * - Concurrent readers and writers
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/logging/console_logger.h>
#include <kcenon/record_client/resilience/throttle_tracker.h>

using namespace record_client;
using namespace record_client::resilience;
using namespace std::chrono_literals;

// ============================================================================
// Recording Tests
// ============================================================================

class ThrottleTrackerTest : public ::testing::Test
{
protected:
	throttle_tracker tracker_;
};

TEST_F(ThrottleTrackerTest, UnknownSourceIsNotThrottled)
{
	EXPECT_FALSE(tracker_.is_throttled("a@test"));
	EXPECT_FALSE(tracker_.expiry_of("a@test").has_value());
	EXPECT_EQ(tracker_.throttled_count(), 0u);
}

TEST_F(ThrottleTrackerTest, RecordMarksSourceThrottled)
{
	auto result = tracker_.record_throttle("a@test", 5s);
	ASSERT_TRUE(result.is_ok());

	EXPECT_TRUE(tracker_.is_throttled("a@test"));
	EXPECT_FALSE(tracker_.is_throttled("b@test"));
	ASSERT_TRUE(tracker_.expiry_of("a@test").has_value());
	EXPECT_GT(*tracker_.expiry_of("a@test"), throttle_tracker::clock::now() + 4s);
}

TEST_F(ThrottleTrackerTest, EmptyNameIsRejected)
{
	auto result = tracker_.record_throttle("", 5s);
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), error_code::validation_failure));
	EXPECT_EQ(tracker_.total_events(), 0u);
}

TEST_F(ThrottleTrackerTest, ThrottleExpires)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 50ms).is_ok());
	EXPECT_TRUE(tracker_.is_throttled("a@test"));

	std::this_thread::sleep_for(80ms);

	EXPECT_FALSE(tracker_.is_throttled("a@test"));
	EXPECT_FALSE(tracker_.expiry_of("a@test").has_value());
}

TEST_F(ThrottleTrackerTest, LaterExpiryExtendsThrottle)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 1s).is_ok());
	auto first = *tracker_.expiry_of("a@test");

	ASSERT_TRUE(tracker_.record_throttle("a@test", 10s).is_ok());
	auto second = *tracker_.expiry_of("a@test");

	EXPECT_GT(second, first);
}

TEST_F(ThrottleTrackerTest, EarlierExpiryNeverShortensThrottle)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 10s).is_ok());
	auto first = *tracker_.expiry_of("a@test");

	ASSERT_TRUE(tracker_.record_throttle("a@test", 1s).is_ok());
	auto second = *tracker_.expiry_of("a@test");

	EXPECT_EQ(second, first);
	EXPECT_EQ(tracker_.total_events(), 2u);
}

// ============================================================================
// Clear and Cleanup Tests
// ============================================================================

TEST_F(ThrottleTrackerTest, ClearRemovesThrottle)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 10s).is_ok());
	tracker_.clear("a@test");

	EXPECT_FALSE(tracker_.is_throttled("a@test"));
	EXPECT_EQ(tracker_.throttled_count(), 0u);
}

TEST_F(ThrottleTrackerTest, CleanupDropsOnlyExpiredEntries)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 20ms).is_ok());
	ASSERT_TRUE(tracker_.record_throttle("b@test", 10s).is_ok());

	std::this_thread::sleep_for(50ms);

	EXPECT_EQ(tracker_.cleanup(), 1u);
	EXPECT_EQ(tracker_.throttled_names(), std::vector<std::string>{ "b@test" });
}

// ============================================================================
// Shortest Expiry Tests
// ============================================================================

TEST_F(ThrottleTrackerTest, ShortestExpiryIsZeroWithoutThrottles)
{
	EXPECT_EQ(tracker_.shortest_expiry().count(), 0);
}

TEST_F(ThrottleTrackerTest, ShortestExpiryPicksNearest)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 30s).is_ok());
	ASSERT_TRUE(tracker_.record_throttle("b@test", 10s).is_ok());

	auto shortest = tracker_.shortest_expiry();
	EXPECT_GT(shortest, 9s);
	EXPECT_LE(shortest, 10s);
}

TEST_F(ThrottleTrackerTest, ThrottledNamesAreSorted)
{
	ASSERT_TRUE(tracker_.record_throttle("c@test", 10s).is_ok());
	ASSERT_TRUE(tracker_.record_throttle("a@test", 10s).is_ok());

	auto names = tracker_.throttled_names();
	ASSERT_EQ(names.size(), 2u);
	EXPECT_EQ(names[0], "a@test");
	EXPECT_EQ(names[1], "c@test");
}

// ============================================================================
// Counter Tests
// ============================================================================

TEST_F(ThrottleTrackerTest, CountersAccumulate)
{
	ASSERT_TRUE(tracker_.record_throttle("a@test", 2s).is_ok());
	ASSERT_TRUE(tracker_.record_throttle("b@test", 3s).is_ok());
	tracker_.clear("a@test");

	EXPECT_EQ(tracker_.total_events(), 2u);
	EXPECT_EQ(tracker_.total_backoff_time(), 5s);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(ThrottleTrackerTest, ConcurrentRecordAndRead)
{
	constexpr int writer_count = 4;
	constexpr int events_per_writer = 250;

	std::atomic<bool> running{ true };
	std::vector<std::thread> threads;

	for (int w = 0; w < writer_count; ++w)
	{
		threads.emplace_back(
			[this, w]()
			{
				auto name = "source-" + std::to_string(w) + "@test";
				for (int i = 0; i < events_per_writer; ++i)
				{
					EXPECT_TRUE(tracker_.record_throttle(name, 1s).is_ok());
				}
			});
	}

	threads.emplace_back(
		[this, &running]()
		{
			while (running.load())
			{
				(void)tracker_.is_throttled("source-0@test");
				(void)tracker_.shortest_expiry();
			}
		});

	for (int w = 0; w < writer_count; ++w)
	{
		threads[w].join();
	}
	running = false;
	threads.back().join();

	EXPECT_EQ(tracker_.total_events(), static_cast<uint64_t>(writer_count * events_per_writer));
	EXPECT_EQ(tracker_.throttled_count(), static_cast<size_t>(writer_count));
}

TEST_F(ThrottleTrackerTest, LoggerCanBeSwappedWhileRecording)
{
	using kcenon::common::interfaces::log_level;

	std::ostringstream first_sink;
	std::ostringstream second_sink;
	auto first = std::make_shared<logging::console_logger>(log_level::debug, "first", &first_sink);
	auto second = std::make_shared<logging::console_logger>(log_level::debug, "second", &second_sink);
	tracker_.set_logger(first);

	constexpr int writer_count = 4;
	constexpr int events_per_writer = 200;

	std::atomic<bool> running{ true };
	std::thread swapper(
		[&]
		{
			bool use_first = false;
			while (running.load())
			{
				tracker_.set_logger(use_first ? first : second);
				use_first = !use_first;
			}
			tracker_.set_logger(second);
		});

	std::vector<std::thread> writers;
	for (int w = 0; w < writer_count; ++w)
	{
		writers.emplace_back(
			[this, w]
			{
				auto name = "source-" + std::to_string(w) + "@test";
				for (int i = 0; i < events_per_writer; ++i)
				{
					EXPECT_TRUE(tracker_.record_throttle(name, 1s).is_ok());
				}
			});
	}
	for (auto& writer : writers)
	{
		writer.join();
	}
	running = false;
	swapper.join();

	// Every warning went to exactly one of the two loggers
	EXPECT_EQ(first->lines_written() + second->lines_written(),
			  static_cast<uint64_t>(writer_count * events_per_writer));
	EXPECT_EQ(tracker_.get_logger(), second);
}
