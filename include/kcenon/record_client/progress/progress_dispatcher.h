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
 * @file progress_dispatcher.h
 * @brief Delivers progress snapshots to a caller's sink off the batch path
 */

#pragma once

#include "progress_tracker.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace record_client::progress
{

/// Caller-supplied receiver of progress snapshots
using progress_sink = std::function<void(const progress_snapshot&)>;

/**
 * @class progress_dispatcher
 * @brief Single worker that hands queued snapshots to a sink in order
 *
 * post() only enqueues, so a slow sink never delays batch execution. The
 * worker runs on the executor when one is given, otherwise via std::async.
 * The destructor delivers everything already posted, then joins.
 *
 * Thread Safety:
 * - post() may be called from any thread
 * - The sink is only ever called from the worker
 */
class progress_dispatcher
{
public:
	progress_dispatcher(progress_sink sink,
						std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr,
						std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	~progress_dispatcher();

	progress_dispatcher(const progress_dispatcher&) = delete;
	progress_dispatcher& operator=(const progress_dispatcher&) = delete;

	/**
	 * @brief Queue a snapshot for delivery; never blocks on the sink
	 */
	void post(progress_snapshot snapshot);

	/**
	 * @brief Deliver queued snapshots and stop the worker
	 */
	void close();

	/**
	 * @brief Snapshots handed to the sink so far
	 */
	[[nodiscard]] size_t delivered() const;

private:
	friend class dispatch_job;

	void run();

	progress_sink sink_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;

	mutable std::mutex queue_mutex_;
	std::condition_variable queue_cv_;
	std::deque<progress_snapshot> queue_;
	bool closed_{ false };
	bool finished_{ false };
	std::condition_variable finished_cv_;
	size_t delivered_{ 0 };

	std::future<void> worker_future_;
};

} // namespace record_client::progress
