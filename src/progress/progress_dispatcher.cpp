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

#include <kcenon/record_client/progress/progress_dispatcher.h>

#include <kcenon/record_client/logging/console_logger.h>

namespace record_client::progress
{

using kcenon::common::interfaces::log_level;

/**
 * @brief Job wrapper for running the dispatcher worker via IExecutor
 */
class dispatch_job : public kcenon::common::interfaces::IJob
{
public:
	explicit dispatch_job(progress_dispatcher* dispatcher)
		: dispatcher_(dispatcher)
	{
	}

	kcenon::common::VoidResult execute() override
	{
		if (dispatcher_)
		{
			dispatcher_->run();
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "progress_dispatch"; }
	int get_priority() const override { return 0; }

private:
	progress_dispatcher* dispatcher_;
};

progress_dispatcher::progress_dispatcher(
	progress_sink sink,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: sink_(std::move(sink))
	, logger_(std::move(logger))
{
	if (executor)
	{
		auto result = executor->execute(std::make_unique<dispatch_job>(this));
		if (result.is_ok())
		{
			worker_future_ = std::move(result.unwrap());
			return;
		}
		logging::log_message(logger_, log_level::warning,
							 "Executor rejected progress worker: " + result.error().message);
	}

	// Fallback to std::async if no executor provided
	worker_future_ = std::async(std::launch::async, [this] { run(); });
}

progress_dispatcher::~progress_dispatcher()
{
	close();
}

void progress_dispatcher::post(progress_snapshot snapshot)
{
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		if (closed_)
		{
			return;
		}
		queue_.push_back(std::move(snapshot));
	}
	queue_cv_.notify_one();
}

void progress_dispatcher::close()
{
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		closed_ = true;
	}
	queue_cv_.notify_all();

	// Executor futures may outlive the job; wait on the worker's own flag
	std::unique_lock<std::mutex> lock(queue_mutex_);
	finished_cv_.wait(lock, [this] { return finished_; });
	lock.unlock();

	if (worker_future_.valid())
	{
		worker_future_.wait();
	}
}

size_t progress_dispatcher::delivered() const
{
	std::lock_guard<std::mutex> lock(queue_mutex_);
	return delivered_;
}

void progress_dispatcher::run()
{
	std::unique_lock<std::mutex> lock(queue_mutex_);
	while (true)
	{
		queue_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

		if (queue_.empty())
		{
			break; // closed and drained
		}

		auto snapshot = std::move(queue_.front());
		queue_.pop_front();
		lock.unlock();

		if (sink_)
		{
			try
			{
				sink_(snapshot);
			}
			catch (const std::exception& e)
			{
				logging::log_message(logger_, log_level::warning,
									 std::string("Progress sink threw: ") + e.what());
			}
			catch (...)
			{
				logging::log_message(logger_, log_level::warning,
									 "Progress sink threw a non-standard exception");
			}
		}

		lock.lock();
		++delivered_;
	}

	finished_ = true;
	lock.unlock();
	finished_cv_.notify_all();
}

} // namespace record_client::progress
