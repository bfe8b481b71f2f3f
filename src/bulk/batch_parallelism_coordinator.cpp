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

#include <kcenon/record_client/bulk/batch_parallelism_coordinator.h>

#include <kcenon/record_client/core/error_codes.h>

#include <algorithm>

namespace record_client::bulk
{

batch_slot::batch_slot(std::shared_ptr<pooling::capacity_semaphore> semaphore)
	: semaphore_(std::move(semaphore))
{
}

batch_slot::~batch_slot()
{
	release();
}

void batch_slot::release()
{
	if (released_.exchange(true, std::memory_order_acq_rel))
	{
		return;
	}

	if (semaphore_)
	{
		semaphore_->release();
	}
}

bool batch_slot::is_released() const noexcept
{
	return released_.load(std::memory_order_acquire);
}

batch_parallelism_coordinator::batch_parallelism_coordinator(
	std::shared_ptr<pooling::connection_pool> pool, std::chrono::milliseconds acquire_timeout)
	: pool_(std::move(pool))
	, acquire_timeout_(acquire_timeout)
	, capacity_(std::max<size_t>(1, pool_ ? pool_->total_recommended_parallelism() : 1))
{
	semaphore_ = std::make_shared<pooling::capacity_semaphore>(capacity_);
}

batch_parallelism_coordinator::~batch_parallelism_coordinator()
{
	shutdown();
}

kcenon::common::Result<std::unique_ptr<batch_slot>> batch_parallelism_coordinator::acquire()
{
	return acquire(kcenon::thread::cancellation_token::create());
}

kcenon::common::Result<std::unique_ptr<batch_slot>> batch_parallelism_coordinator::acquire(
	const kcenon::thread::cancellation_token& token)
{
	expand_if_needed();

	switch (semaphore_->acquire(acquire_timeout_, token))
	{
	case pooling::acquire_status::acquired:
		return std::make_unique<batch_slot>(semaphore_);
	case pooling::acquire_status::timeout:
		return make_error(error_code::coordinator_exhausted,
						  "No batch slot available after "
							  + std::to_string(acquire_timeout_.count()) + "ms",
						  "batch_parallelism_coordinator");
	case pooling::acquire_status::cancelled:
		return make_error(error_code::operation_cancelled, "Batch slot wait cancelled",
						  "batch_parallelism_coordinator");
	case pooling::acquire_status::closed:
	default:
		return make_error(error_code::pool_shutdown, "Coordinator is shut down",
						  "batch_parallelism_coordinator");
	}
}

size_t batch_parallelism_coordinator::current_capacity() const
{
	std::lock_guard<std::mutex> lock(capacity_mutex_);
	return capacity_;
}

size_t batch_parallelism_coordinator::available_slots() const
{
	return semaphore_->available();
}

void batch_parallelism_coordinator::shutdown()
{
	semaphore_->close();
}

void batch_parallelism_coordinator::expand_if_needed()
{
	if (!pool_)
	{
		return;
	}

	auto recommended = pool_->total_recommended_parallelism();

	std::lock_guard<std::mutex> lock(capacity_mutex_);
	if (recommended > capacity_)
	{
		semaphore_->release(recommended - capacity_);
		capacity_ = recommended;
	}
}

} // namespace record_client::bulk
