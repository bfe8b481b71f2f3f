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

#include <kcenon/record_client/pooling/capacity_semaphore.h>

#include <algorithm>

namespace record_client::pooling
{

namespace
{
// Waiters re-check cancellation at least this often
constexpr std::chrono::milliseconds cancellation_poll{ 50 };
} // namespace

capacity_semaphore::capacity_semaphore(size_t initial)
	: available_(initial)
{
}

acquire_status capacity_semaphore::acquire(std::chrono::milliseconds timeout,
										   const kcenon::thread::cancellation_token& token)
{
	std::unique_lock<std::mutex> lock(mutex_);

	if (closed_)
	{
		return acquire_status::closed;
	}

	if (waiters_.empty() && available_ > 0)
	{
		--available_;
		return acquire_status::acquired;
	}

	auto ticket = next_ticket_++;
	waiters_.push_back(ticket);

	auto deadline = std::chrono::steady_clock::now() + timeout;

	while (true)
	{
		if (closed_)
		{
			remove_waiter_locked(ticket);
			return acquire_status::closed;
		}

		if (token.is_cancelled())
		{
			remove_waiter_locked(ticket);
			condition_.notify_all();
			return acquire_status::cancelled;
		}

		if (waiters_.front() == ticket && available_ > 0)
		{
			waiters_.pop_front();
			--available_;
			if (available_ > 0 && !waiters_.empty())
			{
				condition_.notify_all();
			}
			return acquire_status::acquired;
		}

		auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
		{
			remove_waiter_locked(ticket);
			condition_.notify_all();
			return acquire_status::timeout;
		}

		auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
																   cancellation_poll);
		condition_.wait_for(lock, slice);
	}
}

acquire_status capacity_semaphore::acquire(std::chrono::milliseconds timeout)
{
	return acquire(timeout, kcenon::thread::cancellation_token::create());
}

bool capacity_semaphore::try_acquire()
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (closed_ || !waiters_.empty() || available_ == 0)
	{
		return false;
	}

	--available_;
	return true;
}

void capacity_semaphore::release(size_t count)
{
	if (count == 0)
	{
		return;
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		available_ += count;
	}
	condition_.notify_all();
}

size_t capacity_semaphore::available() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return available_;
}

size_t capacity_semaphore::waiting() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return waiters_.size();
}

void capacity_semaphore::close()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		closed_ = true;
	}
	condition_.notify_all();
}

bool capacity_semaphore::is_closed() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return closed_;
}

void capacity_semaphore::remove_waiter_locked(uint64_t ticket)
{
	auto it = std::find(waiters_.begin(), waiters_.end(), ticket);
	if (it != waiters_.end())
	{
		waiters_.erase(it);
	}
}

} // namespace record_client::pooling
