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

#include <kcenon/record_client/progress/progress_tracker.h>

#include <algorithm>

namespace record_client::progress
{

namespace
{
// Rates are not computed over spans shorter than this
constexpr double minimum_span_seconds = 0.1;
constexpr double minimum_rate = 0.001;
constexpr std::chrono::hours maximum_estimate{ 24 * 7 };

double to_seconds(std::chrono::steady_clock::duration span)
{
	return std::chrono::duration<double>(span).count();
}
} // namespace

progress_tracker::progress_tracker(uint64_t total, std::chrono::milliseconds rolling_window)
	: total_(total)
	, rolling_window_(rolling_window)
	, started_at_(clock::now())
{
	samples_.push_back({ clock::duration::zero(), 0 });
}

progress_snapshot progress_tracker::record_progress(uint64_t succeeded, uint64_t failed)
{
	std::lock_guard<std::mutex> lock(samples_mutex_);
	if (succeeded > 0)
	{
		succeeded_.fetch_add(succeeded, std::memory_order_relaxed);
	}
	if (failed > 0)
	{
		failed_.fetch_add(failed, std::memory_order_relaxed);
	}

	auto now = clock::now() - started_at_;
	auto processed = succeeded_.load(std::memory_order_relaxed)
					 + failed_.load(std::memory_order_relaxed);
	samples_.push_back({ now, processed });
	prune_locked(now);
	return snapshot_locked(now);
}

progress_snapshot progress_tracker::snapshot() const
{
	std::lock_guard<std::mutex> lock(samples_mutex_);
	return snapshot_locked(clock::now() - started_at_);
}

progress_snapshot progress_tracker::snapshot_locked(clock::duration now) const
{
	progress_snapshot result;
	result.succeeded = succeeded_.load(std::memory_order_relaxed);
	result.failed = failed_.load(std::memory_order_relaxed);
	result.total = total_;
	result.processed = result.succeeded + result.failed;
	result.remaining = total_ > result.processed ? total_ - result.processed : 0;
	result.percent_complete
		= total_ == 0 ? 100.0
					  : std::min(100.0, 100.0 * static_cast<double>(result.processed)
											/ static_cast<double>(total_));

	result.instant_rate = instant_rate_locked(now, result.processed);
	result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now);
	result.overall_rate = overall_rate(now, result.processed);

	if (result.instant_rate > minimum_rate)
	{
		auto seconds = static_cast<double>(result.remaining) / result.instant_rate;
		std::chrono::duration<double> estimate(seconds);
		if (estimate <= maximum_estimate)
		{
			result.estimated_remaining
				= std::chrono::duration_cast<std::chrono::milliseconds>(estimate);
		}
	}

	return result;
}

void progress_tracker::reset()
{
	std::lock_guard<std::mutex> lock(samples_mutex_);
	succeeded_.store(0, std::memory_order_relaxed);
	failed_.store(0, std::memory_order_relaxed);
	samples_.clear();
	samples_.push_back({ clock::duration::zero(), 0 });
	started_at_ = clock::now();
}

double progress_tracker::instant_rate_locked(clock::duration now, uint64_t processed) const
{
	if (samples_.size() < 2)
	{
		return overall_rate(now, processed);
	}

	const auto& oldest = samples_.front();
	auto window = to_seconds(now - oldest.at);
	if (window < minimum_span_seconds)
	{
		return overall_rate(now, processed);
	}

	return static_cast<double>(processed - oldest.processed) / window;
}

void progress_tracker::prune_locked(clock::duration now)
{
	auto cutoff = now - rolling_window_;
	while (samples_.size() > 1 && samples_.front().at < cutoff)
	{
		samples_.pop_front();
	}

	while (samples_.size() > max_samples)
	{
		samples_.pop_front();
	}
}

double progress_tracker::overall_rate(clock::duration elapsed, uint64_t processed)
{
	auto seconds = to_seconds(elapsed);
	return seconds > minimum_span_seconds ? static_cast<double>(processed) / seconds : 0.0;
}

} // namespace record_client::progress
