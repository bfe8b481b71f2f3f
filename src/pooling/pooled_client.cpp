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

#include <kcenon/record_client/pooling/pooled_client.h>

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/pooling/connection_pool.h>
#include <kcenon/record_client/resilience/fault_classifier.h>

namespace record_client::pooling
{

pooled_client::pooled_client(std::unique_ptr<pooled_connection> connection,
							 std::shared_ptr<resilience::throttle_tracker> tracker,
							 std::weak_ptr<connection_pool> pool,
							 bool holds_capacity)
	: connection_id_(connection->connection_id)
	, source_name_(connection->source_name)
	, created_at_(connection->created_at)
	, connection_(std::move(connection))
	, tracker_(std::move(tracker))
	, pool_(std::move(pool))
	, holds_capacity_(holds_capacity)
{
}

pooled_client::~pooled_client()
{
	release();
}

pooled_client::clock::time_point pooled_client::last_used_at() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return connection_ ? connection_->last_used_at : created_at_;
}

kcenon::common::Result<service_response> pooled_client::execute(const service_request& request)
{
	service_handle* handle = nullptr;
	{
		std::lock_guard<std::mutex> lock(state_mutex_);
		if (connection_)
		{
			handle = connection_->handle.get();
		}
	}

	if (!handle || released_.load())
	{
		return make_error(error_code::pool_shutdown,
						  "Client " + connection_id_ + " was already released",
						  "pooled_client");
	}

	auto response = handle->execute(request);

	{
		std::lock_guard<std::mutex> lock(state_mutex_);
		if (connection_)
		{
			connection_->last_used_at = clock::now();
		}
	}

	auto fault = resilience::classify(response);
	if (fault == resilience::fault_class::none)
	{
		return response;
	}

	if (fault == resilience::fault_class::rate_limit)
	{
		auto retry_after = response.retry_after.value_or(
			std::chrono::duration_cast<std::chrono::milliseconds>(default_retry_after));
		if (tracker_)
		{
			[[maybe_unused]] auto recorded = tracker_->record_throttle(source_name_, retry_after);
		}

		return make_error(error_code::rate_limited,
						  "Service protection limit on " + source_name_ + ", retry after "
							  + std::to_string(retry_after.count()) + "ms",
						  "pooled_client");
	}

	std::string message = response.message.empty()
							  ? std::string(record_client::to_string(response.status))
							  : response.message;
	return make_error(resilience::to_error_code(fault), message, "pooled_client");
}

void pooled_client::mark_invalid(const std::string& reason)
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	if (!invalid_.exchange(true))
	{
		invalid_reason_ = reason;
	}
}

bool pooled_client::is_invalid() const noexcept
{
	return invalid_.load();
}

std::string pooled_client::invalid_reason() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return invalid_reason_;
}

bool pooled_client::is_ready() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return connection_ && connection_->handle && connection_->handle->is_ready();
}

uint32_t pooled_client::recommended_parallelism() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return connection_ && connection_->handle ? connection_->handle->recommended_parallelism()
											  : 0;
}

std::string pooled_client::caller_id() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	return connection_ && connection_->handle ? connection_->handle->caller_id() : "";
}

void pooled_client::set_caller_id(const std::string& caller_id)
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	if (connection_ && connection_->handle)
	{
		connection_->handle->set_caller_id(caller_id);
	}
}

void pooled_client::release()
{
	if (released_.exchange(true))
	{
		return;
	}

	std::unique_ptr<pooled_connection> connection;
	std::string reason;
	{
		std::lock_guard<std::mutex> lock(state_mutex_);
		connection = std::move(connection_);
		reason = invalid_reason_;
	}

	if (auto pool = pool_.lock())
	{
		pool->return_connection(std::move(connection), invalid_.load(), reason, holds_capacity_);
	}
}

bool pooled_client::is_released() const noexcept
{
	return released_.load();
}

} // namespace record_client::pooling
