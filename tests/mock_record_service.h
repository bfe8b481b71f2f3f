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
 * @file mock_record_service.h
 * @brief Scripted service handles and sources shared by the unit tests
 */

#pragma once

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/core/record_service.h>
#include <kcenon/record_client/core/remote_types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace record_client::testing
{

/**
 * @brief Behaviour shared by every handle cloned from one source
 *
 * The handler sees each request together with the name of the source whose
 * handle executed it. Without a handler every request succeeds.
 */
struct service_script
{
	using handler_type
		= std::function<service_response(const service_request&, const std::string& source)>;

	void set_handler(handler_type handler)
	{
		std::lock_guard<std::mutex> lock(mutex);
		handler_ = std::move(handler);
	}

	service_response dispatch(const service_request& request, const std::string& source)
	{
		handler_type handler;
		{
			std::lock_guard<std::mutex> lock(mutex);
			requests.push_back(request);
			handler = handler_;
		}
		executions.fetch_add(1);

		if (latency.count() > 0)
		{
			std::this_thread::sleep_for(latency);
		}

		return handler ? handler(request, source) : success_for(request);
	}

	/**
	 * @brief Called whenever a checkout applies a caller id to a handle
	 *
	 * Runs after the pool has picked the handle's source, so a hook that
	 * records a throttle makes the client arrive already throttled.
	 */
	void set_checkout_hook(std::function<void(const std::string& source)> hook)
	{
		std::lock_guard<std::mutex> lock(mutex);
		checkout_hook_ = std::move(hook);
	}

	void checked_out(const std::string& source)
	{
		std::function<void(const std::string&)> hook;
		{
			std::lock_guard<std::mutex> lock(mutex);
			hook = checkout_hook_;
		}
		checkouts.fetch_add(1);
		if (hook)
		{
			hook(source);
		}
	}

	std::vector<service_request> recorded_requests() const
	{
		std::lock_guard<std::mutex> lock(mutex);
		return requests;
	}

	/**
	 * @brief Successful response: create assigns "<entity>-<n>" ids, upsert creates
	 */
	static service_response success_for(const service_request& request)
	{
		static std::atomic<uint64_t> next_id{ 1 };

		service_response response;
		if (request.type == request_type::create_multiple)
		{
			for (size_t i = 0; i < request.targets.size(); ++i)
			{
				response.created_ids.push_back(request.entity + "-"
											   + std::to_string(next_id.fetch_add(1)));
			}
		}
		else if (request.type == request_type::upsert_multiple)
		{
			response.upsert_created.assign(request.targets.size(), true);
		}
		return response;
	}

	mutable std::mutex mutex;
	std::vector<service_request> requests;
	std::atomic<uint64_t> executions{ 0 };
	std::atomic<uint64_t> clones{ 0 };
	std::atomic<int> clone_failures{ 0 };    ///< Next clones that fail with an auth error
	std::atomic<int> seed_failures{ 0 };     ///< Next authentications that fail
	std::atomic<uint32_t> recommended_dop{ 4 };
	std::atomic<bool> ready{ true };
	std::atomic<uint64_t> affinity_disabled{ 0 }; ///< Handles told to drop sticky routing
	std::atomic<uint64_t> checkouts{ 0 };         ///< Checkouts that carried a caller id
	std::chrono::milliseconds latency{ 0 };

private:
	handler_type handler_;
	std::function<void(const std::string&)> checkout_hook_;
};

/**
 * @brief service_handle whose behaviour comes from a service_script
 */
class mock_handle : public service_handle
{
public:
	mock_handle(std::shared_ptr<service_script> script, std::string source)
		: script_(std::move(script))
		, source_(std::move(source))
	{
	}

	kcenon::common::Result<std::unique_ptr<service_handle>> clone() const override
	{
		if (script_->clone_failures.load() > 0)
		{
			script_->clone_failures.fetch_sub(1);
			return make_error(error_code::authentication_failure, "401 Unauthorized: token expired",
							  "mock_handle");
		}
		script_->clones.fetch_add(1);
		std::unique_ptr<service_handle> copy = std::make_unique<mock_handle>(script_, source_);
		return copy;
	}

	bool is_ready() const override { return script_->ready.load(); }

	service_response execute(const service_request& request) override
	{
		return script_->dispatch(request, source_);
	}

	uint32_t recommended_parallelism() const override { return script_->recommended_dop.load(); }

	std::string caller_id() const override { return caller_id_; }

	void set_caller_id(const std::string& caller_id) override
	{
		caller_id_ = caller_id;
		if (!caller_id.empty())
		{
			script_->checked_out(source_);
		}
	}

	void set_session_affinity(bool enabled) override
	{
		session_affinity_ = enabled;
		if (!enabled)
		{
			script_->affinity_disabled.fetch_add(1);
		}
	}

	bool session_affinity() const { return session_affinity_; }

private:
	std::shared_ptr<service_script> script_;
	std::string source_;
	std::string caller_id_;
	bool session_affinity_ = true;
};

/**
 * @brief seed_connection_source whose authenticator yields mock handles
 *
 * The source is named "<identity>@test".
 */
inline std::shared_ptr<seed_connection_source> make_mock_source(
	const std::string& identity, uint32_t max_pool_size, std::shared_ptr<service_script> script)
{
	auto name = identity + "@test";
	return std::make_shared<seed_connection_source>(
		identity, "test", max_pool_size,
		[script, name]() -> kcenon::common::Result<std::unique_ptr<service_handle>>
		{
			if (script->seed_failures.load() > 0)
			{
				script->seed_failures.fetch_sub(1);
				return make_error(error_code::authentication_failure,
								  "AADSTS7000215: invalid client secret", "mock_source");
			}
			std::unique_ptr<service_handle> handle = std::make_unique<mock_handle>(script, name);
			return handle;
		});
}

/**
 * @brief Records "<prefix>-<i>" for i in [0, count)
 */
inline std::vector<record> make_records(size_t count, const std::string& prefix = "rec")
{
	std::vector<record> records;
	records.reserve(count);
	for (size_t i = 0; i < count; ++i)
	{
		record item;
		item.id = prefix + "-" + std::to_string(i);
		item.attributes["name"] = "Record " + std::to_string(i);
		records.push_back(std::move(item));
	}
	return records;
}

inline service_response rate_limited_response(std::chrono::milliseconds retry_after)
{
	service_response response;
	response.status = status_code::rate_limited;
	response.fault_code = -2147015902;
	response.message = "Number of requests exceeded the limit";
	response.retry_after = retry_after;
	return response;
}

inline service_response fault_response(status_code status, const std::string& message,
									   int fault_code = -2147220891)
{
	service_response response;
	response.status = status;
	response.fault_code = fault_code;
	response.message = message;
	return response;
}

} // namespace record_client::testing
