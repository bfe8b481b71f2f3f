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

#include <kcenon/record_client/pooling/pool_registry.h>

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/logging/console_logger.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

namespace record_client::pooling
{

using kcenon::common::interfaces::log_level;

namespace
{

constexpr std::chrono::milliseconds wait_slice{ 50 };

std::string to_lower(std::string text)
{
	std::transform(text.begin(), text.end(), text.begin(),
				   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

bool iequals(const std::string& lhs, const std::string& rhs)
{
	return lhs.size() == rhs.size() && to_lower(lhs) == to_lower(rhs);
}

bool ends_with(const std::string& text, const std::string& suffix)
{
	return text.size() >= suffix.size()
		   && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool key_contains_identity(const std::string& key, const std::string& identity)
{
	auto pipe = key.find('|');
	if (pipe == std::string::npos)
	{
		return false;
	}

	std::istringstream identities(key.substr(0, pipe));
	std::string name;
	while (std::getline(identities, name, ','))
	{
		if (iequals(name, identity))
		{
			return true;
		}
	}
	return false;
}

void shutdown_if_created(const std::shared_future<pool_registry::pool_result>& future)
{
	if (!future.valid())
	{
		return;
	}

	future.wait();
	const auto& result = future.get();
	if (result.is_ok() && result.value())
	{
		result.value()->shutdown();
	}
}

} // namespace

/**
 * @brief Job that runs one pool creation
 */
class pool_creation_job : public kcenon::common::interfaces::IJob
{
public:
	pool_creation_job(pool_registry::pool_factory factory,
					  std::vector<std::string> identities,
					  std::string endpoint,
					  std::shared_ptr<std::promise<pool_registry::pool_result>> promise)
		: factory_(std::move(factory))
		, identities_(std::move(identities))
		, endpoint_(std::move(endpoint))
		, promise_(std::move(promise))
	{
	}

	kcenon::common::VoidResult execute() override
	{
		try
		{
			promise_->set_value(factory_(identities_, endpoint_));
		}
		catch (const std::exception& e)
		{
			promise_->set_value(make_error(error_code::validation_failure,
										   std::string("Pool creation threw: ") + e.what(),
										   "pool_registry"));
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "pool_creation"; }
	int get_priority() const override { return 0; }

private:
	pool_registry::pool_factory factory_;
	std::vector<std::string> identities_;
	std::string endpoint_;
	std::shared_ptr<std::promise<pool_registry::pool_result>> promise_;
};

pool_registry::pool_registry(pool_factory factory,
							 std::chrono::milliseconds creation_timeout,
							 std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: factory_(std::move(factory))
	, creation_timeout_(creation_timeout)
	, executor_(std::move(executor))
{
}

pool_registry::~pool_registry()
{
	shutdown();
}

std::string pool_registry::make_key(const std::vector<std::string>& identities,
									const std::string& endpoint)
{
	auto sorted = identities;
	std::stable_sort(sorted.begin(), sorted.end(),
					 [](const std::string& lhs, const std::string& rhs)
					 { return to_lower(lhs) < to_lower(rhs); });

	std::string key;
	for (size_t i = 0; i < sorted.size(); ++i)
	{
		if (i > 0)
		{
			key += ",";
		}
		key += sorted[i];
	}

	return key + "|" + normalize_endpoint(endpoint);
}

pool_registry::pool_result pool_registry::get_or_create(
	const std::vector<std::string>& identities, const std::string& endpoint)
{
	return get_or_create(identities, endpoint, kcenon::thread::cancellation_token::create());
}

pool_registry::pool_result pool_registry::get_or_create(
	const std::vector<std::string>& identities,
	const std::string& endpoint,
	const kcenon::thread::cancellation_token& token)
{
	if (identities.empty())
	{
		return make_error(error_code::validation_failure,
						  "At least one identity is required", "pool_registry");
	}
	if (normalize_endpoint(endpoint).empty())
	{
		return make_error(error_code::validation_failure, "Endpoint is required",
						  "pool_registry");
	}

	auto key = make_key(identities, endpoint);

	std::shared_future<pool_result> future;
	uint64_t generation = 0;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		if (shutdown_)
		{
			return make_error(error_code::pool_shutdown, "Pool registry is shut down",
							  "pool_registry");
		}

		auto it = entries_.find(key);
		if (it == entries_.end())
		{
			entry created;
			created.future = start_creation(identities, endpoint);
			created.generation = ++next_generation_;
			it = entries_.emplace(key, std::move(created)).first;
			logging::log_message(get_logger(), log_level::info, "Creating connection pool for " + key);
		}
		future = it->second.future;
		generation = it->second.generation;
	}

	auto deadline = std::chrono::steady_clock::now() + creation_timeout_;
	while (future.wait_for(wait_slice) != std::future_status::ready)
	{
		if (token.is_cancelled())
		{
			return make_error(error_code::operation_cancelled,
							  "Wait for pool " + key + " cancelled", "pool_registry");
		}

		if (std::chrono::steady_clock::now() >= deadline)
		{
			remove_if_current(key, generation);
			retire(future);
			logging::log_message(get_logger(), log_level::error,
								 "Pool creation timed out for " + key);
			return make_error(error_code::pool_creation_timeout,
							  "Pool creation timed out after "
								  + std::to_string(creation_timeout_.count()) + "ms for key: "
								  + key,
							  "pool_registry");
		}
	}

	const auto& result = future.get();
	if (result.is_err())
	{
		remove_if_current(key, generation);
		logging::log_message(get_logger(), log_level::error,
							 "Pool creation failed for " + key + ": " + result.error().message);
		return result.error();
	}

	return result.value();
}

size_t pool_registry::invalidate_identity(const std::string& identity)
{
	if (identity.empty())
	{
		return 0;
	}

	std::vector<std::shared_future<pool_result>> removed;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		for (auto it = entries_.begin(); it != entries_.end();)
		{
			if (key_contains_identity(it->first, identity))
			{
				removed.push_back(it->second.future);
				it = entries_.erase(it);
			}
			else
			{
				++it;
			}
		}
	}

	for (auto& future : removed)
	{
		retire(future);
	}

	logging::log_message(get_logger(), log_level::info,
						 "Invalidated " + std::to_string(removed.size()) + " pools for identity "
							 + identity);
	return removed.size();
}

size_t pool_registry::invalidate_endpoint(const std::string& endpoint)
{
	auto normalized = normalize_endpoint(endpoint);
	if (normalized.empty())
	{
		return 0;
	}

	std::vector<std::shared_future<pool_result>> removed;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		for (auto it = entries_.begin(); it != entries_.end();)
		{
			if (ends_with(it->first, "|" + normalized))
			{
				removed.push_back(it->second.future);
				it = entries_.erase(it);
			}
			else
			{
				++it;
			}
		}
	}

	for (auto& future : removed)
	{
		retire(future);
	}

	logging::log_message(get_logger(), log_level::info,
						 "Invalidated " + std::to_string(removed.size()) + " pools for endpoint "
							 + normalized);
	return removed.size();
}

size_t pool_registry::size() const
{
	std::lock_guard<std::mutex> lock(entries_mutex_);
	return entries_.size();
}

void pool_registry::shutdown()
{
	std::vector<std::shared_future<pool_result>> pending;
	{
		std::lock_guard<std::mutex> lock(entries_mutex_);
		if (shutdown_)
		{
			return;
		}
		shutdown_ = true;

		for (auto& [key, value] : entries_)
		{
			pending.push_back(value.future);
		}
		entries_.clear();

		pending.insert(pending.end(), retired_.begin(), retired_.end());
		retired_.clear();
	}

	for (auto& future : pending)
	{
		shutdown_if_created(future);
	}
}

void pool_registry::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

std::shared_ptr<kcenon::common::interfaces::ILogger> pool_registry::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

std::shared_future<pool_registry::pool_result> pool_registry::start_creation(
	const std::vector<std::string>& identities, const std::string& endpoint)
{
	auto promise = std::make_shared<std::promise<pool_result>>();
	auto future = promise->get_future().share();

	auto job = std::make_unique<pool_creation_job>(factory_, identities, endpoint, promise);

	if (executor_)
	{
		auto result = executor_->execute(std::move(job));
		if (result.is_ok())
		{
			return future;
		}
		// The job was consumed; run the factory on a dedicated thread instead
		job = std::make_unique<pool_creation_job>(factory_, identities, endpoint, promise);
	}

	std::thread(
		[job = std::move(job)]() mutable
		{
			[[maybe_unused]] auto result = job->execute();
		})
		.detach();

	return future;
}

void pool_registry::remove_if_current(const std::string& key, uint64_t generation)
{
	std::lock_guard<std::mutex> lock(entries_mutex_);
	auto it = entries_.find(key);
	if (it != entries_.end() && it->second.generation == generation)
	{
		entries_.erase(it);
	}
}

void pool_registry::retire(std::shared_future<pool_result> future)
{
	if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
	{
		shutdown_if_created(future);
		return;
	}

	// Still being created: shut it down once the registry shuts down
	std::lock_guard<std::mutex> lock(entries_mutex_);
	retired_.push_back(std::move(future));
}

std::string pool_registry::normalize_endpoint(const std::string& endpoint)
{
	auto normalized = endpoint;
	while (!normalized.empty() && normalized.back() == '/')
	{
		normalized.pop_back();
	}
	return to_lower(normalized);
}

} // namespace record_client::pooling
