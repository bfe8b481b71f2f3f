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

#include <kcenon/record_client/pooling/connection_pool.h>

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/logging/console_logger.h>

#include <algorithm>
#include <set>
#include <thread>

namespace record_client::pooling
{

using kcenon::common::interfaces::log_level;

namespace
{

// Added to the shortest throttle expiry so the wait ends after it, not at it
constexpr std::chrono::milliseconds throttle_wait_buffer{ 100 };

// Granularity of interruptible sleeps
constexpr std::chrono::milliseconds sleep_slice{ 50 };

std::atomic<uint64_t> next_connection_number{ 0 };

enum class sleep_outcome
{
	elapsed,
	cancelled,
	stopped,
};

sleep_outcome interruptible_sleep(std::chrono::milliseconds duration,
								  const kcenon::thread::cancellation_token& token,
								  const std::atomic<bool>& stop_requested)
{
	auto deadline = std::chrono::steady_clock::now() + duration;
	while (true)
	{
		if (stop_requested.load())
		{
			return sleep_outcome::stopped;
		}
		if (token.is_cancelled())
		{
			return sleep_outcome::cancelled;
		}

		auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
		{
			return sleep_outcome::elapsed;
		}

		std::this_thread::sleep_for(
			std::min<std::chrono::steady_clock::duration>(deadline - now, sleep_slice));
	}
}

uint64_t elapsed_us(std::chrono::steady_clock::time_point start)
{
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
									 std::chrono::steady_clock::now() - start)
									 .count());
}

} // namespace

/**
 * @brief Job implementation for the background validation loop
 */
class validation_job : public kcenon::common::interfaces::IJob
{
public:
	explicit validation_job(connection_pool* pool)
		: pool_(pool)
	{
	}

	kcenon::common::VoidResult execute() override
	{
		if (pool_)
		{
			pool_->validation_loop();
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "pool_validation_loop"; }
	int get_priority() const override { return 0; }

private:
	connection_pool* pool_;
};

kcenon::common::Result<std::shared_ptr<connection_pool>> connection_pool::create(
	std::vector<std::shared_ptr<connection_source>> sources,
	const connection_pool_config& config,
	std::shared_ptr<resilience::throttle_tracker> tracker,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
{
	if (sources.empty())
	{
		return make_error(error_code::validation_failure,
						  "At least one connection source is required", "connection_pool");
	}

	std::set<std::string> names;
	size_t declared_capacity = 0;
	for (const auto& source : sources)
	{
		if (!source)
		{
			return make_error(error_code::validation_failure, "Connection source is null",
							  "connection_pool");
		}
		if (!names.insert(source->name()).second)
		{
			return make_error(error_code::validation_failure,
							  "Duplicate connection source name: " + source->name(),
							  "connection_pool");
		}
		declared_capacity += source->max_pool_size();
	}

	if (config.acquire_timeout.count() <= 0)
	{
		return make_error(error_code::validation_failure, "acquire_timeout must be positive",
						  "connection_pool");
	}
	if (config.enable_validation && config.validation_interval.count() <= 0)
	{
		return make_error(error_code::validation_failure,
						  "validation_interval must be positive when validation is enabled",
						  "connection_pool");
	}

	size_t capacity = config.max_pool_size > 0 ? config.max_pool_size : declared_capacity;
	if (capacity == 0)
	{
		return make_error(error_code::validation_failure,
						  "Pool capacity is zero: sources declare no parallelism",
						  "connection_pool");
	}

	if (!tracker)
	{
		tracker = std::make_shared<resilience::throttle_tracker>();
	}

	std::shared_ptr<connection_pool> pool(new connection_pool(std::move(sources), config,
															  capacity, std::move(tracker),
															  std::move(logger),
															  std::move(executor)));

	pool->log(log_level::info,
			  "Connection pool initialized: " + std::to_string(pool->source_names_.size())
				  + " sources, capacity " + std::to_string(capacity) + ", strategy "
				  + to_string(config.strategy)
				  + (config.enabled ? "" : ", pooling disabled"));

	if (config.enabled && config.min_pool_size > 0)
	{
		for (const auto& name : pool->source_names_)
		{
			pool->warm_up(name, config.min_pool_size);
		}
	}

	if (config.enabled && config.enable_validation)
	{
		pool->start_validation();
	}

	return pool;
}

connection_pool::connection_pool(
	std::vector<std::shared_ptr<connection_source>> sources,
	const connection_pool_config& config,
	size_t capacity,
	std::shared_ptr<resilience::throttle_tracker> tracker,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor)
	: sources_(std::move(sources))
	, config_(config)
	, capacity_(capacity)
	, tracker_(std::move(tracker))
	, semaphore_(capacity)
	, shutdown_token_(kcenon::thread::cancellation_token::create())
	, executor_(std::move(executor))
	, logger_(std::move(logger))
{
	for (const auto& source : sources_)
	{
		auto name = source->name();
		source_names_.push_back(name);

		source_state state;
		state.source = source;
		states_.emplace(name, std::move(state));
	}
}

connection_pool::~connection_pool()
{
	if (!shutdown_requested_.load())
	{
		shutdown();
	}
}

kcenon::common::Result<std::unique_ptr<pooled_client>> connection_pool::acquire(
	const client_options& options, const std::string& exclude_name)
{
	return acquire(options, exclude_name, kcenon::thread::cancellation_token::create());
}

kcenon::common::Result<std::unique_ptr<pooled_client>> connection_pool::acquire(
	const client_options& options,
	const std::string& exclude_name,
	const kcenon::thread::cancellation_token& token)
{
	if (shutdown_requested_.load())
	{
		return make_error(error_code::pool_shutdown, "Pool is shutting down", "connection_pool");
	}

	if (!config_.enabled)
	{
		return acquire_direct(options);
	}

	auto start_time = std::chrono::steady_clock::now();
	auto candidates = candidate_names(exclude_name);

	while (true)
	{
		// Phase 1: wait for a usable source without holding capacity
		auto ready = wait_for_available_source(candidates, token);
		if (ready.is_err())
		{
			metrics_.record_acquisition(elapsed_us(start_time), false);
			return ready.error();
		}

		// Phase 2: admission
		auto status = semaphore_.acquire(config_.acquire_timeout, token);
		if (status != acquire_status::acquired)
		{
			metrics_.record_acquisition(elapsed_us(start_time), false);
			switch (status)
			{
			case acquire_status::timeout:
				metrics_.record_timeout();
				return make_error(error_code::pool_exhausted,
								  "Connection acquisition timeout after "
									  + std::to_string(config_.acquire_timeout.count()) + "ms",
								  "connection_pool");
			case acquire_status::cancelled:
				return make_error(error_code::operation_cancelled,
								  "Connection acquisition cancelled", "connection_pool");
			case acquire_status::closed:
			default:
				return make_error(error_code::pool_shutdown, "Pool is shutting down",
								  "connection_pool");
			}
		}

		std::map<std::string, size_t> active_counts;
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			for (const auto& [name, state] : states_)
			{
				active_counts[name] = state.active;
			}
		}

		const auto rotation = rotation_.fetch_add(1, std::memory_order_relaxed);
		auto index = select_source(config_.strategy, candidates, *tracker_, active_counts, rotation);

		// Strategies that ignore throttling can keep landing on the same
		// throttled source while another one is free
		if (tracker_->is_throttled(candidates[index]) && any_available(candidates, *tracker_))
		{
			index = select_source(selection_strategy::throttle_aware, candidates, *tracker_,
								  active_counts, rotation);
		}
		const auto& selected = candidates[index];

		// Throttled while we were queued for admission: give the slot back
		if (tracker_->is_throttled(selected))
		{
			semaphore_.release();
			continue;
		}

		auto connection = take_idle(selected);
		if (!connection)
		{
			auto created = create_connection(selected);
			if (created.is_err())
			{
				semaphore_.release();
				metrics_.record_acquisition(elapsed_us(start_time), false);
				return created.error();
			}
			connection = std::move(created.value());
		}

		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			auto& state = states_[selected];
			++state.active;
			++state.requests_served;
		}
		metrics_.update_active(1);
		metrics_.record_acquisition(elapsed_us(start_time), true);

		auto client = std::make_unique<pooled_client>(std::move(connection), tracker_,
													  weak_from_this(), true);
		apply_options(*client, options);
		return client;
	}
}

kcenon::common::Result<std::unique_ptr<pooled_client>> connection_pool::acquire_direct(
	const client_options& options)
{
	auto created = create_connection(source_names_.front());
	if (created.is_err())
	{
		return created.error();
	}

	auto client = std::make_unique<pooled_client>(std::move(created.value()), tracker_,
												  weak_from_this(), false);
	apply_options(*client, options);
	return client;
}

kcenon::common::VoidResult connection_pool::wait_for_available_source(
	const std::vector<std::string>& candidates, const kcenon::thread::cancellation_token& token)
{
	if (any_available(candidates, *tracker_))
	{
		return kcenon::common::ok();
	}

	auto wait_start = std::chrono::steady_clock::now();
	std::chrono::milliseconds waited{ 0 };
	log(log_level::info, "All connection sources throttled, waiting for the earliest expiry");

	while (!any_available(candidates, *tracker_))
	{
		std::optional<resilience::throttle_tracker::clock::time_point> earliest;
		for (const auto& name : candidates)
		{
			auto expiry = tracker_->expiry_of(name);
			if (expiry && (!earliest || *expiry < *earliest))
			{
				earliest = expiry;
			}
		}

		std::chrono::milliseconds wait{ 0 };
		if (earliest)
		{
			wait = std::chrono::ceil<std::chrono::milliseconds>(
				*earliest - resilience::throttle_tracker::clock::now());
			wait = std::max(wait, std::chrono::milliseconds(0));
		}
		wait += throttle_wait_buffer;

		if (config_.max_retry_after_tolerance && waited + wait > *config_.max_retry_after_tolerance)
		{
			return make_error(error_code::all_sources_throttled,
							  "All connection sources throttled beyond the tolerance of "
								  + std::to_string(config_.max_retry_after_tolerance->count())
								  + "ms",
							  "connection_pool");
		}

		auto outcome = interruptible_sleep(wait, token, shutdown_requested_);
		if (outcome == sleep_outcome::cancelled)
		{
			return make_error(error_code::operation_cancelled,
							  "Throttle wait cancelled", "connection_pool");
		}
		if (outcome == sleep_outcome::stopped)
		{
			return make_error(error_code::pool_shutdown, "Pool is shutting down",
							  "connection_pool");
		}
		waited += wait;
	}

	auto total = elapsed_us(wait_start);
	metrics_.record_throttle_wait(total);
	log(log_level::info,
		"Throttle wait finished after " + std::to_string(total / 1000) + "ms");
	return kcenon::common::ok();
}

std::vector<std::string> connection_pool::candidate_names(const std::string& exclude_name) const
{
	if (exclude_name.empty() || source_names_.size() <= 1)
	{
		return source_names_;
	}

	std::vector<std::string> filtered;
	std::copy_if(source_names_.begin(), source_names_.end(), std::back_inserter(filtered),
				 [&exclude_name](const std::string& name) { return name != exclude_name; });

	return filtered.empty() ? source_names_ : filtered;
}

std::unique_ptr<pooled_connection> connection_pool::take_idle(const std::string& source_name)
{
	while (true)
	{
		std::unique_ptr<pooled_connection> connection;
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			auto& idle = states_[source_name].idle;
			if (idle.empty())
			{
				return nullptr;
			}
			connection = std::move(idle.front());
			idle.pop_front();
		}

		if (!config_.validate_on_checkout)
		{
			return connection;
		}

		auto reason = eviction_reason(*connection);
		if (reason.empty())
		{
			return connection;
		}

		metrics_.evicted_connections.fetch_add(1, std::memory_order_relaxed);
		log(log_level::debug, "Discarding idle connection " + connection->connection_id
								  + " on checkout: " + reason);
	}
}

kcenon::common::Result<std::unique_ptr<pooled_connection>> connection_pool::create_connection(
	const std::string& source_name)
{
	std::shared_ptr<connection_source> source;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		auto it = states_.find(source_name);
		if (it != states_.end())
		{
			source = it->second.source;
		}
	}

	if (!source)
	{
		return make_error(error_code::validation_failure,
						  "Unknown connection source: " + source_name, "connection_pool");
	}

	kcenon::common::error_info last_error{ static_cast<int>(error_code::connection_failure),
										   "Could not create a connection for " + source_name,
										   "connection_pool" };

	for (uint32_t attempt = 0; attempt <= config_.max_connection_retries; ++attempt)
	{
		if (shutdown_requested_.load())
		{
			return make_error(error_code::pool_shutdown, "Pool is shutting down",
							  "connection_pool");
		}

		auto seed = source->seed_handle();
		if (seed.is_err())
		{
			last_error = seed.error();
			if (has_code(last_error, error_code::authentication_failure))
			{
				source->invalidate_seed();
				record_auth_failure();
			}
			log(log_level::warning, "Seed for " + source_name + " unavailable (attempt "
										+ std::to_string(attempt + 1)
										+ "): " + last_error.message);
			continue;
		}

		auto seed_handle = seed.value();
		auto cloned = seed_handle->clone();
		if (cloned.is_err())
		{
			last_error = cloned.error();
			if (has_code(last_error, error_code::authentication_failure))
			{
				source->invalidate_seed();
				record_auth_failure();
				std::lock_guard<std::mutex> lock(queue_mutex_);
				states_[source_name].seed_parallelism.reset();
			}
			log(log_level::warning, "Cloning seed for " + source_name + " failed (attempt "
										+ std::to_string(attempt + 1)
										+ "): " + last_error.message);
			continue;
		}

		auto handle = std::move(cloned.value());
		if (!handle)
		{
			last_error = make_error(error_code::connection_failure,
									"Seed clone returned no handle for " + source_name,
									"connection_pool");
			continue;
		}

		handle->set_session_affinity(!config_.disable_session_affinity);

		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			states_[source_name].seed_parallelism = seed_handle->recommended_parallelism();
		}

		auto now = pooled_connection::clock::now();
		auto connection = std::make_unique<pooled_connection>();
		connection->connection_id
			= source_name + "#" + std::to_string(next_connection_number.fetch_add(1) + 1);
		connection->source_name = source_name;
		connection->default_caller_id = handle->caller_id();
		connection->handle = std::move(handle);
		connection->created_at = now;
		connection->last_used_at = now;
		return connection;
	}

	return last_error;
}

std::string connection_pool::eviction_reason(const pooled_connection& connection) const
{
	auto now = pooled_connection::clock::now();

	if (!connection.handle)
	{
		return "no handle";
	}
	if (now - connection.last_used_at > config_.max_idle_time)
	{
		return "idle longer than " + std::to_string(config_.max_idle_time.count()) + "ms";
	}
	if (now - connection.created_at > config_.max_lifetime)
	{
		return "older than " + std::to_string(config_.max_lifetime.count()) + "ms";
	}
	if (!connection.handle->is_ready())
	{
		return "handle not ready";
	}
	return "";
}

void connection_pool::apply_options(pooled_client& client, const client_options& options)
{
	if (options.caller_id)
	{
		client.set_caller_id(*options.caller_id);
	}
}

void connection_pool::return_connection(std::unique_ptr<pooled_connection> connection,
										bool invalid,
										const std::string& reason,
										bool holds_capacity)
{
	if (!holds_capacity)
	{
		// Direct clients are never pooled
		return;
	}

	if (connection && !invalid && connection->handle)
	{
		connection->handle->set_caller_id(connection->default_caller_id);
		connection->last_used_at = pooled_connection::clock::now();
	}

	std::unique_ptr<pooled_connection> disposed;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);

		if (connection)
		{
			auto it = states_.find(connection->source_name);
			if (it != states_.end())
			{
				auto& state = it->second;
				if (state.active > 0)
				{
					--state.active;
				}

				if (invalid || shutdown_requested_.load()
					|| state.idle.size() >= state.source->max_pool_size())
				{
					disposed = std::move(connection);
				}
				else
				{
					state.idle.push_back(std::move(connection));
				}
			}
		}
	}

	metrics_.update_active(-1);

	if (invalid)
	{
		metrics_.invalid_connections.fetch_add(1, std::memory_order_relaxed);
		log(log_level::warning, "Disposing invalid connection "
									+ (disposed ? disposed->connection_id : std::string("?"))
									+ ": " + reason);
	}

	semaphore_.release();
}

kcenon::common::Result<service_response> connection_pool::execute_with_retry(
	const service_request& request)
{
	return execute_with_retry(request, kcenon::thread::cancellation_token::create());
}

kcenon::common::Result<service_response> connection_pool::execute_with_retry(
	const service_request& request, const kcenon::thread::cancellation_token& token)
{
	while (true)
	{
		auto acquired = acquire(client_options{}, "", token);
		if (acquired.is_err())
		{
			return acquired.error();
		}

		auto client = std::move(acquired.value());
		auto result = client->execute(request);
		if (result.is_ok())
		{
			return result;
		}

		const auto& error = result.error();
		if (has_code(error, error_code::rate_limited))
		{
			log(log_level::debug, "Request " + request.name + " throttled on "
									  + client->source_name() + ", retrying");
			client->release();
			continue;
		}

		if (has_code(error, error_code::authentication_failure))
		{
			client->mark_invalid("authentication failure: " + error.message);
			[[maybe_unused]] auto invalidated = invalidate_seed(client->source_name());
		}
		else if (has_code(error, error_code::connection_failure))
		{
			client->mark_invalid("connection failure: " + error.message);
			record_connection_failure();
		}

		return error;
	}
}

kcenon::common::VoidResult connection_pool::invalidate_seed(const std::string& source_name)
{
	std::shared_ptr<connection_source> source;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		auto it = states_.find(source_name);
		if (it == states_.end())
		{
			return make_error(error_code::validation_failure,
							  "Unknown connection source: " + source_name, "connection_pool");
		}
		source = it->second.source;
		it->second.seed_parallelism.reset();
	}

	source->invalidate_seed();
	record_auth_failure();
	log(log_level::warning, "Seed invalidated for " + source_name);
	return kcenon::common::ok();
}

void connection_pool::record_auth_failure()
{
	metrics_.auth_failures.fetch_add(1, std::memory_order_relaxed);
}

void connection_pool::record_connection_failure()
{
	metrics_.connection_failures.fetch_add(1, std::memory_order_relaxed);
}

pool_statistics connection_pool::stats() const
{
	pool_statistics result;
	result.capacity = capacity_;

	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		for (const auto& name : source_names_)
		{
			const auto& state = states_.at(name);

			source_statistics source;
			source.name = name;
			source.active = state.active;
			source.idle = state.idle.size();
			source.throttled = tracker_->is_throttled(name);
			source.requests_served = state.requests_served;

			result.active += source.active;
			result.idle += source.idle;
			result.requests_served += source.requests_served;
			if (source.throttled)
			{
				++result.throttled_sources;
			}
			result.sources.push_back(std::move(source));
		}
	}

	result.throttle_events = tracker_->total_events();
	result.total_backoff = tracker_->total_backoff_time();
	result.invalid_connections = metrics_.invalid_connections.load(std::memory_order_relaxed);
	result.auth_failures = metrics_.auth_failures.load(std::memory_order_relaxed);
	result.connection_failures = metrics_.connection_failures.load(std::memory_order_relaxed);
	return result;
}

size_t connection_pool::total_capacity() const noexcept
{
	return capacity_;
}

size_t connection_pool::total_recommended_parallelism() const
{
	size_t total = 0;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		for (const auto& [name, state] : states_)
		{
			size_t declared = state.source->max_pool_size();
			size_t recommended = declared;
			if (state.seed_parallelism && *state.seed_parallelism > 0)
			{
				recommended = std::min<size_t>(*state.seed_parallelism, declared);
			}
			total += recommended;
		}
	}

	return std::min(total, capacity_);
}

size_t connection_pool::validate_now()
{
	size_t evicted = 0;

	for (const auto& name : source_names_)
	{
		size_t queued = 0;
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			queued = states_[name].idle.size();
		}

		// One client at a time so checkouts proceed during the pass
		for (size_t i = 0; i < queued; ++i)
		{
			std::unique_ptr<pooled_connection> connection;
			{
				std::lock_guard<std::mutex> lock(queue_mutex_);
				auto& idle = states_[name].idle;
				if (idle.empty())
				{
					break;
				}
				connection = std::move(idle.front());
				idle.pop_front();
			}

			auto reason = eviction_reason(*connection);
			if (!reason.empty())
			{
				++evicted;
				log(log_level::debug,
					"Evicting connection " + connection->connection_id + ": " + reason);
				continue;
			}

			std::lock_guard<std::mutex> lock(queue_mutex_);
			states_[name].idle.push_back(std::move(connection));
		}

		bool seeded = false;
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			seeded = states_[name].seed_parallelism.has_value();
		}
		if (seeded && !shutdown_requested_.load())
		{
			warm_up(name, std::max<size_t>(1, config_.min_pool_size));
		}
	}

	metrics_.record_validation(evicted);
	return evicted;
}

void connection_pool::warm_up(const std::string& source_name, size_t target)
{
	while (!shutdown_requested_.load())
	{
		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			auto& state = states_[source_name];
			size_t limit = std::min<size_t>(target, state.source->max_pool_size());
			if (state.idle.size() >= limit)
			{
				return;
			}
		}

		auto created = create_connection(source_name);
		if (created.is_err())
		{
			log(log_level::warning, "Warm-up for " + source_name
										+ " failed: " + created.error().message);
			return;
		}

		std::lock_guard<std::mutex> lock(queue_mutex_);
		states_[source_name].idle.push_back(std::move(created.value()));
	}
}

void connection_pool::start_validation()
{
	if (validation_running_.exchange(true))
	{
		return;
	}

	if (executor_)
	{
		auto job = std::make_unique<validation_job>(this);
		auto result = executor_->execute(std::move(job));
		if (result.is_ok())
		{
			validation_future_ = std::move(result.unwrap());
			return;
		}
		log(log_level::warning,
			"Executor rejected validation loop, using a dedicated thread: "
				+ result.error().message);
	}

	validation_future_ = std::async(std::launch::async, [this] { validation_loop(); });
}

void connection_pool::stop_validation()
{
	if (!validation_running_.exchange(false))
	{
		return;
	}

	if (validation_future_.valid())
	{
		validation_future_.wait();
	}
}

void connection_pool::validation_loop()
{
	while (!shutdown_requested_.load() && validation_running_.load())
	{
		// Sleep for the interval, checking for shutdown frequently
		auto sleep_until = std::chrono::steady_clock::now() + config_.validation_interval;
		while (std::chrono::steady_clock::now() < sleep_until && !shutdown_requested_.load()
			   && validation_running_.load())
		{
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}

		if (shutdown_requested_.load() || !validation_running_.load())
		{
			break;
		}

		auto evicted = validate_now();
		if (evicted > 0)
		{
			log(log_level::debug,
				"Validation pass evicted " + std::to_string(evicted) + " connections");
		}
	}
}

void connection_pool::shutdown()
{
	if (shutdown_requested_.exchange(true))
	{
		// Already shutting down
		return;
	}

	shutdown_token_.cancel();
	semaphore_.close();
	stop_validation();

	size_t disposed = 0;
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		for (auto& [name, state] : states_)
		{
			disposed += state.idle.size();
			state.idle.clear();
		}
	}

	log(log_level::info,
		"Connection pool shut down, disposed " + std::to_string(disposed) + " idle connections");
}

bool connection_pool::is_shutdown_requested() const noexcept
{
	return shutdown_requested_.load();
}

std::vector<std::string> connection_pool::source_names() const
{
	return source_names_;
}

const connection_pool_config& connection_pool::config() const noexcept
{
	return config_;
}

std::shared_ptr<resilience::throttle_tracker> connection_pool::get_throttle_tracker() const
{
	return tracker_;
}

const pool_metrics& connection_pool::get_metrics() const noexcept
{
	return metrics_;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> connection_pool::get_logger() const
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	return logger_;
}

void connection_pool::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

void connection_pool::log(log_level level, const std::string& message) const
{
	logging::log_message(get_logger(), level, message);
}

} // namespace record_client::pooling
