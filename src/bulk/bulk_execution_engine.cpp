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

#include <kcenon/record_client/bulk/bulk_execution_engine.h>

#include <kcenon/record_client/bulk/failure_diagnostics.h>
#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/logging/console_logger.h>
#include <kcenon/record_client/progress/progress_tracker.h>
#include <kcenon/record_client/resilience/fault_classifier.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <map>
#include <thread>

namespace record_client::bulk
{

using kcenon::common::interfaces::log_level;

namespace
{

constexpr std::chrono::milliseconds sleep_slice{ 50 };

// Dispatch re-checks the stop flag at least this often while waiting for a run slot
constexpr std::chrono::milliseconds dispatch_poll{ 100 };

bool is_valid_entity_name(const std::string& entity)
{
	if (entity.empty() || !std::isalpha(static_cast<unsigned char>(entity.front())))
	{
		return false;
	}

	return std::all_of(entity.begin(), entity.end(),
					   [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

} // namespace

/**
 * @brief Job wrapper for running one batch via IExecutor
 */
class batch_job : public kcenon::common::interfaces::IJob
{
public:
	batch_job(std::function<void()> work, size_t number)
		: work_(std::move(work))
		, number_(number)
	{
	}

	kcenon::common::VoidResult execute() override
	{
		if (work_)
		{
			work_();
		}
		return kcenon::common::ok();
	}

	std::string get_name() const override { return "bulk_batch_" + std::to_string(number_); }
	int get_priority() const override { return 0; }

private:
	std::function<void()> work_;
	size_t number_;
};

bulk_execution_engine::bulk_execution_engine(
	std::shared_ptr<pooling::connection_pool> pool,
	std::shared_ptr<batch_parallelism_coordinator> coordinator,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor,
	retry_policy policy)
	: pool_(std::move(pool))
	, coordinator_(std::move(coordinator))
	, executor_(std::move(executor))
	, policy_(policy)
	, logger_(std::move(logger))
{
	if (!coordinator_ && pool_)
	{
		coordinator_ = std::make_shared<batch_parallelism_coordinator>(pool_);
	}
}

kcenon::common::Result<batch_result> bulk_execution_engine::run(
	const std::string& entity,
	operation_kind kind,
	const std::vector<record>& records,
	const bulk_options& options,
	progress::progress_sink sink)
{
	return run(entity, kind, records, options, std::move(sink),
			   kcenon::thread::cancellation_token::create());
}

kcenon::common::Result<batch_result> bulk_execution_engine::run(
	const std::string& entity,
	operation_kind kind,
	const std::vector<record>& records,
	const bulk_options& options,
	progress::progress_sink sink,
	const kcenon::thread::cancellation_token& token)
{
	auto started_at = std::chrono::steady_clock::now();

	auto valid = validate(entity, kind, records, options);
	if (valid.is_err())
	{
		return valid.error();
	}

	if (!pool_ || pool_->is_shutdown_requested())
	{
		return make_error(error_code::pool_shutdown, "Connection pool is shut down",
						  "bulk_execution_engine");
	}

	auto bounds = partition(records.size(), options.batch_size);
	size_t parallelism = options.max_parallel_batches > 0
							 ? options.max_parallel_batches
							 : std::max<size_t>(1, pool_->total_recommended_parallelism());

	log(log_level::info, "Starting " + std::string(to_string(kind)) + " of "
							 + std::to_string(records.size()) + " " + entity + " records in "
							 + std::to_string(bounds.size()) + " batches (parallelism "
							 + std::to_string(parallelism) + ")");

	std::unordered_set<std::string> known_ids;
	for (const auto& item : records)
	{
		if (!item.id.empty())
		{
			known_ids.insert(item.id);
		}
	}

	progress::progress_tracker tracker(records.size());
	std::unique_ptr<progress::progress_dispatcher> dispatcher;
	if (sink)
	{
		dispatcher = std::make_unique<progress::progress_dispatcher>(std::move(sink), logger_);
	}

	pooling::capacity_semaphore run_slots(parallelism);
	std::vector<std::optional<batch_outcome>> outcomes(bounds.size());
	std::vector<std::future<void>> pending;
	pending.reserve(bounds.size());

	std::atomic<bool> stop{ false };
	std::mutex progress_mutex;
	std::mutex fatal_mutex;
	std::optional<kcenon::common::error_info> fatal;

	auto record_fatal = [&](const kcenon::common::error_info& error)
	{
		std::lock_guard<std::mutex> lock(fatal_mutex);
		if (!fatal)
		{
			fatal = error;
		}
		stop.store(true, std::memory_order_release);
	};

	for (size_t i = 0; i < bounds.size(); ++i)
	{
		// Bound this run's in-flight batches
		bool admitted = false;
		while (!stop.load(std::memory_order_acquire))
		{
			auto status = run_slots.acquire(dispatch_poll, token);
			if (status == pooling::acquire_status::acquired)
			{
				admitted = true;
				break;
			}
			if (status == pooling::acquire_status::cancelled)
			{
				record_fatal(make_error(error_code::operation_cancelled, "Bulk run cancelled",
										"bulk_execution_engine"));
			}
		}

		if (!admitted)
		{
			break;
		}

		auto context = std::make_shared<batch_context>();
		context->number = i + 1;
		context->offset = bounds[i].first;
		context->entity = entity;
		context->kind = kind;
		context->records.assign(records.begin() + static_cast<std::ptrdiff_t>(bounds[i].first),
								records.begin()
									+ static_cast<std::ptrdiff_t>(bounds[i].first + bounds[i].second));
		context->request = build_request(entity, kind, context->records, options);
		context->options = &options;
		context->known_ids = &known_ids;

		auto work = [this, context, i, &token, &outcomes, &tracker, &dispatcher, &progress_mutex,
					 &run_slots, &record_fatal]()
		{
			try
			{
				auto result = execute_batch(*context, token);
				if (result.is_ok())
				{
					auto& outcome = result.value();
					size_t failed = outcome.errors.size();
					size_t succeeded = outcome.outcomes.size() - failed;
					outcomes[i] = std::move(outcome);

					// Posted in the order the counts were applied
					std::lock_guard<std::mutex> lock(progress_mutex);
					auto snapshot = tracker.record_progress(succeeded, failed);
					if (dispatcher)
					{
						dispatcher->post(std::move(snapshot));
					}
				}
				else
				{
					log(log_level::error, "Batch " + std::to_string(context->number)
											  + " aborted: " + result.error().message);
					record_fatal(result.error());
				}
			}
			catch (const std::exception& e)
			{
				record_fatal(make_error(error_code::remote_fault,
										"Batch " + std::to_string(context->number)
											+ " threw: " + e.what(),
										"bulk_execution_engine"));
			}
			catch (...)
			{
				record_fatal(make_error(error_code::remote_fault,
										"Batch " + std::to_string(context->number)
											+ " threw a non-standard exception",
										"bulk_execution_engine"));
			}
			run_slots.release();
		};

		std::future<void> future;
		if (executor_)
		{
			auto submitted = executor_->execute(std::make_unique<batch_job>(work, i + 1));
			if (submitted.is_ok())
			{
				future = std::move(submitted.unwrap());
			}
		}
		if (!future.valid())
		{
			// Fallback to std::async if no executor provided
			future = std::async(std::launch::async, work);
		}
		pending.push_back(std::move(future));
	}

	for (auto& future : pending)
	{
		future.wait();
	}

	if (dispatcher)
	{
		dispatcher->close();
	}

	if (fatal)
	{
		log(log_level::error, std::string(to_string(kind)) + " of " + entity
								  + " stopped: " + fatal->message);
		return *fatal;
	}

	batch_result result;
	result.batch_count = bounds.size();
	result.outcomes.reserve(records.size());

	for (auto& outcome : outcomes)
	{
		if (!outcome)
		{
			continue;
		}

		for (auto& item : outcome->outcomes)
		{
			if (item.status == record_status::succeeded)
			{
				++result.success_count;
				if (kind == operation_kind::create && !item.record_id.empty())
				{
					result.created_ids.push_back(item.record_id);
				}
			}
			else
			{
				++result.failure_count;
			}
			result.outcomes.push_back(std::move(item));
		}

		result.errors.insert(result.errors.end(), outcome->errors.begin(), outcome->errors.end());
		result.diagnostics.insert(result.diagnostics.end(), outcome->diagnostics.begin(),
								  outcome->diagnostics.end());
		result.created_count += outcome->created_count;
		result.updated_count += outcome->updated_count;
	}

	result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - started_at);

	log(log_level::info, "Completed " + std::string(to_string(kind)) + " of " + entity + ": "
							 + std::to_string(result.success_count) + " succeeded, "
							 + std::to_string(result.failure_count) + " failed in "
							 + std::to_string(result.duration.count()) + "ms");

	return result;
}

kcenon::common::VoidResult bulk_execution_engine::validate(const std::string& entity,
														   operation_kind kind,
														   const std::vector<record>& records,
														   const bulk_options& options)
{
	if (records.empty())
	{
		return make_error(error_code::validation_failure, "At least one record is required",
						  "bulk_execution_engine");
	}

	if (!is_valid_entity_name(entity))
	{
		return make_error(error_code::validation_failure, "Invalid entity name: '" + entity + "'",
						  "bulk_execution_engine");
	}

	if (options.batch_size == 0 || options.batch_size > max_batch_size)
	{
		return make_error(error_code::validation_failure,
						  "Batch size must be between 1 and " + std::to_string(max_batch_size)
							  + ", got " + std::to_string(options.batch_size),
						  "bulk_execution_engine");
	}

	if (kind == operation_kind::update || kind == operation_kind::del)
	{
		for (size_t i = 0; i < records.size(); ++i)
		{
			if (records[i].id.empty())
			{
				return make_error(error_code::validation_failure,
								  "Record at index " + std::to_string(i) + " has no id (required for "
									  + std::string(to_string(kind)) + ")",
								  "bulk_execution_engine");
			}
		}
	}

	return kcenon::common::ok();
}

std::vector<std::pair<size_t, size_t>> bulk_execution_engine::partition(size_t record_count,
																		size_t batch_size)
{
	std::vector<std::pair<size_t, size_t>> bounds;
	if (batch_size == 0)
	{
		return bounds;
	}

	bounds.reserve((record_count + batch_size - 1) / batch_size);
	for (size_t offset = 0; offset < record_count; offset += batch_size)
	{
		bounds.emplace_back(offset, std::min(batch_size, record_count - offset));
	}
	return bounds;
}

service_request bulk_execution_engine::build_request(const std::string& entity,
													 operation_kind kind,
													 const std::vector<record>& batch,
													 const bulk_options& options)
{
	service_request request;
	request.entity = entity;

	switch (kind)
	{
	case operation_kind::create:
		request.type = request_type::create_multiple;
		request.targets = batch;
		break;
	case operation_kind::update:
		request.type = request_type::update_multiple;
		request.targets = batch;
		break;
	case operation_kind::upsert:
		request.type = request_type::upsert_multiple;
		request.targets = batch;
		break;
	case operation_kind::del:
		request.type = options.multi_record_delete ? request_type::delete_multiple
												   : request_type::execute_multiple;
		request.continue_on_error = options.continue_on_error;
		for (const auto& item : batch)
		{
			request.target_ids.push_back(item.id);
		}
		break;
	}

	request.name = std::string(to_string(request.type));
	apply_bypass_options(request, options);
	return request;
}

void bulk_execution_engine::apply_bypass_options(service_request& request,
												 const bulk_options& options)
{
	if (options.bypass_business_logic && !options.bypass_business_logic->empty())
	{
		request.parameters["BypassBusinessLogicExecution"] = *options.bypass_business_logic;
	}
	else if (options.bypass_custom_plugins)
	{
		request.parameters["BypassCustomPluginExecution"] = "true";
	}

	if (options.bypass_power_automate_flows)
	{
		request.parameters["SuppressCallbackRegistrationExpanderJob"] = "true";
	}

	if (options.suppress_duplicate_detection)
	{
		request.parameters["SuppressDuplicateDetection"] = "true";
	}
}

void bulk_execution_engine::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	std::lock_guard<std::mutex> lock(logger_mutex_);
	logger_ = std::move(logger);
}

kcenon::common::Result<bulk_execution_engine::batch_outcome> bulk_execution_engine::execute_batch(
	const batch_context& batch, const kcenon::thread::cancellation_token& token)
{
	uint32_t exhaustion_retries = 0;

	while (true)
	{
		if (token.is_cancelled())
		{
			return make_error(error_code::operation_cancelled,
							  "Batch " + std::to_string(batch.number) + " cancelled",
							  "bulk_execution_engine");
		}

		auto attempt = [&]() -> kcenon::common::Result<batch_outcome>
		{
			auto slot = coordinator_->acquire(token);
			if (slot.is_err())
			{
				return slot.error();
			}
			return execute_batch_attempts(batch, token);
		};

		auto result = attempt();
		if (result.is_ok())
		{
			return result;
		}

		const auto& error = result.error();
		if (has_code(error, error_code::rate_limited))
		{
			log(log_level::info, "Outer retry of batch " + std::to_string(batch.number)
									 + " after rate limit: " + error.message);
			continue;
		}

		if (has_code(error, error_code::pool_exhausted)
			|| has_code(error, error_code::coordinator_exhausted))
		{
			auto delay = backoff_delay(policy_.exhaustion_initial_delay,
									   policy_.exhaustion_max_delay, policy_.backoff_multiplier,
									   exhaustion_retries++);
			log(log_level::warning, "Outer retry " + std::to_string(exhaustion_retries)
										+ " of batch " + std::to_string(batch.number) + " in "
										+ std::to_string(delay.count()) + "ms: " + error.message);
			if (!interruptible_sleep(delay, token))
			{
				return make_error(error_code::operation_cancelled,
								  "Batch " + std::to_string(batch.number)
									  + " cancelled during backoff",
								  "bulk_execution_engine");
			}
			continue;
		}

		return error;
	}
}

kcenon::common::Result<bulk_execution_engine::batch_outcome>
bulk_execution_engine::execute_batch_attempts(const batch_context& batch,
											  const kcenon::thread::cancellation_token& token)
{
	uint32_t auth_retries = 0;
	uint32_t connection_retries = 0;
	uint32_t transient_retries = 0;

	auto retry_allowed = [this, &batch](uint32_t& retries, resilience::fault_class cls,
										const std::string& message)
	{
		if (retries >= policy_.max_retries)
		{
			log(log_level::error, "Batch " + std::to_string(batch.number) + " gave up after "
									  + std::to_string(retries) + " " + resilience::to_string(cls)
									  + " retries: " + message);
			return false;
		}
		++retries;
		log(log_level::warning, "Inner retry " + std::to_string(retries) + " of batch "
									+ std::to_string(batch.number) + " after "
									+ resilience::to_string(cls) + " fault: " + message);
		return true;
	};

	while (true)
	{
		if (token.is_cancelled())
		{
			return make_error(error_code::operation_cancelled,
							  "Batch " + std::to_string(batch.number) + " cancelled",
							  "bulk_execution_engine");
		}

		auto acquired = acquire_guarded(*batch.options, token);
		if (acquired.is_err())
		{
			// Seed or clone failures while creating a connection
			auto error = acquired.error();
			if (has_code(error, error_code::authentication_failure)
				&& retry_allowed(auth_retries, resilience::fault_class::authentication,
								 error.message))
			{
				continue;
			}
			if (has_code(error, error_code::connection_failure)
				&& retry_allowed(connection_retries, resilience::fault_class::connection,
								 error.message))
			{
				continue;
			}
			return error;
		}

		auto client = std::move(acquired.value());
		auto response = client->execute(batch.request);
		if (response.is_ok())
		{
			return outcome_from_response(batch, response.value());
		}

		auto error = response.error();
		switch (resilience::classify_error(error))
		{
		case resilience::fault_class::rate_limit:
			// Throttle already recorded on the tracker; the outer tier retries
			return error;

		case resilience::fault_class::authentication:
		{
			auto source = client->source_name();
			client->mark_invalid("authentication failure: " + error.message);
			client->release();
			[[maybe_unused]] auto invalidated = pool_->invalidate_seed(source);
			if (!retry_allowed(auth_retries, resilience::fault_class::authentication,
							   error.message))
			{
				return error;
			}
			continue;
		}

		case resilience::fault_class::connection:
			client->mark_invalid("connection failure: " + error.message);
			client->release();
			pool_->record_connection_failure();
			if (!retry_allowed(connection_retries, resilience::fault_class::connection,
							   error.message))
			{
				return error;
			}
			continue;

		case resilience::fault_class::transient:
		{
			client->release();
			auto delay = backoff_delay(policy_.transient_initial_delay,
									   policy_.transient_max_delay, policy_.backoff_multiplier,
									   transient_retries);
			if (!retry_allowed(transient_retries, resilience::fault_class::transient,
							   error.message))
			{
				return error;
			}
			if (!interruptible_sleep(delay, token))
			{
				return make_error(error_code::operation_cancelled,
								  "Batch " + std::to_string(batch.number)
									  + " cancelled during backoff",
								  "bulk_execution_engine");
			}
			continue;
		}

		case resilience::fault_class::business:
			if (!has_code(error, error_code::remote_fault))
			{
				return error;
			}
			log(log_level::error, "Batch " + std::to_string(batch.number) + " of "
									  + batch.entity + " failed: " + error.message);
			return failed_outcome(batch, error.message, error.code);

		case resilience::fault_class::none:
		default:
			return error;
		}
	}
}

kcenon::common::Result<std::unique_ptr<pooling::pooled_client>>
bulk_execution_engine::acquire_guarded(const bulk_options& options,
									   const kcenon::thread::cancellation_token& token)
{
	pooling::client_options client_opts;
	client_opts.caller_id = options.caller_id;

	auto tracker = pool_->get_throttle_tracker();
	std::string exclude;

	for (uint32_t attempt = 1;; ++attempt)
	{
		auto acquired = pool_->acquire(client_opts, exclude, token);
		if (acquired.is_err())
		{
			return acquired.error();
		}

		auto client = std::move(acquired.value());
		if (attempt >= policy_.max_preflight_attempts || !tracker
			|| !tracker->is_throttled(client->source_name()))
		{
			return client;
		}

		log(log_level::debug, "Pre-flight: " + client->source_name()
								  + " is throttled, drawing another client");
		exclude = client->source_name();
		client->release();
	}
}

bulk_execution_engine::batch_outcome bulk_execution_engine::outcome_from_response(
	const batch_context& batch, const service_response& response) const
{
	batch_outcome outcome;
	const auto count = batch.records.size();
	outcome.outcomes.resize(count);

	std::map<size_t, const item_fault*> faults;
	for (const auto& fault : response.item_faults)
	{
		if (fault.index < count)
		{
			faults.emplace(fault.index, &fault);
		}
	}

	// Aggregated requests without continue-on-error stop at the first fault
	std::optional<size_t> stopped_at;
	if (batch.request.type == request_type::execute_multiple && !batch.request.continue_on_error
		&& !faults.empty())
	{
		stopped_at = faults.begin()->first;
	}

	std::vector<size_t> failed_indices;
	for (size_t i = 0; i < count; ++i)
	{
		auto& item = outcome.outcomes[i];
		item.index = batch.offset + i;
		item.record_id = batch.records[i].id;

		auto fault = faults.find(i);
		if (fault != faults.end())
		{
			item.status = record_status::failed;
			item.message = fault->second->message;
			outcome.errors.push_back(
				{ item.index, item.record_id, fault->second->code, fault->second->message });
			failed_indices.push_back(i);
			continue;
		}

		if (stopped_at && i > *stopped_at)
		{
			item.status = record_status::failed;
			item.message = "Not executed: an earlier request in the batch failed";
			outcome.errors.push_back({ item.index, item.record_id,
									   static_cast<int>(error_code::remote_fault), item.message });
			continue;
		}

		item.status = record_status::succeeded;
		if (batch.kind == operation_kind::create && i < response.created_ids.size()
			&& !response.created_ids[i].empty())
		{
			item.record_id = response.created_ids[i];
		}
		if (batch.kind == operation_kind::upsert && i < response.upsert_created.size())
		{
			item.created = response.upsert_created[i];
			if (*item.created)
			{
				++outcome.created_count;
			}
			else
			{
				++outcome.updated_count;
			}
		}
	}

	if (!failed_indices.empty())
	{
		log(log_level::warning, "Batch " + std::to_string(batch.number) + " partially failed: "
									+ std::to_string(outcome.errors.size()) + " of "
									+ std::to_string(count) + " records");
		outcome.diagnostics = analyze(batch.entity, batch.kind, batch.records, batch.offset,
									  failed_indices, *batch.known_ids);
	}

	return outcome;
}

bulk_execution_engine::batch_outcome bulk_execution_engine::failed_outcome(
	const batch_context& batch, const std::string& message, int code) const
{
	batch_outcome outcome;
	const auto count = batch.records.size();
	outcome.outcomes.resize(count);

	std::vector<size_t> failed_indices;
	failed_indices.reserve(count);
	for (size_t i = 0; i < count; ++i)
	{
		auto& item = outcome.outcomes[i];
		item.index = batch.offset + i;
		item.record_id = batch.records[i].id;
		item.status = record_status::failed;
		item.message = message;
		outcome.errors.push_back({ item.index, item.record_id, code, message });
		failed_indices.push_back(i);
	}

	outcome.diagnostics = analyze(batch.entity, batch.kind, batch.records, batch.offset,
								  failed_indices, *batch.known_ids);
	return outcome;
}

bool bulk_execution_engine::interruptible_sleep(
	std::chrono::milliseconds duration, const kcenon::thread::cancellation_token& token) const
{
	auto deadline = std::chrono::steady_clock::now() + duration;
	while (true)
	{
		if (token.is_cancelled())
		{
			return false;
		}

		auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
		{
			return true;
		}

		std::this_thread::sleep_for(
			std::min<std::chrono::steady_clock::duration>(deadline - now, sleep_slice));
	}
}

void bulk_execution_engine::log(log_level level, const std::string& message) const
{
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger;
	{
		std::lock_guard<std::mutex> lock(logger_mutex_);
		logger = logger_;
	}
	logging::log_message(logger, level, message);
}

} // namespace record_client::bulk
