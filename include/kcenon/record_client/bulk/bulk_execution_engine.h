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
 * @file bulk_execution_engine.h
 * @brief Parallel batched execution of multi-record requests
 *
 * Splits a record set into batches, runs them concurrently through the
 * connection pool and aggregates one batch_result. Rate limits and pool or
 * coordinator exhaustion are absorbed; authentication, connection and
 * transient faults are retried within a bounded budget; business faults are
 * returned as data with diagnostics.
 *
 * ## Usage Example
 * @code
 * auto coordinator = std::make_shared<batch_parallelism_coordinator>(pool);
 * bulk_execution_engine engine(pool, coordinator, logger);
 *
 * bulk_options options;
 * options.batch_size = 500;
 * options.bypass_business_logic = "CustomSync";
 *
 * auto result = engine.run("account", operation_kind::create, records, options,
 *     [](const progress::progress_snapshot& s) { std::cout << s.percent_complete << "%\n"; });
 * if (result.is_ok()) {
 *     std::cout << result.value().success_count << " created\n";
 * }
 * @endcode
 */

#pragma once

#include "batch_parallelism_coordinator.h"
#include "bulk_types.h"

#include <kcenon/record_client/core/remote_types.h>
#include <kcenon/record_client/pooling/connection_pool.h>
#include <kcenon/record_client/progress/progress_dispatcher.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

namespace record_client::bulk
{

/**
 * @class bulk_execution_engine
 * @brief Runs create, update, upsert and delete over many records
 *
 * ### Retry tiers
 * - execute_batch (outer, unbounded): rate limits are retried at once,
 *   pool_exhausted and coordinator_exhausted after exponential backoff
 * - execute_batch_attempts (inner, bounded): authentication, connection and
 *   transient faults are retried up to retry_policy::max_retries each
 *
 * ### Thread Safety
 * run() may be called concurrently; runs sharing a coordinator share its
 * slot budget.
 */
class bulk_execution_engine
{
public:
	/**
	 * @brief Construct an engine
	 * @param pool Pool the batches run on
	 * @param coordinator Shared batch slot budget (created for the pool when null)
	 * @param logger Optional logger
	 * @param executor Optional executor for batch jobs (std::async when null)
	 * @param policy Backoff settings
	 */
	bulk_execution_engine(std::shared_ptr<pooling::connection_pool> pool,
						  std::shared_ptr<batch_parallelism_coordinator> coordinator,
						  std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr,
						  std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr,
						  retry_policy policy = {});

	bulk_execution_engine(const bulk_execution_engine&) = delete;
	bulk_execution_engine& operator=(const bulk_execution_engine&) = delete;

	/**
	 * @brief Execute one bulk operation
	 * @param entity Target entity name
	 * @param kind Operation to run
	 * @param records Input records
	 * @param options Run settings
	 * @param sink Receives a progress snapshot after every completed batch
	 * @param token Cancellation for every wait of the run
	 * @return Aggregated result, or validation_failure, operation_cancelled
	 *         or the first error a batch could not absorb
	 */
	kcenon::common::Result<batch_result> run(const std::string& entity,
											 operation_kind kind,
											 const std::vector<record>& records,
											 const bulk_options& options,
											 progress::progress_sink sink,
											 const kcenon::thread::cancellation_token& token);

	kcenon::common::Result<batch_result> run(const std::string& entity,
											 operation_kind kind,
											 const std::vector<record>& records,
											 const bulk_options& options = {},
											 progress::progress_sink sink = nullptr);

	/**
	 * @brief Check a run's arguments without executing anything
	 */
	[[nodiscard]] static kcenon::common::VoidResult validate(const std::string& entity,
															 operation_kind kind,
															 const std::vector<record>& records,
															 const bulk_options& options);

	/**
	 * @brief Batch boundaries as (offset, size) pairs, in input order
	 */
	[[nodiscard]] static std::vector<std::pair<size_t, size_t>> partition(size_t record_count,
																		  size_t batch_size);

	/**
	 * @brief Native multi-record request for one batch
	 */
	[[nodiscard]] static service_request build_request(const std::string& entity,
													   operation_kind kind,
													   const std::vector<record>& batch,
													   const bulk_options& options);

	/**
	 * @brief Add the bypass parameters the options ask for
	 */
	static void apply_bypass_options(service_request& request, const bulk_options& options);

	[[nodiscard]] const retry_policy& policy() const noexcept { return policy_; }

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	struct batch_context
	{
		size_t number = 0; ///< 1-based, for logging
		size_t offset = 0; ///< Index of records[0] in the run's input
		std::string entity;
		operation_kind kind = operation_kind::create;
		std::vector<record> records;
		service_request request;
		const bulk_options* options = nullptr;
		const std::unordered_set<std::string>* known_ids = nullptr;
	};

	struct batch_outcome
	{
		std::vector<record_outcome> outcomes;
		std::vector<bulk_error> errors;
		std::vector<failure_diagnostic> diagnostics;
		size_t created_count = 0;
		size_t updated_count = 0;
	};

	/// Outer tier: absorbs rate limits and exhaustion
	kcenon::common::Result<batch_outcome> execute_batch(
		const batch_context& batch, const kcenon::thread::cancellation_token& token);

	/// Inner tier: bounded retries of auth, connection and transient faults
	kcenon::common::Result<batch_outcome> execute_batch_attempts(
		const batch_context& batch, const kcenon::thread::cancellation_token& token);

	/// Acquire a client, redrawing while the drawn source is throttled
	kcenon::common::Result<std::unique_ptr<pooling::pooled_client>> acquire_guarded(
		const bulk_options& options, const kcenon::thread::cancellation_token& token);

	batch_outcome outcome_from_response(const batch_context& batch,
										const service_response& response) const;

	batch_outcome failed_outcome(const batch_context& batch, const std::string& message,
								 int code) const;

	bool interruptible_sleep(std::chrono::milliseconds duration,
							 const kcenon::thread::cancellation_token& token) const;

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	std::shared_ptr<pooling::connection_pool> pool_;
	std::shared_ptr<batch_parallelism_coordinator> coordinator_;
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;
	retry_policy policy_;

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace record_client::bulk
