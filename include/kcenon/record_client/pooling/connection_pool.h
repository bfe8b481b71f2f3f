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
 * @file connection_pool.h
 * @brief Throttle-aware pool of cloned service handles
 *
 * Provides multi-identity connection pooling with:
 * - Two-phase acquisition: wait for an unthrottled source without holding
 *   capacity, then take a FIFO admission slot
 * - Per-source idle queues of handles cloned from one seed per identity
 * - Pluggable source selection (round robin, least connections, throttle aware)
 * - Background validation that evicts idle, expired and broken handles
 * - Cancellation token for graceful shutdown
 */

#pragma once

#include "capacity_semaphore.h"
#include "connection_types.h"
#include "pool_metrics.h"
#include "pooled_client.h"

#include <kcenon/record_client/core/record_service.h>
#include <kcenon/record_client/resilience/throttle_tracker.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Common system interfaces
#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

// Thread system integration
#include <kcenon/thread/core/cancellation_token.h>

namespace record_client::pooling
{

/**
 * @class connection_pool
 * @brief Pool of pre-authenticated clients spread over several identities
 *
 * ### Acquisition
 * 1. **Phase 1**: wait, without holding capacity, until a source that is not
 *    excluded is free of throttles. The wait lasts until the earliest
 *    throttle expires, plus a small buffer.
 * 2. **Phase 2**: take one admission slot, bounded by acquire_timeout.
 * 3. Select a source, pop an idle handle or clone the seed, apply the
 *    per-call overrides and hand out a pooled_client.
 *
 * At most total_capacity() clients are checked out at any time. The slot is
 * returned exactly once, when the pooled_client is released.
 *
 * ### Thread Safety
 * All methods are thread-safe and can be called from multiple threads concurrently.
 *
 * ### Example Usage
 * @code
 * std::vector<std::shared_ptr<connection_source>> sources = { primary, secondary };
 *
 * connection_pool_config config;
 * config.acquire_timeout = std::chrono::seconds(30);
 *
 * auto pool = connection_pool::create(sources, config).value();
 *
 * auto response = pool->execute_with_retry(request);
 * if (response.is_ok()) {
 *     // rate limits were absorbed by the pool
 * }
 * @endcode
 */
class connection_pool : public std::enable_shared_from_this<connection_pool>
{
public:
	/**
	 * @brief Create and start a pool
	 * @param sources Connection sources, one per identity (must not be empty)
	 * @param config Pool configuration
	 * @param tracker Shared throttle state (a private tracker when null)
	 * @param logger Optional logger
	 * @param executor Optional executor for the validation loop
	 * @return Pool, or validation_failure for empty sources, duplicate
	 *         source names, zero capacity or invalid timing settings
	 */
	static kcenon::common::Result<std::shared_ptr<connection_pool>> create(
		std::vector<std::shared_ptr<connection_source>> sources,
		const connection_pool_config& config = {},
		std::shared_ptr<resilience::throttle_tracker> tracker = nullptr,
		std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr,
		std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	/**
	 * @brief Destructor - ensures graceful shutdown
	 */
	~connection_pool();

	// Prevent copying and moving
	connection_pool(const connection_pool&) = delete;
	connection_pool& operator=(const connection_pool&) = delete;
	connection_pool(connection_pool&&) = delete;
	connection_pool& operator=(connection_pool&&) = delete;

	/**
	 * @brief Check out a client
	 * @param options Per-checkout overrides
	 * @param exclude_name Source to avoid when another one exists
	 * @param token Cancellation for the phase-1 and phase-2 waits
	 * @return Client, or pool_shutdown, pool_exhausted, all_sources_throttled,
	 *         operation_cancelled, authentication_failure or connection_failure
	 */
	kcenon::common::Result<std::unique_ptr<pooled_client>> acquire(
		const client_options& options,
		const std::string& exclude_name,
		const kcenon::thread::cancellation_token& token);

	kcenon::common::Result<std::unique_ptr<pooled_client>> acquire(
		const client_options& options = {}, const std::string& exclude_name = "");

	/**
	 * @brief Execute a request, absorbing rate limits
	 * @param request Request to send
	 * @param token Cancellation for waits between attempts
	 * @return Response, or any error except rate_limited
	 *
	 * A rate-limited attempt is retried from phase 1 without bound. An
	 * authentication fault invalidates the source's seed and a connection
	 * fault discards the client before the error is returned.
	 */
	kcenon::common::Result<service_response> execute_with_retry(
		const service_request& request, const kcenon::thread::cancellation_token& token);

	kcenon::common::Result<service_response> execute_with_retry(const service_request& request);

	/**
	 * @brief Drop a source's seed so the next clone re-authenticates
	 * @param source_name Source to invalidate
	 * @return validation_failure for an unknown source
	 */
	kcenon::common::VoidResult invalidate_seed(const std::string& source_name);

	/**
	 * @brief Record an authentication failure observed by a caller
	 */
	void record_auth_failure();

	/**
	 * @brief Record a connection failure observed by a caller
	 */
	void record_connection_failure();

	/**
	 * @brief Gets connection pool statistics
	 */
	[[nodiscard]] pool_statistics stats() const;

	/**
	 * @brief Total admission slots
	 */
	[[nodiscard]] size_t total_capacity() const noexcept;

	/**
	 * @brief Sum of per-source parallelism recommended by the service
	 *
	 * Each source contributes the recommendation reported by its seed,
	 * capped at its declared maximum. Sources that have not been seeded
	 * yet contribute their declared maximum. The sum is capped at
	 * total_capacity().
	 */
	[[nodiscard]] size_t total_recommended_parallelism() const;

	/**
	 * @brief Run one validation pass synchronously
	 * @return Number of idle clients evicted
	 */
	size_t validate_now();

	/**
	 * @brief Shuts down the pool
	 *
	 * Idempotent. Cancels waiters, stops the validation loop and disposes
	 * idle clients. Checked-out clients are disposed when released.
	 */
	void shutdown();

	[[nodiscard]] bool is_shutdown_requested() const noexcept;

	[[nodiscard]] std::vector<std::string> source_names() const;

	[[nodiscard]] const connection_pool_config& config() const noexcept;

	[[nodiscard]] std::shared_ptr<resilience::throttle_tracker> get_throttle_tracker() const;

	/**
	 * @brief Gets performance metrics for this pool
	 */
	[[nodiscard]] const pool_metrics& get_metrics() const noexcept;

	/**
	 * @brief Get the logger used by this pool
	 * @return Shared pointer to logger, or nullptr if not set
	 */
	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;

	/**
	 * @brief Set the logger for this pool
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

private:
	friend class pooled_client;
	friend class validation_job;

	/**
	 * @struct source_state
	 * @brief Idle queue and counters for one source
	 */
	struct source_state
	{
		std::shared_ptr<connection_source> source;
		std::deque<std::unique_ptr<pooled_connection>> idle;
		size_t active = 0;
		uint64_t requests_served = 0;
		std::optional<uint32_t> seed_parallelism; ///< Set once the source produced a clone
	};

	connection_pool(std::vector<std::shared_ptr<connection_source>> sources,
					const connection_pool_config& config,
					size_t capacity,
					std::shared_ptr<resilience::throttle_tracker> tracker,
					std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
					std::shared_ptr<kcenon::common::interfaces::IExecutor> executor);

	kcenon::common::Result<std::unique_ptr<pooled_client>> acquire_direct(
		const client_options& options);

	kcenon::common::VoidResult wait_for_available_source(
		const std::vector<std::string>& candidates,
		const kcenon::thread::cancellation_token& token);

	std::vector<std::string> candidate_names(const std::string& exclude_name) const;

	std::unique_ptr<pooled_connection> take_idle(const std::string& source_name);

	kcenon::common::Result<std::unique_ptr<pooled_connection>> create_connection(
		const std::string& source_name);

	/**
	 * @brief Reason an idle connection must be evicted, empty if healthy
	 */
	std::string eviction_reason(const pooled_connection& connection) const;

	void apply_options(pooled_client& client, const client_options& options);

	/**
	 * @brief Take back a connection released by a pooled_client
	 */
	void return_connection(std::unique_ptr<pooled_connection> connection,
						   bool invalid,
						   const std::string& reason,
						   bool holds_capacity);

	void warm_up(const std::string& source_name, size_t target);

	void start_validation();
	void stop_validation();
	void validation_loop();

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	std::vector<std::shared_ptr<connection_source>> sources_;
	std::vector<std::string> source_names_;
	connection_pool_config config_;
	size_t capacity_;

	std::shared_ptr<resilience::throttle_tracker> tracker_;
	capacity_semaphore semaphore_;

	mutable std::mutex queue_mutex_;
	std::map<std::string, source_state> states_;

	std::atomic<uint64_t> rotation_{ 0 };
	pool_metrics metrics_;

	// Cancellation token for graceful shutdown
	kcenon::thread::cancellation_token shutdown_token_;
	std::atomic<bool> shutdown_requested_{ false };

	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;
	std::future<void> validation_future_;
	std::atomic<bool> validation_running_{ false };

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace record_client::pooling
