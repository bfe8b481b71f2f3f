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
 * @file pool_registry.h
 * @brief Memoized per-key connection pool cache
 *
 * Keeps one connection_pool per (identity set, endpoint). Concurrent first
 * requests for the same key collapse into a single creation that every
 * caller waits on.
 */

#pragma once

#include "connection_pool.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/executor_interface.h>
#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>
#include <kcenon/thread/core/cancellation_token.h>

namespace record_client::pooling
{

/**
 * @class pool_registry
 * @brief Single-flight cache of connection pools
 *
 * ### Creation
 * The first caller for a key starts the factory on the executor (or a
 * dedicated thread) and every caller waits on the same shared future.
 * Creation is never bound to any caller's cancellation token.
 *
 * ### Failure handling
 * - A failed creation is removed so the next caller starts over
 * - A caller whose wait exceeds the creation timeout removes the entry and
 *   receives pool_creation_timeout
 * - A caller whose token is cancelled only stops waiting; the creation
 *   continues and its result stays cached for others
 *
 * ### Thread Safety
 * All methods are thread-safe.
 *
 * @code
 * pool_registry registry(
 *     [](const std::vector<std::string>& identities, const std::string& endpoint) {
 *         return connection_pool::create(make_sources(identities, endpoint));
 *     });
 *
 * auto pool = registry.get_or_create({ "loader", "admin" }, "https://org.example.com/");
 * @endcode
 */
class pool_registry
{
public:
	using pool_result = kcenon::common::Result<std::shared_ptr<connection_pool>>;
	using pool_factory = std::function<pool_result(const std::vector<std::string>& identities,
												   const std::string& endpoint)>;

	/**
	 * @brief Construct a registry
	 * @param factory Creates a pool for an identity set and endpoint
	 * @param creation_timeout Maximum time a caller waits for a creation
	 * @param executor Optional executor that runs creations
	 */
	explicit pool_registry(pool_factory factory,
						   std::chrono::milliseconds creation_timeout = std::chrono::minutes(5),
						   std::shared_ptr<kcenon::common::interfaces::IExecutor> executor = nullptr);

	~pool_registry();

	pool_registry(const pool_registry&) = delete;
	pool_registry& operator=(const pool_registry&) = delete;

	/**
	 * @brief Build the cache key for an identity set and endpoint
	 *
	 * Identities are ordered case-insensitively and joined with ','. The
	 * endpoint is lower-cased with trailing '/' removed. The two parts are
	 * joined with '|'.
	 */
	[[nodiscard]] static std::string make_key(const std::vector<std::string>& identities,
											  const std::string& endpoint);

	/**
	 * @brief Get the cached pool or create it
	 * @return Pool, or validation_failure, pool_creation_timeout,
	 *         operation_cancelled, pool_shutdown or the factory's error
	 */
	pool_result get_or_create(const std::vector<std::string>& identities,
							  const std::string& endpoint,
							  const kcenon::thread::cancellation_token& token);

	pool_result get_or_create(const std::vector<std::string>& identities,
							  const std::string& endpoint);

	/**
	 * @brief Shut down and forget every pool that uses an identity
	 * @return Number of entries removed
	 */
	size_t invalidate_identity(const std::string& identity);

	/**
	 * @brief Shut down and forget every pool for an endpoint
	 * @return Number of entries removed
	 */
	size_t invalidate_endpoint(const std::string& endpoint);

	/**
	 * @brief Number of cached or in-flight entries
	 */
	[[nodiscard]] size_t size() const;

	/**
	 * @brief Shut down every pool, waiting for in-flight creations
	 */
	void shutdown();

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	[[nodiscard]] std::shared_ptr<kcenon::common::interfaces::ILogger> get_logger() const;

private:
	struct entry
	{
		std::shared_future<pool_result> future;
		uint64_t generation = 0;
	};

	std::shared_future<pool_result> start_creation(const std::vector<std::string>& identities,
												   const std::string& endpoint);

	void remove_if_current(const std::string& key, uint64_t generation);

	void retire(std::shared_future<pool_result> future);

	static std::string normalize_endpoint(const std::string& endpoint);

	pool_factory factory_;
	std::chrono::milliseconds creation_timeout_;
	std::shared_ptr<kcenon::common::interfaces::IExecutor> executor_;

	mutable std::mutex entries_mutex_;
	std::map<std::string, entry> entries_;
	std::vector<std::shared_future<pool_result>> retired_;
	uint64_t next_generation_{ 0 };
	bool shutdown_{ false };

	mutable std::mutex logger_mutex_;
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
};

} // namespace record_client::pooling
