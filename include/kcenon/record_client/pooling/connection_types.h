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
 * @file connection_types.h
 * @brief Connection pool configuration and statistics types
 *
 * connection_pool_config is the chrono-typed configuration the pool
 * consumes. client_config::to_pool_config() produces it from a loaded
 * configuration file.
 */

#pragma once

#include "selection_strategy.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace record_client::pooling
{

/**
 * @struct connection_pool_config
 * @brief Configuration parameters for connection pools.
 */
struct connection_pool_config
{
	bool enabled = true;   ///< Pool clients; false clones a direct client per checkout
	size_t max_pool_size = 0; ///< Total capacity override (0 = sum of source maximums)
	size_t min_pool_size = 0; ///< Idle clients kept warm per seeded source
	std::optional<std::chrono::milliseconds> max_retry_after_tolerance; ///< Cap on phase-1 waiting (unset = wait indefinitely)
	std::chrono::milliseconds acquire_timeout{ 120000 };   ///< Bound on admission wait
	std::chrono::milliseconds max_idle_time{ 300000 };     ///< Evict clients idle longer than this
	std::chrono::milliseconds max_lifetime{ 3600000 };     ///< Evict clients older than this
	bool disable_session_affinity = true; ///< Turn off server-offered sticky routing
	selection_strategy strategy = selection_strategy::throttle_aware;
	std::chrono::milliseconds validation_interval{ 60000 }; ///< Background validation period
	bool enable_validation = true;   ///< Run the background validation loop
	bool validate_on_checkout = true; ///< Check idle clients before handing them out
	uint32_t max_connection_retries = 2; ///< Extra attempts when cloning the seed fails
};

/**
 * @struct client_options
 * @brief Per-checkout overrides applied to the handle
 */
struct client_options
{
	std::optional<std::string> caller_id; ///< Execute on behalf of this identity
};

/**
 * @struct source_statistics
 * @brief Per-source counters reported by connection_pool::stats()
 */
struct source_statistics
{
	std::string name;
	size_t active = 0;           ///< Checked-out clients
	size_t idle = 0;             ///< Clients waiting in the source queue
	bool throttled = false;      ///< Source currently throttled
	uint64_t requests_served = 0; ///< Checkouts served by this source
};

/**
 * @struct pool_statistics
 * @brief Snapshot of pool state for monitoring.
 */
struct pool_statistics
{
	size_t capacity = 0;         ///< Total admission slots
	size_t active = 0;           ///< Checked-out clients
	size_t idle = 0;             ///< Clients waiting in source queues
	size_t throttled_sources = 0; ///< Sources currently throttled
	uint64_t requests_served = 0;
	uint64_t throttle_events = 0;
	std::chrono::milliseconds total_backoff{ 0 };
	uint64_t invalid_connections = 0; ///< Clients disposed because they were invalid
	uint64_t auth_failures = 0;
	uint64_t connection_failures = 0;
	std::vector<source_statistics> sources;
};

} // namespace record_client::pooling
