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
 * @file client_config.h
 * @brief record_client configuration structures
 *
 * Defines configuration structures for the connection pool, the bulk
 * engine, logging and the pool registry. Configuration can be loaded from
 * key=value files or constructed programmatically.
 *
 * ## Thread Safety
 * Configuration structs are plain data structures with no internal
 * synchronization. They are read-only after loading and safe to share
 * across threads.
 *
 * ## Usage Example
 * @code
 * // Load from file
 * auto config = record_client::client_config::load_from_file("record_client.conf");
 * if (config) {
 *     for (const auto& err : config->validation_errors()) {
 *         std::cerr << "Config error: " << err << std::endl;
 *     }
 *     auto pool = connection_pool::create(sources, config->to_pool_config(),
 *                                         nullptr, config->create_logger());
 * }
 *
 * // Or construct programmatically
 * record_client::client_config cfg = record_client::client_config::default_config();
 * cfg.pool.acquire_timeout_ms = 30000;
 * cfg.bulk.batch_size = 500;
 * @endcode
 */

#pragma once

#include <kcenon/record_client/bulk/bulk_types.h>
#include <kcenon/record_client/pooling/connection_types.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace record_client
{

/**
 * @struct pool_settings
 * @brief Connection pool settings in file units
 */
struct pool_settings
{
	bool enabled = true;
	uint32_t max_pool_size = 0;                 ///< 0 = sum of source maximums
	uint32_t min_pool_size = 0;                 ///< Idle clients kept warm per seeded source
	uint64_t max_retry_after_tolerance_ms = 0;  ///< 0 = wait for throttles indefinitely
	uint64_t acquire_timeout_ms = 120000;
	uint64_t max_idle_time_ms = 300000;
	uint64_t max_lifetime_ms = 3600000;
	bool disable_session_affinity = true;
	std::string selection_strategy = "throttle_aware"; ///< round_robin, least_connections, throttle_aware
	uint64_t validation_interval_ms = 60000;
	bool enable_validation = true;
	bool validate_on_checkout = true;
	uint32_t max_connection_retries = 2;
};

/**
 * @struct bulk_settings
 * @brief Default bulk engine options
 */
struct bulk_settings
{
	uint32_t batch_size = 100;
	bool multi_record_delete = false;
	bool continue_on_error = true;
	std::string bypass_business_logic; ///< Empty = not set
	bool bypass_custom_plugins = false;
	bool bypass_power_automate_flows = false;
	bool suppress_duplicate_detection = false;
	uint32_t max_parallel_batches = 0; ///< 0 = pool's recommended parallelism
};

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info"; ///< Log level (debug, info, warn, error)
	bool enable_console = true; ///< Enable console output
};

/**
 * @struct registry_settings
 * @brief Pool registry configuration
 */
struct registry_settings
{
	uint64_t pool_creation_timeout_ms = 300000; ///< Wait bound for a memoized creation
};

/**
 * @struct client_config
 * @brief Main record_client configuration
 */
struct client_config
{
	std::string name = "record_client"; ///< Client instance name
	pool_settings pool;
	bulk_settings bulk;
	logging_config logging;
	registry_settings registry;

	/**
	 * @brief Load configuration from key=value file
	 * @param path Path to configuration file
	 * @return Loaded configuration, or std::nullopt on error
	 */
	static std::optional<client_config> load_from_file(const std::string& path);

	/**
	 * @brief Create default configuration
	 * @return Default configuration
	 */
	static client_config default_config();

	/**
	 * @brief Validate configuration
	 * @return true if configuration is valid
	 */
	bool validate() const;

	/**
	 * @brief Get validation errors
	 * @return List of validation error messages
	 */
	std::vector<std::string> validation_errors() const;

	/**
	 * @brief Convert pool settings to the pool's configuration type
	 *
	 * An unknown selection strategy falls back to throttle_aware.
	 */
	pooling::connection_pool_config to_pool_config() const;

	/**
	 * @brief Convert bulk settings to engine options
	 */
	bulk::bulk_options to_bulk_options() const;

	/**
	 * @brief Logger for the pool, registry and engine built from this config
	 *
	 * Returns a console logger tagged with #name at logging.level, or null
	 * when console output is disabled. An unknown level falls back to info.
	 */
	std::shared_ptr<kcenon::common::interfaces::ILogger> create_logger() const;
};

} // namespace record_client
