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

#include <kcenon/record_client/core/client_config.h>

#include <kcenon/record_client/logging/console_logger.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace record_client
{

namespace
{

bool parse_bool(const std::string& value)
{
	return value == "true" || value == "1";
}

} // namespace

std::optional<client_config> client_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		// Error will be logged by caller with appropriate context
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	client_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		// Skip comments and empty lines
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);

		// Trim whitespace
		auto trim = [](std::string& s)
		{
			s.erase(0, s.find_first_not_of(" \t\r\n"));
			s.erase(s.find_last_not_of(" \t\r\n") + 1);
		};
		trim(key);
		trim(value);

		try
		{
			if (key == "name")
			{
				config.name = value;
			}
			else if (key == "pool.enabled")
			{
				config.pool.enabled = parse_bool(value);
			}
			else if (key == "pool.max_pool_size")
			{
				config.pool.max_pool_size = static_cast<uint32_t>(std::stoul(value));
			}
			else if (key == "pool.min_pool_size")
			{
				config.pool.min_pool_size = static_cast<uint32_t>(std::stoul(value));
			}
			else if (key == "pool.max_retry_after_tolerance_ms")
			{
				config.pool.max_retry_after_tolerance_ms = std::stoull(value);
			}
			else if (key == "pool.acquire_timeout_ms")
			{
				config.pool.acquire_timeout_ms = std::stoull(value);
			}
			else if (key == "pool.max_idle_time_ms")
			{
				config.pool.max_idle_time_ms = std::stoull(value);
			}
			else if (key == "pool.max_lifetime_ms")
			{
				config.pool.max_lifetime_ms = std::stoull(value);
			}
			else if (key == "pool.disable_session_affinity")
			{
				config.pool.disable_session_affinity = parse_bool(value);
			}
			else if (key == "pool.selection_strategy")
			{
				config.pool.selection_strategy = value;
			}
			else if (key == "pool.validation_interval_ms")
			{
				config.pool.validation_interval_ms = std::stoull(value);
			}
			else if (key == "pool.enable_validation")
			{
				config.pool.enable_validation = parse_bool(value);
			}
			else if (key == "pool.validate_on_checkout")
			{
				config.pool.validate_on_checkout = parse_bool(value);
			}
			else if (key == "pool.max_connection_retries")
			{
				config.pool.max_connection_retries = static_cast<uint32_t>(std::stoul(value));
			}
			else if (key == "bulk.batch_size")
			{
				config.bulk.batch_size = static_cast<uint32_t>(std::stoul(value));
			}
			else if (key == "bulk.multi_record_delete")
			{
				config.bulk.multi_record_delete = parse_bool(value);
			}
			else if (key == "bulk.continue_on_error")
			{
				config.bulk.continue_on_error = parse_bool(value);
			}
			else if (key == "bulk.bypass_business_logic")
			{
				config.bulk.bypass_business_logic = value;
			}
			else if (key == "bulk.bypass_custom_plugins")
			{
				config.bulk.bypass_custom_plugins = parse_bool(value);
			}
			else if (key == "bulk.bypass_power_automate_flows")
			{
				config.bulk.bypass_power_automate_flows = parse_bool(value);
			}
			else if (key == "bulk.suppress_duplicate_detection")
			{
				config.bulk.suppress_duplicate_detection = parse_bool(value);
			}
			else if (key == "bulk.max_parallel_batches")
			{
				config.bulk.max_parallel_batches = static_cast<uint32_t>(std::stoul(value));
			}
			else if (key == "logging.level")
			{
				config.logging.level = value;
			}
			else if (key == "logging.enable_console")
			{
				config.logging.enable_console = parse_bool(value);
			}
			else if (key == "registry.pool_creation_timeout_ms")
			{
				config.registry.pool_creation_timeout_ms = std::stoull(value);
			}
		}
		catch (const std::logic_error&)
		{
			// Non-numeric value for a numeric key
			return std::nullopt;
		}
	}

	return config;
}

client_config client_config::default_config()
{
	client_config config;
	// All defaults are set in the struct definition
	return config;
}

bool client_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> client_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Client name cannot be empty");
	}

	// Validate pool configuration
	if (pool.acquire_timeout_ms == 0)
	{
		errors.push_back("Pool acquire timeout must be greater than 0");
	}

	if (pool.enable_validation && pool.validation_interval_ms == 0)
	{
		errors.push_back("Pool validation interval must be greater than 0 when validation is enabled");
	}

	if (pool.max_idle_time_ms > pool.max_lifetime_ms)
	{
		errors.push_back("Pool maximum idle time cannot exceed maximum lifetime");
	}

	if (pool.max_pool_size > 0 && pool.min_pool_size > pool.max_pool_size)
	{
		errors.push_back("Pool minimum size cannot exceed maximum size");
	}

	if (!pooling::parse_selection_strategy(pool.selection_strategy))
	{
		errors.push_back("Invalid selection strategy: " + pool.selection_strategy
						 + " (valid: round_robin, least_connections, throttle_aware)");
	}

	// Validate bulk configuration
	if (bulk.batch_size == 0 || bulk.batch_size > bulk::max_batch_size)
	{
		errors.push_back("Batch size must be between 1 and " + std::to_string(bulk::max_batch_size));
	}

	// Validate logging configuration
	if (!logging::parse_log_level(logging.level))
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, error)");
	}

	return errors;
}

pooling::connection_pool_config client_config::to_pool_config() const
{
	pooling::connection_pool_config config;
	config.enabled = pool.enabled;
	config.max_pool_size = pool.max_pool_size;
	config.min_pool_size = pool.min_pool_size;
	if (pool.max_retry_after_tolerance_ms > 0)
	{
		config.max_retry_after_tolerance
			= std::chrono::milliseconds(pool.max_retry_after_tolerance_ms);
	}
	config.acquire_timeout = std::chrono::milliseconds(pool.acquire_timeout_ms);
	config.max_idle_time = std::chrono::milliseconds(pool.max_idle_time_ms);
	config.max_lifetime = std::chrono::milliseconds(pool.max_lifetime_ms);
	config.disable_session_affinity = pool.disable_session_affinity;
	config.strategy = pooling::parse_selection_strategy(pool.selection_strategy)
						  .value_or(pooling::selection_strategy::throttle_aware);
	config.validation_interval = std::chrono::milliseconds(pool.validation_interval_ms);
	config.enable_validation = pool.enable_validation;
	config.validate_on_checkout = pool.validate_on_checkout;
	config.max_connection_retries = pool.max_connection_retries;
	return config;
}

bulk::bulk_options client_config::to_bulk_options() const
{
	bulk::bulk_options options;
	options.batch_size = bulk.batch_size;
	options.multi_record_delete = bulk.multi_record_delete;
	options.continue_on_error = bulk.continue_on_error;
	if (!bulk.bypass_business_logic.empty())
	{
		options.bypass_business_logic = bulk.bypass_business_logic;
	}
	options.bypass_custom_plugins = bulk.bypass_custom_plugins;
	options.bypass_power_automate_flows = bulk.bypass_power_automate_flows;
	options.suppress_duplicate_detection = bulk.suppress_duplicate_detection;
	options.max_parallel_batches = bulk.max_parallel_batches;
	return options;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> client_config::create_logger() const
{
	if (!logging.enable_console)
	{
		return nullptr;
	}

	auto level = logging::parse_log_level(logging.level)
					 .value_or(kcenon::common::interfaces::log_level::info);
	return logging::create_console_logger(level, name);
}

} // namespace record_client
