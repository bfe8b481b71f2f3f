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
 * @file client_config_test.cpp
 * @brief Unit tests for client configuration
 *
 * Tests cover:
 * - Default values
 * - Loading key=value files
 * - Validation errors
 * - Conversion to pool and bulk settings
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <kcenon/record_client/core/client_config.h>
#include <kcenon/record_client/logging/console_logger.h>

using namespace record_client;
using namespace std::chrono_literals;

class ClientConfigTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		path_ = (std::filesystem::temp_directory_path()
				 / ("record_client_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
					+ "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf"))
					.string();
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove(path_, ec);
	}

	void write_file(const std::string& content)
	{
		std::ofstream file(path_);
		file << content;
	}

	std::string path_;
};

// ============================================================================
// Default Tests
// ============================================================================

TEST_F(ClientConfigTest, DefaultConfiguration)
{
	auto config = client_config::default_config();

	EXPECT_EQ(config.name, "record_client");
	EXPECT_TRUE(config.pool.enabled);
	EXPECT_EQ(config.pool.max_pool_size, 0u);
	EXPECT_EQ(config.pool.acquire_timeout_ms, 120000u);
	EXPECT_EQ(config.pool.max_idle_time_ms, 300000u);
	EXPECT_EQ(config.pool.max_lifetime_ms, 3600000u);
	EXPECT_TRUE(config.pool.disable_session_affinity);
	EXPECT_EQ(config.pool.selection_strategy, "throttle_aware");
	EXPECT_EQ(config.pool.validation_interval_ms, 60000u);
	EXPECT_EQ(config.pool.max_connection_retries, 2u);
	EXPECT_EQ(config.bulk.batch_size, 100u);
	EXPECT_EQ(config.registry.pool_creation_timeout_ms, 300000u);
	EXPECT_TRUE(config.validate());
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(ClientConfigTest, MissingFileReturnsNullopt)
{
	EXPECT_FALSE(client_config::load_from_file(path_ + ".missing").has_value());
}

TEST_F(ClientConfigTest, LoadsKeyValueFile)
{
	write_file("# record client\n"
			   "name = loader\n"
			   "\n"
			   "pool.max_pool_size = 8\n"
			   "pool.min_pool_size=2\n"
			   "pool.acquire_timeout_ms=30000\n"
			   "pool.max_retry_after_tolerance_ms=60000\n"
			   "pool.selection_strategy=least_connections\n"
			   "pool.disable_session_affinity=false\n"
			   "bulk.batch_size=500\n"
			   "bulk.bypass_business_logic=CustomSync,CustomAsync\n"
			   "bulk.bypass_power_automate_flows=true\n"
			   "logging.level=debug\n"
			   "registry.pool_creation_timeout_ms=1000\n");

	auto config = client_config::load_from_file(path_);
	ASSERT_TRUE(config.has_value());

	EXPECT_EQ(config->name, "loader");
	EXPECT_EQ(config->pool.max_pool_size, 8u);
	EXPECT_EQ(config->pool.min_pool_size, 2u);
	EXPECT_EQ(config->pool.acquire_timeout_ms, 30000u);
	EXPECT_EQ(config->pool.max_retry_after_tolerance_ms, 60000u);
	EXPECT_EQ(config->pool.selection_strategy, "least_connections");
	EXPECT_FALSE(config->pool.disable_session_affinity);
	EXPECT_EQ(config->bulk.batch_size, 500u);
	EXPECT_EQ(config->bulk.bypass_business_logic, "CustomSync,CustomAsync");
	EXPECT_TRUE(config->bulk.bypass_power_automate_flows);
	EXPECT_EQ(config->logging.level, "debug");
	EXPECT_EQ(config->registry.pool_creation_timeout_ms, 1000u);
	EXPECT_TRUE(config->validate());
}

TEST_F(ClientConfigTest, NonNumericValueFailsLoad)
{
	write_file("bulk.batch_size=lots\n");
	EXPECT_FALSE(client_config::load_from_file(path_).has_value());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ClientConfigTest, ReportsEveryProblem)
{
	client_config config;
	config.name.clear();
	config.pool.acquire_timeout_ms = 0;
	config.pool.validation_interval_ms = 0;
	config.pool.max_idle_time_ms = config.pool.max_lifetime_ms + 1;
	config.pool.max_pool_size = 2;
	config.pool.min_pool_size = 3;
	config.pool.selection_strategy = "random";
	config.bulk.batch_size = 0;
	config.logging.level = "verbose";

	auto errors = config.validation_errors();
	EXPECT_EQ(errors.size(), 8u);
	EXPECT_FALSE(config.validate());
}

TEST_F(ClientConfigTest, BatchSizeUpperBound)
{
	client_config config;
	config.bulk.batch_size = 1000;
	EXPECT_TRUE(config.validate());

	config.bulk.batch_size = 1001;
	EXPECT_FALSE(config.validate());
}

TEST_F(ClientConfigTest, ValidationIntervalIgnoredWhenValidationDisabled)
{
	client_config config;
	config.pool.enable_validation = false;
	config.pool.validation_interval_ms = 0;
	EXPECT_TRUE(config.validate());
}

// ============================================================================
// Conversion Tests
// ============================================================================

TEST_F(ClientConfigTest, ToPoolConfig)
{
	client_config config;
	config.pool.max_pool_size = 12;
	config.pool.acquire_timeout_ms = 5000;
	config.pool.selection_strategy = "round_robin";

	auto pool = config.to_pool_config();
	EXPECT_EQ(pool.max_pool_size, 12u);
	EXPECT_EQ(pool.acquire_timeout, 5000ms);
	EXPECT_EQ(pool.strategy, pooling::selection_strategy::round_robin);
	EXPECT_FALSE(pool.max_retry_after_tolerance.has_value());

	config.pool.max_retry_after_tolerance_ms = 45000;
	EXPECT_EQ(config.to_pool_config().max_retry_after_tolerance, std::chrono::milliseconds(45000));
}

TEST_F(ClientConfigTest, ToBulkOptions)
{
	client_config config;
	config.bulk.batch_size = 250;
	config.bulk.multi_record_delete = true;
	config.bulk.suppress_duplicate_detection = true;

	auto options = config.to_bulk_options();
	EXPECT_EQ(options.batch_size, 250u);
	EXPECT_TRUE(options.multi_record_delete);
	EXPECT_TRUE(options.suppress_duplicate_detection);
	EXPECT_FALSE(options.bypass_business_logic.has_value());

	config.bulk.bypass_business_logic = "CustomSync";
	EXPECT_EQ(config.to_bulk_options().bypass_business_logic, std::string("CustomSync"));
}

TEST_F(ClientConfigTest, CreateLoggerFollowsLoggingSettings)
{
	using kcenon::common::interfaces::log_level;

	client_config config;
	config.name = "migrate-east";
	config.logging.level = "warn";

	auto logger = config.create_logger();
	ASSERT_NE(logger, nullptr);
	EXPECT_EQ(logger->get_level(), log_level::warning);
	EXPECT_FALSE(logger->is_enabled(log_level::info));

	auto console = std::dynamic_pointer_cast<logging::console_logger>(logger);
	ASSERT_NE(console, nullptr);
	EXPECT_EQ(console->instance(), "migrate-east");

	config.logging.enable_console = false;
	EXPECT_EQ(config.create_logger(), nullptr);
}

TEST_F(ClientConfigTest, CreateLoggerFallsBackToInfo)
{
	client_config config;
	config.logging.level = "verbose";

	auto logger = config.create_logger();
	ASSERT_NE(logger, nullptr);
	EXPECT_EQ(logger->get_level(), kcenon::common::interfaces::log_level::info);
}
