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
 * @file bulk_execution_engine_test.cpp
 * @brief Unit tests for bulk execution and batch parallelism
 *
 * Tests cover:
 * - Input validation and partitioning
 * - Request shapes, delete modes and bypass parameters
 * - Partial failures with reference diagnostics
 * - Rate limits and pool exhaustion absorbed by the outer retry tier
 * - Pre-flight redraw of throttled clients
 * - Authentication, connection and transient retries
 * - Business faults reported as data
 * - Upsert created/updated split and progress delivery
 * - Cancellation and in-flight batch bound
 * - batch_parallelism_coordinator capacity handling
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/record_client/bulk/batch_parallelism_coordinator.h>
#include <kcenon/record_client/bulk/bulk_execution_engine.h>
#include <kcenon/record_client/core/error_codes.h>

#include "mock_record_service.h"

using namespace record_client;
using namespace record_client::bulk;
using namespace record_client::pooling;
using namespace record_client::testing;
using namespace std::chrono_literals;

// ============================================================================
// Fixture
// ============================================================================

class BulkExecutionEngineTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		script_ = std::make_shared<service_script>();

		connection_pool_config config;
		config.enable_validation = false;
		config.acquire_timeout = 5s;

		auto created = connection_pool::create(
			{ make_mock_source("a", 4, script_), make_mock_source("b", 4, script_) }, config);
		ASSERT_TRUE(created.is_ok());
		pool_ = created.value();

		policy_.exhaustion_initial_delay = 20ms;
		policy_.exhaustion_max_delay = 100ms;
		policy_.transient_initial_delay = 10ms;
		policy_.transient_max_delay = 40ms;

		engine_ = std::make_unique<bulk_execution_engine>(pool_, nullptr, nullptr, nullptr, policy_);
	}

	void TearDown() override
	{
		engine_.reset();
		if (pool_)
		{
			pool_->shutdown();
		}
	}

	std::shared_ptr<service_script> script_;
	std::shared_ptr<connection_pool> pool_;
	retry_policy policy_;
	std::unique_ptr<bulk_execution_engine> engine_;
};

// ============================================================================
// Validation and Partitioning Tests
// ============================================================================

TEST_F(BulkExecutionEngineTest, RejectsInvalidInput)
{
	auto records = make_records(3);
	bulk_options options;

	EXPECT_TRUE(bulk_execution_engine::validate("account", operation_kind::create, {}, options).is_err());
	EXPECT_TRUE(bulk_execution_engine::validate("1account", operation_kind::create, records, options).is_err());
	EXPECT_TRUE(bulk_execution_engine::validate("new-entity", operation_kind::create, records, options).is_err());

	options.batch_size = 0;
	EXPECT_TRUE(bulk_execution_engine::validate("account", operation_kind::create, records, options).is_err());
	options.batch_size = 1001;
	EXPECT_TRUE(bulk_execution_engine::validate("account", operation_kind::create, records, options).is_err());
	options.batch_size = 1000;
	EXPECT_TRUE(bulk_execution_engine::validate("new_entity", operation_kind::create, records, options).is_ok());
}

TEST_F(BulkExecutionEngineTest, UpdateAndDeleteRequireIds)
{
	auto records = make_records(3);
	records[1].id.clear();

	auto update = bulk_execution_engine::validate("account", operation_kind::update, records, {});
	ASSERT_TRUE(update.is_err());
	EXPECT_NE(update.error().message.find("index 1"), std::string::npos);

	EXPECT_TRUE(bulk_execution_engine::validate("account", operation_kind::del, records, {}).is_err());
	EXPECT_TRUE(bulk_execution_engine::validate("account", operation_kind::create, records, {}).is_ok());
}

TEST_F(BulkExecutionEngineTest, InvalidRunSendsNothing)
{
	auto result = engine_->run("account", operation_kind::create, {});
	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), error_code::validation_failure));
	EXPECT_EQ(script_->executions.load(), 0u);
}

TEST_F(BulkExecutionEngineTest, PartitionCoversInputInOrder)
{
	auto bounds = bulk_execution_engine::partition(250, 100);
	ASSERT_EQ(bounds.size(), 3u);
	EXPECT_EQ(bounds[0], (std::pair<size_t, size_t>{ 0, 100 }));
	EXPECT_EQ(bounds[1], (std::pair<size_t, size_t>{ 100, 100 }));
	EXPECT_EQ(bounds[2], (std::pair<size_t, size_t>{ 200, 50 }));

	EXPECT_EQ(bulk_execution_engine::partition(100, 100).size(), 1u);
	EXPECT_TRUE(bulk_execution_engine::partition(0, 100).empty());
}

// ============================================================================
// Request Shape Tests
// ============================================================================

TEST_F(BulkExecutionEngineTest, RequestTypeFollowsOperation)
{
	auto records = make_records(2);

	auto create = bulk_execution_engine::build_request("account", operation_kind::create, records, {});
	EXPECT_EQ(create.type, request_type::create_multiple);
	EXPECT_EQ(create.name, "CreateMultiple");
	EXPECT_EQ(create.targets.size(), 2u);

	auto update = bulk_execution_engine::build_request("account", operation_kind::update, records, {});
	EXPECT_EQ(update.type, request_type::update_multiple);

	auto upsert = bulk_execution_engine::build_request("account", operation_kind::upsert, records, {});
	EXPECT_EQ(upsert.type, request_type::upsert_multiple);
}

TEST_F(BulkExecutionEngineTest, DeleteModes)
{
	auto records = make_records(3);
	bulk_options options;

	auto aggregated = bulk_execution_engine::build_request("account", operation_kind::del, records, options);
	EXPECT_EQ(aggregated.type, request_type::execute_multiple);
	EXPECT_TRUE(aggregated.continue_on_error);
	EXPECT_EQ(aggregated.target_ids, (std::vector<std::string>{ "rec-0", "rec-1", "rec-2" }));

	options.multi_record_delete = true;
	auto native = bulk_execution_engine::build_request("account", operation_kind::del, records, options);
	EXPECT_EQ(native.type, request_type::delete_multiple);
	EXPECT_EQ(native.name, "DeleteMultiple");
}

TEST_F(BulkExecutionEngineTest, BusinessLogicBypassTakesPrecedence)
{
	bulk_options options;
	options.bypass_business_logic = "CustomSync,CustomAsync";
	options.bypass_custom_plugins = true;

	service_request request;
	bulk_execution_engine::apply_bypass_options(request, options);

	EXPECT_EQ(request.parameters.at("BypassBusinessLogicExecution"), "CustomSync,CustomAsync");
	EXPECT_EQ(request.parameters.count("BypassCustomPluginExecution"), 0u);
}

TEST_F(BulkExecutionEngineTest, LegacyAndSuppressionParameters)
{
	bulk_options options;
	options.bypass_custom_plugins = true;
	options.bypass_power_automate_flows = true;
	options.suppress_duplicate_detection = true;

	service_request request;
	bulk_execution_engine::apply_bypass_options(request, options);

	EXPECT_EQ(request.parameters.at("BypassCustomPluginExecution"), "true");
	EXPECT_EQ(request.parameters.at("SuppressCallbackRegistrationExpanderJob"), "true");
	EXPECT_EQ(request.parameters.at("SuppressDuplicateDetection"), "true");

	service_request plain;
	bulk_execution_engine::apply_bypass_options(plain, bulk_options{});
	EXPECT_TRUE(plain.parameters.empty());
}

// ============================================================================
// Run Tests
// ============================================================================

TEST_F(BulkExecutionEngineTest, CreateRunsOneRequestPerBatch)
{
	auto records = make_records(250);

	auto result = engine_->run("account", operation_kind::create, records);

	ASSERT_TRUE(result.is_ok());
	const auto& summary = result.value();
	EXPECT_EQ(summary.batch_count, 3u);
	EXPECT_EQ(summary.success_count, 250u);
	EXPECT_EQ(summary.failure_count, 0u);
	EXPECT_TRUE(summary.all_succeeded());
	EXPECT_EQ(summary.created_ids.size(), 250u);
	EXPECT_EQ(std::set<std::string>(summary.created_ids.begin(), summary.created_ids.end()).size(),
			  250u);

	ASSERT_EQ(summary.outcomes.size(), 250u);
	for (size_t i = 0; i < summary.outcomes.size(); ++i)
	{
		EXPECT_EQ(summary.outcomes[i].index, i);
	}

	auto requests = script_->recorded_requests();
	ASSERT_EQ(requests.size(), 3u);
	std::vector<size_t> sizes;
	for (const auto& request : requests)
	{
		EXPECT_EQ(request.type, request_type::create_multiple);
		sizes.push_back(request.targets.size());
	}
	std::sort(sizes.begin(), sizes.end());
	EXPECT_EQ(sizes, (std::vector<size_t>{ 50, 100, 100 }));
}

TEST_F(BulkExecutionEngineTest, PartialFailureIsDiagnosed)
{
	auto records = make_records(50);
	records[10].references.push_back({ "parentaccountid", "account", "missing-1" });
	records[30].references.push_back({ "parentaccountid", "account", "missing-2" });

	script_->set_handler(
		[](const service_request& request, const std::string&)
		{
			auto response = service_script::success_for(request);
			for (size_t i = 0; i < request.targets.size(); ++i)
			{
				if (!request.targets[i].references.empty())
				{
					response.item_faults.push_back(
						{ i, -2147220969, "account With Id = missing does not exist" });
				}
			}
			return response;
		});

	auto result = engine_->run("account", operation_kind::create, records);

	ASSERT_TRUE(result.is_ok());
	const auto& summary = result.value();
	EXPECT_EQ(summary.success_count, 48u);
	EXPECT_EQ(summary.failure_count, 2u);
	EXPECT_FALSE(summary.all_succeeded());

	ASSERT_EQ(summary.errors.size(), 2u);
	EXPECT_EQ(summary.errors[0].index, 10u);
	EXPECT_EQ(summary.errors[1].index, 30u);

	ASSERT_EQ(summary.diagnostics.size(), 2u);
	for (const auto& diagnostic : summary.diagnostics)
	{
		EXPECT_EQ(diagnostic.pattern, failure_pattern::missing_reference);
		EXPECT_EQ(diagnostic.field, "parentaccountid");
	}
	EXPECT_EQ(summary.outcomes[10].status, record_status::failed);
	EXPECT_EQ(summary.outcomes[11].status, record_status::succeeded);
}

TEST_F(BulkExecutionEngineTest, RateLimitIsAbsorbed)
{
	std::atomic<bool> throttled_once{ false };
	script_->set_handler(
		[&throttled_once](const service_request& request, const std::string&)
		{
			if (request.targets.front().id == "rec-100" && !throttled_once.exchange(true))
			{
				return rate_limited_response(150ms);
			}
			return service_script::success_for(request);
		});

	auto result = engine_->run("account", operation_kind::create, make_records(300));

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().success_count, 300u);
	EXPECT_EQ(result.value().failure_count, 0u);
	EXPECT_EQ(script_->executions.load(), 4u);
	EXPECT_EQ(pool_->stats().throttle_events, 1u);
}

TEST_F(BulkExecutionEngineTest, PoolExhaustionIsRetriedUntilClientsReturn)
{
	connection_pool_config config;
	config.enable_validation = false;
	config.acquire_timeout = 50ms;

	auto created = connection_pool::create({ make_mock_source("solo", 2, script_) }, config);
	ASSERT_TRUE(created.is_ok());
	auto pool = created.value();

	// Hold every slot so the engine's checkouts time out
	auto first = pool->acquire();
	auto second = pool->acquire();
	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());

	bulk_execution_engine engine(pool, nullptr, nullptr, nullptr, policy_);
	auto start = std::chrono::steady_clock::now();
	auto running = std::async(std::launch::async, [&engine]
							  { return engine.run("account", operation_kind::create, make_records(20), {}); });

	std::this_thread::sleep_for(300ms);
	EXPECT_EQ(script_->executions.load(), 0u);
	first.value()->release();
	second.value()->release();

	auto result = running.get();
	ASSERT_TRUE(result.is_ok()) << result.error().message;
	EXPECT_EQ(result.value().success_count, 20u);
	EXPECT_EQ(script_->executions.load(), 1u);
	EXPECT_GE(pool->get_metrics().timeouts.load(), 2u);
	EXPECT_GE(std::chrono::steady_clock::now() - start, 300ms);

	pool->shutdown();
}

TEST_F(BulkExecutionEngineTest, PreflightRedrawsAwayFromThrottledSource)
{
	connection_pool_config config;
	config.enable_validation = false;
	config.strategy = selection_strategy::least_connections;

	auto created = connection_pool::create(
		{ make_mock_source("a", 2, script_), make_mock_source("b", 2, script_) }, config);
	ASSERT_TRUE(created.is_ok());
	auto pool = created.value();
	auto tracker = pool->get_throttle_tracker();

	// "a" is picked first and becomes throttled during its checkout
	script_->set_checkout_hook(
		[tracker](const std::string& source)
		{
			if (source == "a@test")
			{
				[[maybe_unused]] auto recorded = tracker->record_throttle(source, 5s);
			}
		});

	std::mutex mutex;
	std::vector<std::string> executed_on;
	script_->set_handler(
		[&](const service_request& request, const std::string& source)
		{
			std::lock_guard<std::mutex> lock(mutex);
			executed_on.push_back(source);
			return service_script::success_for(request);
		});

	bulk_options options;
	options.caller_id = "importer";

	bulk_execution_engine engine(pool, nullptr, nullptr, nullptr, policy_);
	auto result = engine.run("account", operation_kind::create, make_records(10), options);

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(script_->checkouts.load(), 2u);
	std::lock_guard<std::mutex> lock(mutex);
	ASSERT_EQ(executed_on.size(), 1u);
	EXPECT_EQ(executed_on.front(), "b@test");

	pool->shutdown();
}

TEST_F(BulkExecutionEngineTest, PreflightProceedsAfterAttemptLimit)
{
	connection_pool_config config;
	config.enable_validation = false;

	auto created = connection_pool::create({ make_mock_source("solo", 2, script_) }, config);
	ASSERT_TRUE(created.is_ok());
	auto pool = created.value();
	auto tracker = pool->get_throttle_tracker();

	// Every checkout lands on a freshly throttled source
	script_->set_checkout_hook(
		[tracker](const std::string& source)
		{ [[maybe_unused]] auto recorded = tracker->record_throttle(source, 50ms); });

	retry_policy policy = policy_;
	policy.max_preflight_attempts = 3;

	bulk_options options;
	options.caller_id = "importer";

	bulk_execution_engine engine(pool, nullptr, nullptr, nullptr, policy);
	auto result = engine.run("account", operation_kind::create, make_records(10), options);

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().success_count, 10u);
	EXPECT_EQ(script_->checkouts.load(), 3u);
	EXPECT_EQ(script_->executions.load(), 1u);

	pool->shutdown();
}

TEST_F(BulkExecutionEngineTest, AuthenticationFailureIsRetried)
{
	std::atomic<int> calls{ 0 };
	script_->set_handler(
		[&calls](const service_request& request, const std::string&)
		{
			if (calls.fetch_add(1) == 0)
			{
				return fault_response(status_code::authentication_failed, "401 Unauthorized");
			}
			return service_script::success_for(request);
		});

	auto result = engine_->run("account", operation_kind::create, make_records(10));

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().success_count, 10u);
	EXPECT_EQ(pool_->stats().auth_failures, 1u);
	EXPECT_EQ(pool_->stats().invalid_connections, 1u);
}

TEST_F(BulkExecutionEngineTest, PersistentAuthenticationFailureStopsRun)
{
	script_->set_handler([](const service_request&, const std::string&)
						 { return fault_response(status_code::authentication_failed, "401 Unauthorized"); });

	auto result = engine_->run("account", operation_kind::create, make_records(10));

	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), error_code::authentication_failure));
	// One attempt plus max_retries
	EXPECT_EQ(script_->executions.load(), policy_.max_retries + 1);
}

TEST_F(BulkExecutionEngineTest, ConnectionFailureIsRetried)
{
	std::atomic<int> calls{ 0 };
	script_->set_handler(
		[&calls](const service_request& request, const std::string&)
		{
			if (calls.fetch_add(1) == 0)
			{
				return fault_response(status_code::connection_failed, "connection reset by peer", 0);
			}
			return service_script::success_for(request);
		});

	auto result = engine_->run("account", operation_kind::create, make_records(10));

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(pool_->stats().connection_failures, 1u);
	EXPECT_EQ(pool_->stats().invalid_connections, 1u);
}

TEST_F(BulkExecutionEngineTest, TransientContentionBacksOff)
{
	std::atomic<int> calls{ 0 };
	script_->set_handler(
		[&calls](const service_request& request, const std::string&)
		{
			if (calls.fetch_add(1) < 2)
			{
				return fault_response(status_code::server_busy, "Server busy", 0);
			}
			return service_script::success_for(request);
		});

	auto result = engine_->run("account", operation_kind::update, make_records(10));

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().success_count, 10u);
	EXPECT_EQ(script_->executions.load(), 3u);
}

TEST_F(BulkExecutionEngineTest, BusinessFaultIsReportedAsData)
{
	script_->set_handler(
		[](const service_request& request, const std::string&)
		{
			if (request.targets.front().id == "rec-100")
			{
				return fault_response(status_code::invalid_request, "Attribute 'name' is too long");
			}
			return service_script::success_for(request);
		});

	auto result = engine_->run("account", operation_kind::create, make_records(250));

	ASSERT_TRUE(result.is_ok());
	const auto& summary = result.value();
	EXPECT_EQ(summary.success_count, 150u);
	EXPECT_EQ(summary.failure_count, 100u);
	EXPECT_EQ(summary.outcomes[100].status, record_status::failed);
	EXPECT_EQ(summary.outcomes[100].message, "Attribute 'name' is too long");
	EXPECT_EQ(summary.outcomes[200].status, record_status::succeeded);
	EXPECT_EQ(script_->executions.load(), 3u);
}

TEST_F(BulkExecutionEngineTest, AggregatedDeleteStopsAtFirstFault)
{
	script_->set_handler(
		[](const service_request& request, const std::string&)
		{
			service_response response;
			if (request.type == request_type::execute_multiple)
			{
				response.item_faults.push_back({ 2, -2147220969, "account does not exist" });
			}
			return response;
		});

	bulk_options options;
	options.continue_on_error = false;

	auto result = engine_->run("account", operation_kind::del, make_records(5), options);

	ASSERT_TRUE(result.is_ok());
	const auto& summary = result.value();
	EXPECT_EQ(summary.success_count, 2u);
	EXPECT_EQ(summary.failure_count, 3u);
	EXPECT_EQ(summary.outcomes[2].message, "account does not exist");
	EXPECT_NE(summary.outcomes[4].message.find("Not executed"), std::string::npos);
}

TEST_F(BulkExecutionEngineTest, NativeDeleteReportsOnlyFaultedRecords)
{
	script_->set_handler(
		[](const service_request& request, const std::string&)
		{
			EXPECT_EQ(request.type, request_type::delete_multiple);
			service_response response;
			response.item_faults.push_back({ 1, -2147220969, "account does not exist" });
			return response;
		});

	bulk_options options;
	options.multi_record_delete = true;

	auto result = engine_->run("account", operation_kind::del, make_records(4), options);

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().success_count, 3u);
	EXPECT_EQ(result.value().failure_count, 1u);
	EXPECT_TRUE(result.value().created_ids.empty());
}

TEST_F(BulkExecutionEngineTest, UpsertSplitsCreatedAndUpdated)
{
	script_->set_handler(
		[](const service_request& request, const std::string&)
		{
			service_response response;
			for (size_t i = 0; i < request.targets.size(); ++i)
			{
				response.upsert_created.push_back(i % 2 == 0);
			}
			return response;
		});

	auto result = engine_->run("contact", operation_kind::upsert, make_records(10));

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().created_count, 5u);
	EXPECT_EQ(result.value().updated_count, 5u);
	ASSERT_TRUE(result.value().outcomes[0].created.has_value());
	EXPECT_TRUE(*result.value().outcomes[0].created);
	EXPECT_FALSE(*result.value().outcomes[1].created);
}

TEST_F(BulkExecutionEngineTest, BypassParametersReachTheService)
{
	bulk_options options;
	options.bypass_business_logic = "CustomSync";
	options.suppress_duplicate_detection = true;

	auto result = engine_->run("account", operation_kind::update, make_records(5), options);
	ASSERT_TRUE(result.is_ok());

	auto requests = script_->recorded_requests();
	ASSERT_EQ(requests.size(), 1u);
	EXPECT_EQ(requests[0].parameters.at("BypassBusinessLogicExecution"), "CustomSync");
	EXPECT_EQ(requests[0].parameters.at("SuppressDuplicateDetection"), "true");
}

// ============================================================================
// Progress, Cancellation and Parallelism Tests
// ============================================================================

TEST_F(BulkExecutionEngineTest, ProgressIsReportedPerBatch)
{
	std::mutex mutex;
	std::vector<progress::progress_snapshot> snapshots;

	auto result = engine_->run("account", operation_kind::create, make_records(250), bulk_options{},
							   [&](const progress::progress_snapshot& snapshot)
							   {
								   std::lock_guard<std::mutex> lock(mutex);
								   snapshots.push_back(snapshot);
							   });

	ASSERT_TRUE(result.is_ok());

	// Every snapshot is delivered before run returns
	std::lock_guard<std::mutex> lock(mutex);
	ASSERT_EQ(snapshots.size(), 3u);
	uint64_t highest = 0;
	for (const auto& snapshot : snapshots)
	{
		EXPECT_EQ(snapshot.total, 250u);
		highest = std::max(highest, snapshot.processed);
	}
	EXPECT_EQ(highest, 250u);
}

TEST_F(BulkExecutionEngineTest, ProgressNeverGoesBackwards)
{
	std::vector<uint64_t> processed;

	bulk_options options;
	options.batch_size = 10;
	options.max_parallel_batches = 8;

	// The sink runs on a single worker thread
	auto result = engine_->run("account", operation_kind::create, make_records(600), options,
							   [&](const progress::progress_snapshot& snapshot)
							   { processed.push_back(snapshot.processed); });

	ASSERT_TRUE(result.is_ok());
	ASSERT_EQ(processed.size(), 60u);
	for (size_t i = 1; i < processed.size(); ++i)
	{
		EXPECT_GT(processed[i], processed[i - 1]) << "snapshot " << i;
	}
	EXPECT_EQ(processed.back(), 600u);
}

TEST_F(BulkExecutionEngineTest, CancelledRunReturnsCancellation)
{
	auto token = kcenon::thread::cancellation_token::create();
	token.cancel();

	auto result = engine_->run("account", operation_kind::create, make_records(250), bulk_options{},
							   nullptr, token);

	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), error_code::operation_cancelled));
	EXPECT_EQ(script_->executions.load(), 0u);
}

TEST_F(BulkExecutionEngineTest, ShutdownPoolRejectsRun)
{
	pool_->shutdown();

	auto result = engine_->run("account", operation_kind::create, make_records(5));

	ASSERT_TRUE(result.is_err());
	EXPECT_TRUE(has_code(result.error(), error_code::pool_shutdown));
}

TEST_F(BulkExecutionEngineTest, InFlightBatchesAreBounded)
{
	std::atomic<int> in_flight{ 0 };
	std::atomic<int> peak{ 0 };
	script_->set_handler(
		[&](const service_request& request, const std::string&)
		{
			int now = in_flight.fetch_add(1) + 1;
			int seen = peak.load();
			while (now > seen && !peak.compare_exchange_weak(seen, now))
			{
			}
			std::this_thread::sleep_for(50ms);
			in_flight.fetch_sub(1);
			return service_script::success_for(request);
		});

	bulk_options options;
	options.batch_size = 10;
	options.max_parallel_batches = 2;

	auto result = engine_->run("account", operation_kind::create, make_records(100), options);

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().batch_count, 10u);
	EXPECT_LE(peak.load(), 2);
	EXPECT_GE(peak.load(), 1);
}

// ============================================================================
// Batch Parallelism Coordinator Tests
// ============================================================================

class BatchParallelismCoordinatorTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		script_ = std::make_shared<service_script>();
		script_->recommended_dop = 2;

		connection_pool_config config;
		config.enable_validation = false;

		auto created = connection_pool::create({ make_mock_source("a", 6, script_) }, config);
		ASSERT_TRUE(created.is_ok());
		pool_ = created.value();
	}

	std::shared_ptr<service_script> script_;
	std::shared_ptr<connection_pool> pool_;
};

TEST_F(BatchParallelismCoordinatorTest, CapacityFollowsRecommendedParallelism)
{
	ASSERT_TRUE(pool_->acquire().is_ok());
	ASSERT_EQ(pool_->total_recommended_parallelism(), 2u);

	batch_parallelism_coordinator coordinator(pool_, 100ms);
	EXPECT_EQ(coordinator.current_capacity(), 2u);

	auto first = coordinator.acquire();
	auto second = coordinator.acquire();
	ASSERT_TRUE(first.is_ok());
	ASSERT_TRUE(second.is_ok());

	auto third = coordinator.acquire();
	ASSERT_TRUE(third.is_err());
	EXPECT_TRUE(has_code(third.error(), error_code::coordinator_exhausted));
}

TEST_F(BatchParallelismCoordinatorTest, SlotReleaseIsIdempotent)
{
	batch_parallelism_coordinator coordinator(pool_, 100ms);
	auto capacity = coordinator.available_slots();

	auto slot = coordinator.acquire();
	ASSERT_TRUE(slot.is_ok());
	EXPECT_EQ(coordinator.available_slots(), capacity - 1);

	slot.value()->release();
	slot.value()->release();
	EXPECT_TRUE(slot.value()->is_released());
	EXPECT_EQ(coordinator.available_slots(), capacity);
}

TEST_F(BatchParallelismCoordinatorTest, GrowsWhenParallelismRises)
{
	ASSERT_TRUE(pool_->acquire().is_ok());
	batch_parallelism_coordinator coordinator(pool_, 100ms);
	ASSERT_EQ(coordinator.current_capacity(), 2u);

	// Back to the declared maximum until the source is seeded again
	ASSERT_TRUE(pool_->invalidate_seed("a@test").is_ok());

	auto slot = coordinator.acquire();
	ASSERT_TRUE(slot.is_ok());
	EXPECT_EQ(coordinator.current_capacity(), 6u);
}

TEST_F(BatchParallelismCoordinatorTest, NeverBelowOne)
{
	batch_parallelism_coordinator coordinator(nullptr, 100ms);
	EXPECT_EQ(coordinator.current_capacity(), 1u);
	EXPECT_TRUE(coordinator.acquire().is_ok());
}

TEST_F(BatchParallelismCoordinatorTest, ShutdownRejectsAcquire)
{
	batch_parallelism_coordinator coordinator(pool_, 100ms);
	coordinator.shutdown();

	auto slot = coordinator.acquire();
	ASSERT_TRUE(slot.is_err());
	EXPECT_TRUE(has_code(slot.error(), error_code::pool_shutdown));
}

TEST_F(BatchParallelismCoordinatorTest, CancellationAbandonsWait)
{
	batch_parallelism_coordinator coordinator(nullptr, 5s);
	auto held = coordinator.acquire();
	ASSERT_TRUE(held.is_ok());

	auto token = kcenon::thread::cancellation_token::create();
	std::thread canceller(
		[&token]
		{
			std::this_thread::sleep_for(50ms);
			token.cancel();
		});

	auto slot = coordinator.acquire(token);
	canceller.join();

	ASSERT_TRUE(slot.is_err());
	EXPECT_TRUE(has_code(slot.error(), error_code::operation_cancelled));
}
