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
 * @file record_client_benchmarks.cpp
 * @brief Performance benchmarks for pooled clients and bulk execution
 *
 * Benchmarks cover:
 * - Pool checkout/return overhead (target: < 50us)
 * - Contended checkout across threads
 * - Source selection strategies
 * - Throttle tracker lookups
 * - Bulk run throughput against an in-memory service
 */

#include <benchmark/benchmark.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <kcenon/record_client/bulk/bulk_execution_engine.h>
#include <kcenon/record_client/pooling/connection_pool.h>
#include <kcenon/record_client/pooling/selection_strategy.h>
#include <kcenon/record_client/resilience/throttle_tracker.h>

#include "mock_record_service.h"

using namespace record_client;
using namespace record_client::pooling;
using namespace record_client::testing;

// ============================================================================
// Benchmark Fixtures
// ============================================================================

class PoolBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& state) override
	{
		// Threaded runs share one pool
		if (state.thread_index() != 0)
		{
			return;
		}

		script_ = std::make_shared<service_script>();

		config_.enable_validation = false;
		config_.acquire_timeout = std::chrono::seconds(30);

		auto created = connection_pool::create({ make_mock_source("bench-a", 16, script_),
												 make_mock_source("bench-b", 16, script_) },
											   config_);
		if (created.is_ok())
		{
			pool_ = created.value();
		}
	}

	void TearDown(const benchmark::State& state) override
	{
		if (state.thread_index() == 0 && pool_)
		{
			pool_->shutdown();
			pool_.reset();
		}
	}

protected:
	std::shared_ptr<service_script> script_;
	connection_pool_config config_;
	std::shared_ptr<connection_pool> pool_;
};

// ============================================================================
// Pool Benchmarks - Checkout Overhead
// ============================================================================

BENCHMARK_DEFINE_F(PoolBenchmarkFixture, CheckoutReturn)(benchmark::State& state)
{
	if (!pool_)
	{
		state.SkipWithError("pool creation failed");
		return;
	}

	for (auto _ : state)
	{
		auto start = std::chrono::high_resolution_clock::now();

		auto client = pool_->acquire();
		benchmark::DoNotOptimize(client);
		if (client.is_ok())
		{
			client.value()->release();
		}

		auto end = std::chrono::high_resolution_clock::now();
		auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
		state.SetIterationTime(duration.count() / 1e9);
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["avg_wait_us"] = pool_->get_metrics().average_wait_time_us();
	state.counters["clones"] = static_cast<double>(script_->clones.load());
}

BENCHMARK_REGISTER_F(PoolBenchmarkFixture, CheckoutReturn)
	->UseManualTime()
	->Unit(benchmark::kMicrosecond)
	->Iterations(10000);

BENCHMARK_DEFINE_F(PoolBenchmarkFixture, ContendedCheckout)(benchmark::State& state)
{
	// pool_ is only visible to every thread once the loop barrier has passed
	for (auto _ : state)
	{
		if (!pool_)
		{
			state.SkipWithError("pool creation failed");
			break;
		}

		auto client = pool_->acquire();
		if (client.is_ok())
		{
			auto response = client.value()->execute(service_request{});
			benchmark::DoNotOptimize(response);
		}
	}

	state.SetItemsProcessed(state.iterations());
	if (state.thread_index() == 0 && pool_)
	{
		state.counters["peak_active"]
			= static_cast<double>(pool_->get_metrics().peak_active.load());
	}
}

BENCHMARK_REGISTER_F(PoolBenchmarkFixture, ContendedCheckout)
	->Unit(benchmark::kMicrosecond)
	->Threads(1)
	->Threads(8)
	->Threads(32)
	->UseRealTime();

// ============================================================================
// Selection and Throttle Benchmarks
// ============================================================================

static void BM_SelectSource(benchmark::State& state)
{
	auto strategy = static_cast<selection_strategy>(state.range(0));
	resilience::throttle_tracker tracker;

	std::vector<std::string> candidates;
	std::map<std::string, size_t> active_counts;
	for (int i = 0; i < 8; ++i)
	{
		candidates.push_back("source-" + std::to_string(i));
		active_counts[candidates.back()] = static_cast<size_t>(i % 3);
	}
	[[maybe_unused]] auto recorded = tracker.record_throttle("source-0", std::chrono::seconds(60));

	uint64_t rotation = 0;
	for (auto _ : state)
	{
		auto selected = select_source(strategy, candidates, tracker, active_counts, rotation++);
		benchmark::DoNotOptimize(selected);
	}

	state.SetItemsProcessed(state.iterations());
	state.SetLabel(to_string(strategy));
}

BENCHMARK(BM_SelectSource)
	->Arg(static_cast<int>(selection_strategy::round_robin))
	->Arg(static_cast<int>(selection_strategy::least_connections))
	->Arg(static_cast<int>(selection_strategy::throttle_aware))
	->Unit(benchmark::kNanosecond);

static void BM_ThrottleLookup(benchmark::State& state)
{
	resilience::throttle_tracker tracker;
	const auto names = static_cast<int>(state.range(0));
	for (int i = 0; i < names; i += 2)
	{
		[[maybe_unused]] auto recorded
			= tracker.record_throttle("identity-" + std::to_string(i), std::chrono::seconds(60));
	}

	int index = 0;
	for (auto _ : state)
	{
		bool throttled = tracker.is_throttled("identity-" + std::to_string(index++ % names));
		benchmark::DoNotOptimize(throttled);
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThrottleLookup)->Arg(4)->Arg(64)->Unit(benchmark::kNanosecond);

// ============================================================================
// Bulk Throughput
// ============================================================================

BENCHMARK_DEFINE_F(PoolBenchmarkFixture, BulkCreateThroughput)(benchmark::State& state)
{
	if (!pool_)
	{
		state.SkipWithError("pool creation failed");
		return;
	}

	bulk::bulk_execution_engine engine(pool_, nullptr);
	auto records = make_records(static_cast<size_t>(state.range(0)));

	bulk::bulk_options options;
	options.batch_size = 100;

	for (auto _ : state)
	{
		auto result = engine.run("account", operation_kind::create, records, options);
		if (result.is_err())
		{
			state.SkipWithError(result.error().message.c_str());
			break;
		}
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations() * state.range(0));
	state.counters["requests"] = static_cast<double>(script_->executions.load());
}

BENCHMARK_REGISTER_F(PoolBenchmarkFixture, BulkCreateThroughput)
	->Arg(1000)
	->Arg(10000)
	->Unit(benchmark::kMillisecond)
	->UseRealTime();

BENCHMARK_MAIN();
