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
 * @file bulk_types.h
 * @brief Options and result types of the bulk execution engine
 *
 * ## Thread Safety
 * All types are plain data structures with no internal synchronization.
 */

#pragma once

#include <kcenon/record_client/core/remote_types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace record_client::bulk
{

/// Largest batch the service accepts in one multi-record request
inline constexpr size_t max_batch_size = 1000;

/**
 * @struct bulk_options
 * @brief Per-run settings of bulk_execution_engine::run
 */
struct bulk_options
{
	size_t batch_size = 100;          ///< Records per multi-record request (1..1000)
	bool multi_record_delete = false; ///< Entity supports true multi-record delete
	bool continue_on_error = true;    ///< Aggregated delete keeps going after a fault
	std::optional<std::string> bypass_business_logic; ///< e.g. "CustomSync,CustomAsync"
	bool bypass_custom_plugins = false;       ///< Legacy plugin bypass
	bool bypass_power_automate_flows = false; ///< Suppress flow triggers
	bool suppress_duplicate_detection = false;
	size_t max_parallel_batches = 0; ///< In-flight batch bound (0 = pool's recommended parallelism)
	std::optional<std::string> caller_id; ///< Execute on behalf of this identity
};

/**
 * @struct retry_policy
 * @brief Backoff settings of the two retry tiers
 */
struct retry_policy
{
	std::chrono::milliseconds exhaustion_initial_delay{ 1000 }; ///< Outer tier, pool/coordinator exhaustion
	std::chrono::milliseconds exhaustion_max_delay{ 32000 };
	std::chrono::milliseconds transient_initial_delay{ 500 };   ///< Inner tier, transient contention
	std::chrono::milliseconds transient_max_delay{ 2000 };
	double backoff_multiplier{ 2.0 };
	uint32_t max_retries{ 3 };             ///< Inner tier budget per failure class
	uint32_t max_preflight_attempts{ 10 }; ///< Throttled-client redraws before proceeding anyway
};

/**
 * @brief Delay before retry number @p attempt (0-based)
 */
inline std::chrono::milliseconds backoff_delay(std::chrono::milliseconds initial,
											   std::chrono::milliseconds max_delay,
											   double multiplier,
											   uint32_t attempt)
{
	double delay_ms = static_cast<double>(initial.count());
	for (uint32_t i = 0; i < attempt && delay_ms < static_cast<double>(max_delay.count()); ++i)
	{
		delay_ms *= multiplier;
	}

	delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));
	return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

/**
 * @enum failure_pattern
 * @brief Cause detected for a failed record
 */
enum class failure_pattern : uint8_t
{
	self_reference = 0,       ///< Lookup points at the record being created
	same_batch_reference = 1, ///< Lookup points at another record of the same batch
	missing_reference = 2,    ///< Lookup points at an id that is not part of the input
};

constexpr const char* to_string(failure_pattern pattern) noexcept
{
	switch (pattern)
	{
	case failure_pattern::self_reference:
		return "self-reference";
	case failure_pattern::same_batch_reference:
		return "same-batch-reference";
	case failure_pattern::missing_reference:
		return "missing-reference";
	default:
		return "unknown";
	}
}

/**
 * @struct failure_diagnostic
 * @brief One detected cause for a failed record, with remediation
 */
struct failure_diagnostic
{
	size_t record_index = 0; ///< Index in the run's input
	std::string record_id;
	failure_pattern pattern = failure_pattern::missing_reference;
	std::string field;     ///< Lookup attribute involved
	std::string target_id; ///< Referenced identifier
	std::string suggestion;
};

/**
 * @struct bulk_error
 * @brief Failure of one record
 */
struct bulk_error
{
	size_t index = 0;  ///< Index in the run's input
	std::string record_id;
	int code = 0;      ///< Service fault code, or record_client error_code
	std::string message;
};

/**
 * @enum record_status
 * @brief Final state of one input record
 */
enum class record_status : uint8_t
{
	succeeded = 0,
	failed = 1,
};

/**
 * @struct record_outcome
 * @brief Result of one input record, in input order
 */
struct record_outcome
{
	size_t index = 0;
	record_status status = record_status::succeeded;
	std::string record_id;             ///< Input id, or the id assigned on create
	std::optional<bool> created;       ///< Upsert only: true = created, false = updated
	std::string message;               ///< Failure message
};

/**
 * @struct batch_result
 * @brief Aggregated outcome of a bulk run
 */
struct batch_result
{
	size_t success_count = 0;
	size_t failure_count = 0;
	std::vector<record_outcome> outcomes; ///< One entry per input record, in input order
	std::vector<bulk_error> errors;
	std::vector<std::string> created_ids; ///< Create only, in input order of successes
	size_t created_count = 0;             ///< Upsert only
	size_t updated_count = 0;             ///< Upsert only
	std::vector<failure_diagnostic> diagnostics;
	size_t batch_count = 0;
	std::chrono::milliseconds duration{ 0 };

	[[nodiscard]] bool all_succeeded() const noexcept { return failure_count == 0; }
};

} // namespace record_client::bulk
