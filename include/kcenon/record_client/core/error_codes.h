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
 * @file error_codes.h
 * @brief Error codes reported through kcenon::common::Result
 *
 * Every fallible record_client operation returns a Result whose error_info
 * carries one of these codes. The values continue the -5xx range used by the
 * pooling layer.
 *
 * | Code                    | Retried by          | Surfaces to caller         |
 * |-------------------------|---------------------|----------------------------|
 * | rate_limited            | pool / bulk engine  | never                      |
 * | pool_exhausted          | bulk engine         | from acquire() only        |
 * | coordinator_exhausted   | bulk engine         | never from run()           |
 * | authentication_failure  | bulk engine (3x)    | after retries              |
 * | connection_failure      | bulk engine (3x)    | after retries              |
 * | transient_contention    | bulk engine (3x)    | after retries              |
 * | validation_failure      | never               | immediately                |
 */

#pragma once

#include <string>

#include <kcenon/common/patterns/result.h>

namespace record_client
{

/**
 * @enum error_code
 * @brief Error codes for record_client operations
 */
enum class error_code : int
{
	success = 0,
	pool_shutdown = -500,          ///< Operation after shutdown (object disposed)
	pool_exhausted = -501,         ///< No capacity within the acquire timeout
	all_sources_throttled = -502,  ///< Throttle wait exceeded the configured tolerance
	authentication_failure = -503, ///< Seed handle rejected by the service
	connection_failure = -504,     ///< Network-level failure
	validation_failure = -505,     ///< Invalid construction or call arguments
	operation_cancelled = -506,    ///< Cancellation observed during a wait
	rate_limited = -507,           ///< Service protection limit hit
	transient_contention = -508,   ///< Lock or resource-creation race on the service
	remote_fault = -509,           ///< Business-logic failure reported by the service
	coordinator_exhausted = -510,  ///< No batch slot within the acquire timeout
	pool_creation_timeout = -511,  ///< Memoized pool creation did not finish in time
};

/**
 * @brief Convert error_code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
constexpr const char* to_string(error_code code) noexcept
{
	switch (code)
	{
	case error_code::success:
		return "success";
	case error_code::pool_shutdown:
		return "pool_shutdown";
	case error_code::pool_exhausted:
		return "pool_exhausted";
	case error_code::all_sources_throttled:
		return "all_sources_throttled";
	case error_code::authentication_failure:
		return "authentication_failure";
	case error_code::connection_failure:
		return "connection_failure";
	case error_code::validation_failure:
		return "validation_failure";
	case error_code::operation_cancelled:
		return "operation_cancelled";
	case error_code::rate_limited:
		return "rate_limited";
	case error_code::transient_contention:
		return "transient_contention";
	case error_code::remote_fault:
		return "remote_fault";
	case error_code::coordinator_exhausted:
		return "coordinator_exhausted";
	case error_code::pool_creation_timeout:
		return "pool_creation_timeout";
	default:
		return "unknown";
	}
}

/**
 * @brief Build an error_info for a record_client error code
 * @param code Error code
 * @param message Human readable message
 * @param module Reporting component
 * @return error_info suitable for returning from a Result
 */
inline kcenon::common::error_info make_error(
	error_code code, const std::string& message, const std::string& module)
{
	return kcenon::common::error_info{ static_cast<int>(code), message, module };
}

/**
 * @brief Check whether an error_info carries the given code
 */
inline bool has_code(const kcenon::common::error_info& error, error_code code) noexcept
{
	return error.code == static_cast<int>(code);
}

} // namespace record_client
