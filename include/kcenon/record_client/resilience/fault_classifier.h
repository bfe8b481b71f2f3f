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
 * @file fault_classifier.h
 * @brief Classification of service faults into retry classes
 *
 * Maps a service_response to the class that decides how the pool and the
 * bulk engine react to it. Token failures and permission failures are kept
 * apart: only token failures invalidate the cached seed.
 */

#pragma once

#include <kcenon/record_client/core/error_codes.h>
#include <kcenon/record_client/core/remote_types.h>

#include <string>
#include <string_view>

namespace record_client::resilience
{

/**
 * @enum fault_class
 * @brief Retry class of a service fault
 */
enum class fault_class : uint8_t
{
	none = 0,           ///< Request succeeded
	rate_limit = 1,     ///< Service protection limit hit
	authentication = 2, ///< Token rejected or expired
	connection = 3,     ///< Network-level failure
	transient = 4,      ///< Lock or resource-creation race on the service
	business = 5,       ///< Logic failure, never retried
};

/**
 * @brief Convert fault_class to string representation
 */
constexpr const char* to_string(fault_class value) noexcept
{
	switch (value)
	{
	case fault_class::none:
		return "none";
	case fault_class::rate_limit:
		return "rate_limit";
	case fault_class::authentication:
		return "authentication";
	case fault_class::connection:
		return "connection";
	case fault_class::transient:
		return "transient";
	case fault_class::business:
		return "business";
	default:
		return "unknown";
	}
}

/// Service protection fault codes (request count, execution time, concurrency)
inline constexpr int service_protection_codes[] = { -2147015902, -2147015903, -2147015898 };

/// Fault codes for valid tokens lacking privileges
inline constexpr int permission_fault_codes[] = { -2147180286, -2147204720, -2147180285 };

/**
 * @brief Check whether a fault code is a service protection limit
 */
[[nodiscard]] bool is_service_protection_code(int fault_code) noexcept;

/**
 * @brief Classify a service response
 * @param response Response returned by a service handle
 * @return fault_class::none for successful responses
 */
[[nodiscard]] fault_class classify(const service_response& response);

/**
 * @brief Check whether a fault message means the token itself is broken
 *
 * Matches rejected tokens ("401", "unauthorized"), expired tokens and
 * credentials, and identity provider errors ("AADSTS").
 */
[[nodiscard]] bool requires_reauthentication(std::string_view message);

/**
 * @brief Check whether a fault message describes a transient service race
 */
[[nodiscard]] bool is_transient_message(std::string_view message);

/**
 * @brief Remediation text for a fault class
 */
[[nodiscard]] std::string user_message(fault_class value);

/**
 * @brief error_code reported for a fault class
 */
[[nodiscard]] error_code to_error_code(fault_class value) noexcept;

/**
 * @brief Map an error_info produced by record_client back to its fault class
 */
[[nodiscard]] fault_class classify_error(const kcenon::common::error_info& error) noexcept;

} // namespace record_client::resilience
