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
 * @file selection_strategy.h
 * @brief Source selection strategies for the connection pool
 *
 * Selection is a pure function of the candidate list, the throttle state and
 * the per-source active counts. The pool supplies a rotation ticket so the
 * round-robin variants stay deterministic and independently testable.
 */

#pragma once

#include <kcenon/record_client/resilience/throttle_tracker.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace record_client::pooling
{

/**
 * @enum selection_strategy
 * @brief Strategy used to pick the source of the next checkout
 */
enum class selection_strategy : uint8_t
{
	round_robin = 0,       ///< Rotate through sources, ignoring throttle state
	least_connections = 1, ///< Source with the fewest checked-out clients
	throttle_aware = 2,    ///< Round-robin over sources that are not throttled
};

constexpr const char* to_string(selection_strategy strategy) noexcept
{
	switch (strategy)
	{
	case selection_strategy::round_robin:
		return "round_robin";
	case selection_strategy::least_connections:
		return "least_connections";
	case selection_strategy::throttle_aware:
		return "throttle_aware";
	default:
		return "unknown";
	}
}

/**
 * @brief Parse a strategy name
 * @return Matching strategy, or std::nullopt when unknown
 */
std::optional<selection_strategy> parse_selection_strategy(std::string_view name);

/**
 * @brief Pick one candidate
 * @param strategy Strategy to apply
 * @param candidates Source names in pool order (must not be empty)
 * @param tracker Throttle state
 * @param active_counts Checked-out clients per source name
 * @param rotation Monotonically increasing ticket supplied by the caller
 * @return Index into @p candidates
 *
 * When every candidate is throttled, throttle_aware returns the one whose
 * throttle expires first. Callers treat that as a hint only.
 */
[[nodiscard]] size_t select_source(selection_strategy strategy,
								   const std::vector<std::string>& candidates,
								   const resilience::throttle_tracker& tracker,
								   const std::map<std::string, size_t>& active_counts,
								   uint64_t rotation);

/**
 * @brief Check whether at least one candidate is not throttled
 */
[[nodiscard]] bool any_available(const std::vector<std::string>& candidates,
								 const resilience::throttle_tracker& tracker);

} // namespace record_client::pooling
