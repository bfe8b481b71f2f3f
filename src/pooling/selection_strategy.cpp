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

#include <kcenon/record_client/pooling/selection_strategy.h>

namespace record_client::pooling
{

namespace
{

size_t select_round_robin(const std::vector<std::string>& candidates, uint64_t rotation)
{
	return static_cast<size_t>(rotation % candidates.size());
}

size_t select_least_connections(const std::vector<std::string>& candidates,
								const std::map<std::string, size_t>& active_counts)
{
	size_t best = 0;
	size_t best_count = SIZE_MAX;

	for (size_t i = 0; i < candidates.size(); ++i)
	{
		auto it = active_counts.find(candidates[i]);
		size_t count = it != active_counts.end() ? it->second : 0;
		if (count < best_count)
		{
			best = i;
			best_count = count;
		}
	}

	return best;
}

size_t select_throttle_aware(const std::vector<std::string>& candidates,
							 const resilience::throttle_tracker& tracker,
							 uint64_t rotation)
{
	std::vector<size_t> available;
	available.reserve(candidates.size());

	std::optional<resilience::throttle_tracker::clock::time_point> nearest;
	size_t nearest_index = 0;

	for (size_t i = 0; i < candidates.size(); ++i)
	{
		auto expiry = tracker.expiry_of(candidates[i]);
		if (!expiry)
		{
			available.push_back(i);
		}
		else if (!nearest || *expiry < *nearest)
		{
			nearest = expiry;
			nearest_index = i;
		}
	}

	if (available.empty())
	{
		return nearest_index;
	}

	return available[static_cast<size_t>(rotation % available.size())];
}

} // namespace

std::optional<selection_strategy> parse_selection_strategy(std::string_view name)
{
	if (name == "round_robin" || name == "RoundRobin")
		return selection_strategy::round_robin;
	if (name == "least_connections" || name == "LeastConnections")
		return selection_strategy::least_connections;
	if (name == "throttle_aware" || name == "ThrottleAware")
		return selection_strategy::throttle_aware;
	return std::nullopt;
}

size_t select_source(selection_strategy strategy,
					 const std::vector<std::string>& candidates,
					 const resilience::throttle_tracker& tracker,
					 const std::map<std::string, size_t>& active_counts,
					 uint64_t rotation)
{
	if (candidates.size() <= 1)
	{
		return 0;
	}

	switch (strategy)
	{
	case selection_strategy::round_robin:
		return select_round_robin(candidates, rotation);
	case selection_strategy::least_connections:
		return select_least_connections(candidates, active_counts);
	case selection_strategy::throttle_aware:
	default:
		return select_throttle_aware(candidates, tracker, rotation);
	}
}

bool any_available(const std::vector<std::string>& candidates,
				   const resilience::throttle_tracker& tracker)
{
	for (const auto& name : candidates)
	{
		if (!tracker.is_throttled(name))
		{
			return true;
		}
	}
	return false;
}

} // namespace record_client::pooling
