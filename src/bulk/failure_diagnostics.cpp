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

#include <kcenon/record_client/bulk/failure_diagnostics.h>

#include <unordered_map>

namespace record_client::bulk
{

std::string suggestion_for(failure_pattern pattern,
						   const std::string& entity,
						   const record_reference& reference)
{
	switch (pattern)
	{
	case failure_pattern::self_reference:
		return "Create the " + entity + " record without '" + reference.field
			   + "', then set the lookup in a second update pass";
	case failure_pattern::same_batch_reference:
		return "Move the referenced " + reference.target_entity
			   + " record into an earlier batch, or load '" + reference.field
			   + "' in a second pass";
	case failure_pattern::missing_reference:
	default:
		return "Verify that " + reference.target_entity + " " + reference.target_id
			   + " exists in the target environment, or include it in the import";
	}
}

std::vector<failure_diagnostic> analyze(const std::string& entity,
										operation_kind kind,
										const std::vector<record>& batch,
										size_t batch_offset,
										const std::vector<size_t>& failed_indices,
										const std::unordered_set<std::string>& known_ids)
{
	std::vector<failure_diagnostic> diagnostics;

	bool creates = kind == operation_kind::create || kind == operation_kind::upsert;

	// Batch id -> batch-relative position
	std::unordered_map<std::string, size_t> batch_ids;
	for (size_t i = 0; i < batch.size(); ++i)
	{
		if (!batch[i].id.empty())
		{
			batch_ids.emplace(batch[i].id, i);
		}
	}

	for (auto index : failed_indices)
	{
		if (index >= batch.size())
		{
			continue;
		}

		const auto& item = batch[index];
		for (const auto& reference : item.references)
		{
			if (reference.target_id.empty())
			{
				continue;
			}

			std::optional<failure_pattern> pattern;
			if (creates && !item.id.empty() && reference.target_id == item.id)
			{
				pattern = failure_pattern::self_reference;
			}
			else if (auto it = batch_ids.find(reference.target_id);
					 it != batch_ids.end() && it->second != index)
			{
				pattern = failure_pattern::same_batch_reference;
			}
			else if (known_ids.find(reference.target_id) == known_ids.end())
			{
				pattern = failure_pattern::missing_reference;
			}

			if (!pattern)
			{
				continue;
			}

			failure_diagnostic diagnostic;
			diagnostic.record_index = batch_offset + index;
			diagnostic.record_id = item.id;
			diagnostic.pattern = *pattern;
			diagnostic.field = reference.field;
			diagnostic.target_id = reference.target_id;
			diagnostic.suggestion = suggestion_for(*pattern, entity, reference);
			diagnostics.push_back(std::move(diagnostic));
		}
	}

	return diagnostics;
}

} // namespace record_client::bulk
