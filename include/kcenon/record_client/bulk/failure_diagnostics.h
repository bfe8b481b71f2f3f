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
 * @file failure_diagnostics.h
 * @brief Detection of reference patterns behind failed bulk records
 */

#pragma once

#include "bulk_types.h"

#include <kcenon/record_client/core/remote_types.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace record_client::bulk
{

/**
 * @brief Inspect the references of failed records
 * @param entity Entity the batch targets
 * @param kind Operation the batch ran
 * @param batch Records of the batch
 * @param batch_offset Index of batch[0] in the run's input
 * @param failed_indices Batch-relative indices of the failed records
 * @param known_ids Every record id in the run's input
 * @return One diagnostic per detected reference problem
 *
 * Each reference is checked for self_reference, then same_batch_reference,
 * then missing_reference. Self-references only count for create and upsert.
 */
[[nodiscard]] std::vector<failure_diagnostic> analyze(
	const std::string& entity,
	operation_kind kind,
	const std::vector<record>& batch,
	size_t batch_offset,
	const std::vector<size_t>& failed_indices,
	const std::unordered_set<std::string>& known_ids);

/**
 * @brief Remediation text for a pattern
 */
[[nodiscard]] std::string suggestion_for(failure_pattern pattern,
										 const std::string& entity,
										 const record_reference& reference);

} // namespace record_client::bulk
