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
 * @file precedence_resolver.h
 * @brief Deduplicates dependency records and sorts them into causal order
 *
 * An object may be reachable from the root through several paths at
 * different depths. The resolver keeps one record per dependent identity,
 * the deepest occurrence (largest tier magnitude; the first one wins on a
 * tie), and sorts the survivors by ascending tier. Survivors sharing a tier
 * keep the order in which their identities first appeared in the input.
 *
 * Because every discovered edge connects tier t to tier t+1 (or t-1 for
 * dependencies), keeping the deepest occurrence never places an object
 * ahead of something it depends on.
 *
 * The operation is pure, total and idempotent.
 */

#pragma once

#include <kcenon/dependency_resolver/core/dependency_types.h>

#include <vector>

namespace dependency_resolver::pipeline
{

/**
 * @class precedence_resolver
 * @brief Stateless deduplication and ordering
 */
class precedence_resolver
{
public:
	/**
	 * @brief Deduplicate and order records
	 * @param records Enriched records in discovery order
	 * @return One record per dependent identity, ascending by tier
	 */
	[[nodiscard]] static std::vector<dependency_record> resolve(
		std::vector<dependency_record> records);
};

} // namespace dependency_resolver::pipeline
