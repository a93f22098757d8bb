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
 * @file node_enricher.h
 * @brief Turns flattened nodes into dependency records
 *
 * For every flat_node the enricher resolves the node and its structural
 * parent through the catalog resolver and, on request, fetches and
 * normalizes the creation script. Any lookup failure is reported as
 * error_codes::resolution_failed for that node only; the caller decides
 * whether to continue with the remaining nodes.
 */

#pragma once

#include "script_normalizer.h"

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/object_identity.h>
#include <kcenon/dependency_resolver/core/server_context.h>
#include <kcenon/dependency_resolver/discovery/catalog_resolver.h>

#include <memory>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::pipeline
{

/**
 * @struct enrichment_context
 * @brief Per-root values stamped onto every record
 */
struct enrichment_context
{
	object_identity origin;    ///< Root object that started the discovery
	server_context server;     ///< Server of the root object
	bool include_script = true;
};

/**
 * @class node_enricher
 * @brief Catalog-backed enrichment of flat nodes
 *
 * Thread Safety:
 * - enrich() is const; concurrent calls are safe if the resolver is
 */
class node_enricher
{
public:
	/**
	 * @brief Construct an enricher
	 * @param resolver Catalog resolver used for every lookup
	 * @param normalizer Script normalization applied when scripts are requested
	 */
	node_enricher(std::shared_ptr<discovery::catalog_resolver> resolver,
				  script_normalizer normalizer = script_normalizer{});

	/**
	 * @brief Build the dependency record for one node
	 * @param node Flattened node
	 * @param context Root-level values (origin, server, script flag)
	 * @return Record, or error_codes::resolution_failed naming the node
	 */
	[[nodiscard]] kcenon::common::Result<dependency_record> enrich(
		const flat_node& node, const enrichment_context& context) const;

private:
	[[nodiscard]] kcenon::common::Result<object_descriptor> lookup(
		const object_identity& identity, const char* role) const;

	std::shared_ptr<discovery::catalog_resolver> resolver_;
	script_normalizer normalizer_;
};

} // namespace dependency_resolver::pipeline
