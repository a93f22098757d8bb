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
 * @file tree_flattener.h
 * @brief Flattens a discovered dependency tree into tiered nodes
 *
 * Performs a pre-order walk of the first-child/next-sibling tree using an
 * explicit work stack. Each emitted flat_node carries its tier (distance
 * from the root object, negated for discovery_direction::dependencies) and
 * its structural parent.
 *
 * Starting point:
 * - include_self = true: the root object itself, tier 0
 * - include_self = false: the root object's first child, tier 1; the root
 *   object is the structural parent of that first level and is not emitted
 *
 * A tree with fewer real nodes than minimum_node_count() yields an empty
 * sequence; callers report that as "no dependencies", not as an error.
 *
 * @code
 * using namespace dependency_resolver::pipeline;
 *
 * flatten_options options;
 * options.direction = discovery_direction::dependents;
 * auto nodes = tree_flattener::flatten(tree, options);
 * @endcode
 */

#pragma once

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/discovery/dependency_tree.h>

#include <cstddef>
#include <vector>

namespace dependency_resolver::pipeline
{

/**
 * @struct flatten_options
 * @brief Options controlling tree flattening
 */
struct flatten_options
{
	discovery_direction direction = discovery_direction::dependents;
	bool include_self = false;
};

/**
 * @class tree_flattener
 * @brief Stateless tree flattening
 */
class tree_flattener
{
public:
	/**
	 * @brief Flatten @p tree in pre-order
	 * @param tree Discovered tree
	 * @param options Direction and self-inclusion
	 * @return Flat nodes in visitation order (possibly empty)
	 */
	[[nodiscard]] static std::vector<flat_node> flatten(const discovery::dependency_tree& tree,
														const flatten_options& options);

	/**
	 * @brief Minimum number of real tree nodes for a non-empty result
	 * @return 1 when the root is included, 2 otherwise
	 */
	[[nodiscard]] static constexpr std::size_t minimum_node_count(bool include_self) noexcept
	{
		return include_self ? 1 : 2;
	}
};

} // namespace dependency_resolver::pipeline
