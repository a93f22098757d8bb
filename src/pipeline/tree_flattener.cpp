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

#include <kcenon/dependency_resolver/pipeline/tree_flattener.h>

#include <optional>

namespace dependency_resolver::pipeline
{

namespace
{

using discovery::dependency_tree;

struct work_item
{
	dependency_tree::node_id node;
	int32_t tier;
	dependency_tree::node_id parent;     ///< npos for the synthetic root
	std::optional<std::size_t> parent_index;
};

} // namespace

std::vector<flat_node> tree_flattener::flatten(const dependency_tree& tree,
											   const flatten_options& options)
{
	std::vector<flat_node> nodes;

	if (tree.count() < minimum_node_count(options.include_self))
	{
		return nodes;
	}

	const auto root_object = tree.first_child(tree.root());
	if (root_object == dependency_tree::npos)
	{
		return nodes;
	}

	std::vector<work_item> stack;
	if (options.include_self)
	{
		stack.push_back({ root_object, 0, dependency_tree::npos, std::nullopt });
	}
	else if (tree.has_children(root_object))
	{
		stack.push_back({ tree.first_child(root_object), 1, root_object, std::nullopt });
	}

	const bool negate = options.direction == discovery_direction::dependencies;
	nodes.reserve(tree.count());

	while (!stack.empty())
	{
		const work_item item = stack.back();
		stack.pop_back();

		const auto& current = tree.at(item.node);

		flat_node flat;
		flat.identity = current.identity;
		flat.tier = negate ? -item.tier : item.tier;
		flat.is_schema_bound = current.is_schema_bound;
		if (item.parent != dependency_tree::npos)
		{
			flat.parent = tree.at(item.parent).identity;
		}
		flat.parent_index = item.parent_index;

		const std::size_t index = nodes.size();
		nodes.push_back(std::move(flat));

		// Sibling goes on the stack first so the whole subtree of the
		// current node is emitted before it. Other requested roots are
		// never siblings of the emitted root object.
		if (current.next_sibling != dependency_tree::npos && item.node != root_object)
		{
			stack.push_back({ current.next_sibling, item.tier, item.parent, item.parent_index });
		}
		if (current.first_child != dependency_tree::npos)
		{
			stack.push_back({ current.first_child, item.tier + 1, item.node, index });
		}
	}

	return nodes;
}

} // namespace dependency_resolver::pipeline
