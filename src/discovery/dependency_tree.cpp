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

#include <kcenon/dependency_resolver/discovery/dependency_tree.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace dependency_resolver::discovery
{

dependency_tree::dependency_tree()
{
	nodes_.emplace_back();
	last_child_.push_back(npos);
}

dependency_tree::node_id dependency_tree::add_child(node_id parent,
													object_identity identity,
													bool is_schema_bound)
{
	if (parent >= nodes_.size())
	{
		throw std::out_of_range("dependency_tree: parent node " + std::to_string(parent)
								+ " does not exist");
	}

	node child;
	child.identity = std::move(identity);
	child.is_schema_bound = is_schema_bound;
	child.parent = parent;

	const node_id id = nodes_.size();
	nodes_.push_back(std::move(child));
	last_child_.push_back(npos);

	if (last_child_[parent] == npos)
	{
		nodes_[parent].first_child = id;
	}
	else
	{
		nodes_[last_child_[parent]].next_sibling = id;
	}
	last_child_[parent] = id;

	return id;
}

const dependency_tree::node& dependency_tree::at(node_id id) const
{
	return nodes_.at(id);
}

dependency_tree::node_id dependency_tree::first_child(node_id id) const noexcept
{
	return id < nodes_.size() ? nodes_[id].first_child : npos;
}

dependency_tree::node_id dependency_tree::next_sibling(node_id id) const noexcept
{
	return id < nodes_.size() ? nodes_[id].next_sibling : npos;
}

bool dependency_tree::has_children(node_id id) const noexcept
{
	return first_child(id) != npos;
}

std::size_t dependency_tree::depth() const
{
	// Children are always appended after their parent, so one forward pass
	// sees every parent's depth before its children.
	std::vector<std::size_t> levels(nodes_.size(), 0);
	std::size_t deepest = 0;
	for (node_id id = 1; id < nodes_.size(); ++id)
	{
		levels[id] = levels[nodes_[id].parent] + 1;
		deepest = std::max(deepest, levels[id]);
	}
	return deepest;
}

} // namespace dependency_resolver::discovery
