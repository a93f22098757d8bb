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
 * @file dependency_tree.h
 * @brief First-child/next-sibling tree produced by dependency discovery
 *
 * The tree owns all of its nodes in a single arena and links them by index,
 * so building, copying and destroying a tree never recurses regardless of
 * its depth. Index 0 is always a synthetic root; its children are the
 * objects the discovery was requested for, and their descendants are the
 * discovered dependents (or dependencies).
 *
 * @code
 * using namespace dependency_resolver::discovery;
 *
 * dependency_tree tree;
 * auto table = tree.add_child(tree.root(), table_id);
 * auto view = tree.add_child(table, view_id, true);   // schema-bound edge
 * tree.count();                                        // 2
 * tree.first_child(table) == view;                     // true
 * @endcode
 */

#pragma once

#include <kcenon/dependency_resolver/core/object_identity.h>

#include <cstddef>
#include <limits>
#include <vector>

namespace dependency_resolver::discovery
{

/**
 * @class dependency_tree
 * @brief Arena-backed first-child/next-sibling tree
 *
 * Thread Safety:
 * - Const member functions are safe to call concurrently
 * - add_child() requires exclusive access
 */
class dependency_tree
{
public:
	using node_id = std::size_t;

	/// Marker for a missing child, sibling or parent
	static constexpr node_id npos = std::numeric_limits<node_id>::max();

	struct node
	{
		object_identity identity;
		bool is_schema_bound = false;
		node_id parent = npos;
		node_id first_child = npos;
		node_id next_sibling = npos;
	};

	/**
	 * @brief Construct a tree holding only the synthetic root
	 */
	dependency_tree();

	/// Index of the synthetic root
	[[nodiscard]] node_id root() const noexcept { return 0; }

	/**
	 * @brief Append a node as the last child of @p parent
	 * @param parent Existing node index
	 * @param identity Identity of the discovered object
	 * @param is_schema_bound Schema binding of the edge to @p parent
	 * @return Index of the new node
	 * @throws std::out_of_range if @p parent does not exist
	 */
	node_id add_child(node_id parent, object_identity identity, bool is_schema_bound = false);

	/**
	 * @brief Access a node
	 * @throws std::out_of_range if @p id does not exist
	 */
	[[nodiscard]] const node& at(node_id id) const;

	[[nodiscard]] node_id first_child(node_id id) const noexcept;
	[[nodiscard]] node_id next_sibling(node_id id) const noexcept;
	[[nodiscard]] bool has_children(node_id id) const noexcept;

	/// Number of real nodes, excluding the synthetic root
	[[nodiscard]] std::size_t count() const noexcept { return nodes_.size() - 1; }

	[[nodiscard]] bool empty() const noexcept { return count() == 0; }

	/// Length of the longest root-to-leaf path, in edges below the synthetic root
	[[nodiscard]] std::size_t depth() const;

private:
	std::vector<node> nodes_;
	std::vector<node_id> last_child_;
};

} // namespace dependency_resolver::discovery
