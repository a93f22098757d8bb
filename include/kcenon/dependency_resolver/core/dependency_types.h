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
 * @file dependency_types.h
 * @brief Data model shared by all dependency resolution stages
 *
 * Defines the discovery direction, the object metadata returned by a
 * catalog resolver, the flattened tree node, and the dependency record
 * emitted by the pipeline.
 *
 * ## Tier sign convention
 * Tiers are distances from the root object. For discovery_direction::
 * dependents they are positive; for discovery_direction::dependencies they
 * are negated. Either way, ascending tier order places every object after
 * the objects it depends on.
 *
 * ## Thread Safety
 * Plain value types with no internal synchronization.
 */

#pragma once

#include "object_identity.h"
#include "server_context.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dependency_resolver
{

/**
 * @enum discovery_direction
 * @brief Which side of the dependency graph to walk
 */
enum class discovery_direction : uint8_t
{
	dependents = 0,   ///< Objects that rely on the root
	dependencies = 1, ///< Objects the root relies on ("parents")
};

/**
 * @brief Convert discovery_direction to string representation
 */
constexpr std::string_view to_string(discovery_direction direction) noexcept
{
	switch (direction)
	{
	case discovery_direction::dependents:
		return "dependents";
	case discovery_direction::dependencies:
		return "dependencies";
	default:
		return "unknown";
	}
}

/**
 * @brief Parse discovery_direction from string
 * @param str "dependents", "dependencies" or "parents"
 * @return Parsed direction, or std::nullopt for unrecognized input
 */
inline std::optional<discovery_direction> parse_direction(std::string_view str) noexcept
{
	if (str == "dependents" || str == "DEPENDENTS")
		return discovery_direction::dependents;
	if (str == "dependencies" || str == "DEPENDENCIES" || str == "parents" || str == "PARENTS")
		return discovery_direction::dependencies;
	return std::nullopt;
}

/**
 * @struct object_descriptor
 * @brief Object metadata returned by a catalog resolver
 */
struct object_descriptor
{
	std::string name;             ///< Object name
	std::string kind;             ///< Object type, e.g. "Table", "StoredProcedure"
	std::string owner;            ///< Owning principal
	bool is_schema_bound = false; ///< Definition is schema-bound
	bool is_system_object = false; ///< Shipped by the server, not user-defined
};

/**
 * @struct flat_node
 * @brief One node of a flattened dependency tree
 */
struct flat_node
{
	object_identity identity;
	int32_t tier = 0;             ///< Signed distance from the root object
	bool is_schema_bound = false; ///< Schema binding of the discovered edge

	/// Identity of the structural parent; std::nullopt for the synthetic root
	std::optional<object_identity> parent;

	/// Position of the parent in the flattened sequence, if it was emitted
	std::optional<std::size_t> parent_index;
};

/**
 * @struct dependency_record
 * @brief Fully enriched dependency entry
 */
struct dependency_record
{
	object_identity dependent;       ///< Identity of the dependent object
	std::string dependent_name;
	std::string dependent_kind;
	std::string owner;
	bool is_schema_bound = false;
	bool is_system_object = false;

	std::optional<object_identity> parent; ///< Structural parent, absent for the synthetic root
	std::string parent_name;
	std::string parent_kind;

	int32_t tier = 0;
	std::optional<std::string> script; ///< Normalized creation script

	object_identity origin;  ///< Root object that started the discovery
	server_context server;   ///< Server the root object lives on
};

} // namespace dependency_resolver
