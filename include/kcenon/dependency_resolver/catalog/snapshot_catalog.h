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
 * @file snapshot_catalog.h
 * @brief Offline catalog implementing discovery and resolution in memory
 *
 * A snapshot_catalog holds a captured copy of a server's object metadata
 * and dependency references. It implements both external capabilities the
 * pipeline needs, so dependency resolution can run from the command line or
 * in tests without a live server.
 *
 * Snapshot file format (one record per line, '|' separated, '#' comments):
 *
 *   object|<urn>|<kind>|<owner>[|<flags>]        flags: system,schemabound
 *   script|<urn>|<text>                           escapes: \n \r \t \\
 *   reference|<dependent urn>|<referenced urn>[|schemabound]
 *
 * Discovery semantics:
 * - Each requested root becomes a child of the synthetic root
 * - Nodes expand to their dependents (objects referencing them) or their
 *   dependencies (objects they reference), in registration order
 * - An object already on the current ancestor path is not expanded again;
 *   the same object may appear under several branches
 * - System objects are skipped unless allowed
 *
 * ## Thread Safety
 * All public methods are thread-safe (reader/writer lock).
 */

#pragma once

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/object_identity.h>
#include <kcenon/dependency_resolver/discovery/catalog_resolver.h>
#include <kcenon/dependency_resolver/discovery/discovery_service.h>

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::catalog
{

/**
 * @struct catalog_object
 * @brief One object captured in the snapshot
 */
struct catalog_object
{
	object_identity identity;
	object_descriptor descriptor;
	std::optional<std::string> script;
};

/**
 * @struct catalog_reference
 * @brief "dependent references referenced" edge
 */
struct catalog_reference
{
	object_identity dependent;
	object_identity referenced;
	bool is_schema_bound = false;
};

/**
 * @class snapshot_catalog
 * @brief In-memory discovery service and catalog resolver
 */
class snapshot_catalog : public discovery::discovery_service,
						 public discovery::catalog_resolver
{
public:
	snapshot_catalog() = default;
	~snapshot_catalog() override = default;

	snapshot_catalog(const snapshot_catalog&) = delete;
	snapshot_catalog& operator=(const snapshot_catalog&) = delete;

	/**
	 * @brief Load a snapshot file
	 * @param path Snapshot file path
	 * @return Loaded catalog, or error_codes::snapshot_error with the
	 *         offending line number
	 */
	[[nodiscard]] static kcenon::common::Result<std::shared_ptr<snapshot_catalog>> load_from_file(
		const std::string& path);

	/**
	 * @brief Load a snapshot from a stream
	 * @param input Snapshot text
	 * @param source_name Name used in error messages
	 */
	[[nodiscard]] static kcenon::common::Result<std::shared_ptr<snapshot_catalog>> load_from_stream(
		std::istream& input, const std::string& source_name);

	/**
	 * @brief Register or replace an object
	 */
	void add_object(catalog_object object);

	/**
	 * @brief Attach a creation script to a registered object
	 * @return error_codes::snapshot_error if the object is unknown
	 */
	kcenon::common::VoidResult set_script(const object_identity& identity, std::string script);

	/**
	 * @brief Register a reference between two registered objects
	 * @return error_codes::snapshot_error if either end is unknown
	 */
	kcenon::common::VoidResult add_reference(const catalog_reference& reference);

	/**
	 * @brief Remove an object; its references stay and fail on lookup
	 * @return true if the object existed
	 */
	bool remove_object(const object_identity& identity);

	[[nodiscard]] std::size_t object_count() const;
	[[nodiscard]] std::size_t reference_count() const;

	// discovery_service
	[[nodiscard]] kcenon::common::Result<discovery::dependency_tree> discover(
		const std::vector<object_identity>& roots,
		bool allow_system_objects,
		discovery_direction direction,
		const discovery::discovery_progress_callback& progress) override;

	// catalog_resolver
	[[nodiscard]] kcenon::common::Result<object_descriptor> resolve(
		const object_identity& identity) override;
	[[nodiscard]] kcenon::common::Result<std::string> script(
		const object_identity& identity) override;

private:
	struct edge
	{
		object_identity target;
		bool is_schema_bound = false;
	};

	[[nodiscard]] bool is_system(const object_identity& identity) const;

	mutable std::shared_mutex mutex_;
	std::unordered_map<object_identity, catalog_object> objects_;
	std::unordered_map<object_identity, std::vector<edge>> dependents_;    ///< referenced -> dependents
	std::unordered_map<object_identity, std::vector<edge>> dependencies_;  ///< dependent -> referenced
	std::size_t reference_count_ = 0;
};

} // namespace dependency_resolver::catalog
