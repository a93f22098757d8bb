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
 * @file discovery_service.h
 * @brief Interface of the external dependency discovery capability
 *
 * A discovery service walks the server's dependency metadata for a set of
 * root objects and returns the result as a dependency_tree. Implementations
 * talk to a live server (or, for offline use, a catalog snapshot); the
 * resolver never inspects how the tree was produced.
 *
 * ## Thread Safety
 * Implementations define their own guarantees. The resolver calls
 * discover() from one thread at a time per pipeline.
 */

#pragma once

#include "dependency_tree.h"

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/object_identity.h>

#include <functional>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::discovery
{

/**
 * @brief Callback invoked for every object the service analyses
 */
using discovery_progress_callback = std::function<void(const object_identity&)>;

/**
 * @class discovery_service
 * @brief Structural dependency discovery for a set of root objects
 */
class discovery_service
{
public:
	virtual ~discovery_service() = default;

	/**
	 * @brief Discover the dependency tree of @p roots
	 * @param roots Root objects; each becomes a child of the synthetic root
	 * @param allow_system_objects Include server-shipped objects
	 * @param direction Walk dependents or dependencies
	 * @param progress Optional progress callback (may be empty)
	 * @return Discovered tree, or an error describing why discovery failed
	 */
	[[nodiscard]] virtual kcenon::common::Result<dependency_tree> discover(
		const std::vector<object_identity>& roots,
		bool allow_system_objects,
		discovery_direction direction,
		const discovery_progress_callback& progress)
		= 0;
};

} // namespace dependency_resolver::discovery
