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
 * @file catalog_resolver.h
 * @brief Interface of the external catalog lookup capability
 */

#pragma once

#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/object_identity.h>

#include <string>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::discovery
{

/**
 * @class catalog_resolver
 * @brief Resolves identities to object metadata and creation scripts
 *
 * Lookups may fail at any time: an object can be dropped or become
 * inaccessible between discovery and enrichment.
 */
class catalog_resolver
{
public:
	virtual ~catalog_resolver() = default;

	/**
	 * @brief Resolve an identity to its metadata
	 */
	[[nodiscard]] virtual kcenon::common::Result<object_descriptor> resolve(
		const object_identity& identity)
		= 0;

	/**
	 * @brief Fetch the raw creation script of an object
	 */
	[[nodiscard]] virtual kcenon::common::Result<std::string> script(
		const object_identity& identity)
		= 0;
};

} // namespace dependency_resolver::discovery
