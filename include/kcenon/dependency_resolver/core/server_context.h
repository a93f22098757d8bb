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
 * @file server_context.h
 * @brief Server context derived from an object identity
 *
 * Every identity handed to the resolver must trace back to a named server.
 * The server segment also supplies the computer, service and instance
 * names that are stamped onto each dependency record.
 */

#pragma once

#include "object_identity.h"

#include <string>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver
{

/**
 * @struct server_context
 * @brief Identifies the server an object lives on
 */
struct server_context
{
	std::string computer_name; ///< Host part of the instance name
	std::string service_name;  ///< Instance part, "MSSQLSERVER" for default instances
	std::string instance_name; ///< Full instance name as found in the URN

	bool operator==(const server_context& other) const noexcept
	{
		return instance_name == other.instance_name;
	}

	bool operator!=(const server_context& other) const noexcept
	{
		return !(*this == other);
	}
};

/// Service name reported for default (unnamed) instances
inline constexpr const char* default_service_name = "MSSQLSERVER";

/**
 * @brief Determine the server context backing an identity
 * @param identity Object identity
 * @return server_context, or error_codes::context_resolution if the identity
 *         has no named Server segment
 */
[[nodiscard]] kcenon::common::Result<server_context> resolve_server_context(
	const object_identity& identity);

} // namespace dependency_resolver
