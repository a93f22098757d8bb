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

#include <kcenon/dependency_resolver/core/server_context.h>
#include <kcenon/dependency_resolver/core/error_codes.h>

namespace dependency_resolver
{

kcenon::common::Result<server_context> resolve_server_context(const object_identity& identity)
{
	if (identity.empty())
	{
		return kcenon::common::error_info{ error_codes::context_resolution,
										   "Cannot resolve server context of an empty identity",
										   "server_context" };
	}

	auto server = identity.server_name();
	if (!server || server->empty())
	{
		return kcenon::common::error_info{
			error_codes::context_resolution,
			"Failed to find valid server object in input: " + identity.urn(), "server_context"
		};
	}

	server_context context;
	context.instance_name = *server;

	auto separator = server->find('\\');
	if (separator == std::string::npos)
	{
		context.computer_name = *server;
		context.service_name = default_service_name;
	}
	else
	{
		context.computer_name = server->substr(0, separator);
		context.service_name = server->substr(separator + 1);
	}

	return context;
}

} // namespace dependency_resolver
