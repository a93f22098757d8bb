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

#include <kcenon/dependency_resolver/discovery/discovery_requester.h>
#include <kcenon/dependency_resolver/core/error_codes.h>
#include <kcenon/dependency_resolver/core/server_context.h>

#include <unordered_set>

namespace dependency_resolver::discovery
{

using kcenon::common::interfaces::log_level;

discovery_requester::discovery_requester(std::shared_ptr<discovery_service> service)
	: service_(std::move(service))
{
}

void discovery_requester::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
}

kcenon::common::Result<dependency_tree> discovery_requester::request(
	const discovery_request& request) const
{
	auto roots_result = validate_roots(request.roots);
	if (roots_result.is_err())
	{
		log(log_level::error, roots_result.error().message);
		return roots_result.error();
	}
	const auto& roots = roots_result.value();

	if (!service_)
	{
		return kcenon::common::error_info{ error_codes::discovery_failed,
										   "No discovery service configured",
										   "discovery_requester" };
	}

	log(log_level::debug, "Discovering " + std::string(to_string(request.direction)) + " of "
							  + std::to_string(roots.size()) + " root object(s) starting at "
							  + roots.front().urn());

	discovery_progress_callback progress = [this](const object_identity& analysed)
	{
		log(log_level::debug, "Analysed " + analysed.name());
	};

	auto tree = service_->discover(roots, request.allow_system_objects, request.direction,
								   progress);
	if (tree.is_err())
	{
		const auto& cause = tree.error();
		return kcenon::common::error_info{
			error_codes::discovery_failed,
			"Dependency discovery failed for " + roots.front().urn() + ": " + cause.message
				+ " [" + cause.module + ":" + std::to_string(cause.code) + "]",
			"discovery_requester"
		};
	}

	log(log_level::debug, "Discovered " + std::to_string(tree.value().count()) + " node(s) for "
							  + roots.front().urn());
	return tree;
}

kcenon::common::Result<std::vector<object_identity>> discovery_requester::validate_roots(
	const std::vector<object_identity>& roots) const
{
	if (roots.empty())
	{
		return kcenon::common::error_info{ error_codes::invalid_input,
										   "No root objects supplied for discovery",
										   "discovery_requester" };
	}

	std::vector<object_identity> unique_roots;
	std::unordered_set<object_identity> seen;
	std::optional<server_context> shared_server;

	for (const auto& root : roots)
	{
		if (root.empty())
		{
			return kcenon::common::error_info{ error_codes::invalid_input,
											   "Root object has no resolvable identity",
											   "discovery_requester" };
		}

		auto context = resolve_server_context(root);
		if (context.is_err())
		{
			return kcenon::common::error_info{
				error_codes::invalid_input,
				"Root object cannot be resolved against a server: " + root.urn(),
				"discovery_requester"
			};
		}

		if (!shared_server)
		{
			shared_server = context.value();
		}
		else if (*shared_server != context.value())
		{
			return kcenon::common::error_info{
				error_codes::invalid_input,
				"Root object belongs to server '" + context.value().instance_name
					+ "' but the request targets '" + shared_server->instance_name
					+ "': " + root.urn(),
				"discovery_requester"
			};
		}

		if (seen.insert(root).second)
		{
			unique_roots.push_back(root);
		}
	}

	return unique_roots;
}

void discovery_requester::log(log_level level, const std::string& message) const
{
	if (logger_)
	{
		(void)logger_->log(level, message);
	}
}

} // namespace dependency_resolver::discovery
