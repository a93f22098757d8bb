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

#include <kcenon/dependency_resolver/pipeline/node_enricher.h>
#include <kcenon/dependency_resolver/core/error_codes.h>

namespace dependency_resolver::pipeline
{

node_enricher::node_enricher(std::shared_ptr<discovery::catalog_resolver> resolver,
							 script_normalizer normalizer)
	: resolver_(std::move(resolver)), normalizer_(std::move(normalizer))
{
}

kcenon::common::Result<dependency_record> node_enricher::enrich(
	const flat_node& node, const enrichment_context& context) const
{
	if (!resolver_)
	{
		return kcenon::common::error_info{ error_codes::resolution_failed,
										   "No catalog resolver configured", "node_enricher" };
	}

	auto dependent = lookup(node.identity, "object");
	if (dependent.is_err())
	{
		return dependent.error();
	}
	const auto& descriptor = dependent.value();

	dependency_record record;
	record.dependent = node.identity;
	record.dependent_name = descriptor.name;
	record.dependent_kind = descriptor.kind;
	record.owner = descriptor.owner;
	record.is_schema_bound = node.is_schema_bound || descriptor.is_schema_bound;
	record.is_system_object = descriptor.is_system_object;
	record.tier = node.tier;
	record.origin = context.origin;
	record.server = context.server;

	if (node.parent)
	{
		auto parent = lookup(*node.parent, "parent");
		if (parent.is_err())
		{
			return kcenon::common::error_info{
				error_codes::resolution_failed,
				parent.error().message + " (while enriching " + node.identity.urn() + ")",
				"node_enricher"
			};
		}
		record.parent = node.parent;
		record.parent_name = parent.value().name;
		record.parent_kind = parent.value().kind;
	}

	if (context.include_script)
	{
		auto script = resolver_->script(node.identity);
		if (script.is_err())
		{
			return kcenon::common::error_info{ error_codes::resolution_failed,
											   "Failed to script " + node.identity.urn() + ": "
												   + script.error().message,
											   "node_enricher" };
		}
		record.script = normalizer_.normalize(script.value());
	}

	return record;
}

kcenon::common::Result<object_descriptor> node_enricher::lookup(const object_identity& identity,
																const char* role) const
{
	auto resolved = resolver_->resolve(identity);
	if (resolved.is_err())
	{
		return kcenon::common::error_info{ error_codes::resolution_failed,
										   std::string("Failed to resolve ") + role + " "
											   + identity.urn() + ": " + resolved.error().message,
										   "node_enricher" };
	}
	return resolved;
}

} // namespace dependency_resolver::pipeline
