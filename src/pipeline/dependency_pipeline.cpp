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

#include <kcenon/dependency_resolver/pipeline/dependency_pipeline.h>
#include <kcenon/dependency_resolver/core/server_context.h>
#include <kcenon/dependency_resolver/pipeline/precedence_resolver.h>
#include <kcenon/dependency_resolver/pipeline/tree_flattener.h>

#include <chrono>
#include <cstdlib>

namespace dependency_resolver::pipeline
{

using kcenon::common::interfaces::log_level;

namespace
{

uint64_t elapsed_us(std::chrono::steady_clock::time_point since)
{
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
									 std::chrono::steady_clock::now() - since)
									 .count());
}

kcenon::common::error_info cancelled_error(const object_identity& root)
{
	return kcenon::common::error_info{ error_codes::cancelled,
									   "Resolution cancelled for " + root.urn(),
									   "dependency_pipeline" };
}

} // namespace

// ============================================================================
// dependency_pipeline
// ============================================================================

dependency_pipeline::dependency_pipeline(std::shared_ptr<discovery::discovery_service> discovery,
										 std::shared_ptr<discovery::catalog_resolver> resolver,
										 script_options scripts)
	: discovery_(std::move(discovery)),
	  resolver_(std::move(resolver)),
	  requester_(discovery_),
	  enricher_(resolver_, script_normalizer(std::move(scripts)))
{
}

void dependency_pipeline::set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
{
	logger_ = std::move(logger);
	requester_.set_logger(logger_);
}

void dependency_pipeline::set_metrics(std::shared_ptr<metrics::resolver_metrics> metrics)
{
	metrics_ = std::move(metrics);
}

void dependency_pipeline::set_cancellation_token(std::shared_ptr<cancellation_token> token)
{
	cancellation_ = std::move(token);
}

root_result dependency_pipeline::resolve(const object_identity& root,
										 const resolve_options& options) const
{
	const auto start_time = std::chrono::steady_clock::now();

	root_result result;
	result.root = root;

	if (metrics_)
	{
		metrics_->roots_processed.fetch_add(1, std::memory_order_relaxed);
	}

	auto finish = [&]()
	{
		if (metrics_)
		{
			metrics_->total_resolution_time_us.fetch_add(elapsed_us(start_time),
														 std::memory_order_relaxed);
		}
		return result;
	};

	log(log_level::debug, "Processing: " + (root.empty() ? std::string("<empty>") : root.urn()));

	// Validation
	if (root.empty())
	{
		fail(result, pipeline_stage::validation,
			 kcenon::common::error_info{ error_codes::invalid_input,
										 "Root object has no resolvable identity",
										 "dependency_pipeline" });
		return finish();
	}

	// Server context
	auto context = resolve_server_context(root);
	if (context.is_err())
	{
		fail(result, pipeline_stage::context, context.error());
		return finish();
	}

	// Discovery
	if (cancelled())
	{
		fail(result, pipeline_stage::discovery, cancelled_error(root));
		return finish();
	}

	discovery::discovery_request request;
	request.roots.push_back(root);
	request.allow_system_objects = options.allow_system_objects;
	request.direction = options.direction;

	auto tree = requester_.request(request);
	if (tree.is_err())
	{
		fail(result, pipeline_stage::discovery, tree.error());
		return finish();
	}

	// Flatten
	if (cancelled())
	{
		fail(result, pipeline_stage::flatten, cancelled_error(root));
		return finish();
	}

	flatten_options flatten_opts;
	flatten_opts.direction = options.direction;
	flatten_opts.include_self = options.include_self;

	const auto nodes = tree_flattener::flatten(tree.value(), flatten_opts);
	if (nodes.empty())
	{
		result.no_dependencies = true;
		if (metrics_)
		{
			metrics_->roots_without_dependencies.fetch_add(1, std::memory_order_relaxed);
		}
		log(log_level::info, "No dependencies detected for " + root.urn());
		return finish();
	}

	if (metrics_)
	{
		metrics_->nodes_flattened.fetch_add(nodes.size(), std::memory_order_relaxed);
	}

	// Enrichment
	enrichment_context enrich_ctx;
	enrich_ctx.origin = root;
	enrich_ctx.server = context.value();
	enrich_ctx.include_script = options.include_script;

	std::vector<dependency_record> records;
	records.reserve(nodes.size());

	for (const auto& node : nodes)
	{
		if (cancelled())
		{
			fail(result, pipeline_stage::enrichment, cancelled_error(root));
			return finish();
		}

		auto record = enricher_.enrich(node, enrich_ctx);
		if (record.is_err())
		{
			log(log_level::warning, record.error().message);
			if (metrics_)
			{
				metrics_->node_failures.fetch_add(1, std::memory_order_relaxed);
			}
			result.node_failures.push_back({ node.identity, node.tier, record.error() });
			continue;
		}

		if (record.value().is_system_object && !options.allow_system_objects)
		{
			log(log_level::debug, "Skipping system object " + node.identity.urn());
			continue;
		}

		if (metrics_)
		{
			metrics_->nodes_enriched.fetch_add(1, std::memory_order_relaxed);
			metrics::metrics_utils::update_max(metrics_->deepest_tier,
											   static_cast<uint64_t>(std::abs(node.tier)));
		}
		records.push_back(std::move(record.value()));
	}

	// Precedence
	const auto enriched_count = records.size();
	result.records = precedence_resolver::resolve(std::move(records));

	if (metrics_)
	{
		metrics_->duplicates_collapsed.fetch_add(enriched_count - result.records.size(),
												 std::memory_order_relaxed);
	}

	log(log_level::info, "Resolved " + std::to_string(result.records.size()) + " "
							 + std::string(to_string(options.direction)) + " of " + root.urn()
							 + (result.node_failures.empty()
									? std::string()
									: " (" + std::to_string(result.node_failures.size())
										  + " node(s) skipped)"));

	return finish();
}

kcenon::common::Result<std::vector<root_result>> dependency_pipeline::resolve_batch(
	const std::vector<object_identity>& roots, const resolve_options& options) const
{
	if (roots.empty())
	{
		return kcenon::common::error_info{ error_codes::invalid_input,
										   "No root objects supplied", "dependency_pipeline" };
	}

	std::vector<root_result> results;
	results.reserve(roots.size());
	for (const auto& root : roots)
	{
		results.push_back(resolve(root, options));
	}
	return results;
}

bool dependency_pipeline::cancelled() const noexcept
{
	return cancellation_ && cancellation_->is_cancelled();
}

void dependency_pipeline::fail(root_result& result, pipeline_stage stage,
							   kcenon::common::error_info error) const
{
	log(log_level::error, "[" + std::string(to_string(stage)) + "] " + error.message);
	if (metrics_)
	{
		metrics_->roots_failed.fetch_add(1, std::memory_order_relaxed);
	}
	result.failure = root_failure{ stage, std::move(error) };
}

void dependency_pipeline::log(log_level level, const std::string& message) const
{
	if (logger_)
	{
		(void)logger_->log(level, message);
	}
}

} // namespace dependency_resolver::pipeline
