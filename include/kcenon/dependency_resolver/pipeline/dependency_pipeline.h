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
 * @file dependency_pipeline.h
 * @brief Per-root dependency resolution: discover, flatten, enrich, order
 *
 * The pipeline strings the four stages together for one root object and
 * applies the error policy:
 *
 * - Root-level failures (invalid input, unknown server context, discovery
 *   failure, cancellation) stop that root and are returned with the stage
 *   at which they happened.
 * - Node-level failures (a node that cannot be resolved or scripted) are
 *   logged, collected in the result, and the node is skipped.
 * - An empty discovery result is a reported no-op, not a failure.
 *
 * Batches are processed one root at a time in input order and always
 * yield one result per root, so callers can report partial success.
 *
 * @code
 * using namespace dependency_resolver;
 *
 * auto catalog = std::make_shared<catalog::snapshot_catalog>();
 * pipeline::dependency_pipeline resolver(catalog, catalog);
 * resolver.set_logger(logging::create_console_logger());
 *
 * pipeline::resolve_options options;
 * options.direction = discovery_direction::dependencies;
 * auto result = resolver.resolve(root, options);
 * for (const auto& record : result.records) {
 *     std::cout << record.tier << " " << record.dependent_name << "\n";
 * }
 * @endcode
 */

#pragma once

#include "node_enricher.h"
#include "script_normalizer.h"

#include <kcenon/dependency_resolver/core/cancellation_token.h>
#include <kcenon/dependency_resolver/core/dependency_types.h>
#include <kcenon/dependency_resolver/core/error_codes.h>
#include <kcenon/dependency_resolver/core/object_identity.h>
#include <kcenon/dependency_resolver/discovery/catalog_resolver.h>
#include <kcenon/dependency_resolver/discovery/discovery_requester.h>
#include <kcenon/dependency_resolver/discovery/discovery_service.h>
#include <kcenon/dependency_resolver/metrics/resolver_metrics.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace dependency_resolver::pipeline
{

/**
 * @struct resolve_options
 * @brief Caller-facing options of a resolution
 */
struct resolve_options
{
	bool allow_system_objects = false;
	discovery_direction direction = discovery_direction::dependents;
	bool include_self = false;
	bool include_script = true;
};

/**
 * @struct node_failure
 * @brief A node skipped because it could not be enriched
 */
struct node_failure
{
	object_identity identity;
	int32_t tier = 0;
	kcenon::common::error_info error;
};

/**
 * @struct root_failure
 * @brief A root whose resolution stopped
 */
struct root_failure
{
	pipeline_stage stage = pipeline_stage::validation;
	kcenon::common::error_info error;
};

/**
 * @struct root_result
 * @brief Outcome of resolving one root object
 */
struct root_result
{
	object_identity root;
	std::vector<dependency_record> records; ///< Deduplicated, causally ordered
	std::vector<node_failure> node_failures;
	std::optional<root_failure> failure;
	bool no_dependencies = false;           ///< Discovery found nothing to emit

	[[nodiscard]] bool is_success() const noexcept { return !failure.has_value(); }
};

/**
 * @class dependency_pipeline
 * @brief Orchestrates discovery, flattening, enrichment and ordering
 *
 * Thread Safety:
 * - resolve() and resolve_batch() are const and keep no state between
 *   calls; they are safe to call concurrently if the services are
 * - set_*() must not race with resolution
 */
class dependency_pipeline
{
public:
	/**
	 * @brief Construct a pipeline over the two external capabilities
	 * @param discovery Discovery service
	 * @param resolver Catalog resolver
	 * @param scripts Script normalization settings
	 */
	dependency_pipeline(std::shared_ptr<discovery::discovery_service> discovery,
						std::shared_ptr<discovery::catalog_resolver> resolver,
						script_options scripts = script_options{});

	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);
	void set_metrics(std::shared_ptr<metrics::resolver_metrics> metrics);
	void set_cancellation_token(std::shared_ptr<cancellation_token> token);

	/**
	 * @brief Resolve the dependencies of one root object
	 * @param root Root object identity
	 * @param options Resolution options
	 * @return Result for the root; inspect failure / no_dependencies
	 */
	[[nodiscard]] root_result resolve(const object_identity& root,
									  const resolve_options& options = resolve_options{}) const;

	/**
	 * @brief Resolve several roots in input order
	 * @return One root_result per input root, or error_codes::invalid_input
	 *         when @p roots is empty
	 */
	[[nodiscard]] kcenon::common::Result<std::vector<root_result>> resolve_batch(
		const std::vector<object_identity>& roots,
		const resolve_options& options = resolve_options{}) const;

private:
	[[nodiscard]] bool cancelled() const noexcept;

	void fail(root_result& result, pipeline_stage stage,
			  kcenon::common::error_info error) const;

	void log(kcenon::common::interfaces::log_level level, const std::string& message) const;

	std::shared_ptr<discovery::discovery_service> discovery_;
	std::shared_ptr<discovery::catalog_resolver> resolver_;
	discovery::discovery_requester requester_;
	node_enricher enricher_;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<metrics::resolver_metrics> metrics_;
	std::shared_ptr<cancellation_token> cancellation_;
};

} // namespace dependency_resolver::pipeline
