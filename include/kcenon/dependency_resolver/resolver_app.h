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
 * @file resolver_app.h
 * @brief Dependency resolver application interface
 *
 * Defines the application class that wires configuration, logging, the
 * catalog and the dependency pipeline together and renders resolution
 * reports.
 *
 * The resolver_app class provides:
 * - Configuration validation
 * - Snapshot catalog loading (or injected services)
 * - Signal handling that cancels in-flight resolution
 * - Text report and script output
 */

#pragma once

#include "core/cancellation_token.h"
#include "core/resolver_config.h"
#include "discovery/catalog_resolver.h"
#include "discovery/discovery_service.h"
#include "metrics/resolver_metrics.h"
#include "pipeline/dependency_pipeline.h"

#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

namespace dependency_resolver
{

/**
 * @enum app_state
 * @brief Represents the current state of the application
 */
enum class app_state
{
	uninitialized, ///< Not initialized
	initialized,   ///< Ready to resolve
	running,       ///< Resolving roots
	stopping,      ///< Cancellation requested
	stopped        ///< Finished a run
};

/**
 * @brief Exit codes returned by resolver_app::run()
 */
namespace exit_codes
{
constexpr int success = 0;        ///< Every root resolved
constexpr int error = 1;          ///< Usage, configuration or snapshot error
constexpr int partial_failure = 2; ///< At least one root failed
} // namespace exit_codes

/**
 * @class resolver_app
 * @brief Main dependency resolver application
 *
 * Thread Safety:
 * - stop() is safe to call from any thread or a signal handler
 * - State transitions are atomic
 *
 * Usage Example:
 * @code
 *   dependency_resolver::resolver_app app;
 *   auto config = dependency_resolver::resolver_config::default_config();
 *   config.snapshot_file = "catalog.snapshot";
 *   if (app.initialize(config).is_err()) {
 *       return 1;
 *   }
 *   return app.run({ "Server[@Name='SQL01']/Database[@Name='Sales']/Table[@Name='Orders' and @Schema='dbo']" },
 *                  std::cout);
 * @endcode
 */
class resolver_app
{
public:
	resolver_app();

	/**
	 * @brief Destructor - releases the signal handler registration
	 */
	~resolver_app();

	resolver_app(const resolver_app&) = delete;
	resolver_app& operator=(const resolver_app&) = delete;
	resolver_app(resolver_app&&) = delete;
	resolver_app& operator=(resolver_app&&) = delete;

	/**
	 * @brief Initialize from a configuration, loading its snapshot file
	 * @return error_codes::invalid_config or error_codes::snapshot_error on failure
	 */
	kcenon::common::VoidResult initialize(const resolver_config& config);

	/**
	 * @brief Initialize with externally supplied services
	 *
	 * The configured snapshot file is ignored.
	 */
	kcenon::common::VoidResult initialize(const resolver_config& config,
										  std::shared_ptr<discovery::discovery_service> discovery,
										  std::shared_ptr<discovery::catalog_resolver> resolver);

	/**
	 * @brief Resolve the given roots and write the report
	 * @param root_urns Root object URNs, in output order
	 * @param out Report destination
	 * @return One of exit_codes
	 */
	int run(const std::vector<std::string>& root_urns, std::ostream& out);

	/**
	 * @brief Request cancellation of the current run
	 */
	void stop();

	/**
	 * @brief Print concatenated normalized scripts after the report
	 */
	void set_print_scripts(bool enabled) { print_scripts_ = enabled; }

	/**
	 * @brief Replace the logger created from configuration
	 */
	void set_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

	app_state state() const;
	const resolver_config& config() const;
	const metrics::resolver_metrics& metrics() const;

private:
	kcenon::common::VoidResult validate_config() const;

	kcenon::common::VoidResult do_initialize(std::shared_ptr<discovery::discovery_service> discovery,
											 std::shared_ptr<discovery::catalog_resolver> resolver);

	pipeline::resolve_options make_resolve_options() const;

	void write_report(const pipeline::root_result& result, std::ostream& out) const;
	void write_scripts(const std::vector<pipeline::root_result>& results, std::ostream& out) const;

	void setup_signal_handlers();

	std::atomic<app_state> state_;
	resolver_config config_;
	bool print_scripts_ = false;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::shared_ptr<metrics::resolver_metrics> metrics_;
	std::shared_ptr<cancellation_token> cancellation_;
	std::unique_ptr<pipeline::dependency_pipeline> pipeline_;

	// Signal handling
	static resolver_app* instance_;
	static void signal_handler(int signal);
};

} // namespace dependency_resolver
