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
 * @file resolver_config.h
 * @brief Resolver configuration structures
 *
 * Defines configuration structures for the dependency resolver.
 * Configuration can be loaded from key=value files or constructed
 * programmatically.
 *
 * ## Thread Safety
 * Configuration structs are plain data structures with no internal
 * synchronization. They are intended to be populated before resolution
 * starts, then read concurrently.
 *
 * @code
 * using namespace dependency_resolver;
 *
 * // Load from file
 * auto config = resolver_config::load_from_file("resolver.conf");
 * if (config.has_value()) {
 *     if (!config->validate()) {
 *         for (const auto& err : config->validation_errors()) {
 *             std::cerr << "Config error: " << err << std::endl;
 *         }
 *     }
 * }
 *
 * // Or construct programmatically
 * auto cfg = resolver_config::default_config();
 * cfg.discovery.direction = "dependencies";
 * cfg.script.batch_terminator = "GO";
 * @endcode
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dependency_resolver
{

/**
 * @struct logging_config
 * @brief Logging configuration
 */
struct logging_config
{
	std::string level = "info"; ///< Log level (debug, info, warn, error)
	bool enable_console = true; ///< Enable console output
};

/**
 * @struct discovery_config
 * @brief Default resolution options
 */
struct discovery_config
{
	bool allow_system_objects = false;   ///< Include server-shipped objects
	std::string direction = "dependents"; ///< dependents, dependencies or parents
	bool include_self = false;           ///< Emit the root object itself
	bool include_script = true;          ///< Fetch and normalize creation scripts
};

/**
 * @struct script_config
 * @brief Script normalization configuration
 */
struct script_config
{
	bool strip_session_settings = true;  ///< Remove ANSI_NULLS / QUOTED_IDENTIFIER statements
	std::string batch_terminator = "GO"; ///< Line appended to every script
};

/**
 * @struct resolver_config
 * @brief Main resolver configuration
 */
struct resolver_config
{
	std::string name = "dependency_resolver"; ///< Instance name used in log output
	std::string snapshot_file;                ///< Catalog snapshot to load (optional)
	logging_config logging;
	discovery_config discovery;
	script_config script;

	/**
	 * @brief Load configuration from a key=value file
	 * @param path Path to the configuration file
	 * @return Loaded configuration, or std::nullopt if the file cannot be read
	 */
	static std::optional<resolver_config> load_from_file(const std::string& path);

	/**
	 * @brief Create a default configuration
	 */
	static resolver_config default_config();

	/**
	 * @brief Validate the configuration
	 * @return true if configuration is valid
	 */
	bool validate() const;

	/**
	 * @brief Get validation error messages
	 */
	std::vector<std::string> validation_errors() const;
};

} // namespace dependency_resolver
