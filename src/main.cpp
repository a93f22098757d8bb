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
 * @file main.cpp
 * @brief Dependency resolver entry point
 *
 * Parses command-line arguments, merges them over the configuration file
 * and runs the resolver against the given root objects.
 */

#include <kcenon/dependency_resolver/resolver_app.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace
{

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_CONFIG = "dependency_resolver.conf";

void print_usage(const char* program_name)
{
	std::cout << "Dependency Resolver v" << VERSION << "\n\n";
	std::cout << "Usage: " << program_name << " [options] [ROOT_URN...]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>    Path to configuration file (default: " << DEFAULT_CONFIG
			  << ")\n";
	std::cout << "  -s, --snapshot <file>  Catalog snapshot to resolve against\n";
	std::cout << "  -r, --root <urn>       Root object (repeatable)\n";
	std::cout << "      --parents          Resolve dependencies instead of dependents\n";
	std::cout << "      --include-self     Emit the root object itself\n";
	std::cout << "      --no-script        Skip script retrieval\n";
	std::cout << "      --allow-system     Include system objects\n";
	std::cout << "      --scripts          Print normalized scripts after the report\n";
	std::cout << "  -h, --help             Show this help message\n";
	std::cout << "  -v, --version          Show version information\n";
	std::cout << "\n";
	std::cout << "Configuration file format (key=value):\n";
	std::cout << "  name=my_resolver\n";
	std::cout << "  snapshot_file=catalog.snapshot\n";
	std::cout << "  discovery.direction=dependents\n";
	std::cout << "  script.batch_terminator=GO\n";
	std::cout << "  logging.level=info\n";
}

void print_version()
{
	std::cout << "Dependency Resolver v" << VERSION << "\n";
	std::cout << "Part of the kcenon unified system\n";
}

bool is_option(const char* arg, const char* short_name, const char* long_name)
{
	return (short_name != nullptr && std::strcmp(arg, short_name) == 0)
		   || std::strcmp(arg, long_name) == 0;
}

} // namespace

int main(int argc, char* argv[])
{
	std::string config_path = DEFAULT_CONFIG;
	bool explicit_config = false;
	std::string snapshot_path;
	std::vector<std::string> roots;
	bool parents = false;
	bool include_self = false;
	bool no_script = false;
	bool allow_system = false;
	bool print_scripts = false;

	// Parse command-line arguments
	for (int i = 1; i < argc; ++i)
	{
		const char* arg = argv[i];

		if (is_option(arg, "-h", "--help"))
		{
			print_usage(argv[0]);
			return 0;
		}

		if (is_option(arg, "-v", "--version"))
		{
			print_version();
			return 0;
		}

		if (is_option(arg, "-c", "--config") && i + 1 < argc)
		{
			config_path = argv[++i];
			explicit_config = true;
			continue;
		}

		if (is_option(arg, "-s", "--snapshot") && i + 1 < argc)
		{
			snapshot_path = argv[++i];
			continue;
		}

		if (is_option(arg, "-r", "--root") && i + 1 < argc)
		{
			roots.emplace_back(argv[++i]);
			continue;
		}

		if (is_option(arg, nullptr, "--parents"))
		{
			parents = true;
			continue;
		}

		if (is_option(arg, nullptr, "--include-self"))
		{
			include_self = true;
			continue;
		}

		if (is_option(arg, nullptr, "--no-script"))
		{
			no_script = true;
			continue;
		}

		if (is_option(arg, nullptr, "--allow-system"))
		{
			allow_system = true;
			continue;
		}

		if (is_option(arg, nullptr, "--scripts"))
		{
			print_scripts = true;
			continue;
		}

		if (arg[0] == '-')
		{
			std::cerr << "Unknown option: " << arg << "\n";
			std::cerr << "Use --help for usage information.\n";
			return dependency_resolver::exit_codes::error;
		}

		roots.emplace_back(arg);
	}

	if (roots.empty())
	{
		std::cerr << "No root objects given.\n";
		std::cerr << "Use --help for usage information.\n";
		return dependency_resolver::exit_codes::error;
	}

	// Try to load config file, fall back to defaults if not found
	dependency_resolver::resolver_config config;
	auto loaded = dependency_resolver::resolver_config::load_from_file(config_path);
	if (loaded)
	{
		config = *loaded;
	}
	else if (explicit_config)
	{
		std::cerr << "Failed to load configuration from: " << config_path << "\n";
		return dependency_resolver::exit_codes::error;
	}
	else
	{
		config = dependency_resolver::resolver_config::default_config();
	}

	// Command-line flags override the configuration
	if (!snapshot_path.empty())
	{
		config.snapshot_file = snapshot_path;
	}
	if (parents)
	{
		config.discovery.direction = "dependencies";
	}
	if (include_self)
	{
		config.discovery.include_self = true;
	}
	if (no_script)
	{
		config.discovery.include_script = false;
	}
	if (allow_system)
	{
		config.discovery.allow_system_objects = true;
	}

	dependency_resolver::resolver_app app;
	app.set_print_scripts(print_scripts);

	auto init_result = app.initialize(config);
	if (init_result.is_err())
	{
		std::cerr << "Failed to initialize resolver: " << init_result.error().message << "\n";
		return dependency_resolver::exit_codes::error;
	}

	return app.run(roots, std::cout);
}
