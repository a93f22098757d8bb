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

#include <kcenon/dependency_resolver/core/resolver_config.h>
#include <kcenon/dependency_resolver/core/dependency_types.h>

#include <filesystem>
#include <fstream>

namespace dependency_resolver
{

namespace
{

bool parse_bool(const std::string& value)
{
	return value == "true" || value == "1" || value == "yes" || value == "on";
}

} // namespace

std::optional<resolver_config> resolver_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		// Error will be logged by caller with appropriate context
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	resolver_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		// Skip comments and empty lines
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);

		auto trim = [](std::string& s)
		{
			s.erase(0, s.find_first_not_of(" \t\r\n"));
			s.erase(s.find_last_not_of(" \t\r\n") + 1);
		};
		trim(key);
		trim(value);

		if (key == "name")
		{
			config.name = value;
		}
		else if (key == "snapshot_file")
		{
			config.snapshot_file = value;
		}
		else if (key == "logging.level")
		{
			config.logging.level = value;
		}
		else if (key == "logging.enable_console")
		{
			config.logging.enable_console = parse_bool(value);
		}
		else if (key == "discovery.allow_system_objects")
		{
			config.discovery.allow_system_objects = parse_bool(value);
		}
		else if (key == "discovery.direction")
		{
			config.discovery.direction = value;
		}
		else if (key == "discovery.include_self")
		{
			config.discovery.include_self = parse_bool(value);
		}
		else if (key == "discovery.include_script")
		{
			config.discovery.include_script = parse_bool(value);
		}
		else if (key == "script.strip_session_settings")
		{
			config.script.strip_session_settings = parse_bool(value);
		}
		else if (key == "script.batch_terminator")
		{
			config.script.batch_terminator = value;
		}
	}

	return config;
}

resolver_config resolver_config::default_config()
{
	resolver_config config;
	// All defaults are set in the struct definition
	return config;
}

bool resolver_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> resolver_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (name.empty())
	{
		errors.push_back("Resolver name cannot be empty");
	}

	if (!snapshot_file.empty() && !std::filesystem::exists(snapshot_file))
	{
		errors.push_back("Snapshot file not found: " + snapshot_file);
	}

	if (!parse_direction(discovery.direction))
	{
		errors.push_back("Invalid discovery direction: " + discovery.direction
						 + " (valid: dependents, dependencies, parents)");
	}

	if (script.batch_terminator.empty())
	{
		errors.push_back("Batch terminator cannot be empty");
	}

	if (logging.level != "debug" && logging.level != "info" && logging.level != "warn"
		&& logging.level != "error")
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: debug, info, warn, error)");
	}

	return errors;
}

} // namespace dependency_resolver
