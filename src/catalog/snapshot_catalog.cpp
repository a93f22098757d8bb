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

#include <kcenon/dependency_resolver/catalog/snapshot_catalog.h>
#include <kcenon/dependency_resolver/core/error_codes.h>

#include <fstream>
#include <mutex>
#include <sstream>

namespace dependency_resolver::catalog
{

namespace
{

kcenon::common::error_info snapshot_error(const std::string& message)
{
	return kcenon::common::error_info{ error_codes::snapshot_error, message, "snapshot_catalog" };
}

void trim(std::string& s)
{
	s.erase(0, s.find_first_not_of(" \t\r\n"));
	s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

/// Split on '|' into at most @p max_fields; the last field keeps the remainder
std::vector<std::string> split_fields(const std::string& line, size_t max_fields)
{
	std::vector<std::string> fields;
	size_t start = 0;
	while (fields.size() + 1 < max_fields)
	{
		auto pos = line.find('|', start);
		if (pos == std::string::npos)
		{
			break;
		}
		fields.push_back(line.substr(start, pos - start));
		start = pos + 1;
	}
	fields.push_back(line.substr(start));
	return fields;
}

std::string unescape(const std::string& text)
{
	std::string out;
	out.reserve(text.size());
	for (size_t i = 0; i < text.size(); ++i)
	{
		if (text[i] != '\\' || i + 1 == text.size())
		{
			out.push_back(text[i]);
			continue;
		}
		switch (text[++i])
		{
		case 'n':
			out.push_back('\n');
			break;
		case 'r':
			out.push_back('\r');
			break;
		case 't':
			out.push_back('\t');
			break;
		case '\\':
			out.push_back('\\');
			break;
		default:
			out.push_back('\\');
			out.push_back(text[i]);
			break;
		}
	}
	return out;
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

kcenon::common::Result<std::shared_ptr<snapshot_catalog>> snapshot_catalog::load_from_file(
	const std::string& path)
{
	std::ifstream file(path);
	if (!file.is_open())
	{
		return snapshot_error("Cannot open snapshot file: " + path);
	}
	return load_from_stream(file, path);
}

kcenon::common::Result<std::shared_ptr<snapshot_catalog>> snapshot_catalog::load_from_stream(
	std::istream& input, const std::string& source_name)
{
	auto catalog = std::make_shared<snapshot_catalog>();

	std::string line;
	size_t line_number = 0;
	while (std::getline(input, line))
	{
		++line_number;
		if (!line.empty() && line.back() == '\r')
		{
			line.pop_back();
		}

		std::string probe = line;
		trim(probe);
		if (probe.empty() || probe[0] == '#')
		{
			continue;
		}

		auto where = [&](const std::string& message)
		{ return snapshot_error(source_name + ":" + std::to_string(line_number) + ": " + message); };

		auto record_type = probe.substr(0, probe.find('|'));

		if (record_type == "object")
		{
			auto fields = split_fields(probe, 5);
			if (fields.size() < 4)
			{
				return where("object record needs urn, kind and owner");
			}
			for (auto& field : fields)
			{
				trim(field);
			}

			auto identity = object_identity::parse(fields[1]);
			if (identity.is_err())
			{
				return where(identity.error().message);
			}

			catalog_object object;
			object.identity = identity.value();
			object.descriptor.name = object.identity.name();
			object.descriptor.kind = fields[2].empty() ? object.identity.type() : fields[2];
			object.descriptor.owner = fields[3];

			if (fields.size() == 5)
			{
				std::istringstream flags(fields[4]);
				std::string flag;
				while (std::getline(flags, flag, ','))
				{
					trim(flag);
					if (flag == "system")
					{
						object.descriptor.is_system_object = true;
					}
					else if (flag == "schemabound")
					{
						object.descriptor.is_schema_bound = true;
					}
					else if (!flag.empty())
					{
						return where("unknown object flag '" + flag + "'");
					}
				}
			}

			catalog->add_object(std::move(object));
		}
		else if (record_type == "script")
		{
			auto fields = split_fields(line.substr(line.find_first_not_of(" \t")), 3);
			if (fields.size() < 3)
			{
				return where("script record needs urn and text");
			}
			trim(fields[1]);

			auto identity = object_identity::parse(fields[1]);
			if (identity.is_err())
			{
				return where(identity.error().message);
			}

			auto stored = catalog->set_script(identity.value(), unescape(fields[2]));
			if (stored.is_err())
			{
				return where(stored.error().message);
			}
		}
		else if (record_type == "reference")
		{
			auto fields = split_fields(probe, 4);
			if (fields.size() < 3)
			{
				return where("reference record needs dependent and referenced urn");
			}
			for (auto& field : fields)
			{
				trim(field);
			}

			auto dependent = object_identity::parse(fields[1]);
			if (dependent.is_err())
			{
				return where(dependent.error().message);
			}
			auto referenced = object_identity::parse(fields[2]);
			if (referenced.is_err())
			{
				return where(referenced.error().message);
			}

			catalog_reference reference;
			reference.dependent = dependent.value();
			reference.referenced = referenced.value();
			if (fields.size() == 4)
			{
				if (fields[3] == "schemabound")
				{
					reference.is_schema_bound = true;
				}
				else if (!fields[3].empty())
				{
					return where("unknown reference flag '" + fields[3] + "'");
				}
			}

			auto added = catalog->add_reference(reference);
			if (added.is_err())
			{
				return where(added.error().message);
			}
		}
		else
		{
			return where("unknown record type '" + record_type + "'");
		}
	}

	return catalog;
}

// ============================================================================
// Mutation
// ============================================================================

void snapshot_catalog::add_object(catalog_object object)
{
	std::unique_lock<std::shared_mutex> lock(mutex_);
	auto key = object.identity;
	objects_[std::move(key)] = std::move(object);
}

kcenon::common::VoidResult snapshot_catalog::set_script(const object_identity& identity,
														std::string script)
{
	std::unique_lock<std::shared_mutex> lock(mutex_);
	auto it = objects_.find(identity);
	if (it == objects_.end())
	{
		return snapshot_error("Cannot attach script to unknown object " + identity.urn());
	}
	it->second.script = std::move(script);
	return kcenon::common::ok();
}

kcenon::common::VoidResult snapshot_catalog::add_reference(const catalog_reference& reference)
{
	std::unique_lock<std::shared_mutex> lock(mutex_);
	if (objects_.find(reference.dependent) == objects_.end())
	{
		return snapshot_error("Unknown dependent object " + reference.dependent.urn());
	}
	if (objects_.find(reference.referenced) == objects_.end())
	{
		return snapshot_error("Unknown referenced object " + reference.referenced.urn());
	}

	dependents_[reference.referenced].push_back({ reference.dependent, reference.is_schema_bound });
	dependencies_[reference.dependent].push_back({ reference.referenced, reference.is_schema_bound });
	++reference_count_;
	return kcenon::common::ok();
}

bool snapshot_catalog::remove_object(const object_identity& identity)
{
	std::unique_lock<std::shared_mutex> lock(mutex_);
	return objects_.erase(identity) > 0;
}

std::size_t snapshot_catalog::object_count() const
{
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return objects_.size();
}

std::size_t snapshot_catalog::reference_count() const
{
	std::shared_lock<std::shared_mutex> lock(mutex_);
	return reference_count_;
}

// ============================================================================
// discovery_service
// ============================================================================

kcenon::common::Result<discovery::dependency_tree> snapshot_catalog::discover(
	const std::vector<object_identity>& roots,
	bool allow_system_objects,
	discovery_direction direction,
	const discovery::discovery_progress_callback& progress)
{
	using discovery::dependency_tree;

	std::shared_lock<std::shared_mutex> lock(mutex_);

	const auto& adjacency
		= direction == discovery_direction::dependents ? dependents_ : dependencies_;

	dependency_tree tree;
	std::vector<dependency_tree::node_id> stack;

	auto on_ancestor_path = [&tree](dependency_tree::node_id from, const object_identity& identity)
	{
		for (auto id = from; id != tree.root(); id = tree.at(id).parent)
		{
			if (tree.at(id).identity == identity)
			{
				return true;
			}
		}
		return false;
	};

	for (const auto& root : roots)
	{
		if (objects_.find(root) == objects_.end())
		{
			return snapshot_error("Object not found in snapshot: " + root.urn());
		}

		stack.push_back(tree.add_child(tree.root(), root));
		if (progress)
		{
			progress(root);
		}

		while (!stack.empty())
		{
			const auto current = stack.back();
			stack.pop_back();

			// Copy: add_child() may reallocate the node arena
			const object_identity identity = tree.at(current).identity;

			auto edges = adjacency.find(identity);
			if (edges == adjacency.end())
			{
				continue;
			}

			for (const auto& next : edges->second)
			{
				if (!allow_system_objects && is_system(next.target))
				{
					continue;
				}
				if (on_ancestor_path(current, next.target))
				{
					continue;
				}

				stack.push_back(tree.add_child(current, next.target, next.is_schema_bound));
				if (progress)
				{
					progress(next.target);
				}
			}
		}
	}

	return tree;
}

// ============================================================================
// catalog_resolver
// ============================================================================

kcenon::common::Result<object_descriptor> snapshot_catalog::resolve(const object_identity& identity)
{
	std::shared_lock<std::shared_mutex> lock(mutex_);
	auto it = objects_.find(identity);
	if (it == objects_.end())
	{
		return snapshot_error("Object not found in snapshot: " + identity.urn());
	}
	return it->second.descriptor;
}

kcenon::common::Result<std::string> snapshot_catalog::script(const object_identity& identity)
{
	std::shared_lock<std::shared_mutex> lock(mutex_);
	auto it = objects_.find(identity);
	if (it == objects_.end())
	{
		return snapshot_error("Object not found in snapshot: " + identity.urn());
	}
	if (!it->second.script)
	{
		return snapshot_error("No script captured for " + identity.urn());
	}
	return *it->second.script;
}

bool snapshot_catalog::is_system(const object_identity& identity) const
{
	auto it = objects_.find(identity);
	return it != objects_.end() && it->second.descriptor.is_system_object;
}

} // namespace dependency_resolver::catalog
