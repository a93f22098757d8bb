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

#include <kcenon/dependency_resolver/core/object_identity.h>
#include <kcenon/dependency_resolver/core/error_codes.h>

#include <cctype>

namespace dependency_resolver
{

namespace
{

constexpr uint64_t fnv_offset_basis = 14695981039346656037ULL;
constexpr uint64_t fnv_prime = 1099511628211ULL;

kcenon::common::error_info malformed(std::string_view urn, const std::string& reason)
{
	return kcenon::common::error_info{ error_codes::invalid_input,
									   "Malformed URN '" + std::string(urn) + "': " + reason,
									   "object_identity" };
}

bool is_type_char(char c)
{
	return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

void skip_spaces(std::string_view text, size_t& pos)
{
	while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0)
	{
		++pos;
	}
}

std::string quote_value(const std::string& value)
{
	std::string quoted;
	quoted.reserve(value.size() + 2);
	quoted.push_back('\'');
	for (char c : value)
	{
		if (c == '\'')
		{
			quoted.push_back('\'');
		}
		quoted.push_back(c);
	}
	quoted.push_back('\'');
	return quoted;
}

std::string format_segment(const urn_segment& segment)
{
	std::string text = segment.type;
	if (segment.attributes.empty())
	{
		return text;
	}

	text.push_back('[');
	for (size_t i = 0; i < segment.attributes.size(); ++i)
	{
		if (i > 0)
		{
			text += " and ";
		}
		text += "@" + segment.attributes[i].first + "=" + quote_value(segment.attributes[i].second);
	}
	text.push_back(']');
	return text;
}

} // namespace

uint64_t stable_urn_hash(std::string_view urn) noexcept
{
	uint64_t hash = fnv_offset_basis;
	for (char c : urn)
	{
		hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
		hash *= fnv_prime;
	}
	return hash;
}

std::optional<std::string> urn_segment::attribute(std::string_view key) const
{
	for (const auto& [name, value] : attributes)
	{
		if (name == key)
		{
			return value;
		}
	}
	return std::nullopt;
}

object_identity::object_identity(std::string urn, std::vector<urn_segment> segments)
	: urn_(std::move(urn)), segments_(std::move(segments)), hash_(stable_urn_hash(urn_))
{
}

kcenon::common::Result<object_identity> object_identity::parse(std::string_view urn)
{
	if (urn.empty())
	{
		return kcenon::common::error_info{ error_codes::invalid_input, "Empty URN",
										   "object_identity" };
	}

	std::vector<urn_segment> segments;
	size_t pos = 0;

	while (pos < urn.size())
	{
		urn_segment segment;

		size_t type_start = pos;
		while (pos < urn.size() && is_type_char(urn[pos]))
		{
			++pos;
		}
		if (pos == type_start)
		{
			return malformed(urn, "expected segment type at offset " + std::to_string(pos));
		}
		segment.type = std::string(urn.substr(type_start, pos - type_start));

		if (pos < urn.size() && urn[pos] == '[')
		{
			++pos;
			bool closed = false;
			while (pos < urn.size() && !closed)
			{
				skip_spaces(urn, pos);
				if (pos >= urn.size() || urn[pos] != '@')
				{
					return malformed(urn, "expected '@' at offset " + std::to_string(pos));
				}
				++pos;

				size_t key_start = pos;
				while (pos < urn.size() && is_type_char(urn[pos]))
				{
					++pos;
				}
				if (pos == key_start)
				{
					return malformed(urn, "empty attribute name");
				}
				std::string key(urn.substr(key_start, pos - key_start));

				skip_spaces(urn, pos);
				if (pos >= urn.size() || urn[pos] != '=')
				{
					return malformed(urn, "expected '=' after @" + key);
				}
				++pos;
				skip_spaces(urn, pos);
				if (pos >= urn.size() || urn[pos] != '\'')
				{
					return malformed(urn, "expected quoted value for @" + key);
				}
				++pos;

				std::string value;
				bool terminated = false;
				while (pos < urn.size())
				{
					if (urn[pos] == '\'')
					{
						if (pos + 1 < urn.size() && urn[pos + 1] == '\'')
						{
							value.push_back('\'');
							pos += 2;
							continue;
						}
						++pos;
						terminated = true;
						break;
					}
					value.push_back(urn[pos]);
					++pos;
				}
				if (!terminated)
				{
					return malformed(urn, "unterminated value for @" + key);
				}
				segment.attributes.emplace_back(std::move(key), std::move(value));

				skip_spaces(urn, pos);
				if (pos < urn.size() && urn[pos] == ']')
				{
					++pos;
					closed = true;
				}
				else if (urn.substr(pos, 3) == "and")
				{
					pos += 3;
				}
				else
				{
					return malformed(urn, "expected ']' or 'and' at offset " + std::to_string(pos));
				}
			}
			if (!closed)
			{
				return malformed(urn, "unterminated predicate");
			}
		}

		segments.push_back(std::move(segment));

		if (pos < urn.size())
		{
			if (urn[pos] != '/')
			{
				return malformed(urn, "expected '/' at offset " + std::to_string(pos));
			}
			++pos;
			if (pos == urn.size())
			{
				return malformed(urn, "trailing '/'");
			}
		}
	}

	object_identity identity(std::string(urn), std::move(segments));
	return identity;
}

object_identity object_identity::child_of(
	const object_identity& parent,
	std::string type,
	std::vector<std::pair<std::string, std::string>> attributes)
{
	urn_segment segment;
	segment.type = std::move(type);
	segment.attributes = std::move(attributes);

	std::string urn = parent.urn_;
	if (!urn.empty())
	{
		urn.push_back('/');
	}
	urn += format_segment(segment);

	auto segments = parent.segments_;
	segments.push_back(std::move(segment));
	return object_identity(std::move(urn), std::move(segments));
}

std::string object_identity::type() const
{
	return segments_.empty() ? std::string() : segments_.back().type;
}

std::string object_identity::name() const
{
	if (segments_.empty())
	{
		return {};
	}
	return segments_.back().attribute("Name").value_or(std::string());
}

std::string object_identity::schema() const
{
	if (segments_.empty())
	{
		return {};
	}
	return segments_.back().attribute("Schema").value_or(std::string());
}

std::optional<std::string> object_identity::server_name() const
{
	for (const auto& segment : segments_)
	{
		if (segment.type == "Server")
		{
			return segment.attribute("Name");
		}
	}
	return std::nullopt;
}

std::optional<std::string> object_identity::database_name() const
{
	for (const auto& segment : segments_)
	{
		if (segment.type == "Database")
		{
			return segment.attribute("Name");
		}
	}
	return std::nullopt;
}

std::optional<object_identity> object_identity::parent() const
{
	if (segments_.size() < 2)
	{
		return std::nullopt;
	}

	object_identity result;
	for (size_t i = 0; i + 1 < segments_.size(); ++i)
	{
		result = child_of(result, segments_[i].type, segments_[i].attributes);
	}
	return result;
}

} // namespace dependency_resolver
