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
 * @file object_identity.h
 * @brief Comparable identity (URN) of a database object
 *
 * An object_identity wraps the hierarchical URN the server object model
 * assigns to every object, for example:
 *
 *   Server[@Name='SQL01\PROD']/Database[@Name='sales']/Table[@Name='orders' and @Schema='dbo']
 *
 * Identities only need equality and a stable hash to drive deduplication.
 * The parsed segments additionally expose the object type, name, schema and
 * owning server/database without depending on the external object model.
 *
 * ## Thread Safety
 * Immutable value type. Safe to share across threads.
 *
 * @code
 * using namespace dependency_resolver;
 *
 * auto parsed = object_identity::parse(
 *     "Server[@Name='srv']/Database[@Name='db']/View[@Name='v1' and @Schema='dbo']");
 * if (parsed.is_ok()) {
 *     const auto& id = parsed.value();
 *     id.type();        // "View"
 *     id.name();        // "v1"
 *     id.server_name(); // "srv"
 * }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <kcenon/common/patterns/result.h>

namespace dependency_resolver
{

/**
 * @struct urn_segment
 * @brief One `Type[@Key='value' and ...]` step of a URN
 */
struct urn_segment
{
	std::string type;
	std::vector<std::pair<std::string, std::string>> attributes;

	/**
	 * @brief Look up an attribute value by key (without the leading '@')
	 * @return The value, or std::nullopt if the attribute is absent
	 */
	[[nodiscard]] std::optional<std::string> attribute(std::string_view key) const;
};

/**
 * @class object_identity
 * @brief Parsed, comparable URN of a database object
 *
 * Equality, ordering and hashing are defined on the URN text. The hash is
 * FNV-1a over the URN bytes, so it is stable across runs and platforms.
 * A default-constructed identity is empty and never equal to a parsed one.
 */
class object_identity
{
public:
	object_identity() = default;

	/**
	 * @brief Parse a URN
	 * @param urn URN text
	 * @return Parsed identity, or error_codes::invalid_input if the URN is
	 *         empty or malformed
	 */
	[[nodiscard]] static kcenon::common::Result<object_identity> parse(std::string_view urn);

	/**
	 * @brief Build an identity by appending a segment to a parent identity
	 * @param parent Parent identity (may be empty for a top-level segment)
	 * @param type Segment type, e.g. "Table"
	 * @param attributes Attributes in emission order, e.g. {{"Name","t"},{"Schema","dbo"}}
	 */
	[[nodiscard]] static object_identity child_of(
		const object_identity& parent,
		std::string type,
		std::vector<std::pair<std::string, std::string>> attributes);

	[[nodiscard]] const std::string& urn() const noexcept { return urn_; }
	[[nodiscard]] bool empty() const noexcept { return urn_.empty(); }
	[[nodiscard]] const std::vector<urn_segment>& segments() const noexcept { return segments_; }

	/// Type of the last segment ("Table", "View", ...), empty if none
	[[nodiscard]] std::string type() const;

	/// Name attribute of the last segment, empty if absent
	[[nodiscard]] std::string name() const;

	/// Schema attribute of the last segment, empty if absent
	[[nodiscard]] std::string schema() const;

	/// Name of the owning `Server` segment, if the URN carries one
	[[nodiscard]] std::optional<std::string> server_name() const;

	/// Name of the owning `Database` segment, if the URN carries one
	[[nodiscard]] std::optional<std::string> database_name() const;

	/// Identity with the last segment removed; std::nullopt for top-level URNs
	[[nodiscard]] std::optional<object_identity> parent() const;

	/// Stable 64-bit FNV-1a hash of the URN
	[[nodiscard]] uint64_t hash() const noexcept { return hash_; }

	bool operator==(const object_identity& other) const noexcept
	{
		return hash_ == other.hash_ && urn_ == other.urn_;
	}

	bool operator!=(const object_identity& other) const noexcept
	{
		return !(*this == other);
	}

	bool operator<(const object_identity& other) const noexcept
	{
		return urn_ < other.urn_;
	}

private:
	object_identity(std::string urn, std::vector<urn_segment> segments);

	std::string urn_;
	std::vector<urn_segment> segments_;
	uint64_t hash_ = 0;
};

/**
 * @brief Compute the stable FNV-1a hash of a URN text
 */
[[nodiscard]] uint64_t stable_urn_hash(std::string_view urn) noexcept;

} // namespace dependency_resolver

template <>
struct std::hash<dependency_resolver::object_identity>
{
	std::size_t operator()(const dependency_resolver::object_identity& id) const noexcept
	{
		return static_cast<std::size_t>(id.hash());
	}
};
