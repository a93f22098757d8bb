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
 * @file object_identity_test.cpp
 * @brief Unit tests for object identities and server context resolution
 *
 * Tests cover:
 * - URN parsing and accessors
 * - Quote escaping and malformed input
 * - Equality, hashing and parent derivation
 * - Server context resolution for default and named instances
 */

#include <gtest/gtest.h>

#include <unordered_set>

#include <kcenon/dependency_resolver/core/error_codes.h>
#include <kcenon/dependency_resolver/core/object_identity.h>
#include <kcenon/dependency_resolver/core/server_context.h>

#include "test_support.h"

using namespace dependency_resolver;
using namespace dependency_resolver::testing;

// ============================================================================
// Parsing Tests
// ============================================================================

class ObjectIdentityParseTest : public ::testing::Test
{
};

TEST_F(ObjectIdentityParseTest, ParsesSchemaScopedObject)
{
	auto parsed = object_identity::parse(object_urn("Table", "Orders"));

	ASSERT_TRUE(parsed.is_ok());
	const auto& identity = parsed.value();
	EXPECT_EQ(identity.segments().size(), 3u);
	EXPECT_EQ(identity.type(), "Table");
	EXPECT_EQ(identity.name(), "Orders");
	EXPECT_EQ(identity.schema(), "dbo");
	EXPECT_EQ(identity.server_name().value_or(""), "SQL01");
	EXPECT_EQ(identity.database_name().value_or(""), "Sales");
	EXPECT_FALSE(identity.empty());
}

TEST_F(ObjectIdentityParseTest, KeepsOriginalText)
{
	const std::string urn = object_urn("View", "ActiveOrders");
	auto parsed = object_identity::parse(urn);

	ASSERT_TRUE(parsed.is_ok());
	EXPECT_EQ(parsed.value().urn(), urn);
}

TEST_F(ObjectIdentityParseTest, UnescapesDoubledQuotes)
{
	auto parsed = object_identity::parse("Server[@Name='SQL01']/Login[@Name='O''Brien']");

	ASSERT_TRUE(parsed.is_ok());
	EXPECT_EQ(parsed.value().name(), "O'Brien");
	EXPECT_EQ(parsed.value().type(), "Login");
}

TEST_F(ObjectIdentityParseTest, SegmentWithoutPredicate)
{
	auto parsed = object_identity::parse("Server[@Name='SQL01']/JobServer");

	ASSERT_TRUE(parsed.is_ok());
	EXPECT_EQ(parsed.value().type(), "JobServer");
	EXPECT_EQ(parsed.value().name(), "");
}

TEST_F(ObjectIdentityParseTest, EmptyInputFails)
{
	auto parsed = object_identity::parse("");

	ASSERT_TRUE(parsed.is_err());
	EXPECT_EQ(parsed.error().code, error_codes::invalid_input);
}

TEST_F(ObjectIdentityParseTest, MalformedInputsFail)
{
	const char* inputs[] = {
		"Server[@Name='SQL01'",             // unterminated predicate
		"Server[@Name='SQL01]",             // unterminated value
		"Server[Name='SQL01']",             // missing '@'
		"Server[@Name=SQL01]",              // unquoted value
		"Server[@Name='SQL01']/",           // trailing separator
		"Server[@Name='SQL01']Database",    // missing separator
		"/Database[@Name='Sales']",         // missing type
		"Server[@Name='A' or @Id='1']",     // unsupported connective
	};

	for (const auto* input : inputs)
	{
		auto parsed = object_identity::parse(input);
		ASSERT_TRUE(parsed.is_err()) << input;
		EXPECT_EQ(parsed.error().code, error_codes::invalid_input) << input;
		EXPECT_EQ(parsed.error().module, "object_identity");
	}
}

// ============================================================================
// Equality and Derivation Tests
// ============================================================================

class ObjectIdentityEqualityTest : public ::testing::Test
{
};

TEST_F(ObjectIdentityEqualityTest, SameUrnIsEqual)
{
	EXPECT_EQ(table("Orders"), table("Orders"));
	EXPECT_EQ(table("Orders").hash(), table("Orders").hash());
	EXPECT_NE(table("Orders"), table("Customers"));
	EXPECT_NE(table("Orders"), view("Orders"));
	EXPECT_NE(table("Orders"), table("Orders", "SQL02"));
}

TEST_F(ObjectIdentityEqualityTest, HashIsStable)
{
	const std::string urn = object_urn("Table", "Orders");
	EXPECT_EQ(make_identity(urn).hash(), stable_urn_hash(urn));
}

TEST_F(ObjectIdentityEqualityTest, UsableAsHashKey)
{
	std::unordered_set<object_identity> set;
	set.insert(table("Orders"));
	set.insert(table("Orders"));
	set.insert(view("Orders"));

	EXPECT_EQ(set.size(), 2u);
}

TEST_F(ObjectIdentityEqualityTest, DefaultIdentityIsEmpty)
{
	object_identity identity;
	EXPECT_TRUE(identity.empty());
	EXPECT_EQ(identity.type(), "");
	EXPECT_FALSE(identity.server_name().has_value());
	EXPECT_FALSE(identity.parent().has_value());
}

TEST_F(ObjectIdentityEqualityTest, ChildOfBuildsCanonicalUrn)
{
	auto server = make_identity("Server[@Name='SQL01']");
	auto database = object_identity::child_of(server, "Database", { { "Name", "Sales" } });
	auto orders = object_identity::child_of(database, "Table",
											{ { "Name", "Orders" }, { "Schema", "dbo" } });

	EXPECT_EQ(orders, table("Orders"));
	EXPECT_EQ(orders.urn(), object_urn("Table", "Orders"));
}

TEST_F(ObjectIdentityEqualityTest, ChildOfQuotesValues)
{
	auto server = make_identity("Server[@Name='SQL01']");
	auto login = object_identity::child_of(server, "Login", { { "Name", "O'Brien" } });

	EXPECT_EQ(login.urn(), "Server[@Name='SQL01']/Login[@Name='O''Brien']");
	EXPECT_EQ(login.name(), "O'Brien");
}

TEST_F(ObjectIdentityEqualityTest, ParentDropsLastSegment)
{
	auto parent = table("Orders").parent();

	ASSERT_TRUE(parent.has_value());
	EXPECT_EQ(parent->urn(), "Server[@Name='SQL01']/Database[@Name='Sales']");
	EXPECT_EQ(parent->type(), "Database");

	auto server = make_identity("Server[@Name='SQL01']");
	EXPECT_FALSE(server.parent().has_value());
}

// ============================================================================
// Server Context Tests
// ============================================================================

class ServerContextTest : public ::testing::Test
{
};

TEST_F(ServerContextTest, DefaultInstance)
{
	auto context = resolve_server_context(table("Orders"));

	ASSERT_TRUE(context.is_ok());
	EXPECT_EQ(context.value().computer_name, "SQL01");
	EXPECT_EQ(context.value().service_name, "MSSQLSERVER");
	EXPECT_EQ(context.value().instance_name, "SQL01");
}

TEST_F(ServerContextTest, NamedInstance)
{
	auto context = resolve_server_context(table("Orders", "HOST7\\REPORTING"));

	ASSERT_TRUE(context.is_ok());
	EXPECT_EQ(context.value().computer_name, "HOST7");
	EXPECT_EQ(context.value().service_name, "REPORTING");
	EXPECT_EQ(context.value().instance_name, "HOST7\\REPORTING");
}

TEST_F(ServerContextTest, MissingServerSegmentFails)
{
	auto context
		= resolve_server_context(make_identity("Database[@Name='Sales']/Table[@Name='Orders']"));

	ASSERT_TRUE(context.is_err());
	EXPECT_EQ(context.error().code, error_codes::context_resolution);
	EXPECT_NE(context.error().message.find("Failed to find valid server object"),
			  std::string::npos);
}

TEST_F(ServerContextTest, EmptyIdentityFails)
{
	auto context = resolve_server_context(object_identity{});

	ASSERT_TRUE(context.is_err());
	EXPECT_EQ(context.error().code, error_codes::context_resolution);
}

TEST_F(ServerContextTest, ErrorClassification)
{
	EXPECT_EQ(classify_error(error_codes::context_resolution), error_kind::context_resolution);
	EXPECT_EQ(classify_error(error_codes::resolution_failed), error_kind::resolution);
	EXPECT_EQ(classify_error(12345), error_kind::unknown);
	EXPECT_EQ(to_string(error_kind::discovery), "DiscoveryError");
	EXPECT_EQ(to_string(pipeline_stage::enrichment), "enrichment");
}
