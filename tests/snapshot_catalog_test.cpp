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
 * @file snapshot_catalog_test.cpp
 * @brief Unit tests for the in-memory snapshot catalog
 *
 * Tests cover:
 * - Snapshot file parsing and error reporting
 * - Discovery in both directions, cycles and diamonds
 * - System object filtering
 * - Descriptor and script lookup
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <kcenon/dependency_resolver/catalog/snapshot_catalog.h>
#include <kcenon/dependency_resolver/core/error_codes.h>

#include "test_support.h"

using namespace dependency_resolver;
using namespace dependency_resolver::catalog;
using namespace dependency_resolver::discovery;
using namespace dependency_resolver::testing;

namespace
{

std::vector<std::string> child_names(const dependency_tree& tree, dependency_tree::node_id id)
{
	std::vector<std::string> names;
	for (auto child = tree.first_child(id); child != dependency_tree::npos;
		 child = tree.next_sibling(child))
	{
		names.push_back(tree.at(child).identity.name());
	}
	return names;
}

} // namespace

// ============================================================================
// Snapshot Loading Tests
// ============================================================================

class SnapshotLoadTest : public ::testing::Test
{
};

TEST_F(SnapshotLoadTest, LoadsObjectsScriptsAndReferences)
{
	std::istringstream input("# sample\n"
							 "object|" + object_urn("Table", "Orders") + "|Table|dbo\n"
							 "object|" + object_urn("View", "V") + "|View|dbo|schemabound\n"
							 "object|" + object_urn("View", "sysv") + "|View|sys|system\n"
							 "\n"
							 "script|" + object_urn("View", "V") + "|CREATE VIEW V\\r\\nAS SELECT 1\n"
							 "reference|" + object_urn("View", "V") + "|"
							 + object_urn("Table", "Orders") + "|schemabound\n");

	auto loaded = snapshot_catalog::load_from_stream(input, "sample");

	ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
	auto catalog = loaded.value();
	EXPECT_EQ(catalog->object_count(), 3u);
	EXPECT_EQ(catalog->reference_count(), 1u);

	auto descriptor = catalog->resolve(view("V"));
	ASSERT_TRUE(descriptor.is_ok());
	EXPECT_EQ(descriptor.value().name, "V");
	EXPECT_EQ(descriptor.value().kind, "View");
	EXPECT_TRUE(descriptor.value().is_schema_bound);

	auto system = catalog->resolve(view("sysv"));
	ASSERT_TRUE(system.is_ok());
	EXPECT_TRUE(system.value().is_system_object);
	EXPECT_EQ(system.value().owner, "sys");

	auto script = catalog->script(view("V"));
	ASSERT_TRUE(script.is_ok());
	EXPECT_EQ(script.value(), "CREATE VIEW V\r\nAS SELECT 1");
}

TEST_F(SnapshotLoadTest, EmptyKindFallsBackToUrnType)
{
	std::istringstream input("object|" + object_urn("Table", "Orders") + "||dbo\n");

	auto loaded = snapshot_catalog::load_from_stream(input, "sample");

	ASSERT_TRUE(loaded.is_ok());
	auto descriptor = loaded.value()->resolve(table("Orders"));
	ASSERT_TRUE(descriptor.is_ok());
	EXPECT_EQ(descriptor.value().kind, "Table");
}

TEST_F(SnapshotLoadTest, ErrorsCarrySourceAndLine)
{
	std::istringstream input("object|" + object_urn("Table", "Orders") + "|Table|dbo\n"
							 "bogus|record\n");

	auto loaded = snapshot_catalog::load_from_stream(input, "broken.snapshot");

	ASSERT_TRUE(loaded.is_err());
	EXPECT_EQ(loaded.error().code, error_codes::snapshot_error);
	EXPECT_NE(loaded.error().message.find("broken.snapshot:2:"), std::string::npos);
}

TEST_F(SnapshotLoadTest, ReferenceToUnknownObjectFails)
{
	std::istringstream input("object|" + object_urn("Table", "Orders") + "|Table|dbo\n"
							 "reference|" + object_urn("View", "V") + "|"
							 + object_urn("Table", "Orders") + "\n");

	auto loaded = snapshot_catalog::load_from_stream(input, "sample");

	ASSERT_TRUE(loaded.is_err());
	EXPECT_NE(loaded.error().message.find("sample:2:"), std::string::npos);
}

TEST_F(SnapshotLoadTest, MalformedRecordsFail)
{
	const std::vector<std::string> inputs{
		"object|" + object_urn("Table", "Orders") + "\n",
		"object|not a urn|Table|dbo\n",
		"object|" + object_urn("Table", "Orders") + "|Table|dbo|frozen\n",
		"script|" + object_urn("Table", "Orders") + "|CREATE TABLE\n",
	};

	for (const auto& text : inputs)
	{
		std::istringstream input(text);
		auto loaded = snapshot_catalog::load_from_stream(input, "sample");
		EXPECT_TRUE(loaded.is_err()) << text;
	}
}

TEST_F(SnapshotLoadTest, MissingFileFails)
{
	auto loaded = snapshot_catalog::load_from_file("/nonexistent/catalog.snapshot");

	ASSERT_TRUE(loaded.is_err());
	EXPECT_EQ(loaded.error().code, error_codes::snapshot_error);
}

// ============================================================================
// Discovery Tests
// ============================================================================

class SnapshotDiscoveryTest : public ::testing::Test
{
protected:
	/**
	 * Orders <- V1 <- P1
	 * Orders <- V2
	 * Orders <- P1
	 * Orders <- sys_view (system)
	 */
	void SetUp() override
	{
		add_object(catalog_, table("Orders"), "Table");
		add_object(catalog_, view("V1"), "View");
		add_object(catalog_, view("V2"), "View");
		add_object(catalog_, procedure("P1"), "StoredProcedure");
		add_object(catalog_, view("sys_view"), "View", true);

		add_reference(catalog_, view("V1"), table("Orders"), true);
		add_reference(catalog_, view("V2"), table("Orders"));
		add_reference(catalog_, procedure("P1"), view("V1"));
		add_reference(catalog_, procedure("P1"), table("Orders"));
		add_reference(catalog_, view("sys_view"), table("Orders"));
	}

	snapshot_catalog catalog_;
};

TEST_F(SnapshotDiscoveryTest, DependentsTree)
{
	auto tree = catalog_.discover({ table("Orders") }, false, discovery_direction::dependents, {});

	ASSERT_TRUE(tree.is_ok());
	const auto& t = tree.value();
	auto root = t.first_child(t.root());
	ASSERT_NE(root, dependency_tree::npos);
	EXPECT_EQ(t.at(root).identity, table("Orders"));
	EXPECT_EQ(child_names(t, root), (std::vector<std::string>{ "V1", "V2", "P1" }));

	auto v1 = t.first_child(root);
	EXPECT_TRUE(t.at(v1).is_schema_bound);
	EXPECT_EQ(child_names(t, v1), (std::vector<std::string>{ "P1" }));
	EXPECT_EQ(t.count(), 5u);
}

TEST_F(SnapshotDiscoveryTest, SystemObjectsIncludedWhenAllowed)
{
	auto tree = catalog_.discover({ table("Orders") }, true, discovery_direction::dependents, {});

	ASSERT_TRUE(tree.is_ok());
	auto root = tree.value().first_child(tree.value().root());
	EXPECT_EQ(child_names(tree.value(), root),
			  (std::vector<std::string>{ "V1", "V2", "P1", "sys_view" }));
}

TEST_F(SnapshotDiscoveryTest, DependenciesTree)
{
	auto tree
		= catalog_.discover({ procedure("P1") }, false, discovery_direction::dependencies, {});

	ASSERT_TRUE(tree.is_ok());
	const auto& t = tree.value();
	auto root = t.first_child(t.root());
	EXPECT_EQ(child_names(t, root), (std::vector<std::string>{ "V1", "Orders" }));
	EXPECT_EQ(child_names(t, t.first_child(root)), (std::vector<std::string>{ "Orders" }));
}

TEST_F(SnapshotDiscoveryTest, CyclesAreNotExpandedTwice)
{
	add_reference(catalog_, table("Orders"), procedure("P1"));

	auto tree = catalog_.discover({ table("Orders") }, false, discovery_direction::dependents, {});

	ASSERT_TRUE(tree.is_ok());
	// Orders, V1, P1 (under V1), V2, P1 (direct); P1 never expands back to Orders
	EXPECT_EQ(tree.value().count(), 5u);
	EXPECT_EQ(tree.value().depth(), 3u);
}

TEST_F(SnapshotDiscoveryTest, ProgressReportsEveryNode)
{
	std::vector<std::string> seen;
	auto tree = catalog_.discover({ table("Orders") }, false, discovery_direction::dependents,
								  [&seen](const object_identity& id) { seen.push_back(id.name()); });

	ASSERT_TRUE(tree.is_ok());
	EXPECT_EQ(seen.size(), tree.value().count());
	EXPECT_EQ(seen.front(), "Orders");
}

TEST_F(SnapshotDiscoveryTest, UnknownRootFails)
{
	auto tree = catalog_.discover({ table("Missing") }, false, discovery_direction::dependents, {});

	ASSERT_TRUE(tree.is_err());
	EXPECT_EQ(tree.error().code, error_codes::snapshot_error);
}

TEST_F(SnapshotDiscoveryTest, ObjectWithoutReferencesYieldsLoneRoot)
{
	auto tree = catalog_.discover({ view("V2") }, false, discovery_direction::dependents, {});

	ASSERT_TRUE(tree.is_ok());
	EXPECT_EQ(tree.value().count(), 1u);
}

// ============================================================================
// Lookup Tests
// ============================================================================

class SnapshotLookupTest : public SnapshotDiscoveryTest
{
};

TEST_F(SnapshotLookupTest, RemovedObjectNoLongerResolves)
{
	EXPECT_TRUE(catalog_.remove_object(view("V2")));
	EXPECT_FALSE(catalog_.remove_object(view("V2")));

	auto descriptor = catalog_.resolve(view("V2"));
	ASSERT_TRUE(descriptor.is_err());
	EXPECT_EQ(descriptor.error().code, error_codes::snapshot_error);
}

TEST_F(SnapshotLookupTest, MissingScriptFails)
{
	catalog_object bare;
	bare.identity = table("Bare");
	bare.descriptor.name = "Bare";
	bare.descriptor.kind = "Table";
	catalog_.add_object(bare);

	auto script = catalog_.script(table("Bare"));
	ASSERT_TRUE(script.is_err());
	EXPECT_NE(script.error().message.find("No script"), std::string::npos);
}

TEST_F(SnapshotLookupTest, SetScriptOnUnknownObjectFails)
{
	auto result = catalog_.set_script(table("Missing"), "CREATE TABLE Missing");

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::snapshot_error);
}
