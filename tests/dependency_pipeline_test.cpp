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
 * @file dependency_pipeline_test.cpp
 * @brief Integration tests for the dependency resolution pipeline
 *
 * Tests cover:
 * - Roots without dependencies
 * - Diamonds and causal ordering in both directions
 * - Node failures that do not abort the root
 * - Root-level failures per stage, batches and cancellation
 * - Logging and metrics
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <kcenon/dependency_resolver/catalog/snapshot_catalog.h>
#include <kcenon/dependency_resolver/core/cancellation_token.h>
#include <kcenon/dependency_resolver/core/error_codes.h>
#include <kcenon/dependency_resolver/metrics/resolver_metrics.h>
#include <kcenon/dependency_resolver/pipeline/dependency_pipeline.h>

#include "test_support.h"

using namespace dependency_resolver;
using namespace dependency_resolver::pipeline;
using namespace dependency_resolver::testing;
using kcenon::common::interfaces::log_level;

class DependencyPipelineTest : public ::testing::Test
{
protected:
	/**
	 * T <- A <- P
	 * T <- B <- P
	 * Lonely (no references)
	 */
	void SetUp() override
	{
		catalog_ = std::make_shared<catalog::snapshot_catalog>();
		add_object(*catalog_, table("T"), "Table");
		add_object(*catalog_, view("A"), "View");
		add_object(*catalog_, view("B"), "View");
		add_object(*catalog_, procedure("P"), "StoredProcedure");
		add_object(*catalog_, table("Lonely"), "Table");

		add_reference(*catalog_, view("A"), table("T"));
		add_reference(*catalog_, view("B"), table("T"));
		add_reference(*catalog_, procedure("P"), view("A"));
		add_reference(*catalog_, procedure("P"), view("B"));

		resolver_ = std::make_shared<failing_resolver>(catalog_);
		logger_ = std::make_shared<capture_logger>();
		metrics_ = std::make_shared<metrics::resolver_metrics>();
	}

	std::unique_ptr<dependency_pipeline> make_pipeline()
	{
		auto pipeline = std::make_unique<dependency_pipeline>(catalog_, resolver_);
		pipeline->set_logger(logger_);
		pipeline->set_metrics(metrics_);
		return pipeline;
	}

	static std::vector<std::string> names(const root_result& result)
	{
		std::vector<std::string> list;
		for (const auto& record : result.records)
		{
			list.push_back(record.dependent_name);
		}
		return list;
	}

	std::shared_ptr<catalog::snapshot_catalog> catalog_;
	std::shared_ptr<failing_resolver> resolver_;
	std::shared_ptr<capture_logger> logger_;
	std::shared_ptr<metrics::resolver_metrics> metrics_;
};

// ============================================================================
// Successful Resolution Tests
// ============================================================================

TEST_F(DependencyPipelineTest, RootWithoutDependenciesIsNotAnError)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(table("Lonely"));

	EXPECT_TRUE(result.is_success());
	EXPECT_TRUE(result.no_dependencies);
	EXPECT_TRUE(result.records.empty());
	EXPECT_TRUE(logger_->contains("No dependencies detected"));
	EXPECT_EQ(metrics_->roots_without_dependencies.load(), 1u);
}

TEST_F(DependencyPipelineTest, DiamondIsDeduplicatedAndOrdered)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(table("T"));

	ASSERT_TRUE(result.is_success());
	EXPECT_EQ(names(result), (std::vector<std::string>{ "A", "B", "P" }));
	EXPECT_EQ(result.records[2].tier, 2);
	EXPECT_EQ(result.records[2].parent_name, "A");
	EXPECT_EQ(metrics_->nodes_flattened.load(), 4u);
	EXPECT_EQ(metrics_->duplicates_collapsed.load(), 1u);
	EXPECT_EQ(metrics_->deepest_tier.load(), 2u);
}

TEST_F(DependencyPipelineTest, RecordsCarryOriginAndServer)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(table("T"));

	ASSERT_TRUE(result.is_success());
	ASSERT_FALSE(result.records.empty());
	for (const auto& record : result.records)
	{
		EXPECT_EQ(record.origin, table("T"));
		EXPECT_EQ(record.server.computer_name, "SQL01");
		EXPECT_EQ(record.server.service_name, "MSSQLSERVER");
		ASSERT_TRUE(record.script.has_value());
		EXPECT_EQ(record.script->find("ANSI_NULLS"), std::string::npos);
	}
}

TEST_F(DependencyPipelineTest, ParentsDirectionOrdersDeepestFirst)
{
	auto pipeline = make_pipeline();
	resolve_options options;
	options.direction = discovery_direction::dependencies;

	auto result = pipeline->resolve(procedure("P"), options);

	ASSERT_TRUE(result.is_success());
	EXPECT_EQ(names(result), (std::vector<std::string>{ "T", "A", "B" }));
	EXPECT_EQ(result.records[0].tier, -2);
	EXPECT_EQ(result.records[1].tier, -1);
}

TEST_F(DependencyPipelineTest, IncludeSelfEmitsRootFirst)
{
	auto pipeline = make_pipeline();
	resolve_options options;
	options.include_self = true;

	auto result = pipeline->resolve(table("T"), options);

	ASSERT_TRUE(result.is_success());
	ASSERT_EQ(result.records.size(), 4u);
	EXPECT_EQ(result.records[0].dependent, table("T"));
	EXPECT_EQ(result.records[0].tier, 0);
	EXPECT_FALSE(result.records[0].parent.has_value());
}

TEST_F(DependencyPipelineTest, IncludeSelfOnLonelyRoot)
{
	auto pipeline = make_pipeline();
	resolve_options options;
	options.include_self = true;

	auto result = pipeline->resolve(table("Lonely"), options);

	ASSERT_TRUE(result.is_success());
	EXPECT_FALSE(result.no_dependencies);
	ASSERT_EQ(result.records.size(), 1u);
	EXPECT_EQ(result.records[0].tier, 0);
}

TEST_F(DependencyPipelineTest, ScriptsCanBeSkipped)
{
	auto pipeline = make_pipeline();
	resolve_options options;
	options.include_script = false;

	auto result = pipeline->resolve(table("T"), options);

	ASSERT_TRUE(result.is_success());
	for (const auto& record : result.records)
	{
		EXPECT_FALSE(record.script.has_value());
	}
	EXPECT_EQ(resolver_->script_calls, 0);
}

TEST_F(DependencyPipelineTest, CustomBatchTerminator)
{
	script_options scripts;
	scripts.batch_terminator = "go";
	dependency_pipeline pipeline(catalog_, resolver_, scripts);

	auto result = pipeline.resolve(table("T"));

	ASSERT_TRUE(result.is_success());
	ASSERT_FALSE(result.records.empty());
	ASSERT_TRUE(result.records[0].script.has_value());
	EXPECT_EQ(result.records[0].script->substr(result.records[0].script->size() - 4), "\r\ngo");
}

// ============================================================================
// Node Failure Tests
// ============================================================================

TEST_F(DependencyPipelineTest, OneFailingNodeDoesNotAbortTheRoot)
{
	const std::vector<std::string> views{ "V1", "V2", "V3", "V4", "V5" };
	add_object(*catalog_, table("Wide"), "Table");
	for (const auto& name : views)
	{
		add_object(*catalog_, view(name), "View");
		add_reference(*catalog_, view(name), table("Wide"));
	}
	resolver_->fail_resolve(view("V3"));

	auto pipeline = make_pipeline();
	auto result = pipeline->resolve(table("Wide"));

	ASSERT_TRUE(result.is_success());
	EXPECT_EQ(names(result), (std::vector<std::string>{ "V1", "V2", "V4", "V5" }));
	ASSERT_EQ(result.node_failures.size(), 1u);
	EXPECT_EQ(result.node_failures[0].identity, view("V3"));
	EXPECT_EQ(result.node_failures[0].tier, 1);
	EXPECT_EQ(result.node_failures[0].error.code, error_codes::resolution_failed);
	EXPECT_EQ(logger_->count(log_level::warning), 1u);
	EXPECT_EQ(metrics_->node_failures.load(), 1u);
}

TEST_F(DependencyPipelineTest, DroppedParentFailsOnlyItsChildren)
{
	resolver_->fail_resolve(view("A"));

	auto pipeline = make_pipeline();
	auto result = pipeline->resolve(table("T"));

	// A fails itself; P under A fails on its parent; P under B survives
	ASSERT_TRUE(result.is_success());
	EXPECT_EQ(names(result), (std::vector<std::string>{ "B", "P" }));
	EXPECT_EQ(result.records[1].parent_name, "B");
	EXPECT_EQ(result.node_failures.size(), 2u);
}

TEST_F(DependencyPipelineTest, SystemObjectsAreDroppedUnlessAllowed)
{
	auto discovery = std::make_shared<scripted_discovery_service>();
	add_object(*catalog_, view("sys_objects"), "View", true);

	discovery::dependency_tree tree;
	auto root = tree.add_child(tree.root(), table("T"));
	tree.add_child(root, view("A"));
	tree.add_child(root, view("sys_objects"));
	discovery->respond_with(tree);

	dependency_pipeline pipeline(discovery, resolver_);

	auto filtered = pipeline.resolve(table("T"));
	ASSERT_TRUE(filtered.is_success());
	EXPECT_EQ(names(filtered), (std::vector<std::string>{ "A" }));
	EXPECT_FALSE(discovery->last_allow_system);

	resolve_options options;
	options.allow_system_objects = true;
	auto allowed = pipeline.resolve(table("T"), options);
	ASSERT_TRUE(allowed.is_success());
	EXPECT_EQ(names(allowed), (std::vector<std::string>{ "A", "sys_objects" }));
	EXPECT_TRUE(allowed.records[1].is_system_object);
	EXPECT_TRUE(discovery->last_allow_system);
}

// ============================================================================
// Root Failure Tests
// ============================================================================

TEST_F(DependencyPipelineTest, EmptyRootFailsValidation)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(object_identity{});

	ASSERT_FALSE(result.is_success());
	EXPECT_EQ(result.failure->stage, pipeline_stage::validation);
	EXPECT_EQ(result.failure->error.code, error_codes::invalid_input);
	EXPECT_EQ(metrics_->roots_failed.load(), 1u);
}

TEST_F(DependencyPipelineTest, RootWithoutServerFailsContext)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(make_identity("Database[@Name='Sales']/Table[@Name='T']"));

	ASSERT_FALSE(result.is_success());
	EXPECT_EQ(result.failure->stage, pipeline_stage::context);
	EXPECT_EQ(result.failure->error.code, error_codes::context_resolution);
	EXPECT_EQ(logger_->count(log_level::error), 1u);
}

TEST_F(DependencyPipelineTest, UnknownRootFailsDiscovery)
{
	auto pipeline = make_pipeline();

	auto result = pipeline->resolve(table("Missing"));

	ASSERT_FALSE(result.is_success());
	EXPECT_EQ(result.failure->stage, pipeline_stage::discovery);
	EXPECT_EQ(result.failure->error.code, error_codes::discovery_failed);
	EXPECT_NE(result.failure->error.message.find("Missing"), std::string::npos);
}

TEST_F(DependencyPipelineTest, CancelledBeforeDiscovery)
{
	auto pipeline = make_pipeline();
	auto token = std::make_shared<cancellation_token>();
	pipeline->set_cancellation_token(token);
	token->cancel();

	auto result = pipeline->resolve(table("T"));

	ASSERT_FALSE(result.is_success());
	EXPECT_EQ(result.failure->error.code, error_codes::cancelled);
	EXPECT_TRUE(result.records.empty());

	token->reset();
	EXPECT_TRUE(pipeline->resolve(table("T")).is_success());
}

// ============================================================================
// Batch Tests
// ============================================================================

TEST_F(DependencyPipelineTest, EmptyBatchIsInvalid)
{
	auto pipeline = make_pipeline();

	auto results = pipeline->resolve_batch({});

	ASSERT_TRUE(results.is_err());
	EXPECT_EQ(results.error().code, error_codes::invalid_input);
}

TEST_F(DependencyPipelineTest, BatchIsolatesRootFailures)
{
	auto pipeline = make_pipeline();

	auto results = pipeline->resolve_batch({ table("T"), table("Missing"), table("Lonely") });

	ASSERT_TRUE(results.is_ok());
	const auto& list = results.value();
	ASSERT_EQ(list.size(), 3u);
	EXPECT_TRUE(list[0].is_success());
	EXPECT_EQ(list[0].records.size(), 3u);
	EXPECT_FALSE(list[1].is_success());
	EXPECT_TRUE(list[2].is_success());
	EXPECT_TRUE(list[2].no_dependencies);

	EXPECT_EQ(metrics_->roots_processed.load(), 3u);
	EXPECT_EQ(metrics_->roots_failed.load(), 1u);
	EXPECT_NEAR(metrics_->success_rate(), 200.0 / 3.0, 0.01);
}

TEST_F(DependencyPipelineTest, MetricsReset)
{
	auto pipeline = make_pipeline();
	(void)pipeline->resolve(table("T"));

	metrics_->reset();

	EXPECT_EQ(metrics_->roots_processed.load(), 0u);
	EXPECT_EQ(metrics_->nodes_enriched.load(), 0u);
	EXPECT_DOUBLE_EQ(metrics_->success_rate(), 100.0);
	EXPECT_DOUBLE_EQ(metrics_->average_resolution_time_us(), 0.0);
}
