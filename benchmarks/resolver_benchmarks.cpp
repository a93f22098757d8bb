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
 * @file resolver_benchmarks.cpp
 * @brief Performance benchmarks for dependency resolution components
 *
 * Benchmarks cover:
 * - Tree flattening of wide and deep trees
 * - Precedence resolution with heavy duplication
 * - Script normalization throughput
 * - End-to-end pipeline over an in-memory catalog
 */

#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <vector>

#include <kcenon/dependency_resolver/catalog/snapshot_catalog.h>
#include <kcenon/dependency_resolver/discovery/dependency_tree.h>
#include <kcenon/dependency_resolver/pipeline/dependency_pipeline.h>
#include <kcenon/dependency_resolver/pipeline/precedence_resolver.h>
#include <kcenon/dependency_resolver/pipeline/script_normalizer.h>
#include <kcenon/dependency_resolver/pipeline/tree_flattener.h>

using namespace dependency_resolver;
using namespace dependency_resolver::discovery;
using namespace dependency_resolver::pipeline;

namespace
{

object_identity make_object(const std::string& type, const std::string& name)
{
	auto server = object_identity::parse("Server[@Name='BENCH']/Database[@Name='Bench']");
	return object_identity::child_of(server.value(), type, { { "Name", name }, { "Schema", "dbo" } });
}

/// Root with @p width children, each carrying a chain of @p depth nodes
dependency_tree build_tree(int width, int depth)
{
	dependency_tree tree;
	auto root = tree.add_child(tree.root(), make_object("Table", "Root"));
	for (int w = 0; w < width; ++w)
	{
		auto current = root;
		for (int d = 0; d < depth; ++d)
		{
			current = tree.add_child(current,
									 make_object("View", "V" + std::to_string(w) + "_" + std::to_string(d)));
		}
	}
	return tree;
}

} // namespace

// ============================================================================
// Tree Flattener Benchmarks
// ============================================================================

static void BM_FlattenWideTree(benchmark::State& state)
{
	auto tree = build_tree(static_cast<int>(state.range(0)), 1);

	for (auto _ : state)
	{
		auto nodes = tree_flattener::flatten(tree, {});
		benchmark::DoNotOptimize(nodes);
	}

	state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_FlattenWideTree)->Unit(benchmark::kMicrosecond)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_FlattenDeepChain(benchmark::State& state)
{
	auto tree = build_tree(1, static_cast<int>(state.range(0)));

	for (auto _ : state)
	{
		auto nodes = tree_flattener::flatten(tree, {});
		benchmark::DoNotOptimize(nodes);
	}

	state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_FlattenDeepChain)->Unit(benchmark::kMicrosecond)->Arg(1000)->Arg(100000);

// ============================================================================
// Precedence Resolver Benchmarks
// ============================================================================

static void BM_PrecedenceWithDuplicates(benchmark::State& state)
{
	const auto count = static_cast<int>(state.range(0));
	std::vector<dependency_record> records;
	records.reserve(static_cast<size_t>(count));
	for (int i = 0; i < count; ++i)
	{
		// Every object appears four times at different tiers
		dependency_record record;
		record.dependent = make_object("View", "V" + std::to_string(i / 4));
		record.tier = (i % 4) + 1;
		records.push_back(std::move(record));
	}

	for (auto _ : state)
	{
		auto resolved = precedence_resolver::resolve(records);
		benchmark::DoNotOptimize(resolved);
	}

	state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_PrecedenceWithDuplicates)->Unit(benchmark::kMicrosecond)->Arg(1000)->Arg(10000);

// ============================================================================
// Script Normalizer Benchmarks
// ============================================================================

static void BM_NormalizeScript(benchmark::State& state)
{
	script_normalizer normalizer;
	std::string script = "SET ANSI_NULLS ON\r\nGO\r\nSET QUOTED_IDENTIFIER ON\r\nGO\r\n"
						 "CREATE VIEW [dbo].[ActiveOrders] AS\r\n";
	for (int i = 0; i < state.range(0); ++i)
	{
		script += "SELECT o.Id, o.Total FROM dbo.Orders o WHERE o.Status = " + std::to_string(i)
				  + "\r\nUNION ALL\r\n";
	}
	script += "SELECT 0, 0\r\n";

	for (auto _ : state)
	{
		auto normalized = normalizer.normalize(script);
		benchmark::DoNotOptimize(normalized);
	}

	state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(script.size()));
}

BENCHMARK(BM_NormalizeScript)->Unit(benchmark::kMicrosecond)->Arg(10)->Arg(1000);

// ============================================================================
// Pipeline Benchmarks
// ============================================================================

class PipelineBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& state) override
	{
		catalog_ = std::make_shared<catalog::snapshot_catalog>();
		root_ = make_object("Table", "Orders");
		register_object(root_, "Table");

		// Layered diamond: every object of layer n references every object of layer n-1
		std::vector<object_identity> previous{ root_ };
		for (int layer = 0; layer < 3; ++layer)
		{
			std::vector<object_identity> current;
			for (int i = 0; i < state.range(0); ++i)
			{
				auto id = make_object("View", "L" + std::to_string(layer) + "_" + std::to_string(i));
				register_object(id, "View");
				for (const auto& referenced : previous)
				{
					(void)catalog_->add_reference({ id, referenced, false });
				}
				current.push_back(id);
			}
			previous = std::move(current);
		}
	}

	void TearDown(const benchmark::State& /*state*/) override { catalog_.reset(); }

protected:
	void register_object(const object_identity& id, const std::string& kind)
	{
		catalog::catalog_object object;
		object.identity = id;
		object.descriptor.name = id.name();
		object.descriptor.kind = kind;
		object.descriptor.owner = "dbo";
		object.script = "SET ANSI_NULLS ON\r\nCREATE " + kind + " " + id.name();
		catalog_->add_object(std::move(object));
	}

	std::shared_ptr<catalog::snapshot_catalog> catalog_;
	object_identity root_;
};

BENCHMARK_DEFINE_F(PipelineBenchmarkFixture, ResolveLayeredDiamond)(benchmark::State& state)
{
	dependency_pipeline pipeline(catalog_, catalog_);

	size_t records = 0;
	for (auto _ : state)
	{
		auto result = pipeline.resolve(root_);
		records = result.records.size();
		benchmark::DoNotOptimize(result);
	}

	state.counters["records"] = static_cast<double>(records);
}

BENCHMARK_REGISTER_F(PipelineBenchmarkFixture, ResolveLayeredDiamond)
	->Unit(benchmark::kMillisecond)
	->Arg(2)
	->Arg(4)
	->Arg(6);

BENCHMARK_MAIN();
