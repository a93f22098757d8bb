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
 * @file resolver_metrics.h
 * @brief Counters collected by the dependency pipeline
 *
 * ## Thread Safety
 * All counters are atomics; recording and reading may happen concurrently.
 */

#pragma once

#include "metrics_base.h"

#include <atomic>
#include <cstdint>

namespace dependency_resolver::metrics
{

/**
 * @struct resolver_metrics
 * @brief Pipeline counters for monitoring and reporting
 */
struct resolver_metrics
{
	std::atomic<uint64_t> roots_processed{0};            ///< Roots that entered the pipeline
	std::atomic<uint64_t> roots_failed{0};               ///< Roots stopped by a root-level error
	std::atomic<uint64_t> roots_without_dependencies{0}; ///< Roots with an empty discovery result
	std::atomic<uint64_t> nodes_flattened{0};            ///< Flat nodes produced
	std::atomic<uint64_t> nodes_enriched{0};             ///< Records built successfully
	std::atomic<uint64_t> node_failures{0};              ///< Nodes skipped after ResolutionError
	std::atomic<uint64_t> duplicates_collapsed{0};       ///< Records removed by deduplication
	std::atomic<uint64_t> deepest_tier{0};               ///< Largest tier magnitude seen
	std::atomic<uint64_t> total_resolution_time_us{0};   ///< Wall time spent in resolve()

	/**
	 * @brief Percentage of processed roots that did not fail
	 */
	[[nodiscard]] double success_rate() const noexcept
	{
		const auto processed = roots_processed.load();
		return metrics_utils::calculate_rate(processed - roots_failed.load(), processed);
	}

	/**
	 * @brief Average wall time per processed root
	 */
	[[nodiscard]] double average_resolution_time_us() const noexcept
	{
		return metrics_utils::average_us(total_resolution_time_us.load(), roots_processed.load());
	}

	void reset() noexcept
	{
		metrics_utils::reset_counter(roots_processed);
		metrics_utils::reset_counter(roots_failed);
		metrics_utils::reset_counter(roots_without_dependencies);
		metrics_utils::reset_counter(nodes_flattened);
		metrics_utils::reset_counter(nodes_enriched);
		metrics_utils::reset_counter(node_failures);
		metrics_utils::reset_counter(duplicates_collapsed);
		metrics_utils::reset_counter(deepest_tier);
		metrics_utils::reset_counter(total_resolution_time_us);
	}
};

} // namespace dependency_resolver::metrics
