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
 * @file metrics_base.h
 * @brief Common utilities for atomic metrics operations
 *
 * Shared helpers for the resolver's metrics structs: counter reset,
 * lock-free maximum tracking and divide-by-zero safe averages and rates.
 *
 * ## Thread Safety
 * All functions are static and operate on `std::atomic` parameters passed
 * by the caller. update_max() is a CAS loop, safe for concurrent calls.
 *
 * @code
 * using namespace dependency_resolver::metrics;
 *
 * std::atomic<uint64_t> deepest{0};
 * metrics_utils::update_max(deepest, 7);
 * double rate = metrics_utils::calculate_rate(resolved, processed);
 * @endcode
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace dependency_resolver::metrics
{

/**
 * @struct metrics_utils
 * @brief Static utility functions for atomic metrics operations
 */
struct metrics_utils
{
	/**
	 * @brief Reset an atomic counter to zero
	 */
	static void reset_counter(std::atomic<uint64_t>& counter,
							  std::memory_order order = std::memory_order_relaxed) noexcept
	{
		counter.store(0, order);
	}

	/**
	 * @brief Update maximum value using compare-and-swap
	 * @param max_value The atomic maximum value to update
	 * @param new_value The candidate new maximum
	 */
	static void update_max(std::atomic<uint64_t>& max_value, uint64_t new_value,
						   std::memory_order order = std::memory_order_relaxed) noexcept
	{
		uint64_t current = max_value.load(std::memory_order_relaxed);
		while (new_value > current
			   && !max_value.compare_exchange_weak(current, new_value, order,
												   std::memory_order_relaxed))
		{
		}
	}

	/**
	 * @brief Calculate average in microseconds
	 * @return Average, or 0.0 if count is zero
	 */
	[[nodiscard]] static double average_us(uint64_t total_us, uint64_t count) noexcept
	{
		if (count == 0)
		{
			return 0.0;
		}
		return static_cast<double>(total_us) / static_cast<double>(count);
	}

	/**
	 * @brief Calculate percentage rate
	 * @param default_value Value to return when denominator is zero (default: 100.0)
	 * @return Rate as percentage (0.0 - 100.0)
	 */
	[[nodiscard]] static double calculate_rate(uint64_t numerator, uint64_t denominator,
											   double default_value = 100.0) noexcept
	{
		if (denominator == 0)
		{
			return default_value;
		}
		return static_cast<double>(numerator) / static_cast<double>(denominator) * 100.0;
	}
};

} // namespace dependency_resolver::metrics
