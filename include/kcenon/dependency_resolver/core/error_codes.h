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
 * @file error_codes.h
 * @brief Error codes and pipeline stages for dependency resolution
 *
 * Every fallible operation in dependency_resolver reports failures as
 * kcenon::common::error_info. The codes below identify the failure kind;
 * the pipeline_stage identifies where a root-level failure happened.
 *
 * ## Thread Safety
 * Constants and constexpr functions only. Fully thread-safe.
 *
 * @code
 * using namespace dependency_resolver;
 *
 * kcenon::common::error_info err{ error_codes::invalid_input,
 *                                 "Root object has no identity",
 *                                 "dependency_pipeline" };
 * auto kind = classify_error(err.code); // error_kind::invalid_input
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace dependency_resolver
{

namespace error_codes
{

constexpr int invalid_input = -100;      ///< Root without identity, empty batch, malformed URN
constexpr int context_resolution = -200; ///< Owning server of an identity cannot be determined
constexpr int discovery_failed = -300;   ///< Discovery service call failed
constexpr int resolution_failed = -400;  ///< Catalog lookup of a single node failed
constexpr int cancelled = -500;          ///< Caller cancelled the resolution
constexpr int invalid_config = -600;     ///< Configuration rejected
constexpr int snapshot_error = -700;     ///< Snapshot catalog load or lookup failed

} // namespace error_codes

/**
 * @enum error_kind
 * @brief Failure categories reported to callers
 */
enum class error_kind : uint8_t
{
	unknown = 0,
	invalid_input = 1,
	context_resolution = 2,
	discovery = 3,
	resolution = 4,
	cancelled = 5,
	invalid_config = 6,
	snapshot = 7,
};

/**
 * @enum pipeline_stage
 * @brief Stage of the per-root pipeline at which a failure occurred
 */
enum class pipeline_stage : uint8_t
{
	validation = 0, ///< Root identity validation
	context = 1,    ///< Server context resolution
	discovery = 2,  ///< Dependency discovery request
	flatten = 3,    ///< Tree flattening
	enrichment = 4, ///< Per-node catalog enrichment
	precedence = 5, ///< Deduplication and ordering
};

/**
 * @brief Map an error code to its category
 * @param code error_info::code value
 * @return Matching error_kind, or error_kind::unknown
 */
constexpr error_kind classify_error(int code) noexcept
{
	switch (code)
	{
	case error_codes::invalid_input:
		return error_kind::invalid_input;
	case error_codes::context_resolution:
		return error_kind::context_resolution;
	case error_codes::discovery_failed:
		return error_kind::discovery;
	case error_codes::resolution_failed:
		return error_kind::resolution;
	case error_codes::cancelled:
		return error_kind::cancelled;
	case error_codes::invalid_config:
		return error_kind::invalid_config;
	case error_codes::snapshot_error:
		return error_kind::snapshot;
	default:
		return error_kind::unknown;
	}
}

/**
 * @brief Convert error_kind to string representation
 */
constexpr std::string_view to_string(error_kind kind) noexcept
{
	switch (kind)
	{
	case error_kind::invalid_input:
		return "InvalidInput";
	case error_kind::context_resolution:
		return "ContextResolutionError";
	case error_kind::discovery:
		return "DiscoveryError";
	case error_kind::resolution:
		return "ResolutionError";
	case error_kind::cancelled:
		return "Cancelled";
	case error_kind::invalid_config:
		return "InvalidConfig";
	case error_kind::snapshot:
		return "SnapshotError";
	default:
		return "Unknown";
	}
}

/**
 * @brief Convert pipeline_stage to string representation
 */
constexpr std::string_view to_string(pipeline_stage stage) noexcept
{
	switch (stage)
	{
	case pipeline_stage::validation:
		return "validation";
	case pipeline_stage::context:
		return "context";
	case pipeline_stage::discovery:
		return "discovery";
	case pipeline_stage::flatten:
		return "flatten";
	case pipeline_stage::enrichment:
		return "enrichment";
	case pipeline_stage::precedence:
		return "precedence";
	default:
		return "unknown";
	}
}

} // namespace dependency_resolver
