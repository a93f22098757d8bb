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
 * @file script_normalizer.h
 * @brief Normalizes object creation scripts for batch replay
 *
 * Scripts generated by the server carry `SET ANSI_NULLS ON` and
 * `SET QUOTED_IDENTIFIER ON` statements that break the recipient's batch
 * splitting. Both settings are session defaults, so they are removed
 * (any casing, any whitespace between tokens, optional trailing ';', any
 * number of occurrences). The result always ends with a batch terminator
 * on its own line.
 *
 * ## Thread Safety
 * normalize() is const and safe to call concurrently.
 *
 * @code
 * using namespace dependency_resolver::pipeline;
 *
 * script_normalizer normalizer;
 * auto text = normalizer.normalize("SET ANSI_NULLS ON\r\nCREATE VIEW v AS SELECT 1");
 * // text == "\r\nCREATE VIEW v AS SELECT 1\r\nGO"
 * @endcode
 */

#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace dependency_resolver::pipeline
{

/**
 * @struct script_options
 * @brief Script normalization settings
 */
struct script_options
{
	bool strip_session_settings = true;  ///< Remove ANSI_NULLS / QUOTED_IDENTIFIER statements
	std::string batch_terminator = "GO"; ///< Appended on its own line
};

/**
 * @class script_normalizer
 * @brief Applies the fixed textual normalization to creation scripts
 */
class script_normalizer
{
public:
	explicit script_normalizer(script_options options = script_options{});

	/**
	 * @brief Normalize a raw creation script
	 * @param script Script text as returned by the catalog resolver
	 * @return Normalized script ending with the batch terminator
	 */
	[[nodiscard]] std::string normalize(std::string_view script) const;

	[[nodiscard]] const script_options& options() const noexcept { return options_; }

private:
	script_options options_;
	std::regex session_settings_;
};

} // namespace dependency_resolver::pipeline
