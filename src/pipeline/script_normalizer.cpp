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

#include <kcenon/dependency_resolver/pipeline/script_normalizer.h>

namespace dependency_resolver::pipeline
{

namespace
{

constexpr const char* session_settings_pattern
	= R"(SET\s+(ANSI_NULLS|QUOTED_IDENTIFIER)\s+ON\b[ \t]*;?)";

constexpr const char* line_break = "\r\n";

} // namespace

script_normalizer::script_normalizer(script_options options)
	: options_(std::move(options)),
	  session_settings_(session_settings_pattern,
						std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
{
}

std::string script_normalizer::normalize(std::string_view script) const
{
	std::string text(script);

	if (options_.strip_session_settings)
	{
		text = std::regex_replace(text, session_settings_, "");
	}

	auto last = text.find_last_not_of(" \t\r\n");
	text.erase(last == std::string::npos ? 0 : last + 1);

	text += line_break;
	text += options_.batch_terminator;
	return text;
}

} // namespace dependency_resolver::pipeline
