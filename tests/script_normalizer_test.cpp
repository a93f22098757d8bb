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
 * @file script_normalizer_test.cpp
 * @brief Unit tests for creation script normalization
 */

#include <gtest/gtest.h>

#include <string>

#include <kcenon/dependency_resolver/pipeline/script_normalizer.h>

using namespace dependency_resolver::pipeline;

class ScriptNormalizerTest : public ::testing::Test
{
protected:
	script_normalizer normalizer_;
};

TEST_F(ScriptNormalizerTest, DefaultOptions)
{
	script_options options;

	EXPECT_TRUE(options.strip_session_settings);
	EXPECT_EQ(options.batch_terminator, "GO");
}

TEST_F(ScriptNormalizerTest, StripsSessionSettingsAndAppendsTerminator)
{
	const std::string script = "SET ANSI_NULLS ON\r\nSET QUOTED_IDENTIFIER ON\r\n"
							   "CREATE VIEW dbo.V AS SELECT 1 AS x";

	auto normalized = normalizer_.normalize(script);

	EXPECT_EQ(normalized.find("ANSI_NULLS"), std::string::npos);
	EXPECT_EQ(normalized.find("QUOTED_IDENTIFIER"), std::string::npos);
	EXPECT_NE(normalized.find("CREATE VIEW dbo.V AS SELECT 1 AS x"), std::string::npos);
	EXPECT_EQ(normalized.substr(normalized.size() - 4), "\r\nGO");
}

TEST_F(ScriptNormalizerTest, MatchingIsCaseInsensitive)
{
	auto normalized = normalizer_.normalize("set ansi_nulls on;\nset  Quoted_Identifier\tOn\n"
											"CREATE TABLE t (a int)");

	EXPECT_EQ(normalized, "\n\nCREATE TABLE t (a int)\r\nGO");
}

TEST_F(ScriptNormalizerTest, KeepsOffVariants)
{
	auto normalized = normalizer_.normalize("SET ANSI_NULLS OFF\nCREATE TABLE t (a int)");

	EXPECT_NE(normalized.find("SET ANSI_NULLS OFF"), std::string::npos);
}

TEST_F(ScriptNormalizerTest, KeepsOtherSetStatements)
{
	auto normalized = normalizer_.normalize("SET NOCOUNT ON\nCREATE TABLE t (a int)");

	EXPECT_NE(normalized.find("SET NOCOUNT ON"), std::string::npos);
}

TEST_F(ScriptNormalizerTest, TrimsTrailingWhitespaceBeforeTerminator)
{
	EXPECT_EQ(normalizer_.normalize("CREATE TABLE t (a int)\r\n\r\n  \t"),
			  "CREATE TABLE t (a int)\r\nGO");
}

TEST_F(ScriptNormalizerTest, EmptyScriptBecomesTerminatorOnly)
{
	EXPECT_EQ(normalizer_.normalize(""), "\r\nGO");
}

TEST_F(ScriptNormalizerTest, CustomTerminator)
{
	script_options options;
	options.batch_terminator = "go";
	script_normalizer normalizer(options);

	EXPECT_EQ(normalizer.normalize("SELECT 1"), "SELECT 1\r\ngo");
}

TEST_F(ScriptNormalizerTest, StrippingCanBeDisabled)
{
	script_options options;
	options.strip_session_settings = false;
	script_normalizer normalizer(options);

	auto normalized = normalizer.normalize("SET ANSI_NULLS ON\nSELECT 1");

	EXPECT_EQ(normalized, "SET ANSI_NULLS ON\nSELECT 1\r\nGO");
}
