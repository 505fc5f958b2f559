// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <string>

#include "LogQueryKit/sampling/PatternNormalizer.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace LogQueryKit::sampling;
using ::testing::HasSubstr;
using ::testing::Not;

class PatternNormalizerTest : public ::testing::Test
{
  protected:
	static std::string normalize(const std::string &message)
	{
		return normalize_to_pattern(message);
	}
};

// =============================================================================
// Standard rules
// =============================================================================

TEST_F(PatternNormalizerTest, Uuid)
{
	const auto pattern = normalize("user 123e4567-e89b-12d3-a456-426614174000 failed");
	EXPECT_THAT(pattern, HasSubstr("{UUID}"));
	EXPECT_THAT(pattern, Not(HasSubstr("123e4567")));
	EXPECT_EQ(pattern, "user {UUID} failed");
}

TEST_F(PatternNormalizerTest, UuidUppercase)
{
	EXPECT_EQ(normalize("id=123E4567-E89B-12D3-A456-426614174000"), "id={UUID}");
}

TEST_F(PatternNormalizerTest, LongHex)
{
	EXPECT_EQ(normalize("trace 0123456789abcdef0123 done"), "trace {HEX} done");
}

TEST_F(PatternNormalizerTest, ShortHexId)
{
	EXPECT_EQ(normalize("request deadbeef failed"), "request {ID} failed");
}

TEST_F(PatternNormalizerTest, Timestamp)
{
	EXPECT_EQ(normalize("at 2024-01-15T11:45:23.123Z ok"), "at {TS} ok");
	EXPECT_EQ(normalize("at 2024-01-15T11:45:23 ok"), "at {TS} ok");
}

TEST_F(PatternNormalizerTest, IpAndNumber)
{
	EXPECT_EQ(normalize("from 192.168.1.10 port 8080"), "from {IP} port {N}");
}

TEST_F(PatternNormalizerTest, ShortNumbersKept)
{
	EXPECT_EQ(normalize("took 1234 ms, 12 retries"), "took {N} ms, 12 retries");
}

TEST_F(PatternNormalizerTest, EightDigitNumberIsId)
{
	// hex ids are replaced before plain numbers
	EXPECT_EQ(normalize("order 12345678 shipped"), "order {ID} shipped");
}

TEST_F(PatternNormalizerTest, PlaceholdersNotRematched)
{
	const auto once = normalize("user 123e4567-e89b-12d3-a456-426614174000 at 10.0.0.1");
	EXPECT_EQ(once, "user {UUID} at {IP}");
	EXPECT_EQ(normalize(once), once);
}

TEST_F(PatternNormalizerTest, PlainTextUnchanged)
{
	EXPECT_EQ(normalize("connection refused"), "connection refused");
	EXPECT_EQ(normalize(""), "");
}

TEST_F(PatternNormalizerTest, Deterministic)
{
	const std::string message = "job 42 of batch 9f8e7d6c5b4a3928 finished at 2024-01-15T11:45:23Z";
	EXPECT_EQ(normalize(message), normalize(message));
}

TEST_F(PatternNormalizerTest, SameShapeSamePattern)
{
	EXPECT_EQ(normalize("timeout after 5000 ms on 10.0.0.1"),
			  normalize("timeout after 7500 ms on 10.0.0.2"));
}

// =============================================================================
// Truncation
// =============================================================================

TEST_F(PatternNormalizerTest, TruncatedTo200Characters)
{
	const std::string message(300, 'x');
	EXPECT_EQ(normalize(message), std::string(200, 'x'));
}

TEST_F(PatternNormalizerTest, TruncationCountsCharactersNotBytes)
{
	std::string message;
	for (int i = 0; i < 250; ++i)
		message += "\xC3\xA9"; // e acute
	const auto pattern = normalize(message);
	EXPECT_EQ(pattern.size(), 400u);
}

TEST_F(PatternNormalizerTest, TruncateUtf8)
{
	EXPECT_EQ(truncate_utf8("h\xC3\xA9llo", 2), "h\xC3\xA9");
	EXPECT_EQ(truncate_utf8("abc", 0), "");
	EXPECT_EQ(truncate_utf8("abc", 10), "abc");
	EXPECT_EQ(truncate_utf8("", 3), "");
}

// =============================================================================
// Custom rule tables
// =============================================================================

TEST_F(PatternNormalizerTest, CustomRules)
{
	PatternRuleCollection rules;
	rules.push_back({"word", boost::regex{"foo"}, "<F>"});
	const PatternNormalizer normalizer{rules, 5};

	EXPECT_EQ(normalizer.normalize("foofoo bar"), "<F><F");
	EXPECT_EQ(normalizer.max_length(), 5u);
	ASSERT_EQ(normalizer.rules().size(), 1u);
	EXPECT_EQ(normalizer.rules()[0].name, "word");
}

TEST_F(PatternNormalizerTest, RuleReplacementIsLiteral)
{
	const PatternRule rule{"dollar", boost::regex{"x"}, "$1&"};
	EXPECT_EQ(rule.apply("axb"), "a$1&b");
}

TEST_F(PatternNormalizerTest, StandardRuleOrder)
{
	const auto rules = PatternNormalizer::standard_rules();
	ASSERT_EQ(rules.size(), 6u);
	EXPECT_EQ(rules[0].name, "uuid");
	EXPECT_EQ(rules[1].name, "hex");
	EXPECT_EQ(rules[2].name, "id");
	EXPECT_EQ(rules[3].name, "ts");
	EXPECT_EQ(rules[4].name, "ip");
	EXPECT_EQ(rules[5].name, "num");
}
