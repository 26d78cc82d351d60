// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "cli/Expand.hxx"

#include <gtest/gtest.h>

#include <string>

using namespace XCopy;
namespace fs = std::filesystem;

TEST(Expand, Wildcards)
{
	const TempDirectory tmp;
	WriteTextFile(tmp / "b.txt", "");
	WriteTextFile(tmp / "a.txt", "");
	WriteTextFile(tmp / "c.dat", "");

	const std::string pattern = (tmp / "*.txt").native();
	const std::string literal = (tmp / "c.dat").native();
	const char *const patterns[] = {pattern.c_str(), literal.c_str()};

	const auto result = ExpandSources(patterns);
	ASSERT_EQ(result.size(), 3U);
	EXPECT_EQ(result[0], tmp / "a.txt");
	EXPECT_EQ(result[1], tmp / "b.txt");
	EXPECT_EQ(result[2], tmp / "c.dat");
}

TEST(Expand, NoMatch)
{
	const TempDirectory tmp;

	/* passed through, so the copy can complain about it */
	const std::string pattern = (tmp / "*.missing").native();
	const char *const patterns[] = {pattern.c_str()};

	const auto result = ExpandSources(patterns);
	ASSERT_EQ(result.size(), 1U);
	EXPECT_EQ(result[0], pattern);
}

TEST(Expand, Empty)
{
	EXPECT_TRUE(ExpandSources({}).empty());
}
