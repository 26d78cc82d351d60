// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "io/FileAt.hxx"
#include "io/SameFile.hxx"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

static FileAt
At(const fs::path &path) noexcept
{
	return FileAt::CurrentDirectory(path.c_str());
}

TEST(SameFile, Basic)
{
	const TempDirectory tmp;
	WriteTextFile(tmp / "a", "a");
	WriteTextFile(tmp / "b", "a");

	const auto a = tmp / "a", b = tmp / "b", missing = tmp / "missing";

	EXPECT_TRUE(IsSameFile(At(a), At(a)));
	EXPECT_FALSE(IsSameFile(At(a), At(b)));

	/* missing files are never the same */
	EXPECT_FALSE(IsSameFile(At(missing), At(missing)));
	EXPECT_FALSE(IsSameFile(At(a), At(missing)));
}

TEST(SameFile, Links)
{
	const TempDirectory tmp;
	WriteTextFile(tmp / "a", "a");
	fs::create_hard_link(tmp / "a", tmp / "hard");
	fs::create_symlink("a", tmp / "soft");

	const auto a = tmp / "a", hard = tmp / "hard", soft = tmp / "soft";

	EXPECT_TRUE(IsSameFile(At(a), At(hard)));
	EXPECT_TRUE(IsSameFile(At(a), At(soft)));
	EXPECT_FALSE(IsSameFile(At(a), At(soft), false));
}
