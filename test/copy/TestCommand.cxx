// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "copy/Command.hxx"
#include "copy/Config.hxx"
#include "copy/Error.hxx"

#include <gtest/gtest.h>

using namespace XCopy;
namespace fs = std::filesystem;

namespace {

struct CountingProgress final : ProgressListener {
	uint_least64_t total = 0, done = 0;
	unsigned n_finish = 0;

	void Increment(uint_least64_t bytes) noexcept override {
		done += bytes;
	}

	void IncrementTotal(uint_least64_t bytes) noexcept override {
		total += bytes;
	}

	void Finish() noexcept override {
		++n_finish;
	}
};

class CommandTest : public ::testing::Test {
protected:
	TempDirectory tmp;
	CopyConfig config;
	CountingProgress progress;

	TransferTotals Copy(std::initializer_list<fs::path> sources,
			    const fs::path &destination) {
		return RunCopy(config, std::span{sources.begin(), sources.size()},
			       destination, progress);
	}

	ErrorKind CatchCopy(std::initializer_list<fs::path> sources,
			    const fs::path &destination) {
		try {
			Copy(sources, destination);
		} catch (const Error &e) {
			return e.GetKind();
		} catch (...) {
			return GetErrorKind(std::current_exception());
		}

		ADD_FAILURE() << "No exception thrown";
		return ErrorKind::OTHER;
	}
};

} // anonymous namespace

TEST_F(CommandTest, FileToNewFile)
{
	WriteTextFile(tmp / "a.txt", "this is 21 bytes long");

	const auto totals = Copy({tmp / "a.txt"}, tmp / "b.txt");
	EXPECT_EQ(totals.size, 21U);
	EXPECT_EQ(totals.copied, 21U);
	EXPECT_EQ(progress.total, 21U);
	EXPECT_EQ(progress.done, 21U);
	EXPECT_EQ(progress.n_finish, 1U);

	EXPECT_EQ(ReadTextFile(tmp / "b.txt"), "this is 21 bytes long");
}

TEST_F(CommandTest, FileIntoDirectory)
{
	WriteTextFile(tmp / "a.txt", "a");
	fs::create_directory(tmp / "dir");

	Copy({tmp / "a.txt"}, tmp / "dir");
	EXPECT_EQ(ReadTextFile(tmp / "dir" / "a.txt"), "a");
}

TEST_F(CommandTest, OverwriteFile)
{
	WriteTextFile(tmp / "a.txt", "new");
	WriteTextFile(tmp / "b.txt", "old and longer");

	Copy({tmp / "a.txt"}, tmp / "b.txt");
	EXPECT_EQ(ReadTextFile(tmp / "b.txt"), "new");
}

TEST_F(CommandTest, NoClobberFile)
{
	WriteTextFile(tmp / "a.txt", "new");
	WriteTextFile(tmp / "b.txt", "old");

	config.no_clobber = true;
	EXPECT_EQ(CatchCopy({tmp / "a.txt"}, tmp / "b.txt"),
		  ErrorKind::DESTINATION_EXISTS);
	EXPECT_EQ(ReadTextFile(tmp / "b.txt"), "old");
}

TEST_F(CommandTest, SameFile)
{
	WriteTextFile(tmp / "a.txt", "a");
	fs::create_hard_link(tmp / "a.txt", tmp / "hard");

	EXPECT_EQ(CatchCopy({tmp / "a.txt"}, tmp / "a.txt"),
		  ErrorKind::DESTINATION_EXISTS);
	EXPECT_EQ(CatchCopy({tmp / "a.txt"}, tmp / "hard"),
		  ErrorKind::DESTINATION_EXISTS);
	EXPECT_EQ(ReadTextFile(tmp / "a.txt"), "a");
}

TEST_F(CommandTest, EmptyDirectoryTree)
{
	fs::create_directories(tmp / "dir" / "x" / "y" / "z");
	fs::create_directory(tmp / "out");

	config.recursive = true;
	Copy({tmp / "dir"}, tmp / "out");
	EXPECT_TRUE(fs::is_directory(tmp / "out" / "dir" / "x" / "y" / "z"));
}

TEST_F(CommandTest, MultipleSources)
{
	WriteTextFile(tmp / "a", "a");
	WriteTextFile(tmp / "b", "bb");
	fs::create_directory(tmp / "dir");

	const auto totals = Copy({tmp / "a", tmp / "b"}, tmp / "dir");
	EXPECT_EQ(totals.copied, 3U);
	EXPECT_EQ(ReadTextFile(tmp / "dir" / "a"), "a");
	EXPECT_EQ(ReadTextFile(tmp / "dir" / "b"), "bb");
}

TEST_F(CommandTest, MultipleSourcesNotDirectory)
{
	WriteTextFile(tmp / "a", "a");
	WriteTextFile(tmp / "b", "b");
	WriteTextFile(tmp / "c", "c");

	EXPECT_EQ(CatchCopy({tmp / "a", tmp / "b"}, tmp / "c"),
		  ErrorKind::INVALID_DESTINATION);
	EXPECT_EQ(CatchCopy({tmp / "a", tmp / "b"}, tmp / "missing"),
		  ErrorKind::INVALID_DESTINATION);
	EXPECT_FALSE(fs::exists(tmp / "missing"));
}

TEST_F(CommandTest, NoSources)
{
	EXPECT_EQ(CatchCopy({}, tmp / "dst"), ErrorKind::INVALID_SOURCE);
}

TEST_F(CommandTest, MissingSource)
{
	EXPECT_EQ(CatchCopy({tmp / "missing"}, tmp / "dst"),
		  ErrorKind::INVALID_SOURCE);
	EXPECT_FALSE(fs::exists(tmp / "dst"));
}

TEST_F(CommandTest, DirectoryNotRecursive)
{
	fs::create_directory(tmp / "dir");
	WriteTextFile(tmp / "dir" / "file", "x");

	EXPECT_EQ(CatchCopy({tmp / "dir"}, tmp / "dst"),
		  ErrorKind::INVALID_SOURCE);
	EXPECT_FALSE(fs::exists(tmp / "dst"));
}

TEST_F(CommandTest, DirectoryOntoFile)
{
	fs::create_directory(tmp / "dir");
	WriteTextFile(tmp / "file", "x");

	config.recursive = true;

	/* a regular file destination with a single source means
	   "overwrite", which a directory cannot do */
	EXPECT_EQ(CatchCopy({tmp / "dir"}, tmp / "file"),
		  ErrorKind::INVALID_DESTINATION);
	EXPECT_EQ(ReadTextFile(tmp / "file"), "x");

	config.recursive = false;
	EXPECT_EQ(CatchCopy({tmp / "dir"}, tmp / "file"),
		  ErrorKind::INVALID_SOURCE);
	EXPECT_EQ(ReadTextFile(tmp / "file"), "x");
}

TEST_F(CommandTest, DestinationNotAccessible)
{
	WriteTextFile(tmp / "file", "x");
	fs::create_symlink("loop", tmp / "loop");

	/* stat() fails with ELOOP, which is not "does not exist" */
	EXPECT_EQ(CatchCopy({tmp / "file"}, tmp / "loop"), ErrorKind::IO);
	EXPECT_EQ(CatchCopy({tmp / "file"}, tmp / "loop" / "dst"),
		  ErrorKind::IO);
	EXPECT_TRUE(fs::is_symlink(fs::symlink_status(tmp / "loop")));
}

TEST_F(CommandTest, IntoItself)
{
	fs::create_directory(tmp / "dir");
	config.recursive = true;

	EXPECT_EQ(CatchCopy({tmp / "dir"}, tmp / "dir"),
		  ErrorKind::INVALID_SOURCE);
}

TEST_F(CommandTest, Sequential)
{
	fs::create_directories(tmp / "src" / "sub");
	WriteTextFile(tmp / "src" / "sub" / "data", MakeTestData(100000));

	config.driver_kind = DriverKind::SEQUENTIAL;
	config.recursive = true;
	config.block_size = 16384;

	const auto totals = Copy({tmp / "src"}, tmp / "dst");
	EXPECT_EQ(totals.copied, 100000U);
	EXPECT_EQ(ReadTextFile(tmp / "dst" / "sub" / "data"),
		  MakeTestData(100000));
}
