// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "io/CopyRegularFile.hxx"
#include "io/FileAt.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/linux/Reflink.hxx"

#include <gtest/gtest.h>

#include <vector>

#include <fcntl.h>

namespace {

struct RecordingHandler final : CopyRegularFileHandler {
	std::vector<std::size_t> steps;

	std::size_t GetTotal() const noexcept {
		std::size_t total = 0;
		for (auto i : steps)
			total += i;
		return total;
	}

	void OnCopyProgress(std::size_t nbytes) override {
		steps.push_back(nbytes);
	}
};

CopyMethod
Copy(const TempDirectory &tmp, std::string_view data,
     const CopyRegularFileOptions &options, RecordingHandler &handler)
{
	WriteTextFile(tmp / "src", data);

	const auto src = OpenReadOnly((tmp / "src").c_str());
	const auto dst = OpenWriteOnly(FileAt::CurrentDirectory((tmp / "dst").c_str()),
				       O_EXCL);

	return CopyRegularFile(src, dst, data.size(), options, handler);
}

} // anonymous namespace

TEST(CopyRegularFile, CopyFileRange)
{
	const TempDirectory tmp;
	const auto data = MakeTestData(100000);

	CopyRegularFileOptions options;
	options.block_size = 16384;

	RecordingHandler handler;
	const auto method = Copy(tmp, data, options, handler);

	/* some file systems do not support copy_file_range() */
	EXPECT_TRUE(method == CopyMethod::COPY_FILE_RANGE ||
		    method == CopyMethod::READ_WRITE);

	EXPECT_EQ(ReadTextFile(tmp / "dst"), data);
	EXPECT_EQ(handler.GetTotal(), data.size());

	for (auto i : handler.steps)
		EXPECT_LE(i, options.block_size);
}

TEST(CopyRegularFile, ReadWrite)
{
	const TempDirectory tmp;
	const auto data = MakeTestData(50000);

	CopyRegularFileOptions options;
	options.block_size = 4096;
	options.copy_file_range = false;

	RecordingHandler handler;
	EXPECT_EQ(Copy(tmp, data, options, handler), CopyMethod::READ_WRITE);

	EXPECT_EQ(ReadTextFile(tmp / "dst"), data);
	EXPECT_EQ(handler.GetTotal(), data.size());
	EXPECT_EQ(handler.steps.size(), (data.size() + 4095) / 4096);
}

TEST(CopyRegularFile, Empty)
{
	const TempDirectory tmp;

	RecordingHandler handler;
	EXPECT_EQ(Copy(tmp, {}, {}, handler), CopyMethod::NONE);

	EXPECT_EQ(ReadTextFile(tmp / "dst"), "");
	EXPECT_TRUE(handler.steps.empty());
}

TEST(CopyRegularFile, CloneFallback)
{
	const TempDirectory tmp;
	const auto data = MakeTestData(20000);

	/* request a clone even if the file system cannot do it; the
	   copy must still succeed */
	CopyRegularFileOptions options;
	options.clone = true;

	RecordingHandler handler;
	const auto method = Copy(tmp, data, options, handler);
	EXPECT_NE(method, CopyMethod::NONE);

	EXPECT_EQ(ReadTextFile(tmp / "dst"), data);
	EXPECT_EQ(handler.GetTotal(), data.size());
}

TEST(Reflink, Probe)
{
	const TempDirectory tmp;
	WriteTextFile(tmp / "a", "a");
	WriteTextFile(tmp / "b", "b");

	const auto a = OpenReadOnly((tmp / "a").c_str());
	const auto b = OpenReadOnly((tmp / "b").c_str());

	/* the result for two files depends on the file system */
	(void)IsReflinkCapable(a, b);

	EXPECT_FALSE(IsReflinkCapable(a, FileDescriptor::Undefined()));
}
