// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cli/CommandLine.hxx"
#include "copy/Error.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace XCopy;

namespace {

/**
 * Owns a mutable copy of the given arguments, because getopt_long()
 * wants a non-const argv.
 */
class Args {
	std::vector<std::string> strings;
	std::vector<char *> argv;

public:
	Args(std::initializer_list<const char *> args)
		:strings(args.begin(), args.end())
	{
		strings.insert(strings.begin(), "xcopy");
		for (auto &i : strings)
			argv.push_back(i.data());
		argv.push_back(nullptr);
	}

	CommandLine Parse() {
		return ParseCommandLine(int(argv.size() - 1), argv.data());
	}
};

static std::string
CatchMessage(std::initializer_list<const char *> args)
{
	try {
		Args{args}.Parse();
	} catch (const Error &e) {
		EXPECT_EQ(e.GetKind(), ErrorKind::INVALID_ARGUMENTS);
		return e.what();
	}

	ADD_FAILURE() << "No exception thrown";
	return {};
}

} // anonymous namespace

TEST(CommandLine, Defaults)
{
	const auto cmdline = Args{"a", "b"}.Parse();
	ASSERT_EQ(cmdline.paths.size(), 2U);
	EXPECT_STREQ(cmdline.paths[0], "a");
	EXPECT_STREQ(cmdline.paths[1], "b");
	EXPECT_EQ(cmdline.verbose, 0U);
	EXPECT_TRUE(cmdline.progress);
	EXPECT_FALSE(cmdline.recursive);
	EXPECT_FALSE(cmdline.driver_kind);
	EXPECT_FALSE(cmdline.parallelism);
	EXPECT_FALSE(cmdline.block_size);
	EXPECT_EQ(cmdline.config_path, nullptr);

	/* nothing given, nothing changed */
	CopyConfig config;
	config.driver_kind = DriverKind::SEQUENTIAL;
	config.parallelism = 7;
	cmdline.ApplyTo(config);
	EXPECT_EQ(config.driver_kind, DriverKind::SEQUENTIAL);
	EXPECT_EQ(config.parallelism, 7U);
	EXPECT_EQ(config.error_policy, ErrorPolicy::ABORT);
	EXPECT_EQ(config.partial_file_policy, PartialFilePolicy::KEEP);
}

TEST(CommandLine, ShortOptions)
{
	const auto cmdline = Args{"-rnvvpL", "-d", "sequential", "-w4",
				  "-b", "1M", "-c", "my.conf",
				  "x", "y", "z"}.Parse();
	EXPECT_TRUE(cmdline.recursive);
	EXPECT_TRUE(cmdline.no_clobber);
	EXPECT_EQ(cmdline.verbose, 2U);
	EXPECT_TRUE(cmdline.preserve_metadata);
	EXPECT_TRUE(cmdline.dereference);
	EXPECT_EQ(cmdline.driver_kind, DriverKind::SEQUENTIAL);
	EXPECT_EQ(cmdline.parallelism, 4U);
	EXPECT_EQ(cmdline.block_size, 1024U * 1024U);
	EXPECT_STREQ(cmdline.config_path, "my.conf");
	EXPECT_EQ(cmdline.paths.size(), 3U);

	CopyConfig config;
	cmdline.ApplyTo(config);
	EXPECT_TRUE(config.recursive);
	EXPECT_TRUE(config.no_clobber);
	EXPECT_TRUE(config.preserve_metadata);
	EXPECT_TRUE(config.dereference);
	EXPECT_EQ(config.driver_kind, DriverKind::SEQUENTIAL);
	EXPECT_EQ(config.parallelism, 4U);
	EXPECT_EQ(config.block_size, 1024U * 1024U);
}

TEST(CommandLine, LongOptions)
{
	const auto cmdline = Args{"--recursive", "src", "--driver=parallel",
				  "--workers", "2", "--keep-going",
				  "--remove-partial", "--no-progress",
				  "dst"}.Parse();
	EXPECT_TRUE(cmdline.recursive);
	EXPECT_EQ(cmdline.driver_kind, DriverKind::PARALLEL);
	EXPECT_EQ(cmdline.parallelism, 2U);
	EXPECT_FALSE(cmdline.progress);

	/* options may follow the paths */
	ASSERT_EQ(cmdline.paths.size(), 2U);
	EXPECT_STREQ(cmdline.paths[0], "src");
	EXPECT_STREQ(cmdline.paths[1], "dst");

	CopyConfig config;
	cmdline.ApplyTo(config);
	EXPECT_EQ(config.error_policy, ErrorPolicy::CONTINUE);
	EXPECT_EQ(config.partial_file_policy, PartialFilePolicy::REMOVE);
}

TEST(CommandLine, Help)
{
	/* no paths required */
	EXPECT_TRUE(Args{"--help"}.Parse().help);
	EXPECT_TRUE((Args{"-h", "a"}.Parse().help));
}

TEST(CommandLine, Errors)
{
	EXPECT_EQ(CatchMessage({}), "Insufficient arguments");
	EXPECT_EQ(CatchMessage({"only-one"}), "Insufficient arguments");
	EXPECT_EQ(CatchMessage({"-x", "a", "b"}), "Unknown option: -x");
	EXPECT_EQ(CatchMessage({"--frobnicate", "a", "b"}),
		  "Unknown option: --frobnicate");
	EXPECT_EQ(CatchMessage({"a", "b", "-w"}), "Missing argument for -w");
	EXPECT_EQ(CatchMessage({"-d", "turbo", "a", "b"}),
		  "Invalid value for --driver");
	EXPECT_EQ(CatchMessage({"-w", "0", "a", "b"}),
		  "Invalid value for --workers");
	EXPECT_EQ(CatchMessage({"-b", "0", "a", "b"}),
		  "Invalid value for --block-size");
	EXPECT_EQ(CatchMessage({"-b", "lots", "a", "b"}),
		  "Invalid value for --block-size");
}
