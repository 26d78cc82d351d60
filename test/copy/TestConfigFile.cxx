// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempDirectory.hxx"
#include "copy/Config.hxx"
#include "copy/ConfigFile.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdlib.h>

using namespace XCopy;

TEST(ConfigFile, Full)
{
	const TempDirectory tmp;
	WriteTextFile(tmp / "xcopy.conf",
		      "# xcopy settings\n"
		      "driver sequential\n"
		      "workers 3\n"
		      "block_size 64k\n"
		      "preserve yes\n"
		      "no_clobber yes\n"
		      "dereference no\n"
		      "on_error continue\n"
		      "partial_files remove\n");

	CopyConfig config;
	LoadConfigFile(config, tmp / "xcopy.conf");

	EXPECT_EQ(config.driver_kind, DriverKind::SEQUENTIAL);
	EXPECT_EQ(config.parallelism, 3U);
	EXPECT_EQ(config.block_size, 64U * 1024U);
	EXPECT_TRUE(config.preserve_metadata);
	EXPECT_TRUE(config.no_clobber);
	EXPECT_FALSE(config.dereference);
	EXPECT_EQ(config.error_policy, ErrorPolicy::CONTINUE);
	EXPECT_EQ(config.partial_file_policy, PartialFilePolicy::REMOVE);

	/* settings not mentioned are left alone */
	EXPECT_FALSE(config.recursive);
}

TEST(ConfigFile, Errors)
{
	const TempDirectory tmp;
	CopyConfig config;

	WriteTextFile(tmp / "unknown.conf", "foo bar\n");
	try {
		LoadConfigFile(config, tmp / "unknown.conf");
		FAIL();
	} catch (...) {
		EXPECT_NE(GetFullMessage(std::current_exception()).find("Unknown option: \"foo\""),
			  std::string::npos);
	}

	WriteTextFile(tmp / "driver.conf", "\n\ndriver turbo\n");
	try {
		LoadConfigFile(config, tmp / "driver.conf");
		FAIL();
	} catch (...) {
		EXPECT_NE(GetFullMessage(std::current_exception()).find("driver.conf:3; "),
			  std::string::npos);
	}

	WriteTextFile(tmp / "zero.conf", "block_size 0\n");
	EXPECT_THROW(LoadConfigFile(config, tmp / "zero.conf"), std::runtime_error);

	WriteTextFile(tmp / "trailing.conf", "workers 2 3\n");
	EXPECT_THROW(LoadConfigFile(config, tmp / "trailing.conf"), std::runtime_error);

	EXPECT_THROW(LoadConfigFile(config, tmp / "missing.conf"), std::system_error);
}

TEST(ConfigFile, Optional)
{
	const TempDirectory tmp;
	CopyConfig config;

	LoadOptionalConfigFile(config, {});
	LoadOptionalConfigFile(config, tmp / "missing.conf");
	LoadOptionalConfigFile(config, tmp / "missing" / "xcopy.conf");
	EXPECT_EQ(config.driver_kind, DriverKind::PARALLEL);

	WriteTextFile(tmp / "xcopy.conf", "driver sequential\n");
	LoadOptionalConfigFile(config, tmp / "xcopy.conf");
	EXPECT_EQ(config.driver_kind, DriverKind::SEQUENTIAL);
}

TEST(ConfigFile, DefaultPath)
{
	setenv("XDG_CONFIG_HOME", "/xdg", 1);
	setenv("HOME", "/home/user", 1);
	EXPECT_EQ(GetDefaultConfigPath(), "/xdg/xcopy.conf");

	unsetenv("XDG_CONFIG_HOME");
	EXPECT_EQ(GetDefaultConfigPath(), "/home/user/.config/xcopy.conf");

	unsetenv("HOME");
	EXPECT_TRUE(GetDefaultConfigPath().empty());
}
